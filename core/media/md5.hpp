#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lcdlink {
namespace media {

// Lowercase hex MD5 of data. Returns false (error set) if the digest backend fails.
bool md5_hex(const std::vector<uint8_t> &data, std::string &digest, std::string &error);

}  // namespace media
}  // namespace lcdlink
