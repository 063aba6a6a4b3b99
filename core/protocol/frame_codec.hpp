#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace lcdlink {
namespace protocol {

// HID report ids used by the display firmware
constexpr uint8_t kSubcommandReportId = 0x02;
constexpr uint8_t kCommandReportId = 0x1E;
constexpr uint8_t kFileTransferReportId = 0x1F;
constexpr uint8_t kResponseReportId = 0x20;

// Command frames are delimited by 0x5A; 0x5A/0x5B inside a frame are escaped with 0x5B
constexpr uint8_t kFrameMarker = 0x5A;
constexpr uint8_t kEscapeByte = 0x5B;
constexpr uint8_t kEscapedMarker = 0x01;
constexpr uint8_t kEscapedEscape = 0x02;

// File transfer blocks
constexpr uint8_t kBlockMarker = 0x5C;
constexpr size_t kBlockMetadataSize = 20;
constexpr size_t kMaxBlockSize = 1000;
constexpr size_t kMaxBlockCount = 65535;
constexpr uint8_t kMaxTransferId = 59;

// Device subcommands (report 0x02)
constexpr uint8_t kSubcommandFactoryReset = 0x01;
constexpr uint8_t kSubcommandReboot = 0x02;

enum class FileType : uint8_t {
    UNSPECIFIED = 0,
    JPEG = 1,
    PNG = 2,
};

// Picks the transfer file type from the extension (.jpg/.jpeg/.png, case-insensitive)
FileType file_type_from_path(const std::string &path);

// Escape 0x5A -> 0x5B 0x01 and 0x5B -> 0x5B 0x02
std::vector<uint8_t> stuff_bytes(const std::vector<uint8_t> &data);

// Reverse of stuff_bytes. Returns false on a dangling or unknown escape sequence.
bool unstuff_bytes(const uint8_t *data, size_t len, std::vector<uint8_t> &out);

// Low 8 bits of the byte sum
uint8_t compute_checksum(const uint8_t *data, size_t len);

// Builds [report][0x5A][stuffed(len_hi len_lo payload checksum)][0x5A]
// where len = payload + 5 (length field, checksum and both markers).
std::vector<uint8_t> encode_command_frame(const std::string &payload, uint8_t report_id = kCommandReportId);

// Validates a response report (report id, markers, length, checksum) and extracts its text.
// Trailing padding after the end marker is ignored.
bool decode_response_frame(const uint8_t *report, size_t len, std::string &payload, std::string &error);

// Splits a file into 0x1F block reports. Fails on empty data, an out-of-range
// transfer id or block size, or a file needing more than kMaxBlockCount blocks.
bool encode_file_blocks(const uint8_t *data, size_t size, FileType type, uint8_t transfer_id, size_t block_size,
                        std::vector<std::vector<uint8_t>> &reports, std::string &error);

std::vector<uint8_t> encode_subcommand(uint8_t subcommand);

}  // namespace protocol
}  // namespace lcdlink
