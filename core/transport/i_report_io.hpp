#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace lcdlink {
namespace transport {

// Single blocking report read/write on one HID endpoint. Not thread-safe:
// callers serialize access through the owning DeviceHandle's channel lock.
class IReportIo {
public:
    virtual ~IReportIo() = default;

    // Writes one report (first byte is the report id)
    virtual bool write_report(const std::vector<uint8_t> &report) = 0;

    // Reads one input report into buffer (resized to the bytes read).
    // Returns bytes read, 0 on timeout, -1 on error (sets last_error()).
    virtual int read_report(std::vector<uint8_t> &buffer, int timeout_ms) = 0;

    virtual void close() = 0;
    virtual bool is_open() const = 0;

    virtual const std::string &last_error() const = 0;
};

}  // namespace transport
}  // namespace lcdlink
