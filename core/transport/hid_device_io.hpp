#pragma once

#include <hidapi/hidapi.h>

#include <memory>
#include <string>
#include <vector>

#include "transport/i_device_enumerator.hpp"
#include "transport/i_report_io.hpp"

namespace lcdlink {
namespace transport {

// Largest input report the display firmware sends (report id included)
constexpr size_t kMaxInputReportSize = 1025;

// IReportIo over an open hidapi device
class HidReportIo : public IReportIo {
public:
    HidReportIo(hid_device *device, std::string path);
    ~HidReportIo() override;

    HidReportIo(const HidReportIo &) = delete;
    HidReportIo &operator=(const HidReportIo &) = delete;

    bool write_report(const std::vector<uint8_t> &report) override;
    int read_report(std::vector<uint8_t> &buffer, int timeout_ms) override;
    void close() override;
    bool is_open() const override { return handle_ != nullptr; }
    const std::string &last_error() const override { return error_; }

private:
    struct HidDeleter {
        void operator()(hid_device *device) const noexcept;
    };

    std::string hid_error_string() const;

    std::unique_ptr<hid_device, HidDeleter> handle_;
    std::string path_;
    std::string error_;
};

// Enumerates hidapi devices matching a vendor/product filter
class HidDeviceEnumerator : public IDeviceEnumerator {
public:
    HidDeviceEnumerator();
    ~HidDeviceEnumerator() override = default;

    bool enumerate(uint16_t vendor_id, uint16_t product_id, std::vector<device::DeviceIdentity> &devices) override;
    std::unique_ptr<IReportIo> open(const device::DeviceIdentity &identity) override;
    const std::string &last_error() const override { return error_; }

    // Frees hidapi's global state. Call once after every handle is closed.
    static void release_library();

private:
    bool ensure_initialized();

    std::string error_;
};

}  // namespace transport
}  // namespace lcdlink
