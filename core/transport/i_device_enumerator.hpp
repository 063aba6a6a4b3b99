#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include "device/device_identity.hpp"
#include "transport/i_report_io.hpp"

namespace lcdlink {
namespace transport {

// Enumerates attached devices and opens their report endpoint
class IDeviceEnumerator {
public:
    virtual ~IDeviceEnumerator() = default;

    virtual bool enumerate(uint16_t vendor_id, uint16_t product_id, std::vector<device::DeviceIdentity> &devices) = 0;

    // Returns nullptr on failure (sets last_error())
    virtual std::unique_ptr<IReportIo> open(const device::DeviceIdentity &identity) = 0;

    virtual const std::string &last_error() const = 0;
};

}  // namespace transport
}  // namespace lcdlink
