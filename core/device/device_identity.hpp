#pragma once

#include <cstdint>
#include <string>

namespace lcdlink {
namespace device {

// One physical attachment instance. Unplug/replug yields a new identity
// (new path) with the same serial number.
struct DeviceIdentity {
    uint16_t vendor_id = 0;
    uint16_t product_id = 0;
    std::string path;
    std::string serial_number;
    std::string product;

    // Stable key across re-attachment: serial when the device reports one, path otherwise
    std::string storage_key() const { return serial_number.empty() ? path : serial_number; }

    bool operator==(const DeviceIdentity &other) const {
        return vendor_id == other.vendor_id && product_id == other.product_id && path == other.path &&
               serial_number == other.serial_number && product == other.product;
    }
    bool operator!=(const DeviceIdentity &other) const { return !(*this == other); }
};

}  // namespace device
}  // namespace lcdlink
