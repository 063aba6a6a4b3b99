#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "device/device_handle.hpp"
#include "protocol/device_status.hpp"
#include "transport/command_transport.hpp"

namespace lcdlink {
namespace control {

using transport::CommandResult;
using transport::TransportError;

// Typed device command surface. Each call is one round-trip through the
// command transport; success is the device's status code, not just delivery.
// Arguments are validated before anything is sent.
class DeviceController {
public:
    DeviceController(transport::ICommandTransport &transport, std::chrono::milliseconds timeout);

    CommandResult set_brightness(device::DeviceHandle &handle, int value);
    CommandResult set_rotation(device::DeviceHandle &handle, int degrees);
    CommandResult set_display_in_sleep(device::DeviceHandle &handle, bool enable);
    CommandResult set_realtime_display(device::DeviceHandle &handle, bool enable);
    CommandResult set_keep_alive_timeout(device::DeviceHandle &handle, int seconds);
    CommandResult send_keep_alive(device::DeviceHandle &handle, int64_t timestamp_ms);

    // "param" parsed into a DeviceStatus; an unparseable payload is MALFORMED_RESPONSE
    CommandResult read_status(device::DeviceHandle &handle, protocol::DeviceStatus &status);

    // Suspend media file workflow: announce, transfer, confirm
    CommandResult begin_suspend_transfer(device::DeviceHandle &handle, const std::string &file_name, size_t file_size);
    CommandResult complete_suspend_transfer(device::DeviceHandle &handle, const std::string &file_name,
                                            const std::string &md5);
    CommandResult delete_suspend_media(device::DeviceHandle &handle, const std::string &file_name);

    CommandResult get_serial_number(device::DeviceHandle &handle, std::string &serial);
    CommandResult set_serial_number(device::DeviceHandle &handle, const std::string &serial);
    CommandResult get_sku_color(device::DeviceHandle &handle, std::string &color);
    CommandResult set_sku_color(device::DeviceHandle &handle, const std::string &color);

    CommandResult send_file(device::DeviceHandle &handle, const std::vector<uint8_t> &data, protocol::FileType type,
                            uint8_t transfer_id);

    CommandResult reboot(device::DeviceHandle &handle);
    CommandResult factory_reset(device::DeviceHandle &handle);

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    CommandResult post(device::DeviceHandle &handle, const std::string &command, nlohmann::json payload);

    // Pulls a string field out of a successful response payload
    CommandResult read_string_field(device::DeviceHandle &handle, const std::string &command, const char *field,
                                    std::string &value);

    transport::ICommandTransport &transport_;
    std::chrono::milliseconds timeout_;
};

// Name used for delete-all
constexpr const char *kDeleteAllMedia = "all";

}  // namespace control
}  // namespace lcdlink
