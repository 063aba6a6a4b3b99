#include "device_controller.hpp"

#include <cctype>

#include "logging/logger.hpp"

namespace lcdlink {
namespace control {

namespace {

bool is_hex_string(const std::string &s) {
    for (unsigned char c : s) {
        if (!std::isxdigit(c)) {
            return false;
        }
    }
    return !s.empty();
}

CommandResult invalid(const std::string &message) {
    return CommandResult::failure(TransportError::INVALID_ARGUMENT, message);
}

}  // namespace

DeviceController::DeviceController(transport::ICommandTransport &transport, std::chrono::milliseconds timeout)
    : transport_(transport), timeout_(timeout) {}

CommandResult DeviceController::post(device::DeviceHandle &handle, const std::string &command,
                                     nlohmann::json payload) {
    return transport_.send_command(handle, protocol::CommandRequest::post(command, std::move(payload)), timeout_);
}

CommandResult DeviceController::set_brightness(device::DeviceHandle &handle, int value) {
    if (value < 0 || value > 100) {
        return invalid("Brightness must be between 0 and 100 (got " + std::to_string(value) + ")");
    }
    auto result = post(handle, protocol::commands::kBrightness, {{"value", value}});
    if (result.ok()) {
        handle.set_brightness(value);
    }
    return result;
}

CommandResult DeviceController::set_rotation(device::DeviceHandle &handle, int degrees) {
    if (!protocol::is_valid_rotation(degrees)) {
        return invalid("Rotation must be 0, 90, 180 or 270 (got " + std::to_string(degrees) + ")");
    }
    auto result = post(handle, protocol::commands::kRotate, {{"degree", degrees}});
    if (result.ok()) {
        handle.set_rotation(degrees);
    }
    return result;
}

CommandResult DeviceController::set_display_in_sleep(device::DeviceHandle &handle, bool enable) {
    return post(handle, protocol::commands::kDisplayInSleep, {{"enable", enable}});
}

CommandResult DeviceController::set_realtime_display(device::DeviceHandle &handle, bool enable) {
    return post(handle, protocol::commands::kRealtimeDisplay, {{"enable", enable}});
}

CommandResult DeviceController::set_keep_alive_timeout(device::DeviceHandle &handle, int seconds) {
    if (seconds <= 0) {
        return invalid("Keep-alive timeout must be positive (got " + std::to_string(seconds) + ")");
    }
    auto result = post(handle, protocol::commands::kTimeout, {{"value", seconds}});
    if (result.ok()) {
        handle.set_keep_alive_timeout(seconds);
    }
    return result;
}

CommandResult DeviceController::send_keep_alive(device::DeviceHandle &handle, int64_t timestamp_ms) {
    auto result = transport_.send_command(handle, protocol::CommandRequest::keep_alive(timestamp_ms), timeout_);
    if (result.ok()) {
        handle.record_keep_alive(timestamp_ms);
    }
    return result;
}

CommandResult DeviceController::read_status(device::DeviceHandle &handle, protocol::DeviceStatus &status) {
    auto result = post(handle, protocol::commands::kParam, nlohmann::json::object());
    if (!result.ok()) {
        return result;
    }
    if (!result.response.payload) {
        return CommandResult::failure(TransportError::MALFORMED_RESPONSE, "Status response has no body");
    }

    std::string error;
    if (!protocol::parse_device_status(*result.response.payload, status, error)) {
        return CommandResult::failure(TransportError::MALFORMED_RESPONSE, error);
    }
    return result;
}

CommandResult DeviceController::begin_suspend_transfer(device::DeviceHandle &handle, const std::string &file_name,
                                                       size_t file_size) {
    if (file_name.empty() || file_size == 0) {
        return invalid("Suspend transfer needs a file name and a non-empty file");
    }
    return post(handle, protocol::commands::kTransport,
                {{"type", "suspend"}, {"fileName", file_name}, {"fileSize", file_size}});
}

CommandResult DeviceController::complete_suspend_transfer(device::DeviceHandle &handle, const std::string &file_name,
                                                          const std::string &md5) {
    return post(handle, protocol::commands::kTransported, {{"fileName", file_name}, {"md5", md5}});
}

CommandResult DeviceController::delete_suspend_media(device::DeviceHandle &handle, const std::string &file_name) {
    if (file_name.empty()) {
        return invalid("File name required");
    }
    return post(handle, protocol::commands::kDeleteMedia, {{"type", "suspend"}, {"fileName", file_name}});
}

CommandResult DeviceController::read_string_field(device::DeviceHandle &handle, const std::string &command,
                                                  const char *field, std::string &value) {
    auto result = post(handle, command, nlohmann::json::object());
    if (!result.ok()) {
        return result;
    }
    const auto &payload = result.response.payload;
    if (!payload || !payload->is_object() || !payload->contains(field) || !(*payload)[field].is_string()) {
        return CommandResult::failure(TransportError::MALFORMED_RESPONSE,
                                      "'" + command + "' response missing '" + field + "'");
    }
    value = (*payload)[field].get<std::string>();
    return result;
}

CommandResult DeviceController::get_serial_number(device::DeviceHandle &handle, std::string &serial) {
    return read_string_field(handle, protocol::commands::kGetSerial, "sn", serial);
}

CommandResult DeviceController::set_serial_number(device::DeviceHandle &handle, const std::string &serial) {
    if (serial.size() != 32 || !is_hex_string(serial)) {
        return invalid("Serial number must be 32 hex characters");
    }
    return post(handle, protocol::commands::kSetSerial, {{"sn", serial}});
}

CommandResult DeviceController::get_sku_color(device::DeviceHandle &handle, std::string &color) {
    return read_string_field(handle, protocol::commands::kGetSkuColor, "color", color);
}

CommandResult DeviceController::set_sku_color(device::DeviceHandle &handle, const std::string &color) {
    if (color.size() < 3 || color.compare(0, 2, "0x") != 0 || !is_hex_string(color.substr(2))) {
        return invalid("SKU color must be a 0x-prefixed hex value");
    }
    return post(handle, protocol::commands::kSetSkuColor, {{"color", color}});
}

CommandResult DeviceController::send_file(device::DeviceHandle &handle, const std::vector<uint8_t> &data,
                                          protocol::FileType type, uint8_t transfer_id) {
    return transport_.send_file(handle, data, type, transfer_id);
}

CommandResult DeviceController::reboot(device::DeviceHandle &handle) {
    LOG_INFO("[Control] Rebooting " << handle.path());
    return transport_.send_subcommand(handle, protocol::kSubcommandReboot);
}

CommandResult DeviceController::factory_reset(device::DeviceHandle &handle) {
    LOG_WARN("[Control] Factory reset requested for " << handle.path());
    return transport_.send_subcommand(handle, protocol::kSubcommandFactoryReset);
}

}  // namespace control
}  // namespace lcdlink
