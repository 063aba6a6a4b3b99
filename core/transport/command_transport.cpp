#include "command_transport.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace lcdlink {
namespace transport {

const char *transport_error_to_string(TransportError error) {
    switch (error) {
        case TransportError::NONE: return "None";
        case TransportError::DEVICE_UNAVAILABLE: return "DeviceUnavailable";
        case TransportError::TIMEOUT: return "Timeout";
        case TransportError::MALFORMED_RESPONSE: return "MalformedResponse";
        case TransportError::COMMAND_REJECTED: return "CommandRejected";
        case TransportError::IO_ERROR: return "IoError";
        case TransportError::INVALID_ARGUMENT: return "InvalidArgument";
    }
    return "Unknown";
}

CommandTransport::CommandTransport(size_t block_size) : block_size_(block_size) {}

CommandResult CommandTransport::write_failure(device::DeviceHandle &handle) const {
    if (!handle.is_valid() || !handle.io().is_open()) {
        return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE, "Device unavailable: " + handle.path());
    }
    return CommandResult::failure(TransportError::IO_ERROR, "Write failed: " + handle.io().last_error());
}

CommandResult CommandTransport::send_command(device::DeviceHandle &handle, const protocol::CommandRequest &request,
                                             std::chrono::milliseconds timeout) {
    if (!handle.is_valid()) {
        return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE, "Device unavailable: " + handle.path());
    }

    auto lock = handle.lock_channel();

    // Detach may have raced with the lock
    if (!handle.is_valid()) {
        return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE, "Device unavailable: " + handle.path());
    }

    const uint32_t sequence_number = handle.next_sequence_number();
    const std::string text = protocol::format_request(request, sequence_number);
    LOG_DEBUG("[Transport] " << handle.path() << " -> " << request.verb << " " << request.command
                             << " seq=" << sequence_number);

    if (!handle.io().write_report(protocol::encode_command_frame(text))) {
        auto result = write_failure(handle);
        LOG_WARN("[Transport] " << request.command << " on " << handle.path() << ": " << result.error_message);
        return result;
    }

    return wait_for_response(handle, request.command, sequence_number, timeout);
}

CommandResult CommandTransport::wait_for_response(device::DeviceHandle &handle, const std::string &command,
                                                  uint32_t sequence_number, std::chrono::milliseconds timeout) {
    using namespace std::chrono;

    const auto deadline = steady_clock::now() + timeout;
    const uint32_t ack = protocol::expected_ack(sequence_number);
    std::vector<uint8_t> buffer;

    while (true) {
        if (!handle.is_valid()) {
            return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE,
                                          "Device detached while waiting for '" + command + "'");
        }

        const auto remaining = duration_cast<milliseconds>(deadline - steady_clock::now()).count();
        if (remaining <= 0) {
            CommandResult result = CommandResult::failure(
                TransportError::TIMEOUT,
                "Timeout waiting for '" + command + "' response (" + std::to_string(timeout.count()) + "ms)");
            LOG_WARN("[Transport] " << handle.path() << ": " << result.error_message);
            return result;
        }

        // Poll in short slices so detach is noticed promptly
        const int slice = static_cast<int>(std::min<long long>(remaining, 100));
        const int n = handle.io().read_report(buffer, slice);
        if (n < 0) {
            if (!handle.is_valid() || !handle.io().is_open()) {
                return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE,
                                              "Device unavailable: " + handle.path());
            }
            return CommandResult::failure(TransportError::IO_ERROR, "Read failed: " + handle.io().last_error());
        }
        if (n == 0) {
            continue;
        }

        if (buffer[0] != protocol::kResponseReportId) {
            LOG_DEBUG("[Transport] Ignoring report 0x" << std::hex << static_cast<int>(buffer[0]) << std::dec
                                                       << " from " << handle.path());
            continue;
        }

        std::string text;
        std::string error;
        if (!protocol::decode_response_frame(buffer.data(), buffer.size(), text, error)) {
            return CommandResult::failure(TransportError::MALFORMED_RESPONSE,
                                          "Malformed '" + command + "' response frame: " + error);
        }

        CommandResult result;
        if (!protocol::parse_response(text, result.response, error)) {
            return CommandResult::failure(TransportError::MALFORMED_RESPONSE,
                                          "Malformed '" + command + "' response: " + error);
        }

        if (result.response.ack_number != ack) {
            // Late answer to an earlier, timed-out request
            LOG_DEBUG("[Transport] Discarding stale response ack=" << result.response.ack_number << " (expected "
                                                                   << ack << ")");
            continue;
        }

        if (!result.response.success()) {
            result.error = TransportError::COMMAND_REJECTED;
            result.error_message =
                "Device rejected '" + command + "' with status " + std::to_string(result.response.status_code);
            LOG_WARN("[Transport] " << handle.path() << ": " << result.error_message);
        }
        return result;
    }
}

CommandResult CommandTransport::send_file(device::DeviceHandle &handle, const std::vector<uint8_t> &data,
                                          protocol::FileType type, uint8_t transfer_id) {
    std::vector<std::vector<uint8_t>> reports;
    std::string error;
    if (!protocol::encode_file_blocks(data.data(), data.size(), type, transfer_id, block_size_, reports, error)) {
        return CommandResult::failure(TransportError::INVALID_ARGUMENT, error);
    }

    if (!handle.is_valid()) {
        return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE, "Device unavailable: " + handle.path());
    }

    auto lock = handle.lock_channel();
    for (const auto &report : reports) {
        if (!handle.is_valid()) {
            return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE,
                                          "Device detached during file transfer: " + handle.path());
        }
        if (!handle.io().write_report(report)) {
            return write_failure(handle);
        }
    }

    LOG_DEBUG("[Transport] Sent " << data.size() << " bytes in " << reports.size() << " blocks (id "
                                  << static_cast<int>(transfer_id) << ") to " << handle.path());
    return CommandResult{};
}

CommandResult CommandTransport::send_subcommand(device::DeviceHandle &handle, uint8_t subcommand) {
    if (!handle.is_valid()) {
        return CommandResult::failure(TransportError::DEVICE_UNAVAILABLE, "Device unavailable: " + handle.path());
    }

    auto lock = handle.lock_channel();
    if (!handle.io().write_report(protocol::encode_subcommand(subcommand))) {
        return write_failure(handle);
    }
    return CommandResult{};
}

}  // namespace transport
}  // namespace lcdlink
