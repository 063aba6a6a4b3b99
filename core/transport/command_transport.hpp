#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <vector>

#include "device/device_handle.hpp"
#include "protocol/command.hpp"
#include "protocol/frame_codec.hpp"

namespace lcdlink {
namespace transport {

enum class TransportError {
    NONE,
    DEVICE_UNAVAILABLE,  // Handle invalidated by detach or endpoint closed
    TIMEOUT,             // No matching response before the deadline
    MALFORMED_RESPONSE,  // Frame or body did not parse
    COMMAND_REJECTED,    // Device answered with a non-200 status
    IO_ERROR,            // Write/read failed on a live handle
    INVALID_ARGUMENT,    // Rejected before touching the device
};

const char *transport_error_to_string(TransportError error);

struct CommandResult {
    TransportError error = TransportError::NONE;
    std::string error_message;
    protocol::CommandResponse response;

    bool ok() const { return error == TransportError::NONE; }

    static CommandResult failure(TransportError error, std::string message) {
        CommandResult result;
        result.error = error;
        result.error_message = std::move(message);
        return result;
    }
};

// Interface for CommandTransport to enable mocking
class ICommandTransport {
public:
    virtual ~ICommandTransport() = default;

    // One request, one correlated response. Calls on the same handle are serialized.
    virtual CommandResult send_command(device::DeviceHandle &handle, const protocol::CommandRequest &request,
                                       std::chrono::milliseconds timeout) = 0;

    // Framed file transfer tagged with transfer_id. No response is expected.
    virtual CommandResult send_file(device::DeviceHandle &handle, const std::vector<uint8_t> &data,
                                    protocol::FileType type, uint8_t transfer_id) = 0;

    // Fire-and-forget device subcommand (reboot, factory reset)
    virtual CommandResult send_subcommand(device::DeviceHandle &handle, uint8_t subcommand) = 0;
};

class CommandTransport : public ICommandTransport {
public:
    explicit CommandTransport(size_t block_size = protocol::kMaxBlockSize);

    CommandResult send_command(device::DeviceHandle &handle, const protocol::CommandRequest &request,
                               std::chrono::milliseconds timeout) override;
    CommandResult send_file(device::DeviceHandle &handle, const std::vector<uint8_t> &data, protocol::FileType type,
                            uint8_t transfer_id) override;
    CommandResult send_subcommand(device::DeviceHandle &handle, uint8_t subcommand) override;

private:
    // Reads reports until one acknowledges sequence_number. Channel lock must be held.
    CommandResult wait_for_response(device::DeviceHandle &handle, const std::string &command,
                                    uint32_t sequence_number, std::chrono::milliseconds timeout);

    // Classifies a write failure. Channel lock must be held.
    CommandResult write_failure(device::DeviceHandle &handle) const;

    size_t block_size_;
};

}  // namespace transport
}  // namespace lcdlink
