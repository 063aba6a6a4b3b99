#pragma once

/**
 * @file streaming_engine.hpp
 * @brief Real-time frame pump for one device display
 *
 * The device double-buffers incoming frames: a frame sent now becomes visible
 * only after buffer_depth further frames arrive. The engine keeps a FIFO of
 * in-flight (frame, transfer id) pairs so callers learn what is actually on
 * screen, and rotates transfer ids so an id still held by the device buffer is
 * never reused.
 *
 * State per device: IDLE -> ENABLING -> STREAMING -> DISABLING -> IDLE, with
 * CANCELLED recorded when a pump is stopped by its token.
 */

#include <chrono>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>

#include "control/device_controller.hpp"
#include "events/event_emitter.hpp"
#include "streaming/frame_source.hpp"
#include "streaming/transfer_id_rotation.hpp"
#include "sync/cancellation_token.hpp"

namespace lcdlink {
namespace streaming {

constexpr size_t kDefaultBufferDepth = 2;

enum class StreamState { IDLE, ENABLING, STREAMING, DISABLING, CANCELLED };

enum class StreamOutcome {
    COMPLETED,      // Source exhausted
    CANCELLED,      // Token fired
    ENABLE_FAILED,  // Setup command failed, nothing streamed
    ABORTED,        // Device gone or too many consecutive frame failures
    BUSY,           // Another session is active on this handle
    SOURCE_FAILED,  // Frame source could not be opened or read
};

const char *stream_state_to_string(StreamState state);
const char *stream_outcome_to_string(StreamOutcome outcome);

struct StreamResult {
    StreamOutcome outcome = StreamOutcome::COMPLETED;
    std::string error_message;
    uint64_t frames_sent = 0;
    uint64_t frames_displayed = 0;
    uint64_t frames_failed = 0;
    control::TransportError last_error = control::TransportError::NONE;

    bool ok() const { return outcome == StreamOutcome::COMPLETED || outcome == StreamOutcome::CANCELLED; }
};

struct StreamingConfig {
    size_t buffer_depth = kDefaultBufferDepth;
    TransferIdWindow ids;
    int brightness = 80;
    int device_timeout_s = 60;  // Must stay well above the keep-alive interval
    bool wake_before_enable = true;
    int max_consecutive_failures = 3;
};

// Both callbacks run on the pumping thread
struct StreamCallbacks {
    std::function<void(const Frame &, uint8_t transfer_id)> on_frame_sent;
    std::function<void(const Frame &, uint8_t transfer_id)> on_frame_displayed;
};

class StreamingEngine {
public:
    StreamingEngine(control::DeviceController &controller, StreamingConfig config,
                    std::shared_ptr<events::EventEmitter> emitter = nullptr);

    /**
     * @brief Wake, enable real-time display, then apply brightness and device timeout
     *
     * Stops at the first failing command and returns its result.
     */
    control::CommandResult enable(device::DeviceHandle &handle);

    /**
     * @brief Send frames from source until it is exhausted, cancelled or the device fails
     *
     * Frames are paced to interval boundaries. Individual frame failures are
     * counted and skipped. Every in-flight frame is reported as displayed before
     * return. Unless the source completed, real-time display is disabled before
     * returning.
     */
    StreamResult pump(device::DeviceHandle &handle, IFrameSource &source, std::chrono::milliseconds interval,
                      const sync::CancellationToken &token, const StreamCallbacks &callbacks = StreamCallbacks{});

    // Best effort; failures are only logged
    void disable(device::DeviceHandle &handle);

    // enable + pump + disable
    StreamResult stream(device::DeviceHandle &handle, IFrameSource &source, std::chrono::milliseconds interval,
                        const sync::CancellationToken &token, const StreamCallbacks &callbacks = StreamCallbacks{});

    StreamState state(const std::string &path) const;

    const StreamingConfig &config() const { return config_; }

private:
    struct InFlight {
        Frame frame;
        uint8_t transfer_id;
    };

    StreamResult run_pump(device::DeviceHandle &handle, IFrameSource &source, std::chrono::milliseconds interval,
                          const sync::CancellationToken &token, const StreamCallbacks &callbacks);

    void report_displayed(device::DeviceHandle &handle, const InFlight &entry, const StreamCallbacks &callbacks,
                          StreamResult &result);

    void set_state(const std::string &path, StreamState state);

    control::DeviceController &controller_;
    StreamingConfig config_;
    std::shared_ptr<events::EventEmitter> emitter_;

    mutable std::mutex state_mutex_;
    std::map<std::string, StreamState> states_;
};

}  // namespace streaming
}  // namespace lcdlink
