#include "streaming_engine.hpp"

#include <deque>

#include "logging/logger.hpp"

namespace lcdlink {
namespace streaming {

using control::CommandResult;
using control::TransportError;

const char *stream_state_to_string(StreamState state) {
    switch (state) {
        case StreamState::IDLE:
            return "IDLE";
        case StreamState::ENABLING:
            return "ENABLING";
        case StreamState::STREAMING:
            return "STREAMING";
        case StreamState::DISABLING:
            return "DISABLING";
        case StreamState::CANCELLED:
            return "CANCELLED";
    }
    return "UNKNOWN";
}

const char *stream_outcome_to_string(StreamOutcome outcome) {
    switch (outcome) {
        case StreamOutcome::COMPLETED:
            return "COMPLETED";
        case StreamOutcome::CANCELLED:
            return "CANCELLED";
        case StreamOutcome::ENABLE_FAILED:
            return "ENABLE_FAILED";
        case StreamOutcome::ABORTED:
            return "ABORTED";
        case StreamOutcome::BUSY:
            return "BUSY";
        case StreamOutcome::SOURCE_FAILED:
            return "SOURCE_FAILED";
    }
    return "UNKNOWN";
}

namespace {

// Clears the handle's streaming flag on every exit path
class StreamingGuard {
public:
    explicit StreamingGuard(device::DeviceHandle &handle) : handle_(handle), owned_(handle.try_begin_streaming()) {}
    ~StreamingGuard() {
        if (owned_) {
            handle_.end_streaming();
        }
    }
    bool owned() const { return owned_; }

private:
    device::DeviceHandle &handle_;
    bool owned_;
};

StreamResult busy_result(const device::DeviceHandle &handle) {
    StreamResult result;
    result.outcome = StreamOutcome::BUSY;
    result.error_message = "Streaming already active on " + handle.path();
    return result;
}

}  // namespace

StreamingEngine::StreamingEngine(control::DeviceController &controller, StreamingConfig config,
                                 std::shared_ptr<events::EventEmitter> emitter)
    : controller_(controller), config_(std::move(config)), emitter_(std::move(emitter)) {
    std::string error;
    if (!validate_window(config_.ids, config_.buffer_depth, error)) {
        LOG_WARN("[Streaming] " << error << "; using default window and depth");
        config_.ids = TransferIdWindow{};
        config_.buffer_depth = kDefaultBufferDepth;
    }
}

CommandResult StreamingEngine::enable(device::DeviceHandle &handle) {
    set_state(handle.path(), StreamState::ENABLING);

    auto fail = [&](const char *step, CommandResult result) {
        LOG_ERROR("[Streaming] Enable failed on " << handle.path() << " at " << step << ": " << result.error_message);
        set_state(handle.path(), StreamState::IDLE);
        return result;
    };

    if (config_.wake_before_enable) {
        auto result = controller_.set_display_in_sleep(handle, false);
        if (!result.ok()) {
            return fail("wake", std::move(result));
        }
    }

    auto result = controller_.set_realtime_display(handle, true);
    if (!result.ok()) {
        return fail("realtimeDisplay", std::move(result));
    }

    result = controller_.set_brightness(handle, config_.brightness);
    if (!result.ok()) {
        return fail("brightness", std::move(result));
    }

    result = controller_.set_keep_alive_timeout(handle, config_.device_timeout_s);
    if (!result.ok()) {
        return fail("timeout", std::move(result));
    }

    set_state(handle.path(), StreamState::STREAMING);
    LOG_INFO("[Streaming] Real-time display enabled on " << handle.path());
    return result;
}

void StreamingEngine::disable(device::DeviceHandle &handle) {
    const bool was_cancelled = state(handle.path()) == StreamState::CANCELLED;
    set_state(handle.path(), StreamState::DISABLING);

    auto result = controller_.set_realtime_display(handle, false);
    if (!result.ok()) {
        LOG_WARN("[Streaming] Disable on " << handle.path() << " failed: " << result.error_message);
    } else {
        LOG_INFO("[Streaming] Real-time display disabled on " << handle.path());
    }

    set_state(handle.path(), was_cancelled ? StreamState::CANCELLED : StreamState::IDLE);
}

StreamResult StreamingEngine::pump(device::DeviceHandle &handle, IFrameSource &source,
                                   std::chrono::milliseconds interval, const sync::CancellationToken &token,
                                   const StreamCallbacks &callbacks) {
    StreamingGuard guard(handle);
    if (!guard.owned()) {
        return busy_result(handle);
    }

    auto result = run_pump(handle, source, interval, token, callbacks);
    if (result.outcome != StreamOutcome::COMPLETED) {
        disable(handle);
    }
    return result;
}

StreamResult StreamingEngine::stream(device::DeviceHandle &handle, IFrameSource &source,
                                     std::chrono::milliseconds interval, const sync::CancellationToken &token,
                                     const StreamCallbacks &callbacks) {
    StreamingGuard guard(handle);
    if (!guard.owned()) {
        return busy_result(handle);
    }

    auto enabled = enable(handle);
    if (!enabled.ok()) {
        StreamResult result;
        result.outcome = StreamOutcome::ENABLE_FAILED;
        result.error_message = enabled.error_message;
        result.last_error = enabled.error;
        return result;
    }

    auto result = run_pump(handle, source, interval, token, callbacks);
    disable(handle);
    return result;
}

StreamResult StreamingEngine::run_pump(device::DeviceHandle &handle, IFrameSource &source,
                                       std::chrono::milliseconds interval, const sync::CancellationToken &token,
                                       const StreamCallbacks &callbacks) {
    using clock = std::chrono::steady_clock;

    StreamResult result;
    set_state(handle.path(), StreamState::STREAMING);

    auto sequence = source.open();
    if (!sequence) {
        result.outcome = StreamOutcome::SOURCE_FAILED;
        result.error_message = "Cannot open frame source " + source.describe();
        LOG_ERROR("[Streaming] " << result.error_message);
        return result;
    }

    LOG_INFO("[Streaming] Pumping " << source.describe() << " to " << handle.path() << " every " << interval.count()
                                    << "ms");

    TransferIdRotation ids(config_.ids);
    std::deque<InFlight> in_flight;
    int consecutive_failures = 0;
    auto next_frame = clock::now();
    bool first_frame = true;

    while (true) {
        if (token.is_cancelled()) {
            result.outcome = StreamOutcome::CANCELLED;
            break;
        }

        auto frame = sequence->next();
        if (!frame) {
            if (!sequence->last_error().empty()) {
                result.outcome = StreamOutcome::SOURCE_FAILED;
                result.error_message = sequence->last_error();
                LOG_ERROR("[Streaming] Frame source failed: " << result.error_message);
            }
            break;
        }

        // First frame goes out immediately, later ones on interval boundaries
        if (!first_frame) {
            next_frame += interval;
            const auto now = clock::now();
            if (next_frame < now) {
                // Behind schedule after a slow send; restart pacing here instead of bursting
                next_frame = now;
            }
            if (token.wait_until(next_frame)) {
                result.outcome = StreamOutcome::CANCELLED;
                break;
            }
        }
        first_frame = false;

        const uint8_t transfer_id = ids.current();
        auto sent = controller_.send_file(handle, frame->data, frame->type, transfer_id);
        if (!sent.ok()) {
            ++result.frames_failed;
            result.last_error = sent.error;
            result.error_message = sent.error_message;
            LOG_DEBUG("[Streaming] Frame " << frame->index << " to " << handle.path() << " failed: "
                                           << sent.error_message);

            if (sent.error == TransportError::DEVICE_UNAVAILABLE ||
                ++consecutive_failures >= config_.max_consecutive_failures) {
                result.outcome = StreamOutcome::ABORTED;
                LOG_WARN("[Streaming] Aborting stream on " << handle.path() << ": " << sent.error_message);
                break;
            }
            // The device may hold a partial transfer under this id
            ids.advance();
            continue;
        }

        consecutive_failures = 0;
        ++result.frames_sent;
        if (callbacks.on_frame_sent) {
            callbacks.on_frame_sent(*frame, transfer_id);
        }

        in_flight.push_back(InFlight{std::move(*frame), transfer_id});
        if (in_flight.size() > config_.buffer_depth) {
            report_displayed(handle, in_flight.front(), callbacks, result);
            in_flight.pop_front();
        }

        ids.advance();
    }

    // Whatever the exit reason, the device shows everything already sent
    while (!in_flight.empty()) {
        report_displayed(handle, in_flight.front(), callbacks, result);
        in_flight.pop_front();
    }

    if (result.outcome == StreamOutcome::CANCELLED) {
        set_state(handle.path(), StreamState::CANCELLED);
    }

    LOG_INFO("[Streaming] Stream on " << handle.path() << " ended " << stream_outcome_to_string(result.outcome)
                                      << " (sent " << result.frames_sent << ", failed " << result.frames_failed
                                      << ")");
    return result;
}

void StreamingEngine::report_displayed(device::DeviceHandle &handle, const InFlight &entry,
                                       const StreamCallbacks &callbacks, StreamResult &result) {
    ++result.frames_displayed;
    if (callbacks.on_frame_displayed) {
        callbacks.on_frame_displayed(entry.frame, entry.transfer_id);
    }
    if (emitter_) {
        events::FrameDisplayedEvent event;
        event.path = handle.path();
        event.frame_index = entry.frame.index;
        event.transfer_id = entry.transfer_id;
        event.timestamp_ms = events::now_epoch_ms();
        emitter_->emit(event);
    }
}

void StreamingEngine::set_state(const std::string &path, StreamState state) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    states_[path] = state;
}

StreamState StreamingEngine::state(const std::string &path) const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    auto it = states_.find(path);
    return it == states_.end() ? StreamState::IDLE : it->second;
}

}  // namespace streaming
}  // namespace lcdlink
