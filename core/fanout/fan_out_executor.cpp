#include "fan_out_executor.hpp"

#include <utility>

namespace lcdlink {
namespace fanout {

const char *outcome_status_to_string(OutcomeStatus status) {
    switch (status) {
        case OutcomeStatus::SUCCEEDED: return "SUCCEEDED";
        case OutcomeStatus::FAILED: return "FAILED";
        case OutcomeStatus::TIMED_OUT: return "TIMED_OUT";
    }
    return "UNKNOWN";
}

FanOutExecutor::FanOutExecutor(std::chrono::milliseconds default_timeout, Launcher launcher)
    : default_timeout_(default_timeout), launcher_(std::move(launcher)), tracker_(std::make_shared<Tracker>()) {
    if (!launcher_) {
        launcher_ = [](std::function<void()> work) { std::thread(std::move(work)).detach(); };
    }
}

FanOutExecutor::~FanOutExecutor() {
    std::unique_lock<std::mutex> lock(tracker_->mutex);
    if (tracker_->running > 0) {
        LOG_DEBUG("[FanOut] Waiting for " << tracker_->running << " straggling operation(s)");
    }
    tracker_->cv.wait(lock, [this] { return tracker_->running == 0; });
}

void FanOutExecutor::begin_task() {
    std::lock_guard<std::mutex> lock(tracker_->mutex);
    ++tracker_->running;
}

void FanOutExecutor::end_task(const std::shared_ptr<Tracker> &tracker) {
    {
        std::lock_guard<std::mutex> lock(tracker->mutex);
        --tracker->running;
    }
    tracker->cv.notify_all();
}

bool FanOutExecutor::wait_idle(std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(tracker_->mutex);
    return tracker_->cv.wait_for(lock, timeout, [this] { return tracker_->running == 0; });
}

size_t FanOutExecutor::in_flight() const {
    std::lock_guard<std::mutex> lock(tracker_->mutex);
    return tracker_->running;
}

}  // namespace fanout
}  // namespace lcdlink
