#include "keep_alive_scheduler.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace lcdlink {
namespace keepalive {

KeepAliveScheduler::KeepAliveScheduler(DeviceSource devices, control::DeviceController &controller,
                                       fanout::FanOutExecutor &executor,
                                       std::shared_ptr<events::EventEmitter> emitter)
    : devices_(std::move(devices)), controller_(controller), executor_(executor), emitter_(std::move(emitter)) {}

KeepAliveScheduler::~KeepAliveScheduler() { stop(); }

bool KeepAliveScheduler::start(std::chrono::milliseconds interval) {
    if (interval.count() <= 0) {
        LOG_ERROR("[KeepAlive] Invalid interval: " << interval.count() << "ms");
        return false;
    }

    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    stop_locked();

    interval_ms_ = interval.count();
    cancel_ = std::make_unique<sync::CancellationSource>();
    running_ = true;
    tick_thread_ = std::make_unique<std::thread>(&KeepAliveScheduler::tick_loop, this, cancel_->token(), interval);

    LOG_INFO("[KeepAlive] Started (interval " << interval.count() << "ms)");
    return true;
}

void KeepAliveScheduler::stop() {
    std::lock_guard<std::mutex> lock(lifecycle_mutex_);
    stop_locked();
}

void KeepAliveScheduler::stop_locked() {
    if (!running_) {
        return;
    }

    running_ = false;
    cancel_->cancel();
    if (tick_thread_ && tick_thread_->joinable()) {
        tick_thread_->join();
    }
    tick_thread_.reset();
    cancel_.reset();

    LOG_INFO("[KeepAlive] Stopped after " << tick_count_.load() << " tick(s)");
}

void KeepAliveScheduler::tick_loop(sync::CancellationToken token, std::chrono::milliseconds interval) {
    using namespace std::chrono;

    // First beat goes out immediately; later beats keep a fixed rate
    auto next_tick = steady_clock::now();
    while (!token.is_cancelled()) {
        tick_once();

        next_tick += interval;
        const auto now = steady_clock::now();
        if (next_tick < now) {
            LOG_WARN("[KeepAlive] Tick overran interval by "
                     << duration_cast<milliseconds>(now - next_tick).count() << "ms");
            next_tick = now;
        }
        if (token.wait_until(next_tick)) {
            break;
        }
    }
}

fanout::FanOutResult<control::CommandResult> KeepAliveScheduler::tick_once() {
    const int64_t timestamp_ms = events::now_epoch_ms();
    const auto devices = devices_();

    fanout::FanOutExecutor::Operation<control::CommandResult> operation =
        [this, timestamp_ms](const fanout::FanOutExecutor::DevicePtr &device, const sync::CancellationToken &) {
            return controller_.send_keep_alive(*device, timestamp_ms);
        };
    fanout::FanOutExecutor::Classifier<control::CommandResult> classify = [](const control::CommandResult &result,
                                                                            std::string &error) {
        error = result.error_message;
        return result.ok();
    };

    // A tick never waits past its own interval
    const auto timeout = std::min(interval(), executor_.default_timeout());
    auto result = executor_.run_on_all<control::CommandResult>(devices, operation, timeout, classify);
    tick_count_++;

    for (const auto &entry : result.outcomes) {
        if (!entry.second.ok()) {
            LOG_DEBUG("[KeepAlive] Missed beat on " << entry.first << ": " << entry.second.error_message);
        }
    }

    if (emitter_ && result.total() > 0) {
        events::KeepAliveTickEvent event;
        event.succeeded = result.succeeded();
        event.total = result.total();
        event.timestamp_ms = timestamp_ms;
        emitter_->emit(event);
    }
    return result;
}

}  // namespace keepalive
}  // namespace lcdlink
