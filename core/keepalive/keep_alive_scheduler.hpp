#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "control/device_controller.hpp"
#include "events/event_emitter.hpp"
#include "fanout/fan_out_executor.hpp"
#include "sync/cancellation_token.hpp"

namespace lcdlink {
namespace keepalive {

constexpr std::chrono::milliseconds kDefaultInterval{4000};

// Periodically fans a keep-alive (epoch ms timestamp) out to every active device
// so the device-side display timeout never fires while the host is alive.
// Individual failures are tolerated; the next tick retries.
class KeepAliveScheduler {
public:
    using DeviceSource = std::function<std::vector<std::shared_ptr<device::DeviceHandle>>()>;

    KeepAliveScheduler(DeviceSource devices, control::DeviceController &controller,
                       fanout::FanOutExecutor &executor, std::shared_ptr<events::EventEmitter> emitter = nullptr);
    ~KeepAliveScheduler();

    KeepAliveScheduler(const KeepAliveScheduler &) = delete;
    KeepAliveScheduler &operator=(const KeepAliveScheduler &) = delete;

    // Stops any running timer first, so only one schedule is ever live
    bool start(std::chrono::milliseconds interval = kDefaultInterval);

    // Idempotent
    void stop();

    bool is_running() const { return running_.load(); }
    std::chrono::milliseconds interval() const { return std::chrono::milliseconds(interval_ms_.load()); }
    uint64_t tick_count() const { return tick_count_.load(); }

    // One keep-alive fan-out, independent of the timer
    fanout::FanOutResult<control::CommandResult> tick_once();

private:
    void tick_loop(sync::CancellationToken token, std::chrono::milliseconds interval);
    void stop_locked();

    DeviceSource devices_;
    control::DeviceController &controller_;
    fanout::FanOutExecutor &executor_;
    std::shared_ptr<events::EventEmitter> emitter_;

    std::mutex lifecycle_mutex_;
    std::atomic<bool> running_{false};
    std::atomic<long long> interval_ms_{kDefaultInterval.count()};
    std::unique_ptr<std::thread> tick_thread_;
    std::unique_ptr<sync::CancellationSource> cancel_;
    std::atomic<uint64_t> tick_count_{0};
};

}  // namespace keepalive
}  // namespace lcdlink
