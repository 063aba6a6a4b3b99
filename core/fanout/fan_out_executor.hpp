#pragma once

#include <algorithm>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include "device/device_handle.hpp"
#include "logging/logger.hpp"
#include "sync/cancellation_token.hpp"

namespace lcdlink {
namespace fanout {

enum class OutcomeStatus {
    SUCCEEDED,
    FAILED,     // Operation finished but reported failure (or threw)
    TIMED_OUT,  // Not finished when results were collected
};

const char *outcome_status_to_string(OutcomeStatus status);

template <typename T>
struct DeviceOutcome {
    OutcomeStatus status = OutcomeStatus::TIMED_OUT;
    std::optional<T> value;  // Set whenever the operation returned
    std::string error_message;

    bool ok() const { return status == OutcomeStatus::SUCCEEDED; }
};

// One entry per device passed to run_on_all, whatever its outcome.
// Partial failure is the normal case: callers act on succeeded()/total().
template <typename T>
struct FanOutResult {
    std::map<std::string, DeviceOutcome<T>> outcomes;  // Keyed by device path

    size_t total() const { return outcomes.size(); }

    size_t succeeded() const { return count(OutcomeStatus::SUCCEEDED); }
    size_t failed() const { return count(OutcomeStatus::FAILED); }
    size_t timed_out() const { return count(OutcomeStatus::TIMED_OUT); }
    bool all_succeeded() const { return succeeded() == total(); }

    const DeviceOutcome<T> *find(const std::string &path) const {
        auto it = outcomes.find(path);
        return it == outcomes.end() ? nullptr : &it->second;
    }

private:
    size_t count(OutcomeStatus status) const {
        size_t n = 0;
        for (const auto &entry : outcomes) {
            if (entry.second.status == status) {
                ++n;
            }
        }
        return n;
    }
};

// Runs one operation per device concurrently and collects the results at a shared deadline.
//
// Each operation runs on its own detached worker. Operations still running at the
// deadline are recorded as TIMED_OUT and their cancellation token is signalled; they
// are not killed. The executor tracks stragglers and its destructor waits for them,
// so anything an operation captures by reference must outlive the executor.
class FanOutExecutor {
public:
    using DevicePtr = std::shared_ptr<device::DeviceHandle>;

    template <typename T>
    using Operation = std::function<T(const DevicePtr &, const sync::CancellationToken &)>;

    // Decides success from a returned value; fills error on failure
    template <typename T>
    using Classifier = std::function<bool(const T &, std::string &)>;

    // Starts one worker. The default runs it on a detached std::thread and throws
    // std::system_error when the system cannot create one.
    using Launcher = std::function<void(std::function<void()>)>;

    explicit FanOutExecutor(std::chrono::milliseconds default_timeout = std::chrono::milliseconds(2000),
                            Launcher launcher = nullptr);
    ~FanOutExecutor();

    FanOutExecutor(const FanOutExecutor &) = delete;
    FanOutExecutor &operator=(const FanOutExecutor &) = delete;

    template <typename T>
    FanOutResult<T> run_on_all(const std::vector<DevicePtr> &devices, Operation<T> operation,
                               std::chrono::milliseconds timeout, Classifier<T> classify = nullptr,
                               const sync::CancellationToken &cancel = sync::CancellationToken()) {
        struct Shared {
            std::mutex mutex;
            std::condition_variable cv;
            std::map<std::string, DeviceOutcome<T>> finished;
            size_t pending = 0;
        };

        auto shared = std::make_shared<Shared>();
        auto run_cancel = std::make_shared<sync::CancellationSource>();
        const auto deadline = std::chrono::steady_clock::now() + timeout;

        FanOutResult<T> result;
        for (const auto &device : devices) {
            if (!device) {
                continue;
            }
            result.outcomes[device->path()] = DeviceOutcome<T>{};
        }
        shared->pending = result.outcomes.size();

        for (const auto &device : devices) {
            if (!device) {
                continue;
            }
            auto tracker = tracker_;
            const sync::CancellationToken token = run_cancel->token();
            std::function<void()> work = [shared, tracker, device, operation, classify, token]() {
                DeviceOutcome<T> outcome;
                try {
                    T value = operation(device, token);
                    std::string error;
                    const bool ok = classify ? classify(value, error) : true;
                    outcome.status = ok ? OutcomeStatus::SUCCEEDED : OutcomeStatus::FAILED;
                    outcome.error_message = std::move(error);
                    outcome.value = std::move(value);
                } catch (const std::exception &e) {
                    outcome.status = OutcomeStatus::FAILED;
                    outcome.error_message = e.what();
                }

                {
                    std::lock_guard<std::mutex> lock(shared->mutex);
                    shared->finished[device->path()] = std::move(outcome);
                    --shared->pending;
                }
                shared->cv.notify_all();
                end_task(tracker);
            };

            begin_task();
            try {
                launcher_(std::move(work));
            } catch (const std::exception &e) {
                end_task(tracker_);
                LOG_ERROR("[FanOut] Cannot start worker for " << device->path() << ": " << e.what());

                DeviceOutcome<T> outcome;
                outcome.status = OutcomeStatus::FAILED;
                outcome.error_message = std::string("Cannot start worker: ") + e.what();
                std::lock_guard<std::mutex> lock(shared->mutex);
                shared->finished[device->path()] = std::move(outcome);
                --shared->pending;
            }
        }

        {
            std::unique_lock<std::mutex> lock(shared->mutex);
            while (shared->pending > 0 && !cancel.is_cancelled()) {
                // Short slices so a caller cancellation is observed promptly
                const auto slice = std::min(deadline, std::chrono::steady_clock::now() + std::chrono::milliseconds(50));
                shared->cv.wait_until(lock, slice, [&shared] { return shared->pending == 0; });
                if (std::chrono::steady_clock::now() >= deadline) {
                    break;
                }
            }

            for (auto &entry : result.outcomes) {
                auto it = shared->finished.find(entry.first);
                if (it != shared->finished.end()) {
                    entry.second = it->second;
                } else {
                    entry.second.status = OutcomeStatus::TIMED_OUT;
                    entry.second.error_message = cancel.is_cancelled()
                                                     ? "Cancelled before completion"
                                                     : "No result within " + std::to_string(timeout.count()) + "ms";
                }
            }
        }

        // Ask stragglers to stop; results are already collected
        run_cancel->cancel();

        if (result.succeeded() != result.total()) {
            LOG_DEBUG("[FanOut] " << result.succeeded() << "/" << result.total() << " succeeded ("
                                  << result.timed_out() << " timed out)");
        }
        return result;
    }

    // Blocks until every worker has returned or the timeout elapses. Returns true if idle.
    bool wait_idle(std::chrono::milliseconds timeout);

    size_t in_flight() const;

    std::chrono::milliseconds default_timeout() const { return default_timeout_; }

private:
    struct Tracker {
        std::mutex mutex;
        std::condition_variable cv;
        size_t running = 0;
    };

    void begin_task();
    static void end_task(const std::shared_ptr<Tracker> &tracker);

    std::chrono::milliseconds default_timeout_;
    Launcher launcher_;
    std::shared_ptr<Tracker> tracker_;
};

}  // namespace fanout
}  // namespace lcdlink
