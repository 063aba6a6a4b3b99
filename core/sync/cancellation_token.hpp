#pragma once

#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>

namespace lcdlink {
namespace sync {

namespace detail {
struct CancellationState {
    std::mutex mutex;
    std::condition_variable cv;
    bool cancelled = false;
};
}  // namespace detail

// Read side of a cancellation signal. Cheap to copy; a default-constructed
// token can never be cancelled.
class CancellationToken {
public:
    CancellationToken() = default;

    bool is_cancelled() const;

    // Sleeps up to duration. Returns true if cancelled (early or already).
    bool wait_for(std::chrono::milliseconds duration) const;
    bool wait_until(std::chrono::steady_clock::time_point deadline) const;

private:
    friend class CancellationSource;
    explicit CancellationToken(std::shared_ptr<detail::CancellationState> state) : state_(std::move(state)) {}

    std::shared_ptr<detail::CancellationState> state_;
};

// Owner side: cancel() wakes every waiting token
class CancellationSource {
public:
    CancellationSource();

    CancellationToken token() const { return CancellationToken(state_); }
    void cancel();
    bool is_cancelled() const;

private:
    std::shared_ptr<detail::CancellationState> state_;
};

}  // namespace sync
}  // namespace lcdlink
