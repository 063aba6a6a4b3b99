#include "cancellation_token.hpp"

#include <thread>

namespace lcdlink {
namespace sync {

bool CancellationToken::is_cancelled() const {
    if (!state_) {
        return false;
    }
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

bool CancellationToken::wait_for(std::chrono::milliseconds duration) const {
    return wait_until(std::chrono::steady_clock::now() + duration);
}

bool CancellationToken::wait_until(std::chrono::steady_clock::time_point deadline) const {
    if (!state_) {
        std::this_thread::sleep_until(deadline);
        return false;
    }
    std::unique_lock<std::mutex> lock(state_->mutex);
    return state_->cv.wait_until(lock, deadline, [this] { return state_->cancelled; });
}

CancellationSource::CancellationSource() : state_(std::make_shared<detail::CancellationState>()) {}

void CancellationSource::cancel() {
    {
        std::lock_guard<std::mutex> lock(state_->mutex);
        state_->cancelled = true;
    }
    state_->cv.notify_all();
}

bool CancellationSource::is_cancelled() const {
    std::lock_guard<std::mutex> lock(state_->mutex);
    return state_->cancelled;
}

}  // namespace sync
}  // namespace lcdlink
