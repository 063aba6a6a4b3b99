#include "event_emitter.hpp"

#include <chrono>
#include <type_traits>
#include <utility>
#include <vector>

#include "logging/logger.hpp"

namespace lcdlink {
namespace events {

EventKind event_kind(const Event &event) {
    switch (event.index()) {
        case 0:
            return EventKind::DeviceAttached;
        case 1:
            return EventKind::DeviceDetached;
        case 2:
            return EventKind::DeviceError;
        case 3:
            return EventKind::KeepAliveTick;
        case 4:
            return EventKind::FrameDisplayed;
        default:
            return EventKind::MediaSlotChanged;
    }
}

const char *event_kind_name(EventKind kind) {
    switch (kind) {
        case EventKind::DeviceAttached:
            return "DeviceAttached";
        case EventKind::DeviceDetached:
            return "DeviceDetached";
        case EventKind::DeviceError:
            return "DeviceError";
        case EventKind::KeepAliveTick:
            return "KeepAliveTick";
        case EventKind::FrameDisplayed:
            return "FrameDisplayed";
        case EventKind::MediaSlotChanged:
            return "MediaSlotChanged";
    }
    return "Unknown";
}

// ----------------------------------------------------------------------------
// SubscriberQueue
// ----------------------------------------------------------------------------

SubscriberQueue::SubscriberQueue(size_t max_size, const std::string &name) : max_size_(max_size), name_(name) {}

bool SubscriberQueue::push(const Event &event) {
    size_t dropped_now = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            return false;
        }
        while (max_size_ > 0 && queue_.size() >= max_size_) {
            queue_.pop_front();
            ++dropped_count_;
            dropped_now = dropped_count_;
        }
        queue_.push_back(event);
    }
    cv_.notify_one();

    if (dropped_now == 0) {
        return true;
    }
    // First drop, then every hundredth
    if (dropped_now % 100 == 1) {
        LOG_WARN("[Events] Queue '" << name_ << "' full, " << dropped_now << " events dropped so far");
    }
    return false;
}

std::optional<Event> SubscriberQueue::pop(int timeout_ms) {
    std::unique_lock<std::mutex> lock(mutex_);
    if (queue_.empty() && timeout_ms > 0 && !closed_) {
        cv_.wait_for(lock, std::chrono::milliseconds(timeout_ms), [this] { return closed_ || !queue_.empty(); });
    }
    if (queue_.empty()) {
        return std::nullopt;
    }
    std::optional<Event> next(std::move(queue_.front()));
    queue_.pop_front();
    return next;
}

size_t SubscriberQueue::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

size_t SubscriberQueue::dropped_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return dropped_count_;
}

void SubscriberQueue::close() {
    std::unique_lock<std::mutex> lock(mutex_);
    closed_ = true;
    lock.unlock();
    cv_.notify_all();
}

bool SubscriberQueue::is_closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

// ----------------------------------------------------------------------------
// Subscription
// ----------------------------------------------------------------------------

Subscription::Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                           std::function<void(SubscriptionId)> unsubscribe_fn)
    : id_(id), queue_(std::move(queue)), unsubscribe_fn_(std::move(unsubscribe_fn)) {}

Subscription::~Subscription() { unsubscribe(); }

Subscription::Subscription(Subscription &&other) noexcept
    : id_(std::exchange(other.id_, 0)),
      queue_(std::move(other.queue_)),
      unsubscribe_fn_(std::move(other.unsubscribe_fn_)) {}

Subscription &Subscription::operator=(Subscription &&other) noexcept {
    if (this == &other) {
        return *this;
    }
    unsubscribe();
    id_ = std::exchange(other.id_, 0);
    queue_ = std::move(other.queue_);
    unsubscribe_fn_ = std::move(other.unsubscribe_fn_);
    return *this;
}

std::optional<Event> Subscription::pop(int timeout_ms) {
    return queue_ ? queue_->pop(timeout_ms) : std::nullopt;
}

bool Subscription::is_active() const { return queue_ && !queue_->is_closed(); }

size_t Subscription::queue_size() const { return queue_ ? queue_->size() : 0; }

size_t Subscription::dropped_count() const { return queue_ ? queue_->dropped_count() : 0; }

void Subscription::unsubscribe() {
    if (id_ == 0) {
        return;
    }
    const SubscriptionId id = std::exchange(id_, 0);
    if (unsubscribe_fn_) {
        unsubscribe_fn_(id);
    }
    if (queue_) {
        queue_->close();
    }
}

// ----------------------------------------------------------------------------
// EventFilter
// ----------------------------------------------------------------------------

bool EventFilter::matches(const Event &event) const {
    if ((kinds & kind_bit(event_kind(event))) == 0) {
        return false;
    }
    if (path.empty()) {
        return true;
    }
    return std::visit(
        [this](const auto &e) -> bool {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, KeepAliveTickEvent>) {
                return true;
            } else {
                return e.path == path;
            }
        },
        event);
}

// ----------------------------------------------------------------------------
// EventEmitter
// ----------------------------------------------------------------------------

EventEmitter::EventEmitter(size_t default_queue_size, size_t max_subscribers)
    : default_queue_size_(default_queue_size),
      max_subscribers_(max_subscribers),
      alive_(std::make_shared<std::atomic<bool>>(true)) {}

EventEmitter::~EventEmitter() {
    alive_->store(false);
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto &entry : subscribers_) {
        entry.second.queue->close();
    }
    subscribers_.clear();
}

std::unique_ptr<Subscription> EventEmitter::subscribe(const EventFilter &filter, size_t queue_size,
                                                      const std::string &name) {
    const size_t capacity = queue_size > 0 ? queue_size : default_queue_size_;
    auto queue = std::make_shared<SubscriberQueue>(capacity, name);
    SubscriptionId id = 0;
    size_t total = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        total = subscribers_.size();
        if (max_subscribers_ == 0 || total < max_subscribers_) {
            id = next_subscription_id_++;
            subscribers_.emplace(id, SubscriberInfo{queue, filter, name});
            ++total;
        }
    }

    if (id == 0) {
        LOG_WARN("[Events] Subscriber limit " << max_subscribers_ << " reached, rejecting '" << name << "'");
        return nullptr;
    }
    LOG_DEBUG("[Events] Subscribed #" << id << (name.empty() ? std::string() : " '" + name + "'") << " ("
                                      << total << " active)");

    // The emitter may be destroyed first; the weak flag turns unsubscribe into a no-op then
    std::weak_ptr<std::atomic<bool>> alive = alive_;
    return std::make_unique<Subscription>(id, std::move(queue), [this, alive](SubscriptionId sub_id) {
        auto flag = alive.lock();
        if (flag && flag->load()) {
            unsubscribe(sub_id);
        }
    });
}

void EventEmitter::emit(Event event) {
    std::vector<std::shared_ptr<SubscriberQueue>> targets;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        const uint64_t event_id = next_event_id_++;
        std::visit([event_id](auto &e) { e.event_id = event_id; }, event);

        targets.reserve(subscribers_.size());
        for (const auto &entry : subscribers_) {
            if (entry.second.filter.matches(event)) {
                targets.push_back(entry.second.queue);
            }
        }
    }

    // Delivered outside the lock so a full queue never stalls other publishers
    for (const auto &queue : targets) {
        queue->push(event);
    }
}

size_t EventEmitter::subscriber_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return subscribers_.size();
}

void EventEmitter::unsubscribe(SubscriptionId id) {
    std::shared_ptr<SubscriberQueue> removed;
    size_t remaining = 0;

    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = subscribers_.find(id);
        if (it == subscribers_.end()) {
            return;
        }
        removed = std::move(it->second.queue);
        subscribers_.erase(it);
        remaining = subscribers_.size();
    }

    removed->close();
    LOG_DEBUG("[Events] Unsubscribed #" << id << " (" << remaining << " active)");
}

}  // namespace events
}  // namespace lcdlink
