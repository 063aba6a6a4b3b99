#pragma once

/**
 * @file event_emitter.hpp
 * @brief Thread-safe fan-out event dispatcher with per-subscriber queues
 *
 * - Publishers (registry monitor, keep-alive scheduler, streaming loops) call emit()
 * - Each subscriber owns a bounded queue; overflow drops the oldest event
 * - emit() never blocks on a slow consumer
 */

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <initializer_list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

#include "event_types.hpp"

namespace lcdlink {
namespace events {

/**
 * @brief Bounded event queue for a single subscriber
 */
class SubscriberQueue {
public:
    explicit SubscriberQueue(size_t max_size, const std::string &name = "");

    // Never blocks. Returns false if the oldest event had to be dropped.
    bool push(const Event &event);

    // Waits up to timeout_ms (0 = non-blocking)
    std::optional<Event> pop(int timeout_ms = 0);

    size_t size() const;
    size_t dropped_count() const;

    // Wakes waiting consumers; pop() then drains remaining events and returns nullopt
    void close();
    bool is_closed() const;

private:
    const size_t max_size_;
    const std::string name_;

    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<Event> queue_;
    size_t dropped_count_ = 0;
    bool closed_ = false;
};

/**
 * @brief RAII subscription handle, unsubscribes on destruction
 */
class Subscription {
public:
    using SubscriptionId = uint64_t;

    Subscription(SubscriptionId id, std::shared_ptr<SubscriberQueue> queue,
                 std::function<void(SubscriptionId)> unsubscribe_fn);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    std::optional<Event> pop(int timeout_ms = 100);
    std::optional<Event> try_pop() { return pop(0); }

    SubscriptionId id() const { return id_; }
    bool is_active() const;
    size_t queue_size() const;
    size_t dropped_count() const;

    void unsubscribe();

private:
    SubscriptionId id_;
    std::shared_ptr<SubscriberQueue> queue_;
    std::function<void(SubscriptionId)> unsubscribe_fn_;
};

/**
 * @brief Restricts a subscription by device path and event kind
 *
 * An empty path matches every device. Fleet-wide events (keep-alive ticks)
 * carry no path and pass any path restriction; the kind mask still applies.
 */
struct EventFilter {
    std::string path;
    uint32_t kinds = kAllEventKinds;

    bool matches(const Event &event) const;

    EventFilter excluding(EventKind kind) const {
        EventFilter copy = *this;
        copy.kinds &= ~kind_bit(kind);
        return copy;
    }

    static EventFilter all() { return EventFilter{}; }
    static EventFilter for_device(const std::string &device_path) { return EventFilter{device_path, kAllEventKinds}; }
    static EventFilter of_kinds(std::initializer_list<EventKind> wanted) {
        EventFilter filter;
        filter.kinds = 0;
        for (EventKind kind : wanted) {
            filter.kinds |= kind_bit(kind);
        }
        return filter;
    }
};

class EventEmitter {
public:
    using SubscriptionId = Subscription::SubscriptionId;

    /**
     * @param default_queue_size Max events per subscriber queue
     * @param max_subscribers Concurrent subscriber limit (0 = unlimited)
     */
    explicit EventEmitter(size_t default_queue_size = 100, size_t max_subscribers = 32);
    ~EventEmitter();

    EventEmitter(const EventEmitter &) = delete;
    EventEmitter &operator=(const EventEmitter &) = delete;

    /**
     * @return Subscription, or nullptr if the subscriber limit is reached
     */
    std::unique_ptr<Subscription> subscribe(const EventFilter &filter = EventFilter::all(), size_t queue_size = 0,
                                            const std::string &name = "");

    // Assigns a monotonic event_id and copies the event to every matching queue
    void emit(Event event);

    size_t subscriber_count() const;
    size_t max_subscribers() const { return max_subscribers_; }

private:
    void unsubscribe(SubscriptionId id);

    struct SubscriberInfo {
        std::shared_ptr<SubscriberQueue> queue;
        EventFilter filter;
        std::string name;
    };

    const size_t default_queue_size_;
    const size_t max_subscribers_;

    mutable std::mutex mutex_;
    std::unordered_map<SubscriptionId, SubscriberInfo> subscribers_;
    SubscriptionId next_subscription_id_ = 1;
    uint64_t next_event_id_ = 1;

    // Shared with outstanding Subscriptions so they can outlive the emitter safely
    std::shared_ptr<std::atomic<bool>> alive_;
};

}  // namespace events
}  // namespace lcdlink
