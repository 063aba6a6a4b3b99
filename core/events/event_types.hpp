#pragma once

/**
 * @file event_types.hpp
 * @brief Typed notifications published by the device fleet core
 *
 * Events are plain value types delivered through EventEmitter. Consumers
 * (runtime, UI adapters, tests) poll their Subscription instead of being
 * called back on the publishing thread.
 *
 * Timestamps are epoch milliseconds.
 */

#include <chrono>
#include <cstdint>
#include <string>
#include <variant>

namespace lcdlink {
namespace events {

inline int64_t now_epoch_ms() {
    return std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

/**
 * @brief A matching device appeared and a handle was opened for it
 */
struct DeviceAttachedEvent {
    uint64_t event_id = 0;
    std::string path;
    std::string serial_number;
    std::string product;
    int64_t timestamp_ms = 0;
};

/**
 * @brief A device disappeared (or monitoring stopped) and its handle was invalidated
 */
struct DeviceDetachedEvent {
    uint64_t event_id = 0;
    std::string path;
    std::string serial_number;
    int64_t timestamp_ms = 0;
};

/**
 * @brief Transport-level failure unrelated to detach
 *
 * The device stays registered; the consumer decides whether to drop it.
 */
struct DeviceErrorEvent {
    uint64_t event_id = 0;
    std::string path;
    std::string message;
    int64_t timestamp_ms = 0;
};

// One keep-alive fan-out completed
struct KeepAliveTickEvent {
    uint64_t event_id = 0;
    size_t succeeded = 0;
    size_t total = 0;
    int64_t timestamp_ms = 0;
};

// A streamed frame left the device-side double buffer and is now visible
struct FrameDisplayedEvent {
    uint64_t event_id = 0;
    std::string path;
    uint64_t frame_index = 0;
    uint8_t transfer_id = 0;
    int64_t timestamp_ms = 0;
};

// Suspend media slot was written, cleared or reconciled
struct MediaSlotChangedEvent {
    uint64_t event_id = 0;
    std::string path;
    int slot = -1;  // -1 = every slot (clear all)
    bool occupied = false;
    std::string file_name;
    int64_t timestamp_ms = 0;
};

using Event = std::variant<DeviceAttachedEvent, DeviceDetachedEvent, DeviceErrorEvent, KeepAliveTickEvent,
                           FrameDisplayedEvent, MediaSlotChangedEvent>;

inline uint64_t get_event_id(const Event &event) {
    return std::visit([](auto &&e) { return e.event_id; }, event);
}

inline int64_t get_timestamp_ms(const Event &event) {
    return std::visit([](auto &&e) { return e.timestamp_ms; }, event);
}

/**
 * @brief Bit flags naming each event alternative, used by EventFilter
 */
enum class EventKind : uint32_t {
    DeviceAttached = 1u << 0,
    DeviceDetached = 1u << 1,
    DeviceError = 1u << 2,
    KeepAliveTick = 1u << 3,
    FrameDisplayed = 1u << 4,
    MediaSlotChanged = 1u << 5,
};

constexpr uint32_t kAllEventKinds = 0x3Fu;

constexpr uint32_t kind_bit(EventKind kind) { return static_cast<uint32_t>(kind); }

EventKind event_kind(const Event &event);
const char *event_kind_name(EventKind kind);

inline const char *event_type_name(const Event &event) { return event_kind_name(event_kind(event)); }

}  // namespace events
}  // namespace lcdlink
