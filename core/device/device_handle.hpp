#pragma once

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

#include "device/device_identity.hpp"
#include "transport/i_report_io.hpp"

namespace lcdlink {
namespace device {

// Host-side view of per-device session settings
struct SessionState {
    int brightness = -1;  // -1 until set or read
    int rotation = 0;
    int keep_alive_timeout_s = 0;
    bool streaming_active = false;
    bool suspend_mode = false;
    int64_t last_keep_alive_ms = 0;  // Epoch ms of the last acknowledged keep-alive
};

// Owns the open report endpoint of one attached device.
//
// Thread Safety:
// - The channel mutex serializes whole command round-trips (one outstanding request per device)
// - Session state has its own small mutex and is returned by value
// - invalidate() may be called from any thread; in-flight calls observe it and fail
class DeviceHandle {
public:
    DeviceHandle(DeviceIdentity identity, std::unique_ptr<transport::IReportIo> io);
    ~DeviceHandle();

    DeviceHandle(const DeviceHandle &) = delete;
    DeviceHandle &operator=(const DeviceHandle &) = delete;

    const DeviceIdentity &identity() const { return identity_; }
    const std::string &path() const { return identity_.path; }

    bool is_valid() const { return valid_.load(std::memory_order_acquire); }

    // Marks the handle unusable and closes the endpoint once any in-flight call finishes
    void invalidate();

    // Exclusive access to the endpoint for one round-trip
    std::unique_lock<std::mutex> lock_channel() { return std::unique_lock<std::mutex>(channel_mutex_); }

    // Requires lock_channel() to be held
    transport::IReportIo &io() { return *io_; }

    // 1, 2, ... wrapping back to 1 at 0xFFFFFFFE. Requires lock_channel().
    uint32_t next_sequence_number();

    SessionState session() const;
    void set_brightness(int value);
    void set_rotation(int degrees);
    void set_keep_alive_timeout(int seconds);
    void set_suspend_mode(bool active);
    void record_keep_alive(int64_t timestamp_ms);

    // At most one streaming session per handle
    bool try_begin_streaming();
    void end_streaming();

private:
    const DeviceIdentity identity_;
    std::unique_ptr<transport::IReportIo> io_;
    std::atomic<bool> valid_{true};
    uint32_t sequence_number_ = 1;

    std::mutex channel_mutex_;
    mutable std::mutex session_mutex_;
    SessionState session_;
};

}  // namespace device
}  // namespace lcdlink
