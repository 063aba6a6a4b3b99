#include "device_handle.hpp"

#include <limits>

#include "logging/logger.hpp"

namespace lcdlink {
namespace device {

DeviceHandle::DeviceHandle(DeviceIdentity identity, std::unique_ptr<transport::IReportIo> io)
    : identity_(std::move(identity)), io_(std::move(io)) {
    if (!io_) {
        valid_.store(false, std::memory_order_release);
    }
}

DeviceHandle::~DeviceHandle() {
    if (io_ && io_->is_open()) {
        io_->close();
    }
}

void DeviceHandle::invalidate() {
    if (!valid_.exchange(false, std::memory_order_acq_rel)) {
        return;
    }

    LOG_DEBUG("[Device] Invalidating handle " << identity_.path);
    std::lock_guard<std::mutex> lock(channel_mutex_);
    if (io_) {
        io_->close();
    }
}

uint32_t DeviceHandle::next_sequence_number() {
    const uint32_t current = sequence_number_;
    ++sequence_number_;
    if (sequence_number_ == std::numeric_limits<uint32_t>::max() - 1) {
        sequence_number_ = 1;
    }
    return current;
}

SessionState DeviceHandle::session() const {
    std::lock_guard<std::mutex> lock(session_mutex_);
    return session_;
}

void DeviceHandle::set_brightness(int value) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.brightness = value;
}

void DeviceHandle::set_rotation(int degrees) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.rotation = degrees;
}

void DeviceHandle::set_keep_alive_timeout(int seconds) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.keep_alive_timeout_s = seconds;
}

void DeviceHandle::set_suspend_mode(bool active) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.suspend_mode = active;
}

void DeviceHandle::record_keep_alive(int64_t timestamp_ms) {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.last_keep_alive_ms = timestamp_ms;
}

bool DeviceHandle::try_begin_streaming() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    if (session_.streaming_active) {
        return false;
    }
    session_.streaming_active = true;
    return true;
}

void DeviceHandle::end_streaming() {
    std::lock_guard<std::mutex> lock(session_mutex_);
    session_.streaming_active = false;
}

}  // namespace device
}  // namespace lcdlink
