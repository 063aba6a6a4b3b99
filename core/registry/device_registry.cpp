#include "device_registry.hpp"

#include <algorithm>

#include "logging/logger.hpp"

namespace lcdlink {
namespace registry {

DeviceRegistry::DeviceRegistry(transport::IDeviceEnumerator &enumerator,
                               std::shared_ptr<events::EventEmitter> emitter, DeviceFilter filter,
                               std::chrono::milliseconds poll_interval)
    : enumerator_(enumerator), emitter_(std::move(emitter)), filter_(filter), poll_interval_(poll_interval) {}

DeviceRegistry::~DeviceRegistry() { stop_monitoring(); }

bool DeviceRegistry::start_monitoring() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);
    if (monitoring_) {
        LOG_DEBUG("[Registry] Already monitoring");
        return true;
    }

    LOG_INFO("[Registry] Monitoring devices " << std::hex << "0x" << filter_.vendor_id << ":0x"
                                              << filter_.product_id << std::dec << " every "
                                              << poll_interval_.count() << "ms");

    if (!refresh()) {
        LOG_WARN("[Registry] Initial enumeration failed: " << last_error());
    }

    monitor_cancel_ = std::make_unique<sync::CancellationSource>();
    monitoring_ = true;
    monitor_thread_ = std::make_unique<std::thread>(&DeviceRegistry::monitor_loop, this, monitor_cancel_->token());
    return true;
}

void DeviceRegistry::stop_monitoring() {
    std::lock_guard<std::mutex> lifecycle(lifecycle_mutex_);

    if (monitoring_) {
        LOG_INFO("[Registry] Stopping device monitor");
        monitoring_ = false;
        monitor_cancel_->cancel();
        if (monitor_thread_ && monitor_thread_->joinable()) {
            monitor_thread_->join();
        }
        monitor_thread_.reset();
        monitor_cancel_.reset();
    }

    std::vector<std::shared_ptr<device::DeviceHandle>> closing;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        closing.swap(devices_);
    }
    for (auto &handle : closing) {
        handle->invalidate();
    }
    if (!closing.empty()) {
        LOG_INFO("[Registry] Closed " << closing.size() << " device handle(s)");
    }
}

void DeviceRegistry::monitor_loop(sync::CancellationToken token) {
    while (!token.wait_for(poll_interval_)) {
        if (!refresh()) {
            LOG_WARN("[Registry] Enumeration failed: " << last_error());
        }
    }
}

bool DeviceRegistry::refresh() {
    std::lock_guard<std::mutex> refresh_lock(refresh_mutex_);

    std::vector<device::DeviceIdentity> found;
    if (!enumerator_.enumerate(filter_.vendor_id, filter_.product_id, found)) {
        set_error("Enumeration failed: " + enumerator_.last_error());
        return false;
    }

    // Some platforms list one device per interface; keep the first entry per path
    std::set<std::string> present;
    std::vector<device::DeviceIdentity> unique_found;
    for (auto &identity : found) {
        if (present.insert(identity.path).second) {
            unique_found.push_back(std::move(identity));
        }
    }

    std::vector<std::shared_ptr<device::DeviceHandle>> gone;
    std::set<std::string> known;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = std::stable_partition(devices_.begin(), devices_.end(), [&present](const auto &handle) {
            return present.count(handle->path()) > 0;
        });
        gone.assign(it, devices_.end());
        devices_.erase(it, devices_.end());
        for (const auto &handle : devices_) {
            known.insert(handle->path());
        }
    }

    for (const auto &handle : gone) {
        detach(handle);
    }

    for (auto it = open_failures_.begin(); it != open_failures_.end();) {
        it = present.count(*it) ? std::next(it) : open_failures_.erase(it);
    }

    for (const auto &identity : unique_found) {
        if (known.count(identity.path)) {
            continue;
        }

        // Open outside the map lock (may block on the OS)
        auto io = enumerator_.open(identity);
        if (!io) {
            const std::string message = "Failed to open device: " + enumerator_.last_error();
            if (open_failures_.insert(identity.path).second) {
                LOG_WARN("[Registry] " << identity.path << ": " << message);
                report_error(identity.path, message);
            }
            continue;
        }
        open_failures_.erase(identity.path);

        auto handle = std::make_shared<device::DeviceHandle>(identity, std::move(io));
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            devices_.push_back(handle);
        }

        LOG_INFO("[Registry] Attached: " << identity.path << " (serial '" << identity.serial_number << "', "
                                         << identity.product << ")");
        if (emitter_) {
            events::DeviceAttachedEvent event;
            event.path = identity.path;
            event.serial_number = identity.serial_number;
            event.product = identity.product;
            event.timestamp_ms = events::now_epoch_ms();
            emitter_->emit(event);
        }
    }

    return true;
}

void DeviceRegistry::detach(const std::shared_ptr<device::DeviceHandle> &handle) {
    handle->invalidate();
    LOG_INFO("[Registry] Detached: " << handle->path());

    if (emitter_) {
        events::DeviceDetachedEvent event;
        event.path = handle->path();
        event.serial_number = handle->identity().serial_number;
        event.timestamp_ms = events::now_epoch_ms();
        emitter_->emit(event);
    }
}

std::vector<std::shared_ptr<device::DeviceHandle>> DeviceRegistry::get_active_devices() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_;
}

std::shared_ptr<device::DeviceHandle> DeviceRegistry::get_device(const std::string &path) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    for (const auto &handle : devices_) {
        if (handle->path() == path) {
            return handle;
        }
    }
    return nullptr;
}

size_t DeviceRegistry::device_count() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return devices_.size();
}

void DeviceRegistry::report_error(const std::string &path, const std::string &message) {
    LOG_WARN("[Registry] Device error on " << path << ": " << message);
    if (emitter_) {
        events::DeviceErrorEvent event;
        event.path = path;
        event.message = message;
        event.timestamp_ms = events::now_epoch_ms();
        emitter_->emit(event);
    }
}

bool DeviceRegistry::remove_device(const std::string &path) {
    std::shared_ptr<device::DeviceHandle> removed;
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        auto it = std::find_if(devices_.begin(), devices_.end(),
                               [&path](const auto &handle) { return handle->path() == path; });
        if (it == devices_.end()) {
            return false;
        }
        removed = *it;
        devices_.erase(it);
    }
    detach(removed);
    return true;
}

void DeviceRegistry::set_error(const std::string &error) {
    std::lock_guard<std::mutex> lock(error_mutex_);
    error_ = error;
}

std::string DeviceRegistry::last_error() const {
    std::lock_guard<std::mutex> lock(error_mutex_);
    return error_;
}

}  // namespace registry
}  // namespace lcdlink
