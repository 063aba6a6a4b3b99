#ifndef LCDLINK_REGISTRY_DEVICE_REGISTRY_HPP
#define LCDLINK_REGISTRY_DEVICE_REGISTRY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

#include "device/device_handle.hpp"
#include "events/event_emitter.hpp"
#include "sync/cancellation_token.hpp"
#include "transport/i_device_enumerator.hpp"

namespace lcdlink {
namespace registry {

// Vendor/product pair a device must match to be registered
struct DeviceFilter {
    uint16_t vendor_id = 0x2516;
    uint16_t product_id = 0x0228;
};

// Device Registry - live set of handles for attached displays
/**
 * Thread Safety:
 * - Reads use shared_lock and return snapshots (shared_ptr copies), so iterating
 *   after a concurrent detach never faults; detached handles fail with DeviceUnavailable
 * - refresh() passes are serialized; enumeration and opening happen outside the map lock
 * - At most one handle per path is ever registered
 *
 * Lifecycle:
 * - start_monitoring() enumerates once synchronously, then polls every interval
 * - stop_monitoring() joins the poller and closes every handle without emitting events
 */
class DeviceRegistry {
public:
    DeviceRegistry(transport::IDeviceEnumerator &enumerator, std::shared_ptr<events::EventEmitter> emitter,
                   DeviceFilter filter = DeviceFilter{},
                   std::chrono::milliseconds poll_interval = std::chrono::milliseconds(1000));
    ~DeviceRegistry();

    DeviceRegistry(const DeviceRegistry &) = delete;
    DeviceRegistry &operator=(const DeviceRegistry &) = delete;

    // Idempotent: returns true if monitoring is (now) active
    bool start_monitoring();

    // Idempotent
    void stop_monitoring();

    bool is_monitoring() const { return monitoring_.load(); }

    // One enumerate-and-diff pass. Emits attach/detach events for the changes.
    bool refresh();

    // Snapshot in attach order
    std::vector<std::shared_ptr<device::DeviceHandle>> get_active_devices() const;
    std::shared_ptr<device::DeviceHandle> get_device(const std::string &path) const;
    size_t device_count() const;

    // Surfaces a transport failure. The device stays registered.
    void report_error(const std::string &path, const std::string &message);

    // Caller-driven removal after an error: closes the handle and emits DeviceDetached.
    // A device that is still enumerated is re-opened with a fresh handle on the next refresh.
    bool remove_device(const std::string &path);

    std::string last_error() const;

private:
    void monitor_loop(sync::CancellationToken token);
    void detach(const std::shared_ptr<device::DeviceHandle> &handle);
    void set_error(const std::string &error);

    transport::IDeviceEnumerator &enumerator_;
    std::shared_ptr<events::EventEmitter> emitter_;
    const DeviceFilter filter_;
    const std::chrono::milliseconds poll_interval_;

    std::vector<std::shared_ptr<device::DeviceHandle>> devices_;
    mutable std::shared_mutex mutex_;

    // Serializes refresh passes and guards open_failures_
    std::mutex refresh_mutex_;
    std::set<std::string> open_failures_;  // Paths already reported as failing to open

    std::atomic<bool> monitoring_{false};
    std::mutex lifecycle_mutex_;
    std::unique_ptr<std::thread> monitor_thread_;
    std::unique_ptr<sync::CancellationSource> monitor_cancel_;

    mutable std::mutex error_mutex_;
    std::string error_;
};

}  // namespace registry
}  // namespace lcdlink

#endif  // LCDLINK_REGISTRY_DEVICE_REGISTRY_HPP
