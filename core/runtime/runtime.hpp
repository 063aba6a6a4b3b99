#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

#include "config.hpp"
#include "control/device_controller.hpp"
#include "events/event_emitter.hpp"
#include "fanout/fan_out_executor.hpp"
#include "keepalive/keep_alive_scheduler.hpp"
#include "media/json_media_index.hpp"
#include "media/suspend_media_manager.hpp"
#include "registry/device_registry.hpp"
#include "streaming/streaming_engine.hpp"
#include "sync/cancellation_token.hpp"
#include "transport/command_transport.hpp"
#include "transport/i_device_enumerator.hpp"

namespace lcdlink {
namespace runtime {

class Runtime {
public:
    // Uses the hidapi enumerator
    explicit Runtime(const RuntimeConfig &config);
    Runtime(const RuntimeConfig &config, std::unique_ptr<transport::IDeviceEnumerator> enumerator);
    ~Runtime();

    // Builds every service; nothing talks to devices yet
    bool initialize(std::string &error);

    // Starts monitoring and keep-alive, then dispatches events until stop() or a signal
    void run();

    // Triggers the main loop to exit
    void stop() { running_ = false; }

    // Stops streams, keep-alive and monitoring. Idempotent.
    void shutdown();

    // Brightness for every attached device, one result per device
    fanout::FanOutResult<control::CommandResult> set_brightness_all(int value);

    registry::DeviceRegistry &get_registry() { return *registry_; }
    control::DeviceController &get_controller() { return *controller_; }
    streaming::StreamingEngine &get_streaming() { return *streaming_; }
    keepalive::KeepAliveScheduler &get_keep_alive() { return *keep_alive_; }
    fanout::FanOutExecutor &get_executor() { return *executor_; }
    events::EventEmitter &get_event_emitter() { return *event_emitter_; }

    // nullptr when media is disabled
    media::SuspendMediaManager *get_media_manager() { return media_manager_.get(); }

    // Dispatches one event (exposed for the event loop and tests)
    void handle_event(const events::Event &event);

    bool is_streaming(const std::string &path) const;

private:
    struct StreamTask {
        sync::CancellationSource cancel;
        std::thread thread;
    };

    bool init_core_services(std::string &error);
    bool init_media(std::string &error);

    void on_attached(const events::DeviceAttachedEvent &event);
    void on_detached(const events::DeviceDetachedEvent &event);

    void start_stream(const std::shared_ptr<device::DeviceHandle> &handle);
    void stop_stream(const std::string &path);
    void stop_all_streams();

    RuntimeConfig config_;

    // Destroyed bottom-up; each service borrows the ones declared above it
    std::unique_ptr<transport::IDeviceEnumerator> enumerator_;
    std::shared_ptr<events::EventEmitter> event_emitter_;
    std::unique_ptr<transport::CommandTransport> transport_;
    std::unique_ptr<control::DeviceController> controller_;
    std::unique_ptr<fanout::FanOutExecutor> executor_;
    std::unique_ptr<registry::DeviceRegistry> registry_;
    std::unique_ptr<keepalive::KeepAliveScheduler> keep_alive_;
    std::unique_ptr<streaming::StreamingEngine> streaming_;
    std::unique_ptr<media::JsonMediaIndex> media_index_;
    std::unique_ptr<media::SuspendMediaManager> media_manager_;
    std::unique_ptr<events::Subscription> subscription_;

    mutable std::mutex streams_mutex_;
    std::map<std::string, std::unique_ptr<StreamTask>> streams_;

    std::atomic<bool> running_{false};
    std::atomic<bool> shut_down_{false};
};

}  // namespace runtime
}  // namespace lcdlink
