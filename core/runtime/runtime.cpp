#include "runtime.hpp"

#include <chrono>
#include <type_traits>
#include <vector>

#include "logging/logger.hpp"
#include "signal_handler.hpp"
#include "streaming/image_sequence_source.hpp"
#include "transport/hid_device_io.hpp"

namespace lcdlink {
namespace runtime {

Runtime::Runtime(const RuntimeConfig &config)
    : Runtime(config, std::make_unique<transport::HidDeviceEnumerator>()) {}

Runtime::Runtime(const RuntimeConfig &config, std::unique_ptr<transport::IDeviceEnumerator> enumerator)
    : config_(config), enumerator_(std::move(enumerator)) {}

Runtime::~Runtime() { shutdown(); }

bool Runtime::initialize(std::string &error) {
    LOG_INFO("[Runtime] Initializing lcdlink");

    if (!init_core_services(error)) {
        return false;
    }

    if (!init_media(error)) {
        return false;
    }

    // Subscribe before monitoring starts so the first attach events are seen
    // Frame events arrive at stream rate and are not needed here
    auto filter = events::EventFilter::all().excluding(events::EventKind::FrameDisplayed);
    subscription_ = event_emitter_->subscribe(filter, 256, "runtime");
    if (!subscription_) {
        error = "Cannot subscribe runtime to device events";
        return false;
    }

    LOG_INFO("[Runtime] Initialization complete");
    return true;
}

bool Runtime::init_core_services(std::string &error) {
    if (!enumerator_) {
        error = "No device enumerator";
        return false;
    }

    event_emitter_ = std::make_shared<events::EventEmitter>(100, 32);
    LOG_INFO("[Runtime] Event emitter created (max " << event_emitter_->max_subscribers() << " subscribers)");

    transport_ = std::make_unique<transport::CommandTransport>(static_cast<size_t>(config_.transport.block_size));
    controller_ = std::make_unique<control::DeviceController>(
        *transport_, std::chrono::milliseconds(config_.transport.command_timeout_ms));

    executor_ = std::make_unique<fanout::FanOutExecutor>(std::chrono::milliseconds(config_.fanout.timeout_ms));

    registry::DeviceFilter filter;
    filter.vendor_id = config_.device.vendor_id;
    filter.product_id = config_.device.product_id;
    registry_ = std::make_unique<registry::DeviceRegistry>(
        *enumerator_, event_emitter_, filter, std::chrono::milliseconds(config_.device.monitor_interval_ms));

    auto *registry = registry_.get();
    keep_alive_ = std::make_unique<keepalive::KeepAliveScheduler>(
        [registry]() { return registry->get_active_devices(); }, *controller_, *executor_, event_emitter_);

    streaming::StreamingConfig streaming_config;
    streaming_config.buffer_depth = static_cast<size_t>(config_.streaming.buffer_depth);
    streaming_config.ids.first_rotating = static_cast<uint8_t>(config_.streaming.reserved_transfer_ids);
    streaming_config.ids.last_rotating = static_cast<uint8_t>(config_.streaming.max_transfer_id);
    streaming_config.brightness = config_.streaming.brightness;
    streaming_config.device_timeout_s = config_.keep_alive.device_timeout_s;
    streaming_config.wake_before_enable = config_.streaming.wake_before_enable;
    streaming_config.max_consecutive_failures = config_.streaming.max_consecutive_failures;

    if (!streaming::validate_window(streaming_config.ids, streaming_config.buffer_depth, error)) {
        return false;
    }
    streaming_ = std::make_unique<streaming::StreamingEngine>(*controller_, streaming_config, event_emitter_);

    return true;
}

bool Runtime::init_media(std::string &error) {
    if (!config_.media.enabled) {
        LOG_INFO("[Runtime] Suspend media disabled in config");
        return true;
    }

    media_index_ = std::make_unique<media::JsonMediaIndex>(config_.media.index_path);
    if (!media_index_->load()) {
        error = "Media index load failed: " + media_index_->last_error();
        return false;
    }

    media::MediaConfig media_config;
    media_config.cache_dir = config_.media.cache_dir;
    media_config.reserved_transfer_ids = static_cast<uint8_t>(config_.streaming.reserved_transfer_ids);
    media_config.policy.reference_resolution = config_.media.reference_resolution;
    media_config.policy.max_bitrate_kbps = config_.media.max_bitrate_kbps;

    // No video transcoder ships with the runtime; files are sent as given
    media_manager_ = std::make_unique<media::SuspendMediaManager>(*controller_, *media_index_, media_config,
                                                                  nullptr, event_emitter_);
    LOG_INFO("[Runtime] Suspend media manager ready (cache " << config_.media.cache_dir << ")");
    return true;
}

void Runtime::run() {
    LOG_INFO("[Runtime] Starting main loop");
    running_ = true;

    if (!registry_->start_monitoring()) {
        LOG_ERROR("[Runtime] Device monitoring failed to start: " << registry_->last_error());
    }

    if (config_.keep_alive.enabled) {
        keep_alive_->start(std::chrono::milliseconds(config_.keep_alive.interval_ms));
    } else {
        LOG_INFO("[Runtime] Keep-alive disabled in config");
    }

    LOG_INFO("[Runtime] Press Ctrl+C to exit");

    while (running_) {
        auto event = subscription_->pop(100);
        if (event) {
            handle_event(*event);
        }

        if (SignalHandler::is_shutdown_requested()) {
            LOG_INFO("[Runtime] Signal received, stopping...");
            running_ = false;
        }
    }

    LOG_INFO("[Runtime] Shutting down");
    shutdown();
}

void Runtime::shutdown() {
    if (shut_down_.exchange(true)) {
        return;
    }

    stop_all_streams();

    if (keep_alive_) {
        keep_alive_->stop();
    }

    if (registry_) {
        registry_->stop_monitoring();
    }

    subscription_.reset();
}

void Runtime::handle_event(const events::Event &event) {
    std::visit(
        [this](const auto &e) {
            using T = std::decay_t<decltype(e)>;
            if constexpr (std::is_same_v<T, events::DeviceAttachedEvent>) {
                on_attached(e);
            } else if constexpr (std::is_same_v<T, events::DeviceDetachedEvent>) {
                on_detached(e);
            } else if constexpr (std::is_same_v<T, events::DeviceErrorEvent>) {
                LOG_WARN("[Runtime] Device error on " << e.path << ": " << e.message);
            } else if constexpr (std::is_same_v<T, events::KeepAliveTickEvent>) {
                if (e.succeeded < e.total) {
                    LOG_DEBUG("[Runtime] Keep-alive " << e.succeeded << "/" << e.total);
                }
            } else if constexpr (std::is_same_v<T, events::MediaSlotChangedEvent>) {
                LOG_DEBUG("[Runtime] Slot " << e.slot << " on " << e.path << (e.occupied ? " <- " : " cleared ")
                                            << e.file_name);
            }
        },
        event);
}

void Runtime::on_attached(const events::DeviceAttachedEvent &event) {
    LOG_INFO("[Runtime] Device attached: " << event.path << " (" << event.product << ", SN "
                                           << event.serial_number << ")");

    auto handle = registry_->get_device(event.path);
    if (!handle) {
        return;  // Detached again before the event was handled
    }

    if (media_manager_) {
        std::vector<media::SlotView> views;
        auto result = media_manager_->reconcile(*handle, views);
        if (!result.ok()) {
            registry_->report_error(event.path, "Suspend slot reconcile failed: " + result.error_message);
        } else {
            size_t occupied = 0;
            for (const auto &view : views) {
                occupied += view.occupied ? 1 : 0;
            }
            LOG_INFO("[Runtime] " << event.path << ": " << occupied << "/" << views.size()
                                  << " suspend slot(s) occupied");
        }
    }

    if (!config_.streaming.autostart_source.empty()) {
        start_stream(handle);
    }
}

void Runtime::on_detached(const events::DeviceDetachedEvent &event) {
    LOG_INFO("[Runtime] Device detached: " << event.path);
    stop_stream(event.path);
}

void Runtime::start_stream(const std::shared_ptr<device::DeviceHandle> &handle) {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    auto &slot = streams_[handle->path()];
    if (slot) {
        // Previous run finished (or is finishing); replace it
        slot->cancel.cancel();
        if (slot->thread.joinable()) {
            slot->thread.join();
        }
    }

    slot = std::make_unique<StreamTask>();
    const auto token = slot->cancel.token();
    const auto interval = std::chrono::milliseconds(config_.streaming.frame_interval_ms);
    const std::string source_dir = config_.streaming.autostart_source;
    const bool loop = config_.streaming.loop;
    auto *engine = streaming_.get();

    slot->thread = std::thread([engine, handle, token, interval, source_dir, loop]() {
        streaming::ImageSequenceSource source(source_dir, loop);
        auto result = engine->stream(*handle, source, interval, token);
        if (!result.ok()) {
            LOG_WARN("[Runtime] Stream on " << handle->path() << " ended "
                                            << streaming::stream_outcome_to_string(result.outcome) << ": "
                                            << result.error_message);
        }
    });
    LOG_INFO("[Runtime] Streaming " << source_dir << " to " << handle->path());
}

void Runtime::stop_stream(const std::string &path) {
    std::unique_ptr<StreamTask> task;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        auto it = streams_.find(path);
        if (it == streams_.end()) {
            return;
        }
        task = std::move(it->second);
        streams_.erase(it);
    }

    task->cancel.cancel();
    if (task->thread.joinable()) {
        task->thread.join();
    }
}

void Runtime::stop_all_streams() {
    std::map<std::string, std::unique_ptr<StreamTask>> tasks;
    {
        std::lock_guard<std::mutex> lock(streams_mutex_);
        tasks.swap(streams_);
    }

    for (auto &[path, task] : tasks) {
        task->cancel.cancel();
    }
    for (auto &[path, task] : tasks) {
        if (task->thread.joinable()) {
            task->thread.join();
        }
    }
}

bool Runtime::is_streaming(const std::string &path) const {
    std::lock_guard<std::mutex> lock(streams_mutex_);
    return streams_.count(path) > 0;
}

fanout::FanOutResult<control::CommandResult> Runtime::set_brightness_all(int value) {
    auto *controller = controller_.get();
    fanout::FanOutExecutor::Operation<control::CommandResult> operation =
        [controller, value](const fanout::FanOutExecutor::DevicePtr &device, const sync::CancellationToken &) {
            return controller->set_brightness(*device, value);
        };
    fanout::FanOutExecutor::Classifier<control::CommandResult> classify = [](const control::CommandResult &result,
                                                                            std::string &error) {
        error = result.error_message;
        return result.ok();
    };

    auto result = executor_->run_on_all<control::CommandResult>(registry_->get_active_devices(), operation,
                                                                executor_->default_timeout(), classify);
    LOG_INFO("[Runtime] Brightness " << value << " applied on " << result.succeeded() << "/" << result.total()
                                     << " device(s)");
    return result;
}

}  // namespace runtime
}  // namespace lcdlink
