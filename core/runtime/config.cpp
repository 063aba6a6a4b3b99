#include "config.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>
#include <vector>

#include "logging/logger.hpp"

namespace lcdlink {
namespace runtime {

namespace {

template <typename T>
void read_key(const YAML::Node &section, const char *key, T &value) {
    if (section[key]) {
        value = section[key].as<T>();
    }
}

}  // namespace

bool validate_config(const RuntimeConfig &config, std::string &error) {
    // Device settings
    if (config.device.vendor_id == 0) {
        error = "device.vendor_id must be non-zero";
        return false;
    }
    if (config.device.monitor_interval_ms < 100) {
        error = "device.monitor_interval_ms must be >= 100ms";
        return false;
    }

    // Transport settings
    if (config.transport.command_timeout_ms < 100) {
        error = "transport.command_timeout_ms must be >= 100ms";
        return false;
    }
    if (config.transport.block_size < 1 || config.transport.block_size > 1000) {
        error = "transport.block_size must be between 1 and 1000";
        return false;
    }

    // Keep-alive settings
    if (config.keep_alive.interval_ms < 100) {
        error = "keep_alive.interval_ms must be >= 100ms";
        return false;
    }
    if (config.keep_alive.device_timeout_s < 1) {
        error = "keep_alive.device_timeout_s must be >= 1";
        return false;
    }
    if (static_cast<long long>(config.keep_alive.device_timeout_s) * 1000 <
        10LL * config.keep_alive.interval_ms) {
        error = "keep_alive.device_timeout_s (" + std::to_string(config.keep_alive.device_timeout_s) +
                "s) must be at least 10x keep_alive.interval_ms (" + std::to_string(config.keep_alive.interval_ms) +
                "ms)";
        return false;
    }

    // Streaming settings
    const auto &s = config.streaming;
    if (s.buffer_depth < 1) {
        error = "streaming.buffer_depth must be >= 1";
        return false;
    }
    if (s.reserved_transfer_ids < 1) {
        error = "streaming.reserved_transfer_ids must be >= 1";
        return false;
    }
    if (s.max_transfer_id > 59 || s.max_transfer_id < s.reserved_transfer_ids) {
        error = "streaming.max_transfer_id must be between reserved_transfer_ids and 59";
        return false;
    }
    if (s.max_transfer_id - s.reserved_transfer_ids + 1 <= s.buffer_depth) {
        error = "streaming transfer id window must hold more ids than buffer_depth";
        return false;
    }
    if (s.brightness < 0 || s.brightness > 100) {
        error = "streaming.brightness must be between 0 and 100";
        return false;
    }
    if (s.frame_interval_ms < 1) {
        error = "streaming.frame_interval_ms must be >= 1";
        return false;
    }
    if (s.max_consecutive_failures < 1) {
        error = "streaming.max_consecutive_failures must be >= 1";
        return false;
    }

    // Media settings
    if (config.media.enabled) {
        if (config.media.cache_dir.empty()) {
            error = "media.cache_dir must not be empty";
            return false;
        }
        if (config.media.reference_resolution < 1) {
            error = "media.reference_resolution must be >= 1";
            return false;
        }
        if (config.media.max_bitrate_kbps < 0) {
            error = "media.max_bitrate_kbps must be >= 0";
            return false;
        }
    }

    if (config.fanout.timeout_ms < 1) {
        error = "fanout.timeout_ms must be >= 1";
        return false;
    }

    // Logging settings
    if (config.logging.level != "debug" && config.logging.level != "info" && config.logging.level != "warn" &&
        config.logging.level != "error") {
        error = "Invalid log level: " + config.logging.level;
        return false;
    }

    return true;
}

bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error) {
    try {
        YAML::Node yaml = YAML::LoadFile(config_path);

        // Check for unknown top-level keys
        const std::vector<std::string> valid_keys = {"device", "transport", "keep_alive", "streaming",
                                                     "media",  "fanout",    "logging"};
        for (const auto &key_node : yaml) {
            std::string key = key_node.first.as<std::string>();
            bool known = false;
            for (const auto &valid_key : valid_keys) {
                if (key == valid_key) {
                    known = true;
                    break;
                }
            }
            if (!known) {
                LOG_WARN("[Config] Unknown top-level key: '" << key << "' (will be ignored)");
            }
        }

        if (const auto device = yaml["device"]) {
            read_key(device, "vendor_id", config.device.vendor_id);
            read_key(device, "product_id", config.device.product_id);
            read_key(device, "monitor_interval_ms", config.device.monitor_interval_ms);
        }

        if (const auto transport = yaml["transport"]) {
            read_key(transport, "command_timeout_ms", config.transport.command_timeout_ms);
            read_key(transport, "block_size", config.transport.block_size);
        }

        if (const auto keep_alive = yaml["keep_alive"]) {
            read_key(keep_alive, "enabled", config.keep_alive.enabled);
            read_key(keep_alive, "interval_ms", config.keep_alive.interval_ms);
            read_key(keep_alive, "device_timeout_s", config.keep_alive.device_timeout_s);
        }

        if (const auto streaming = yaml["streaming"]) {
            auto &s = config.streaming;
            read_key(streaming, "buffer_depth", s.buffer_depth);
            read_key(streaming, "reserved_transfer_ids", s.reserved_transfer_ids);
            read_key(streaming, "max_transfer_id", s.max_transfer_id);
            read_key(streaming, "brightness", s.brightness);
            read_key(streaming, "frame_interval_ms", s.frame_interval_ms);
            read_key(streaming, "wake_before_enable", s.wake_before_enable);
            read_key(streaming, "max_consecutive_failures", s.max_consecutive_failures);
            read_key(streaming, "autostart_source", s.autostart_source);
            read_key(streaming, "loop", s.loop);
        }

        if (const auto media = yaml["media"]) {
            read_key(media, "enabled", config.media.enabled);
            read_key(media, "cache_dir", config.media.cache_dir);
            read_key(media, "index_path", config.media.index_path);
            read_key(media, "reference_resolution", config.media.reference_resolution);
            read_key(media, "max_bitrate_kbps", config.media.max_bitrate_kbps);
        }

        if (const auto fanout = yaml["fanout"]) {
            read_key(fanout, "timeout_ms", config.fanout.timeout_ms);
        }

        if (const auto logging = yaml["logging"]) {
            read_key(logging, "level", config.logging.level);
        }

        if (!validate_config(config, error)) {
            return false;
        }

        std::stringstream device_msg;
        device_msg << "[Config] Device filter: " << std::hex << "0x" << config.device.vendor_id << ":0x"
                   << config.device.product_id << std::dec << " (poll " << config.device.monitor_interval_ms
                   << "ms)";
        LOG_INFO(device_msg.str());

        LOG_INFO("[Config] Keep-alive: " << (config.keep_alive.enabled ? "enabled" : "disabled") << " ("
                                         << config.keep_alive.interval_ms << "ms, device timeout "
                                         << config.keep_alive.device_timeout_s << "s)");

        std::stringstream streaming_msg;
        streaming_msg << "[Config] Streaming: depth " << config.streaming.buffer_depth << ", ids "
                      << config.streaming.reserved_transfer_ids << ".." << config.streaming.max_transfer_id << ", "
                      << config.streaming.frame_interval_ms << "ms";
        if (!config.streaming.autostart_source.empty()) {
            streaming_msg << ", autostart " << config.streaming.autostart_source;
        }
        LOG_INFO(streaming_msg.str());

        LOG_INFO("[Config] Media: " << (config.media.enabled ? "enabled" : "disabled") << " (cache "
                                    << config.media.cache_dir << ")");
        LOG_INFO("[Config] Log level: " << config.logging.level);

        return true;
    } catch (const YAML::BadFile &e) {
        error = "Cannot open config file: " + config_path;
        return false;
    } catch (const YAML::ParserException &e) {
        error = "YAML parse error: " + std::string(e.what());
        return false;
    } catch (const std::exception &e) {
        error = "Config load error: " + std::string(e.what());
        return false;
    }
}

}  // namespace runtime
}  // namespace lcdlink
