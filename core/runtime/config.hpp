#pragma once

#include <cstdint>
#include <string>

namespace lcdlink {
namespace runtime {

struct DeviceConfig {
    uint16_t vendor_id = 0x2516;
    uint16_t product_id = 0x0228;
    int monitor_interval_ms = 1000;  // Enumeration poll period
};

struct TransportConfig {
    int command_timeout_ms = 3000;
    int block_size = 1000;  // File transfer block payload (1-1000)
};

struct KeepAliveConfig {
    bool enabled = true;
    int interval_ms = 4000;
    int device_timeout_s = 60;  // Must be >= 10x interval
};

struct StreamingSection {
    int buffer_depth = 2;
    int reserved_transfer_ids = 4;  // Ids 0..reserved-1 never used by streaming
    int max_transfer_id = 59;
    int brightness = 80;
    int frame_interval_ms = 40;
    bool wake_before_enable = true;
    int max_consecutive_failures = 3;
    std::string autostart_source;  // Image directory streamed to every attached device (empty = off)
    bool loop = true;
};

struct MediaSection {
    bool enabled = true;
    std::string cache_dir = "lcdlink-media";
    std::string index_path = "lcdlink-media/index.json";
    int reference_resolution = 480;
    int max_bitrate_kbps = 2000;
};

struct FanOutConfig {
    int timeout_ms = 2000;
};

struct LoggingConfig {
    std::string level = "info";  // debug, info, warn, error
};

struct RuntimeConfig {
    DeviceConfig device;
    TransportConfig transport;
    KeepAliveConfig keep_alive;
    StreamingSection streaming;
    MediaSection media;
    FanOutConfig fanout;
    LoggingConfig logging;
};

// Loads configuration from a YAML file. Missing keys keep their defaults.
bool load_config(const std::string &config_path, RuntimeConfig &config, std::string &error);

// Validates the configuration
bool validate_config(const RuntimeConfig &config, std::string &error);

}  // namespace runtime
}  // namespace lcdlink
