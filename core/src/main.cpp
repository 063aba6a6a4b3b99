// lcdlink runtime
// Config-based device fleet service with CLI argument parsing

#include <filesystem>
#include <iostream>
#include <string>

#include "logging/logger.hpp"
#include "runtime/config.hpp"
#include "runtime/runtime.hpp"
#include "runtime/signal_handler.hpp"
#include "transport/hid_device_io.hpp"

int main(int argc, char **argv) {
    // Parse CLI arguments
    std::string config_path = "lcdlink-runtime.yaml";  // Default

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        if (arg == "--config" && i + 1 < argc) {
            config_path = argv[++i];
        } else if (arg.substr(0, 9) == "--config=") {
            config_path = arg.substr(9);
        } else if (arg == "--help" || arg == "-h") {
            std::cerr << "Usage: lcdlink-runtime [OPTIONS]\n\n";
            std::cerr << "Options:\n";
            std::cerr << "  --config=PATH    Path to config file (default: lcdlink-runtime.yaml)\n";
            std::cerr << "  --help, -h       Show this help\n";
            return 0;
        } else {
            std::cerr << "Unknown argument: " << arg << "\n";
            std::cerr << "Use --help for usage information\n";
            return 1;
        }
    }

    if (!std::filesystem::exists(config_path)) {
        // Logger level is not configured yet
        std::cerr << "ERROR: Config file not found: " << config_path << "\n";
        std::cerr << "\nCreate a config file or specify path with --config=PATH\n";
        return 1;
    }

    LOG_INFO("lcdlink runtime starting...");
    LOG_INFO("Loading config: " << config_path);

    lcdlink::runtime::RuntimeConfig config;
    std::string error;

    if (!lcdlink::runtime::load_config(config_path, config, error)) {
        LOG_ERROR("Failed to load config: " << error);
        return 1;
    }

    lcdlink::logging::Logger::set_level(lcdlink::logging::string_to_level(config.logging.level));

    int exit_code = 0;
    {
        lcdlink::runtime::Runtime runtime(config);

        if (!runtime.initialize(error)) {
            LOG_ERROR("Runtime initialization failed: " << error);
            exit_code = 1;
        } else {
            lcdlink::runtime::SignalHandler::install();

            LOG_INFO("Runtime Ready");
            LOG_INFO("  Keep-alive: " << (config.keep_alive.enabled ? "on" : "off") << " ("
                                      << config.keep_alive.interval_ms << "ms)");
            LOG_INFO("  Autostart: " << (config.streaming.autostart_source.empty()
                                             ? std::string("off")
                                             : config.streaming.autostart_source));

            // Blocks until Ctrl+C
            runtime.run();
        }
    }

    lcdlink::transport::HidDeviceEnumerator::release_library();
    LOG_INFO("Shutdown complete");
    return exit_code;
}
