#pragma once

#include <atomic>
#include <functional>
#include <mutex>
#include <sstream>
#include <string>

namespace lcdlink {
namespace logging {

enum class Level {
    LVL_DEBUG,
    LVL_INFO,
    LVL_WARN,
    LVL_ERROR,
    LVL_NONE
};

class Logger {
public:
    // Receives the fully formatted line (without trailing newline)
    using Sink = std::function<void(Level, const std::string &)>;

    static void init(Level threshold);
    static void log(Level level, const char *file, int line, const std::string &message);
    static void set_level(Level level);
    static Level level();

    // Replace stderr output with a custom sink (nullptr restores stderr)
    static void set_sink(Sink sink);

private:
    static std::atomic<Level> threshold_;
    static Sink sink_;
    static std::mutex mutex_;
};

// Helper to convert config strings ("debug", "INFO", ...) to Level
Level string_to_level(const std::string &level_str);

const char *level_to_string(Level level);

}  // namespace logging
}  // namespace lcdlink

#define LCDLINK_LOG_INTERNAL(lvl, msg)                                                    \
    do {                                                                                  \
        if ((lvl) >= lcdlink::logging::Logger::level()) {                                 \
            std::stringstream lcdlink_log_ss;                                             \
            lcdlink_log_ss << msg;                                                        \
            lcdlink::logging::Logger::log(lvl, __FILE__, __LINE__, lcdlink_log_ss.str()); \
        }                                                                                 \
    } while (0)

#define LOG_DEBUG(msg) LCDLINK_LOG_INTERNAL(lcdlink::logging::Level::LVL_DEBUG, msg)
#define LOG_INFO(msg) LCDLINK_LOG_INTERNAL(lcdlink::logging::Level::LVL_INFO, msg)
#define LOG_WARN(msg) LCDLINK_LOG_INTERNAL(lcdlink::logging::Level::LVL_WARN, msg)
#define LOG_ERROR(msg) LCDLINK_LOG_INTERNAL(lcdlink::logging::Level::LVL_ERROR, msg)
