#pragma once

#include <string>
#include <iostream>
#include <mutex>
#include <sstream>
#include <chrono>
#include <iomanip>
#include <cstdint>
#include <unistd.h>

namespace netlaunch {

enum class LogLevel {
    DEBUG = 0,
    INFO = 1,
    WARN = 2,
    ERROR = 3
};

/**
 * Parse a log level name ("debug", "INFO", "warning", ...)
 * @param name Level name, case insensitive
 * @param fallback Level returned when the name is not recognised
 * @return Parsed level
 */
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::INFO);

const char* log_level_name(LogLevel level);

class Logger {
public:
    static Logger& getInstance();

    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void set_log_level(LogLevel level) {
        std::lock_guard<std::mutex> lock(mutex_);
        min_level_ = level;
    }

    LogLevel get_log_level() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return min_level_;
    }

    void set_colors_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        colors_enabled_ = enabled;
    }

    void set_timestamps_enabled(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        timestamps_enabled_ = enabled;
    }

    // Send every level to stderr, keeping stdout free for program output
    void set_stderr_only(bool enabled) {
        std::lock_guard<std::mutex> lock(mutex_);
        stderr_only_ = enabled;
    }

    bool is_enabled(LogLevel level) const {
        std::lock_guard<std::mutex> lock(mutex_);
        return level >= min_level_;
    }

    // Writes one line; ERROR goes to stderr, everything else to stdout unless stderr_only
    void log(LogLevel level, const std::string& module, const std::string& message);

private:
    Logger();

    std::string format_line(LogLevel level, const std::string& module, const std::string& message) const;
    const char* level_color(LogLevel level) const;
    const char* module_color(const std::string& module) const;
    bool use_colors() const { return colors_enabled_ && is_terminal_; }

    mutable std::mutex mutex_;
    LogLevel min_level_;
    bool colors_enabled_;
    bool timestamps_enabled_;
    bool stderr_only_;
    bool is_terminal_;
};

} // namespace netlaunch

#define NETLAUNCH_LOG(level, module, message) \
    do { \
        if (netlaunch::Logger::getInstance().is_enabled(level)) { \
            std::ostringstream oss; \
            oss << message; \
            netlaunch::Logger::getInstance().log(level, module, oss.str()); \
        } \
    } while(0)

#define LOG_DEBUG(module, message) NETLAUNCH_LOG(netlaunch::LogLevel::DEBUG, module, message)
#define LOG_INFO(module, message)  NETLAUNCH_LOG(netlaunch::LogLevel::INFO, module, message)
#define LOG_WARN(module, message)  NETLAUNCH_LOG(netlaunch::LogLevel::WARN, module, message)
#define LOG_ERROR(module, message) NETLAUNCH_LOG(netlaunch::LogLevel::ERROR, module, message)
