#include "logger.h"
#include <algorithm>
#include <cctype>
#include <ctime>
#include <cstdio>

namespace netlaunch {

namespace {

const char* const MODULE_COLORS[] = {
    "\033[35m",  // Magenta
    "\033[36m",  // Cyan
    "\033[94m",  // Bright Blue
    "\033[95m",  // Bright Magenta
    "\033[96m",  // Bright Cyan
    "\033[93m",  // Bright Yellow
    "\033[92m",  // Bright Green
    "\033[34m",  // Blue
    "\033[38;5;208m", // Orange
    "\033[38;5;141m"  // Purple
};

const char* const RESET_COLOR = "\033[0m";

uint32_t hash_module(const std::string& str) {
    uint32_t hash = 5381;
    for (char c : str) {
        hash = ((hash << 5) + hash) + static_cast<unsigned char>(c);
    }
    return hash;
}

} // namespace

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string upper = name;
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });

    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "INFO") return LogLevel::INFO;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    return fallback;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        default: return "UNKNOWN";
    }
}

Logger& Logger::getInstance() {
    static Logger instance;
    return instance;
}

Logger::Logger()
    : min_level_(LogLevel::INFO),
      colors_enabled_(true),
      timestamps_enabled_(true),
      stderr_only_(false),
      is_terminal_(isatty(fileno(stdout)) != 0) {
}

void Logger::log(LogLevel level, const std::string& module, const std::string& message) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (level < min_level_) {
        return;
    }

    std::string line = format_line(level, module, message);

    if (level >= LogLevel::ERROR || stderr_only_) {
        std::cerr << line;
        std::cerr.flush();
    } else {
        std::cout << line;
        std::cout.flush();
    }
}

std::string Logger::format_line(LogLevel level, const std::string& module, const std::string& message) const {
    std::ostringstream oss;

    if (timestamps_enabled_) {
        auto now = std::chrono::system_clock::now();
        std::time_t time_t_now = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm local_tm{};
        localtime_r(&time_t_now, &local_tm);
        oss << "[" << std::put_time(&local_tm, "%H:%M:%S");
        oss << "." << std::setfill('0') << std::setw(3) << ms.count() << "] ";
    }

    if (use_colors()) {
        oss << level_color(level) << "[" << log_level_name(level) << "]" << RESET_COLOR;
    } else {
        oss << "[" << log_level_name(level) << "]";
    }

    if (!module.empty()) {
        if (use_colors()) {
            oss << " " << module_color(module) << "[" << module << "]" << RESET_COLOR;
        } else {
            oss << " [" << module << "]";
        }
    }

    oss << " " << message << "\n";
    return oss.str();
}

const char* Logger::level_color(LogLevel level) const {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";  // Cyan
        case LogLevel::INFO:  return "\033[32m";  // Green
        case LogLevel::WARN:  return "\033[33m";  // Yellow
        case LogLevel::ERROR: return "\033[31m";  // Red
        default: return "";
    }
}

const char* Logger::module_color(const std::string& module) const {
    size_t color_count = sizeof(MODULE_COLORS) / sizeof(MODULE_COLORS[0]);
    return MODULE_COLORS[hash_module(module) % color_count];
}

} // namespace netlaunch
