#pragma once

#include <string>
#include <chrono>

namespace netlaunch {

/**
 * Format a time point as ISO-8601 UTC with milliseconds, "2024-05-01T12:30:00.123Z"
 */
std::string to_iso8601(std::chrono::system_clock::time_point time);

inline std::string now_iso8601() {
    return to_iso8601(std::chrono::system_clock::now());
}

} // namespace netlaunch
