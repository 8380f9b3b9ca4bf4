#pragma once

#include <string>
#include <optional>
#include <nlohmann/json.hpp>

namespace netlaunch {

enum class HealthStatus {
    HEALTHY,
    WARNING,
    ERROR,
    UNKNOWN
};

const char* health_status_to_string(HealthStatus status);

struct HealthCheckResult {
    std::string item_id;
    std::optional<std::string> url;
    HealthStatus status;
    std::optional<int> status_code;
    std::optional<int> response_time_ms;
    std::optional<std::string> error;
    std::string checked_at;  // ISO-8601

    HealthCheckResult() : status(HealthStatus::UNKNOWN) {}
};

// One entry of an item's reachability history
struct MetricDataPoint {
    std::string timestamp;  // ISO-8601
    int response_time_ms;
    bool success;

    MetricDataPoint() : response_time_ms(0), success(false) {}
    MetricDataPoint(const std::string& ts, int response_time, bool ok)
        : timestamp(ts), response_time_ms(response_time), success(ok) {}

    // success is true only for healthy results
    static MetricDataPoint from_result(const HealthCheckResult& result);
};

void to_json(nlohmann::json& j, const HealthCheckResult& result);
void to_json(nlohmann::json& j, const MetricDataPoint& point);

} // namespace netlaunch
