#include "health_result.h"

namespace netlaunch {

const char* health_status_to_string(HealthStatus status) {
    switch (status) {
        case HealthStatus::HEALTHY: return "healthy";
        case HealthStatus::WARNING: return "warning";
        case HealthStatus::ERROR: return "error";
        case HealthStatus::UNKNOWN: return "unknown";
    }
    return "unknown";
}

MetricDataPoint MetricDataPoint::from_result(const HealthCheckResult& result) {
    return MetricDataPoint(result.checked_at,
                           result.response_time_ms.value_or(0),
                           result.status == HealthStatus::HEALTHY);
}

void to_json(nlohmann::json& j, const HealthCheckResult& result) {
    j = nlohmann::json{
        {"itemId", result.item_id},
        {"url", result.url ? nlohmann::json(*result.url) : nlohmann::json(nullptr)},
        {"status", health_status_to_string(result.status)},
        {"checkedAt", result.checked_at}
    };
    if (result.status_code) j["statusCode"] = *result.status_code;
    if (result.response_time_ms) j["responseTime"] = *result.response_time_ms;
    if (result.error) j["error"] = *result.error;
}

void to_json(nlohmann::json& j, const MetricDataPoint& point) {
    j = nlohmann::json{
        {"timestamp", point.timestamp},
        {"responseTime", point.response_time_ms},
        {"success", point.success}
    };
}

} // namespace netlaunch
