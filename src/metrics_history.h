#pragma once

#include "health_result.h"
#include <string>
#include <vector>
#include <deque>
#include <unordered_map>
#include <mutex>

namespace netlaunch {

const size_t MAX_METRIC_HISTORY = 100;

/**
 * Per-item history of reachability outcomes, capped at MAX_METRIC_HISTORY
 * entries per item. Once full, recording drops the oldest entry.
 */
class MetricsHistory {
public:
    explicit MetricsHistory(size_t capacity = MAX_METRIC_HISTORY);

    void record_metric(const std::string& item_id, const MetricDataPoint& point);
    void record_metric(const std::string& item_id, const HealthCheckResult& result);

    // Oldest first; empty for unknown items
    std::vector<MetricDataPoint> get_metrics_history(const std::string& item_id) const;

    /**
     * Percentage of successful entries in the retained history.
     * Items without history count as 100% up.
     */
    double calculate_uptime(const std::string& item_id) const;

    void clear_metrics(const std::string& item_id);
    void clear_all();

    size_t capacity() const { return capacity_; }

private:
    size_t capacity_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, std::deque<MetricDataPoint>> history_;
};

} // namespace netlaunch
