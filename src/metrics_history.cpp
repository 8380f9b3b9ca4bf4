#include "metrics_history.h"
#include <algorithm>

namespace netlaunch {

MetricsHistory::MetricsHistory(size_t capacity)
    : capacity_(capacity == 0 ? 1 : capacity) {
}

void MetricsHistory::record_metric(const std::string& item_id, const MetricDataPoint& point) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto& entries = history_[item_id];
    entries.push_back(point);
    while (entries.size() > capacity_) {
        entries.pop_front();
    }
}

void MetricsHistory::record_metric(const std::string& item_id, const HealthCheckResult& result) {
    record_metric(item_id, MetricDataPoint::from_result(result));
}

std::vector<MetricDataPoint> MetricsHistory::get_metrics_history(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = history_.find(item_id);
    if (it == history_.end()) {
        return {};
    }
    return std::vector<MetricDataPoint>(it->second.begin(), it->second.end());
}

double MetricsHistory::calculate_uptime(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = history_.find(item_id);
    if (it == history_.end() || it->second.empty()) {
        return 100.0;
    }

    const auto& entries = it->second;
    auto successes = std::count_if(entries.begin(), entries.end(),
                                   [](const MetricDataPoint& point) { return point.success; });
    return static_cast<double>(successes) / static_cast<double>(entries.size()) * 100.0;
}

void MetricsHistory::clear_metrics(const std::string& item_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.erase(item_id);
}

void MetricsHistory::clear_all() {
    std::lock_guard<std::mutex> lock(mutex_);
    history_.clear();
}

} // namespace netlaunch
