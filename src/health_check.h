#pragma once

#include "health_result.h"
#include "metrics_history.h"
#include "routing_selector.h"
#include "launch_item.h"
#include "http_prober.h"
#include "config.h"
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <functional>
#include <memory>
#include <mutex>

namespace netlaunch {

const int DEFAULT_HEALTH_CHECK_TIMEOUT_MS = 10000;
const int DEFAULT_BATCH_DELAY_MS = 100;

using HealthProgressCallback = std::function<void(size_t current, size_t total, const HealthCheckResult& result)>;

/**
 * True for protocols that are launched through an external handler and have
 * no HTTP endpoint to probe (browsers, mail, file shares, databases, IDEs...)
 */
bool is_non_probeable_protocol(const std::string& protocol);

/**
 * Checks launcher items over HTTP and keeps the newest result per item
 * together with a bounded history used for uptime.
 */
class HealthCheckService {
public:
    HealthCheckService(std::shared_ptr<HttpProber> prober, const NetlaunchConfig& config);

    HealthCheckResult check_bookmark(const LaunchItem& item, NetworkProfile profile);

    /**
     * Check items one after another, pausing batch_delay_ms between checks.
     * on_progress is called after every check with a 1-based position.
     */
    std::vector<HealthCheckResult> check_multiple_bookmarks(const std::vector<LaunchItem>& items,
                                                            NetworkProfile profile,
                                                            HealthProgressCallback on_progress = nullptr);

    std::optional<ResolvedAddress> find_first_reachable_address(const LaunchItem& item);

    std::optional<HealthCheckResult> get_result(const std::string& item_id) const;
    std::unordered_map<std::string, HealthCheckResult> get_all_results() const;
    void clear_results();

    std::vector<MetricDataPoint> get_metrics_history(const std::string& item_id) const;
    double calculate_uptime(const std::string& item_id) const;
    void clear_metrics(const std::string& item_id);
    // Drops the metrics history of every item; last results are kept
    void clear_all();

    RoutingSelector& routing() { return routing_; }

private:
    std::shared_ptr<HttpProber> prober_;
    int timeout_ms_;
    int batch_delay_ms_;

    RoutingSelector routing_;
    MetricsHistory metrics_;

    mutable std::mutex results_mutex_;
    std::unordered_map<std::string, HealthCheckResult> results_;

    void store_result(const HealthCheckResult& result, bool record);
};

} // namespace netlaunch
