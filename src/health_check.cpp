#include "health_check.h"
#include "logger.h"
#include "time_utils.h"
#include <algorithm>
#include <cctype>
#include <chrono>
#include <thread>
#include <unordered_set>

#define LOG_HEALTH_DEBUG(message) LOG_DEBUG("health", message)
#define LOG_HEALTH_INFO(message)  LOG_INFO("health", message)
#define LOG_HEALTH_WARN(message)  LOG_WARN("health", message)
#define LOG_HEALTH_ERROR(message) LOG_ERROR("health", message)

namespace netlaunch {

namespace {

const std::unordered_set<std::string>& non_probeable_protocols() {
    static const std::unordered_set<std::string> protocols = {
        "chrome", "edge", "brave", "opera", "chatgpt",
        "about", "mailto", "app",
        "ftp", "sftp", "ftps",
        "smb", "afp", "nfs", "file",
        "postgres", "mysql", "mongodb", "redis",
        "vscode", "cursor", "jetbrains", "git",
        "slack", "discord", "zoommtg", "tg"
    };
    return protocols;
}

} // anonymous namespace

bool is_non_probeable_protocol(const std::string& protocol) {
    std::string lower = protocol;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return non_probeable_protocols().count(lower) > 0;
}

HealthCheckService::HealthCheckService(std::shared_ptr<HttpProber> prober, const NetlaunchConfig& config)
    : prober_(std::move(prober)),
      timeout_ms_(config.health_check_timeout_ms > 0 ? config.health_check_timeout_ms
                                                     : DEFAULT_HEALTH_CHECK_TIMEOUT_MS),
      batch_delay_ms_(std::max(0, config.batch_delay_ms)),
      routing_(*prober_, config.route_probe_timeout_ms) {
}

HealthCheckResult HealthCheckService::check_bookmark(const LaunchItem& item, NetworkProfile profile) {
    HealthCheckResult result;
    result.item_id = item.id;

    auto url = build_url(item, profile);
    if (!url) {
        result.status = HealthStatus::ERROR;
        result.error = "No URL configured for this profile";
        result.checked_at = now_iso8601();
        LOG_HEALTH_WARN("Item " << item.id << " has no address for profile " << profile_to_string(profile));
        store_result(result, false);
        return result;
    }
    result.url = *url;

    if (is_non_probeable_protocol(item.effective_protocol()) || url->rfind("file://", 0) == 0) {
        result.status = HealthStatus::HEALTHY;
        result.response_time_ms = 0;
        result.checked_at = now_iso8601();
        LOG_HEALTH_DEBUG("Skipping probe for " << *url << " (protocol " << item.effective_protocol() << ")");
        store_result(result, true);
        return result;
    }

    result.checked_at = now_iso8601();
    auto start = std::chrono::steady_clock::now();
    ProbeOutcome outcome = prober_->head(*url, timeout_ms_);
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);

    result.response_time_ms = static_cast<int>(elapsed.count());

    if (outcome.responded) {
        result.status_code = outcome.status_code;
        if (outcome.status_code >= 200 && outcome.status_code < 300) {
            result.status = HealthStatus::HEALTHY;
        } else if (outcome.status_code >= 300 && outcome.status_code < 400) {
            result.status = HealthStatus::WARNING;
        } else if (outcome.status_code >= 400) {
            result.status = HealthStatus::ERROR;
            result.error = "HTTP " + std::to_string(outcome.status_code);
        } else {
            // Informational answers say nothing about health
            result.status = HealthStatus::UNKNOWN;
        }
        LOG_HEALTH_DEBUG(*url << " answered HTTP " << outcome.status_code << " in " << elapsed.count() << "ms");
    } else {
        result.status = HealthStatus::ERROR;
        result.error = outcome.error.empty() ? std::string("Connection failed") : outcome.error;
        LOG_HEALTH_INFO(*url << " unreachable: " << *result.error);
    }

    store_result(result, true);
    return result;
}

std::vector<HealthCheckResult> HealthCheckService::check_multiple_bookmarks(const std::vector<LaunchItem>& items,
                                                                            NetworkProfile profile,
                                                                            HealthProgressCallback on_progress) {
    std::vector<HealthCheckResult> results;
    results.reserve(items.size());

    LOG_HEALTH_INFO("Checking " << items.size() << " items with profile " << profile_to_string(profile));

    for (size_t i = 0; i < items.size(); ++i) {
        results.push_back(check_bookmark(items[i], profile));

        if (on_progress) {
            on_progress(i + 1, items.size(), results.back());
        }

        if (i + 1 < items.size() && batch_delay_ms_ > 0) {
            std::this_thread::sleep_for(std::chrono::milliseconds(batch_delay_ms_));
        }
    }

    return results;
}

std::optional<ResolvedAddress> HealthCheckService::find_first_reachable_address(const LaunchItem& item) {
    return routing_.find_first_reachable_address(item);
}

std::optional<HealthCheckResult> HealthCheckService::get_result(const std::string& item_id) const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    auto it = results_.find(item_id);
    if (it == results_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::unordered_map<std::string, HealthCheckResult> HealthCheckService::get_all_results() const {
    std::lock_guard<std::mutex> lock(results_mutex_);
    return results_;
}

void HealthCheckService::clear_results() {
    std::lock_guard<std::mutex> lock(results_mutex_);
    results_.clear();
}

std::vector<MetricDataPoint> HealthCheckService::get_metrics_history(const std::string& item_id) const {
    return metrics_.get_metrics_history(item_id);
}

double HealthCheckService::calculate_uptime(const std::string& item_id) const {
    return metrics_.calculate_uptime(item_id);
}

void HealthCheckService::clear_metrics(const std::string& item_id) {
    metrics_.clear_metrics(item_id);
}

void HealthCheckService::clear_all() {
    metrics_.clear_all();
}

void HealthCheckService::store_result(const HealthCheckResult& result, bool record) {
    if (record) {
        metrics_.record_metric(result.item_id, result);
    }

    std::lock_guard<std::mutex> lock(results_mutex_);
    results_[result.item_id] = result;
}

} // namespace netlaunch
