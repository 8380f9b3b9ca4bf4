#include "routing_selector.h"
#include "logger.h"
#include <future>
#include <system_error>
#include <vector>

#define LOG_ROUTE_DEBUG(message) LOG_DEBUG("routing", message)
#define LOG_ROUTE_INFO(message)  LOG_INFO("routing", message)
#define LOG_ROUTE_WARN(message)  LOG_WARN("routing", message)

namespace netlaunch {

RoutingSelector::RoutingSelector(HttpProber& prober, int timeout_ms)
    : prober_(prober), timeout_ms_(timeout_ms > 0 ? timeout_ms : DEFAULT_ROUTE_PROBE_TIMEOUT_MS) {
}

std::optional<ResolvedAddress> RoutingSelector::find_first_reachable_address(const LaunchItem& item) {
    struct Candidate {
        ResolvedAddress address;
        std::future<ProbeOutcome> outcome;
    };

    std::vector<Candidate> candidates;
    for (NetworkProfile profile : profiles_in_preference_order()) {
        auto url = build_profile_url(item, profile);
        if (!url) {
            continue;
        }

        Candidate candidate;
        candidate.address = ResolvedAddress{*url, profile};
        std::string probe_url = *url;
        try {
            candidate.outcome = std::async(std::launch::async, [this, probe_url]() {
                return prober_.head(probe_url, timeout_ms_);
            });
        } catch (const std::system_error& e) {
            LOG_ROUTE_WARN("Could not start probe for " << probe_url << ": " << e.what());
            std::promise<ProbeOutcome> not_probed;
            not_probed.set_value(ProbeOutcome::failure("Probe not started"));
            candidate.outcome = not_probed.get_future();
        }
        candidates.push_back(std::move(candidate));
    }

    if (candidates.empty()) {
        LOG_ROUTE_DEBUG("Item " << item.id << " has no addresses to route");
        return std::nullopt;
    }

    // Wait for every probe so none outlives this call
    std::vector<ProbeOutcome> outcomes;
    outcomes.reserve(candidates.size());
    for (auto& candidate : candidates) {
        outcomes.push_back(candidate.outcome.get());
    }

    for (size_t i = 0; i < candidates.size(); ++i) {
        const auto& address = candidates[i].address;
        const auto& outcome = outcomes[i];
        if (outcome.responded && outcome.status_code < 400) {
            LOG_ROUTE_INFO("Routing " << item.id << " via " << profile_to_string(address.profile)
                           << " (" << address.url << ")");
            return address;
        }

        if (outcome.responded) {
            LOG_ROUTE_DEBUG(profile_to_string(address.profile) << " answered HTTP " << outcome.status_code
                            << " for " << address.url);
        } else {
            LOG_ROUTE_DEBUG(profile_to_string(address.profile) << " unreachable for " << address.url
                            << ": " << outcome.error);
        }
    }

    LOG_ROUTE_WARN("No reachable address for " << item.id);
    return std::nullopt;
}

LaunchRoute RoutingSelector::select_launch_profile(const LaunchItem& item, NetworkProfile requested,
                                                   bool auto_route) {
    if (auto_route) {
        auto resolved = find_first_reachable_address(item);
        if (resolved && resolved->profile != requested) {
            LOG_ROUTE_INFO("Auto-routed " << item.id << " from " << profile_to_string(requested)
                           << " to " << profile_to_string(resolved->profile));
            return LaunchRoute{resolved->profile, true};
        }
    }
    return LaunchRoute{requested, false};
}

} // namespace netlaunch
