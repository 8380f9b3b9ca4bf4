#pragma once

#include "launch_item.h"
#include "http_prober.h"
#include <string>
#include <optional>

namespace netlaunch {

const int DEFAULT_ROUTE_PROBE_TIMEOUT_MS = 3000;

struct ResolvedAddress {
    std::string url;
    NetworkProfile profile;
};

// Profile chosen for a launch and whether auto-routing picked it
struct LaunchRoute {
    NetworkProfile profile_used;
    bool routed;
};

/**
 * Picks the first reachable address of an item in profile preference order.
 * All configured profiles are probed in parallel; the answer is the most
 * preferred profile that responded with a status below 400, regardless of
 * which probe finished first.
 */
class RoutingSelector {
public:
    explicit RoutingSelector(HttpProber& prober, int timeout_ms = DEFAULT_ROUTE_PROBE_TIMEOUT_MS);

    std::optional<ResolvedAddress> find_first_reachable_address(const LaunchItem& item);

    /**
     * Decide which profile a launch should use. With auto_route on, a
     * reachable address under a different profile overrides the request.
     */
    LaunchRoute select_launch_profile(const LaunchItem& item, NetworkProfile requested, bool auto_route);

private:
    HttpProber& prober_;
    int timeout_ms_;
};

} // namespace netlaunch
