#pragma once

#include "config.h"
#include "share_registry.h"
#include "service_browser.h"
#include "service_resolver.h"
#include "neighbor_sweep.h"
#include "subprocess.h"
#include "threadmanager.h"
#include <string>
#include <vector>
#include <atomic>
#include <memory>

namespace netlaunch {

#define LOG_DISCOVERY_DEBUG(message) LOG_DEBUG("discovery", message)
#define LOG_DISCOVERY_INFO(message)  LOG_INFO("discovery", message)
#define LOG_DISCOVERY_WARN(message)  LOG_WARN("discovery", message)
#define LOG_DISCOVERY_ERROR(message) LOG_ERROR("discovery", message)

/**
 * Active LAN discovery session.
 *
 * scan_for_shares() runs one DNS-SD browser per service type and the neighbor
 * sweep side by side, each for the scan duration, then waits for the service
 * resolutions the browsers started. The instance owns every subprocess it
 * spawns so stop_scanning() can tear the whole session down.
 *
 * Only one scan may run at a time per instance; a second concurrent call
 * returns an empty list.
 */
class NetworkDiscovery : public ThreadManager {
public:
    /**
     * @param config Tool paths, timeouts and probe limits
     * @param port_scan Port scanner used by the neighbor sweep, defaults to a
     *        basic-preset scan with the configured timeout and batch size
     */
    explicit NetworkDiscovery(const NetlaunchConfig& config = NetlaunchConfig(),
                              PortScanFunction port_scan = PortScanFunction());
    ~NetworkDiscovery() override;

    /**
     * Discover shares for duration_ms
     * @param duration_ms Browse and sweep window; resolutions still running at
     *        the end get up to the resolver timeout on top of it
     * @return Deduplicated shares, one per (type, host)
     */
    std::vector<DiscoveredShare> scan_for_shares(int duration_ms = 5000);

    /**
     * Probe a host for open ports using the configured timeout and batch size
     */
    std::vector<int> scan_ports(const std::string& host, PortPreset preset = PortPreset::Basic) const;
    std::vector<int> scan_ports(const std::string& host, const std::vector<int>& ports) const;

    /**
     * Kill every subprocess of the running scan and drop pending resolutions
     * without waiting for them. The share list of an interrupted scan may be
     * incomplete.
     */
    void stop_scanning();

    bool is_scanning() const { return scanning_.load(); }

    void set_service_types(const std::vector<BrowsedServiceType>& service_types);

    // Exposed for tests that exercise the merge rules without a network
    ShareRegistry& registry() { return registry_; }

private:
    void browse_service_type(const BrowsedServiceType& service, int duration_ms);
    void resolve_instance(const std::string& instance_name, const BrowsedServiceType& service);

    NetlaunchConfig config_;
    std::vector<BrowsedServiceType> service_types_;

    ShareRegistry registry_;
    ProcessTracker processes_;
    ServiceBrowser browser_;
    ServiceResolver resolver_;
    NeighborSweep sweep_;

    std::atomic<bool> scanning_;
    std::atomic<bool> stop_requested_;
};

} // namespace netlaunch
