#pragma once

#include "share_registry.h"
#include "port_prober.h"
#include <string>
#include <vector>
#include <functional>
#include <optional>

namespace netlaunch {

#define LOG_SWEEP_DEBUG(message) LOG_DEBUG("sweep", message)
#define LOG_SWEEP_INFO(message)  LOG_INFO("sweep", message)
#define LOG_SWEEP_WARN(message)  LOG_WARN("sweep", message)
#define LOG_SWEEP_ERROR(message) LOG_ERROR("sweep", message)

// Neighbors probed at the same time during a sweep
const size_t NEIGHBOR_SWEEP_CONCURRENCY = 16;

using PortScanFunction = std::function<std::vector<int>(const std::string& host)>;
using ReverseLookupFunction = std::function<std::optional<std::string>(const std::string& ip)>;

/**
 * Unicast IPv4 neighbors listed in `arp -a` style output, without duplicates,
 * in order of first appearance
 */
std::vector<std::string> parse_neighbor_table(const std::string& text);

/**
 * Guess the share type from open ports: 445/139 SMB, then 548 AFP, then
 * 2049 NFS, otherwise OTHER
 */
ShareType classify_open_ports(const std::vector<int>& open_ports);

/**
 * First label of a hostname ("nas.lan" -> "nas"); IP literals and anything
 * that is not a valid hostname are returned unchanged
 */
std::string display_name_for_host(const std::string& hostname);

/**
 * Finds shares by probing every host in the neighbor table.
 */
class NeighborSweep {
public:
    /**
     * @param neighbor_command Command printing the neighbor table, e.g. {"arp", "-a"}
     * @param port_scan Open-port scanner, defaults to a basic-preset scan_ports()
     * @param reverse_lookup Reverse DNS, defaults to network_utils::reverse_lookup()
     */
    explicit NeighborSweep(std::vector<std::string> neighbor_command,
                           PortScanFunction port_scan = PortScanFunction(),
                           ReverseLookupFunction reverse_lookup = ReverseLookupFunction());

    /**
     * Read the neighbor table and probe neighbors concurrently, in batches of
     * NEIGHBOR_SWEEP_CONCURRENCY, merging results into the registry. Never
     * fails: unreadable tables, failed probes and threads that cannot be
     * started are logged and yield nothing.
     * @param command_timeout_ms Deadline for the neighbor-table command
     * @return Number of neighbors probed
     */
    size_t sweep(ShareRegistry& registry, int command_timeout_ms);

    /**
     * Probe one neighbor and merge it into the registry if any port is open
     * @return true if the neighbor had at least one open port
     */
    bool process_neighbor(const std::string& ip, ShareRegistry& registry);

private:
    std::vector<std::string> neighbor_command_;
    PortScanFunction port_scan_;
    ReverseLookupFunction reverse_lookup_;
};

} // namespace netlaunch
