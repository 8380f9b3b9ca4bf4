#include "neighbor_sweep.h"
#include "network_utils.h"
#include "subprocess.h"
#include <algorithm>
#include <system_error>
#include <thread>
#include <unordered_set>

namespace netlaunch {

std::vector<std::string> parse_neighbor_table(const std::string& text) {
    std::vector<std::string> neighbors;
    std::unordered_set<std::string> seen;

    for (const auto& ip : network_utils::extract_parenthesized_ipv4(text)) {
        if (network_utils::is_multicast_or_broadcast(ip)) {
            continue;
        }
        if (seen.insert(ip).second) {
            neighbors.push_back(ip);
        }
    }
    return neighbors;
}

ShareType classify_open_ports(const std::vector<int>& open_ports) {
    auto has = [&open_ports](int port) {
        return std::find(open_ports.begin(), open_ports.end(), port) != open_ports.end();
    };

    if (has(445) || has(139)) return ShareType::SMB;
    if (has(548)) return ShareType::AFP;
    if (has(2049)) return ShareType::NFS;
    return ShareType::OTHER;
}

std::string display_name_for_host(const std::string& hostname) {
    if (!network_utils::is_hostname(hostname)) {
        return hostname;
    }
    size_t dot = hostname.find('.');
    return dot == std::string::npos ? hostname : hostname.substr(0, dot);
}

NeighborSweep::NeighborSweep(std::vector<std::string> neighbor_command,
                             PortScanFunction port_scan,
                             ReverseLookupFunction reverse_lookup)
    : neighbor_command_(std::move(neighbor_command)),
      port_scan_(std::move(port_scan)),
      reverse_lookup_(std::move(reverse_lookup)) {
    if (!port_scan_) {
        port_scan_ = [](const std::string& host) {
            return scan_ports(host, PortPreset::Basic);
        };
    }
    if (!reverse_lookup_) {
        reverse_lookup_ = [](const std::string& ip) {
            return network_utils::reverse_lookup(ip);
        };
    }
}

size_t NeighborSweep::sweep(ShareRegistry& registry, int command_timeout_ms) {
    std::string table;
    if (!run_command(neighbor_command_, command_timeout_ms, table)) {
        LOG_SWEEP_ERROR("Neighbor table scan failed: could not run '"
                        << (neighbor_command_.empty() ? std::string() : neighbor_command_.front()) << "'");
        return 0;
    }

    std::vector<std::string> neighbors = parse_neighbor_table(table);
    LOG_SWEEP_INFO("Probing " << neighbors.size() << " neighbor(s)");

    for (size_t batch_start = 0; batch_start < neighbors.size(); batch_start += NEIGHBOR_SWEEP_CONCURRENCY) {
        size_t batch_end = std::min(neighbors.size(), batch_start + NEIGHBOR_SWEEP_CONCURRENCY);

        std::vector<std::thread> workers;
        workers.reserve(batch_end - batch_start);
        for (size_t i = batch_start; i < batch_end; ++i) {
            const std::string& ip = neighbors[i];
            try {
                workers.emplace_back([this, ip, &registry]() {
                    process_neighbor(ip, registry);
                });
            } catch (const std::system_error& e) {
                LOG_SWEEP_WARN("Could not start probe thread for " << ip << ", skipping it: " << e.what());
            }
        }

        for (auto& worker : workers) {
            worker.join();
        }
    }

    return neighbors.size();
}

bool NeighborSweep::process_neighbor(const std::string& ip, ShareRegistry& registry) {
    std::vector<int> open_ports = port_scan_(ip);
    if (open_ports.empty()) {
        return false;
    }

    ShareType type = classify_open_ports(open_ports);

    std::string hostname = ip;
    auto reversed = reverse_lookup_(ip);
    if (reversed && !reversed->empty()) {
        hostname = *reversed;
    } else {
        LOG_SWEEP_DEBUG("No reverse DNS for " << ip << ", keeping the address as name");
    }

    DiscoveredShare share(display_name_for_host(hostname), type, hostname);
    share.address = ip;
    share.open_ports = open_ports;

    if (registry.merge_neighbor(share)) {
        LOG_SWEEP_INFO("Found " << share_type_to_string(type) << " host " << hostname << " (" << ip << ")");
    }
    return true;
}

} // namespace netlaunch
