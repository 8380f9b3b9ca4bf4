#include "discovery.h"
#include "network_utils.h"
#include <chrono>
#include <system_error>
#include <thread>

namespace netlaunch {

NetworkDiscovery::NetworkDiscovery(const NetlaunchConfig& config, PortScanFunction port_scan)
    : config_(config),
      service_types_(default_service_types()),
      browser_(config.dns_sd_path, &processes_),
      resolver_(config.dns_sd_path, config.resolve_timeout_ms, &processes_),
      sweep_(config.neighbor_command,
             port_scan ? std::move(port_scan) : PortScanFunction([config](const std::string& host) {
                 return netlaunch::scan_ports(host, PortPreset::Basic,
                                              static_cast<size_t>(config.port_probe_concurrency),
                                              config.port_probe_timeout_ms);
             })),
      scanning_(false),
      stop_requested_(false) {
}

NetworkDiscovery::~NetworkDiscovery() {
    stop_scanning();
    join_all_active_threads();
}

void NetworkDiscovery::set_service_types(const std::vector<BrowsedServiceType>& service_types) {
    service_types_ = service_types;
}

std::vector<DiscoveredShare> NetworkDiscovery::scan_for_shares(int duration_ms) {
    bool expected = false;
    if (!scanning_.compare_exchange_strong(expected, true)) {
        LOG_DISCOVERY_WARN("A scan is already in progress, ignoring concurrent scan request");
        return {};
    }

    auto started = std::chrono::steady_clock::now();

    // Leftovers of a stopped scan must finish before the registry is reused
    join_all_active_threads();
    registry_.clear();
    reset_shutdown();
    stop_requested_.store(false);

    LOG_DISCOVERY_INFO("Scanning for shares for " << duration_ms << "ms ("
                       << service_types_.size() << " service types + neighbor sweep)");

    std::vector<std::thread> scanners;
    scanners.reserve(service_types_.size() + 1);

    try {
        for (const auto& service : service_types_) {
            scanners.emplace_back([this, service, duration_ms]() {
                browse_service_type(service, duration_ms);
            });
        }

        scanners.emplace_back([this, duration_ms]() {
            sweep_.sweep(registry_, duration_ms);
        });
    } catch (const std::system_error& e) {
        LOG_DISCOVERY_ERROR("Could not start every scanner, results will be partial: " << e.what());
    }

    for (auto& scanner : scanners) {
        scanner.join();
    }

    size_t pending = get_active_thread_count();
    if (pending > 0) {
        LOG_DISCOVERY_DEBUG("Waiting for " << pending << " pending resolution(s)");
    }
    join_all_active_threads();

    std::vector<DiscoveredShare> shares = registry_.values();

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - started).count();
    LOG_DISCOVERY_INFO("Scan completed in " << elapsed << "ms, found " << shares.size() << " share(s)");

    scanning_.store(false);
    return shares;
}

void NetworkDiscovery::browse_service_type(const BrowsedServiceType& service, int duration_ms) {
    bool started = browser_.browse(service.service_type, duration_ms,
        [this, service](const std::string& instance_name) {
            if (stop_requested_.load()) {
                return;
            }
            try {
                add_managed_thread(std::thread([this, instance_name, service]() {
                    resolve_instance(instance_name, service);
                }), "resolve " + instance_name);
            } catch (const std::system_error& e) {
                LOG_DISCOVERY_WARN("Could not start resolution of '" << instance_name << "': " << e.what());
                registry_.upsert_resolved(DiscoveredShare(instance_name, service.share_type, instance_name + ".local"));
            }
        });

    if (!started) {
        LOG_DISCOVERY_WARN("Skipping " << service.service_type << ": browser unavailable");
    }
}

void NetworkDiscovery::resolve_instance(const std::string& instance_name, const BrowsedServiceType& service) {
    auto resolution = resolver_.resolve(instance_name, service.service_type, "local");
    if (stop_requested_.load()) {
        return;
    }

    if (resolution) {
        DiscoveredShare share(instance_name, service.share_type, resolution->host);
        share.address = network_utils::resolve_hostname(resolution->host);
        share.open_ports = std::vector<int>{resolution->port};
        registry_.upsert_resolved(share);
        return;
    }

    // Unresolved instances are still listed under their mDNS name
    LOG_DISCOVERY_DEBUG("Could not resolve '" << instance_name << "', listing it as " << instance_name << ".local");
    registry_.upsert_resolved(DiscoveredShare(instance_name, service.share_type, instance_name + ".local"));
}

std::vector<int> NetworkDiscovery::scan_ports(const std::string& host, PortPreset preset) const {
    return scan_ports(host, preset_ports(preset));
}

std::vector<int> NetworkDiscovery::scan_ports(const std::string& host, const std::vector<int>& ports) const {
    return probe_ports(host, ports,
                       static_cast<size_t>(config_.port_probe_concurrency),
                       config_.port_probe_timeout_ms);
}

void NetworkDiscovery::stop_scanning() {
    stop_requested_.store(true);
    shutdown_all_threads();
    size_t killed = processes_.size();
    processes_.kill_all();
    if (killed > 0) {
        LOG_DISCOVERY_INFO("Stopped scanning, killed " << killed << " subprocess(es)");
    }
}

} // namespace netlaunch
