#include "config.h"
#include "discovery.h"
#include "fs.h"
#include "health_check.h"
#include "http_prober.h"
#include "launch_item.h"
#include "logger.h"
#include "port_prober.h"
#include "routing_selector.h"
#include "socket.h"
#include <iostream>
#include <string>
#include <vector>
#include <memory>
#include <nlohmann/json.hpp>

// Main module logging macros
#define LOG_MAIN_DEBUG(message) LOG_DEBUG("main", message)
#define LOG_MAIN_INFO(message)  LOG_INFO("main", message)
#define LOG_MAIN_WARN(message)  LOG_WARN("main", message)
#define LOG_MAIN_ERROR(message) LOG_ERROR("main", message)

using namespace netlaunch;

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [--config FILE] [--log-level LEVEL] <command> [args]\n";
    std::cout << "\nCommands:\n";
    std::cout << "  scan [duration_ms]                 Discover file shares on the local network\n";
    std::cout << "  ports <host> [basic|deep|p1,p2,...] Probe a host for open TCP ports\n";
    std::cout << "  check <items.json> [profile]       Health check every item in a JSON array\n";
    std::cout << "  route <item.json>                  Find the first reachable address of an item\n";
    std::cout << "\nProfiles: local, tailscale, vpn, custom\n";
    std::cout << "\nExample:\n";
    std::cout << "  " << program_name << " scan 8000\n";
    std::cout << "  " << program_name << " --log-level debug ports 192.168.1.20 deep\n";
}

static bool parse_int_arg(const std::string& text, int& value) {
    try {
        size_t consumed = 0;
        value = std::stoi(text, &consumed);
        return consumed == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

static bool load_json_file(const std::string& path, nlohmann::json& out) {
    auto content = read_file_text(path);
    if (!content) {
        LOG_MAIN_ERROR("Cannot read " << path);
        return false;
    }
    try {
        out = nlohmann::json::parse(*content);
    } catch (const nlohmann::json::exception& e) {
        LOG_MAIN_ERROR("Invalid JSON in " << path << ": " << e.what());
        return false;
    }
    return true;
}

static int run_scan(const NetlaunchConfig& config, const std::vector<std::string>& args) {
    int duration_ms = config.scan_duration_ms;
    if (!args.empty() && (!parse_int_arg(args[0], duration_ms) || duration_ms <= 0)) {
        LOG_MAIN_ERROR("Invalid scan duration: " << args[0]);
        return 1;
    }

    NetworkDiscovery discovery(config);
    auto shares = discovery.scan_for_shares(duration_ms);

    nlohmann::json output = shares;
    std::cout << output.dump(2) << std::endl;
    return 0;
}

static int run_ports(const NetlaunchConfig& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        LOG_MAIN_ERROR("ports requires a host");
        return 1;
    }

    const std::string& host = args[0];
    std::string mode = args.size() > 1 ? args[1] : "basic";

    NetworkDiscovery discovery(config);
    std::vector<int> open_ports;
    if (mode == "basic") {
        open_ports = discovery.scan_ports(host, PortPreset::Basic);
    } else if (mode == "deep") {
        open_ports = discovery.scan_ports(host, PortPreset::Deep);
    } else {
        std::vector<int> ports;
        if (!parse_port_spec(mode, ports)) {
            LOG_MAIN_ERROR("Invalid port list: " << mode);
            return 1;
        }
        open_ports = discovery.scan_ports(host, ports);
    }

    nlohmann::json output = {{"host", host}, {"openPorts", open_ports}};
    std::cout << output.dump(2) << std::endl;
    return 0;
}

static int run_check(const NetlaunchConfig& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        LOG_MAIN_ERROR("check requires an items file");
        return 1;
    }

    NetworkProfile profile = NetworkProfile::LOCAL;
    if (args.size() > 1) {
        auto parsed = profile_from_string(args[1]);
        if (!parsed) {
            LOG_MAIN_ERROR("Unknown profile: " << args[1]);
            return 1;
        }
        profile = *parsed;
    }

    nlohmann::json json;
    if (!load_json_file(args[0], json)) {
        return 1;
    }
    if (!json.is_array()) {
        LOG_MAIN_ERROR(args[0] << " must contain a JSON array of items");
        return 1;
    }

    std::vector<LaunchItem> items;
    try {
        items = json.get<std::vector<LaunchItem>>();
    } catch (const nlohmann::json::exception& e) {
        LOG_MAIN_ERROR("Invalid item in " << args[0] << ": " << e.what());
        return 1;
    }

    HealthCheckService service(std::make_shared<CurlHttpProber>(), config);
    auto results = service.check_multiple_bookmarks(items, profile,
        [](size_t current, size_t total, const HealthCheckResult& result) {
            LOG_MAIN_INFO("[" << current << "/" << total << "] " << result.item_id << ": "
                          << health_status_to_string(result.status));
        });

    nlohmann::json output = nlohmann::json::array();
    for (const auto& result : results) {
        nlohmann::json entry = result;
        entry["uptime"] = service.calculate_uptime(result.item_id);
        output.push_back(entry);
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
}

static int run_route(const NetlaunchConfig& config, const std::vector<std::string>& args) {
    if (args.empty()) {
        LOG_MAIN_ERROR("route requires an item file");
        return 1;
    }

    nlohmann::json json;
    if (!load_json_file(args[0], json)) {
        return 1;
    }

    LaunchItem item;
    try {
        item = json.get<LaunchItem>();
    } catch (const nlohmann::json::exception& e) {
        LOG_MAIN_ERROR("Invalid item in " << args[0] << ": " << e.what());
        return 1;
    }

    CurlHttpProber prober;
    RoutingSelector selector(prober, config.route_probe_timeout_ms);
    auto resolved = selector.find_first_reachable_address(item);

    nlohmann::json output = nullptr;
    if (resolved) {
        output = {{"url", resolved->url}, {"profile", profile_to_string(resolved->profile)}};
    }
    std::cout << output.dump(2) << std::endl;
    return 0;
}

int main(int argc, char* argv[]) {
    std::string config_path;
    std::string log_level_override;
    std::vector<std::string> positional;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "--config" || arg == "--log-level") && i + 1 < argc) {
            (arg == "--config" ? config_path : log_level_override) = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            print_usage(argv[0]);
            return 0;
        } else {
            positional.push_back(arg);
        }
    }

    if (positional.empty()) {
        print_usage(argv[0]);
        return 1;
    }

    Logger::getInstance().set_stderr_only(true);

    NetlaunchConfig config;
    if (!config_path.empty() && !load_config(config_path, config)) {
        LOG_MAIN_WARN("Continuing with default settings");
    }
    if (!log_level_override.empty()) {
        config.log_level = parse_log_level(log_level_override, config.log_level);
    }
    Logger::getInstance().set_log_level(config.log_level);

    if (!init_socket_library()) {
        LOG_MAIN_ERROR("Failed to initialize socket library");
        return 1;
    }

    std::string command = positional[0];
    std::vector<std::string> args(positional.begin() + 1, positional.end());
    LOG_MAIN_DEBUG("Running command '" << command << "'");

    int rc;
    if (command == "scan") {
        rc = run_scan(config, args);
    } else if (command == "ports") {
        rc = run_ports(config, args);
    } else if (command == "check") {
        rc = run_check(config, args);
    } else if (command == "route") {
        rc = run_route(config, args);
    } else {
        LOG_MAIN_ERROR("Unknown command: " << command);
        print_usage(argv[0]);
        rc = 1;
    }

    cleanup_socket_library();
    return rc;
}
