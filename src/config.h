#pragma once

#include "logger.h"
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace netlaunch {

/**
 * Runtime settings for discovery and reachability probing.
 * Every field has a default; a config file only needs the keys it overrides.
 */
struct NetlaunchConfig {
    LogLevel log_level = LogLevel::INFO;

    int scan_duration_ms = 5000;
    int port_probe_timeout_ms = 400;
    int port_probe_concurrency = 10;
    int resolve_timeout_ms = 3000;

    int health_check_timeout_ms = 10000;
    int route_probe_timeout_ms = 3000;
    int batch_delay_ms = 100;

    std::string dns_sd_path = "dns-sd";
    std::vector<std::string> neighbor_command = {"arp", "-a"};
};

/**
 * Apply the keys present in a JSON object on top of config.
 * Unknown keys are ignored; keys of the wrong type or out-of-range values are
 * logged and skipped.
 */
void apply_config_json(const nlohmann::json& json, NetlaunchConfig& config);

/**
 * Load a JSON config file on top of config.
 * A missing file leaves the defaults in place and counts as success.
 * @return false if the file exists but cannot be read or parsed
 */
bool load_config(const std::string& path, NetlaunchConfig& config);

void to_json(nlohmann::json& j, const NetlaunchConfig& config);

} // namespace netlaunch
