#include "config.h"
#include "fs.h"
#include <cstdint>
#include <limits>

#define LOG_CONFIG_DEBUG(message) LOG_DEBUG("config", message)
#define LOG_CONFIG_INFO(message)  LOG_INFO("config", message)
#define LOG_CONFIG_WARN(message)  LOG_WARN("config", message)
#define LOG_CONFIG_ERROR(message) LOG_ERROR("config", message)

namespace netlaunch {

namespace {

// Integer that fits an int, checked before narrowing
bool read_int_value(const nlohmann::json& value, int& out) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        uint64_t wide = value.get<uint64_t>();
        if (wide > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(wide);
        return true;
    }
    int64_t wide = value.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(wide);
    return true;
}

void read_positive_int(const nlohmann::json& json, const char* key, int& target) {
    if (!json.contains(key)) {
        return;
    }
    int value = 0;
    if (!read_int_value(json[key], value) || value <= 0) {
        LOG_CONFIG_WARN("Ignoring '" << key << "': expected a positive integer");
        return;
    }
    target = value;
}

void read_non_negative_int(const nlohmann::json& json, const char* key, int& target) {
    if (!json.contains(key)) {
        return;
    }
    int value = 0;
    if (!read_int_value(json[key], value) || value < 0) {
        LOG_CONFIG_WARN("Ignoring '" << key << "': expected a non-negative integer");
        return;
    }
    target = value;
}

} // namespace

void apply_config_json(const nlohmann::json& json, NetlaunchConfig& config) {
    if (!json.is_object()) {
        LOG_CONFIG_WARN("Configuration root is not an object, using defaults");
        return;
    }

    if (json.contains("log_level")) {
        if (json["log_level"].is_string()) {
            config.log_level = parse_log_level(json["log_level"].get<std::string>(), config.log_level);
        } else {
            LOG_CONFIG_WARN("Ignoring 'log_level': expected a string");
        }
    }

    read_positive_int(json, "scan_duration_ms", config.scan_duration_ms);
    read_positive_int(json, "port_probe_timeout_ms", config.port_probe_timeout_ms);
    read_positive_int(json, "port_probe_concurrency", config.port_probe_concurrency);
    read_positive_int(json, "resolve_timeout_ms", config.resolve_timeout_ms);
    read_positive_int(json, "health_check_timeout_ms", config.health_check_timeout_ms);
    read_positive_int(json, "route_probe_timeout_ms", config.route_probe_timeout_ms);
    read_non_negative_int(json, "batch_delay_ms", config.batch_delay_ms);

    if (json.contains("dns_sd_path")) {
        if (json["dns_sd_path"].is_string() && !json["dns_sd_path"].get<std::string>().empty()) {
            config.dns_sd_path = json["dns_sd_path"].get<std::string>();
        } else {
            LOG_CONFIG_WARN("Ignoring 'dns_sd_path': expected a non-empty string");
        }
    }

    if (json.contains("neighbor_command")) {
        const auto& command = json["neighbor_command"];
        bool valid = command.is_array() && !command.empty();
        if (valid) {
            for (const auto& arg : command) {
                valid = valid && arg.is_string();
            }
        }
        if (valid) {
            config.neighbor_command = command.get<std::vector<std::string>>();
        } else {
            LOG_CONFIG_WARN("Ignoring 'neighbor_command': expected a non-empty array of strings");
        }
    }
}

bool load_config(const std::string& path, NetlaunchConfig& config) {
    if (!file_exists(path)) {
        LOG_CONFIG_INFO("No configuration at " << path << ", using defaults");
        return true;
    }

    auto content = read_file_text(path);
    if (!content) {
        LOG_CONFIG_ERROR("Failed to read configuration file " << path);
        return false;
    }

    try {
        nlohmann::json json = nlohmann::json::parse(*content);
        apply_config_json(json, config);
        LOG_CONFIG_INFO("Loaded configuration from " << path);
        return true;
    } catch (const nlohmann::json::exception& e) {
        LOG_CONFIG_ERROR("Failed to parse configuration file " << path << ": " << e.what());
        return false;
    }
}

void to_json(nlohmann::json& j, const NetlaunchConfig& config) {
    std::string level = log_level_name(config.log_level);
    while (!level.empty() && level.back() == ' ') {
        level.pop_back();
    }

    j = nlohmann::json{
        {"log_level", level},
        {"scan_duration_ms", config.scan_duration_ms},
        {"port_probe_timeout_ms", config.port_probe_timeout_ms},
        {"port_probe_concurrency", config.port_probe_concurrency},
        {"resolve_timeout_ms", config.resolve_timeout_ms},
        {"health_check_timeout_ms", config.health_check_timeout_ms},
        {"route_probe_timeout_ms", config.route_probe_timeout_ms},
        {"batch_delay_ms", config.batch_delay_ms},
        {"dns_sd_path", config.dns_sd_path},
        {"neighbor_command", config.neighbor_command}
    };
}

} // namespace netlaunch
