#include "launch_item.h"
#include <sstream>

namespace netlaunch {

namespace {

std::optional<std::string> non_empty(const std::optional<std::string>& value) {
    if (value && !value->empty()) {
        return value;
    }
    return std::nullopt;
}

std::optional<std::string> first_of(std::initializer_list<const std::optional<std::string>*> slots) {
    for (const auto* slot : slots) {
        if (auto value = non_empty(*slot)) {
            return value;
        }
    }
    return std::nullopt;
}

std::optional<std::string> optional_string(const nlohmann::json& j, const char* key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

} // namespace

const char* profile_to_string(NetworkProfile profile) {
    switch (profile) {
        case NetworkProfile::LOCAL: return "local";
        case NetworkProfile::TAILSCALE: return "tailscale";
        case NetworkProfile::VPN: return "vpn";
        case NetworkProfile::CUSTOM: return "custom";
    }
    return "local";
}

std::optional<NetworkProfile> profile_from_string(const std::string& name) {
    if (name == "local") return NetworkProfile::LOCAL;
    if (name == "tailscale") return NetworkProfile::TAILSCALE;
    if (name == "vpn") return NetworkProfile::VPN;
    if (name == "custom") return NetworkProfile::CUSTOM;
    return std::nullopt;
}

const std::vector<NetworkProfile>& profiles_in_preference_order() {
    static const std::vector<NetworkProfile> order = {
        NetworkProfile::LOCAL,
        NetworkProfile::TAILSCALE,
        NetworkProfile::VPN,
        NetworkProfile::CUSTOM
    };
    return order;
}

std::optional<std::string> NetworkAddressSet::address_for(NetworkProfile profile) const {
    switch (profile) {
        case NetworkProfile::LOCAL: return non_empty(local);
        case NetworkProfile::TAILSCALE: return non_empty(tailscale);
        case NetworkProfile::VPN: return non_empty(vpn);
        case NetworkProfile::CUSTOM: return non_empty(custom);
    }
    return std::nullopt;
}

std::optional<std::string> NetworkAddressSet::host_for_profile(NetworkProfile profile) const {
    switch (profile) {
        case NetworkProfile::LOCAL: return first_of({&local, &tailscale, &vpn});
        case NetworkProfile::TAILSCALE: return first_of({&tailscale, &local});
        case NetworkProfile::VPN: return first_of({&vpn, &local});
        case NetworkProfile::CUSTOM: return first_of({&custom, &local});
    }
    return std::nullopt;
}

std::string LaunchItem::effective_protocol() const {
    if (protocol && !protocol->empty()) {
        return *protocol;
    }
    return "https";
}

std::string build_url_for_host(const LaunchItem& item, const std::string& host) {
    const std::string protocol = item.effective_protocol();
    const std::string path = item.path.value_or("");

    std::ostringstream url;

    if (protocol == "about" || protocol == "mailto") {
        url << protocol << ":" << host << path;
        return url.str();
    }

    url << protocol << "://";

    if (host.find(':') != std::string::npos && host.front() != '[') {
        url << "[" << host << "]";
    } else {
        url << host;
    }

    if (item.port && *item.port > 0) {
        bool default_port = (protocol == "http" && *item.port == 80) ||
                            (protocol == "https" && *item.port == 443);
        if (!default_port) {
            url << ":" << *item.port;
        }
    }

    if (!path.empty()) {
        if (path.front() != '/') {
            url << "/";
        }
        url << path;
    }

    return url.str();
}

std::optional<std::string> build_url(const LaunchItem& item, NetworkProfile profile) {
    auto host = item.network_addresses.host_for_profile(profile);
    if (!host) {
        return std::nullopt;
    }
    return build_url_for_host(item, *host);
}

std::optional<std::string> build_profile_url(const LaunchItem& item, NetworkProfile profile) {
    auto host = item.network_addresses.address_for(profile);
    if (!host) {
        return std::nullopt;
    }
    return build_url_for_host(item, *host);
}

void to_json(nlohmann::json& j, const NetworkAddressSet& addresses) {
    j = nlohmann::json::object();
    if (addresses.local) j["local"] = *addresses.local;
    if (addresses.tailscale) j["tailscale"] = *addresses.tailscale;
    if (addresses.vpn) j["vpn"] = *addresses.vpn;
    if (addresses.custom) j["custom"] = *addresses.custom;
}

void from_json(const nlohmann::json& j, NetworkAddressSet& addresses) {
    addresses.local = optional_string(j, "local");
    addresses.tailscale = optional_string(j, "tailscale");
    addresses.vpn = optional_string(j, "vpn");
    addresses.custom = optional_string(j, "custom");
}

void to_json(nlohmann::json& j, const LaunchItem& item) {
    j = nlohmann::json{
        {"id", item.id},
        {"networkAddresses", item.network_addresses}
    };
    if (item.protocol) j["protocol"] = *item.protocol;
    if (item.port) j["port"] = *item.port;
    if (item.path) j["path"] = *item.path;
}

// Throws nlohmann::json::exception when "id" is missing or not a string
void from_json(const nlohmann::json& j, LaunchItem& item) {
    item.id = j.at("id").get<std::string>();
    item.network_addresses = j.contains("networkAddresses")
        ? j.at("networkAddresses").get<NetworkAddressSet>()
        : NetworkAddressSet();
    item.protocol = optional_string(j, "protocol");
    item.port = (j.contains("port") && j["port"].is_number_integer())
        ? std::optional<int>(j["port"].get<int>())
        : std::nullopt;
    item.path = optional_string(j, "path");
}

} // namespace netlaunch
