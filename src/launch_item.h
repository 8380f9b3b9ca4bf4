#pragma once

#include <string>
#include <vector>
#include <optional>
#include <nlohmann/json.hpp>

namespace netlaunch {

// Network context through which an item is reached
enum class NetworkProfile {
    LOCAL,
    TAILSCALE,
    VPN,
    CUSTOM
};

const char* profile_to_string(NetworkProfile profile);
std::optional<NetworkProfile> profile_from_string(const std::string& name);

/**
 * Profiles in routing preference order: local, tailscale, vpn, custom
 */
const std::vector<NetworkProfile>& profiles_in_preference_order();

// The same logical endpoint as seen from each network context
struct NetworkAddressSet {
    std::optional<std::string> local;
    std::optional<std::string> tailscale;
    std::optional<std::string> vpn;
    std::optional<std::string> custom;

    /**
     * The address configured for exactly this profile, if non-empty
     */
    std::optional<std::string> address_for(NetworkProfile profile) const;

    /**
     * Address used when launching with a profile, falling back to other slots:
     * local -> local, tailscale, vpn; tailscale -> tailscale, local;
     * vpn -> vpn, local; custom -> custom, local
     */
    std::optional<std::string> host_for_profile(NetworkProfile profile) const;
};

// Minimal view of a launcher item needed to build URLs and probe them
struct LaunchItem {
    std::string id;
    NetworkAddressSet network_addresses;
    std::optional<std::string> protocol;  // defaults to "https"
    std::optional<int> port;
    std::optional<std::string> path;

    std::string effective_protocol() const;
};

/**
 * Build a URL from an explicit host:
 *   "<protocol>://<host>[:port][/path]"
 * IPv6 hosts are bracketed, http/80 and https/443 omit the port, paths get a
 * leading '/'. "about" and "mailto" produce "<protocol>:<host><path>".
 */
std::string build_url_for_host(const LaunchItem& item, const std::string& host);

/**
 * Build the URL for a profile using host_for_profile()
 * @return URL, or std::nullopt when no address is configured for the profile
 */
std::optional<std::string> build_url(const LaunchItem& item, NetworkProfile profile);

/**
 * Build the URL from exactly the profile's own slot (no fallback)
 */
std::optional<std::string> build_profile_url(const LaunchItem& item, NetworkProfile profile);

void to_json(nlohmann::json& j, const NetworkAddressSet& addresses);
void from_json(const nlohmann::json& j, NetworkAddressSet& addresses);
void to_json(nlohmann::json& j, const LaunchItem& item);
void from_json(const nlohmann::json& j, LaunchItem& item);

} // namespace netlaunch
