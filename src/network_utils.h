#pragma once

#include <string>
#include <vector>
#include <optional>

namespace netlaunch {
namespace network_utils {

/**
 * Resolve hostname to an IPv4 address
 * @param hostname The hostname to resolve (can be hostname or IP address)
 * @return IPv4 address string, or std::nullopt on error
 *
 * Example usage:
 *   auto ip = network_utils::resolve_hostname("nas.local");
 *   auto ip2 = network_utils::resolve_hostname("192.168.1.1"); // returns same IP
 */
std::optional<std::string> resolve_hostname(const std::string& hostname);

/**
 * Reverse DNS lookup
 * @param ip_address IPv4 or IPv6 literal
 * @return Hostname the address maps to, or std::nullopt if there is no PTR record
 *
 * Example usage:
 *   auto name = network_utils::reverse_lookup("192.168.1.20"); // "nas.lan"
 */
std::optional<std::string> reverse_lookup(const std::string& ip_address);

/**
 * Check if a string is a valid IPv4 address
 *   network_utils::is_valid_ipv4("192.168.1.1"); // true
 *   network_utils::is_valid_ipv4("invalid.ip");  // false
 */
bool is_valid_ipv4(const std::string& ip_str);

/**
 * Check if a string is a valid IPv6 address (without brackets)
 *   network_utils::is_valid_ipv6("fe80::1");     // true
 *   network_utils::is_valid_ipv6("192.168.1.1"); // false
 */
bool is_valid_ipv6(const std::string& ip_str);

/**
 * Check if a string is a hostname (not an IP address)
 *   network_utils::is_hostname("nas.local");   // true
 *   network_utils::is_hostname("192.168.1.1"); // false
 */
bool is_hostname(const std::string& str);

/**
 * Extract every parenthesized IPv4 address from text, in order of appearance.
 * This is the format of `arp -a` output: "? (192.168.1.1) at aa:bb:... on en0".
 */
std::vector<std::string> extract_parenthesized_ipv4(const std::string& text);

/**
 * Multicast (224.x, 239.x) and broadcast (x.x.x.255) addresses are never
 * unicast neighbors worth probing
 */
bool is_multicast_or_broadcast(const std::string& ipv4);

} // namespace network_utils
} // namespace netlaunch
