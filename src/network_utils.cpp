#include <netdb.h>
#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>

#include "network_utils.h"
#include "logger.h"
#include <cstring>
#include <regex>

// Network utilities module logging macros
#define LOG_NETUTILS_DEBUG(message) LOG_DEBUG("network_utils", message)
#define LOG_NETUTILS_INFO(message)  LOG_INFO("network_utils", message)
#define LOG_NETUTILS_WARN(message)  LOG_WARN("network_utils", message)
#define LOG_NETUTILS_ERROR(message) LOG_ERROR("network_utils", message)

namespace netlaunch {
namespace network_utils {

std::optional<std::string> resolve_hostname(const std::string& hostname) {
    LOG_NETUTILS_DEBUG("Resolving hostname: " << hostname);

    if (hostname.empty()) {
        return std::nullopt;
    }

    if (is_valid_ipv4(hostname)) {
        return hostname;
    }

    struct addrinfo hints;
    struct addrinfo* result = nullptr;
    memset(&hints, 0, sizeof(hints));
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    int status = getaddrinfo(hostname.c_str(), nullptr, &hints, &result);
    if (status != 0) {
        LOG_NETUTILS_WARN("Failed to resolve hostname " << hostname << ": " << gai_strerror(status));
        return std::nullopt;
    }

    char ip_str[INET_ADDRSTRLEN];
    struct sockaddr_in* addr_in = reinterpret_cast<struct sockaddr_in*>(result->ai_addr);
    const char* converted = inet_ntop(AF_INET, &addr_in->sin_addr, ip_str, INET_ADDRSTRLEN);
    freeaddrinfo(result);

    if (converted == nullptr) {
        LOG_NETUTILS_ERROR("inet_ntop failed for " << hostname);
        return std::nullopt;
    }

    LOG_NETUTILS_DEBUG("Resolved " << hostname << " to " << ip_str);
    return std::string(ip_str);
}

std::optional<std::string> reverse_lookup(const std::string& ip_address) {
    struct sockaddr_storage storage;
    socklen_t len = 0;
    memset(&storage, 0, sizeof(storage));

    if (is_valid_ipv4(ip_address)) {
        auto* sa = reinterpret_cast<struct sockaddr_in*>(&storage);
        sa->sin_family = AF_INET;
        inet_pton(AF_INET, ip_address.c_str(), &sa->sin_addr);
        len = sizeof(struct sockaddr_in);
    } else if (is_valid_ipv6(ip_address)) {
        auto* sa = reinterpret_cast<struct sockaddr_in6*>(&storage);
        sa->sin6_family = AF_INET6;
        inet_pton(AF_INET6, ip_address.c_str(), &sa->sin6_addr);
        len = sizeof(struct sockaddr_in6);
    } else {
        LOG_NETUTILS_DEBUG("Reverse lookup skipped for non-IP input: " << ip_address);
        return std::nullopt;
    }

    char host[NI_MAXHOST];
    int status = getnameinfo(reinterpret_cast<struct sockaddr*>(&storage), len,
                             host, sizeof(host), nullptr, 0, NI_NAMEREQD);
    if (status != 0) {
        LOG_NETUTILS_DEBUG("Reverse lookup failed for " << ip_address << ": " << gai_strerror(status));
        return std::nullopt;
    }

    return std::string(host);
}

bool is_valid_ipv4(const std::string& ip_str) {
    struct sockaddr_in sa;
    return inet_pton(AF_INET, ip_str.c_str(), &sa.sin_addr) == 1;
}

bool is_valid_ipv6(const std::string& ip_str) {
    struct sockaddr_in6 sa;
    return inet_pton(AF_INET6, ip_str.c_str(), &sa.sin6_addr) == 1;
}

bool is_hostname(const std::string& str) {
    if (is_valid_ipv4(str) || is_valid_ipv6(str)) {
        return false;
    }

    if (str.empty() || str.length() > 253) {
        return false;
    }

    if (str.front() == '.' || str.front() == '-' || str.back() == '-') {
        return false;
    }

    if (str.find("..") != std::string::npos) {
        return false;
    }

    for (char c : str) {
        bool allowed = (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                       (c >= '0' && c <= '9') || c == '-' || c == '.' || c == '_';
        if (!allowed) {
            return false;
        }
    }

    return true;
}

std::vector<std::string> extract_parenthesized_ipv4(const std::string& text) {
    static const std::regex ip_regex(R"(\((\d{1,3}\.\d{1,3}\.\d{1,3}\.\d{1,3})\))");

    std::vector<std::string> addresses;
    auto begin = std::sregex_iterator(text.begin(), text.end(), ip_regex);
    auto end = std::sregex_iterator();
    for (auto it = begin; it != end; ++it) {
        addresses.push_back((*it)[1].str());
    }
    return addresses;
}

bool is_multicast_or_broadcast(const std::string& ipv4) {
    if (ipv4.compare(0, 4, "224.") == 0 || ipv4.compare(0, 4, "239.") == 0) {
        return true;
    }
    return ipv4.size() >= 4 && ipv4.compare(ipv4.size() - 4, 4, ".255") == 0;
}

} // namespace network_utils
} // namespace netlaunch
