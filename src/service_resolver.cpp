#include "service_resolver.h"
#include <chrono>
#include <regex>
#include <sstream>
#include <vector>

#define LOG_RESOLVER_DEBUG(message) LOG_DEBUG("resolver", message)
#define LOG_RESOLVER_INFO(message)  LOG_INFO("resolver", message)
#define LOG_RESOLVER_WARN(message)  LOG_WARN("resolver", message)

namespace netlaunch {

namespace {

std::string strip_trailing_dot(const std::string& host) {
    if (!host.empty() && host.back() == '.') {
        return host.substr(0, host.size() - 1);
    }
    return host;
}

bool parse_port_number(const std::string& text, int& port) {
    if (text.empty() || text.size() > 5) {
        return false;
    }
    for (char c : text) {
        if (c < '0' || c > '9') {
            return false;
        }
    }
    port = std::stoi(text);
    return port > 0 && port <= 65535;
}

} // namespace

std::optional<ResolvedService> parse_resolve_line(const std::string& line, const std::string& instance_name) {
    static const std::regex reached_regex(R"(can be reached at\s+([^:]+):(\d+))");

    std::smatch match;
    if (std::regex_search(line, match, reached_regex)) {
        int port = 0;
        std::string target = match[1].str();
        if (!target.empty() && parse_port_number(match[2].str(), port)) {
            return ResolvedService(strip_trailing_dot(target), port);
        }
    }

    if (instance_name.empty() || line.find(instance_name) == std::string::npos) {
        return std::nullopt;
    }

    std::istringstream stream(line);
    std::vector<std::string> tokens;
    std::string token;
    while (stream >> token) {
        tokens.push_back(token);
    }

    if (tokens.size() < 4) {
        return std::nullopt;
    }

    const std::string& target = tokens[tokens.size() - 1];
    int port = 0;
    if (target.find('.') == std::string::npos || !parse_port_number(tokens[tokens.size() - 2], port)) {
        return std::nullopt;
    }

    return ResolvedService(strip_trailing_dot(target), port);
}

ServiceResolver::ServiceResolver(const std::string& dns_sd_path, int timeout_ms, ProcessTracker* tracker)
    : dns_sd_path_(dns_sd_path), timeout_ms_(timeout_ms), tracker_(tracker) {
}

std::optional<ResolvedService> ServiceResolver::resolve(const std::string& instance_name,
                                                        const std::string& service_type,
                                                        const std::string& domain) {
    LOG_RESOLVER_DEBUG("Resolving '" << instance_name << "' " << service_type << " in " << domain);

    auto process = std::make_shared<Subprocess>(
        std::vector<std::string>{dns_sd_path_, "-L", instance_name, service_type, domain});

    if (!process->start()) {
        LOG_RESOLVER_WARN("Could not start resolver for '" << instance_name << "'");
        return std::nullopt;
    }

    if (tracker_) {
        tracker_->track(process);
    }

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(timeout_ms_);
    std::optional<ResolvedService> resolved;
    std::string line;

    while (!resolved) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            LOG_RESOLVER_DEBUG("Timed out resolving '" << instance_name << "'");
            break;
        }

        ReadStatus status = process->read_line(line, static_cast<int>(remaining));
        if (status != ReadStatus::LINE) {
            break;
        }

        resolved = parse_resolve_line(line, instance_name);
    }

    process->kill();
    if (tracker_) {
        tracker_->untrack(process);
    }

    if (resolved) {
        LOG_RESOLVER_INFO("'" << instance_name << "' can be reached at " << resolved->host << ":" << resolved->port);
    }
    return resolved;
}

} // namespace netlaunch
