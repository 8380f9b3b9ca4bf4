#pragma once

#include "subprocess.h"
#include <string>
#include <optional>

namespace netlaunch {

const int DEFAULT_RESOLVE_TIMEOUT_MS = 3000;

struct ResolvedService {
    std::string host;  // without trailing dot
    int port;

    ResolvedService() : port(0) {}
    ResolvedService(const std::string& h, int p) : host(h), port(p) {}
};

/**
 * Parse one line of `dns-sd -L` output.
 * Understands "... can be reached at host.local.:445 (interface 4)" and the
 * columnar "... <priority> <weight> <port> <target>" layout. The columnar form
 * is only accepted on lines mentioning the instance name.
 */
std::optional<ResolvedService> parse_resolve_line(const std::string& line, const std::string& instance_name);

/**
 * Resolves a browsed service instance to host:port by running `dns-sd -L`.
 */
class ServiceResolver {
public:
    ServiceResolver(const std::string& dns_sd_path,
                    int timeout_ms = DEFAULT_RESOLVE_TIMEOUT_MS,
                    ProcessTracker* tracker = nullptr);

    /**
     * @return host and port, or std::nullopt on timeout, spawn failure or
     *         unrecognised output. The subprocess is killed either way.
     */
    std::optional<ResolvedService> resolve(const std::string& instance_name,
                                           const std::string& service_type,
                                           const std::string& domain = "local");

    int timeout_ms() const { return timeout_ms_; }

private:
    std::string dns_sd_path_;
    int timeout_ms_;
    ProcessTracker* tracker_;
};

} // namespace netlaunch
