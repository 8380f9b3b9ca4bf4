#pragma once

#include "logger.h"
#include <string>
#include <vector>

namespace netlaunch {

#define LOG_PROBE_DEBUG(message) LOG_DEBUG("probe", message)
#define LOG_PROBE_INFO(message)  LOG_INFO("probe", message)
#define LOG_PROBE_WARN(message)  LOG_WARN("probe", message)
#define LOG_PROBE_ERROR(message) LOG_ERROR("probe", message)

// Short timeout for local network probes
const int DEFAULT_PORT_PROBE_TIMEOUT_MS = 400;
const size_t DEFAULT_PORT_PROBE_CONCURRENCY = 10;

enum class PortPreset {
    Basic,  // common service ports
    Deep    // basic plus dev servers and databases
};

/**
 * Ports probed for a preset, in probing order (not sorted)
 */
const std::vector<int>& preset_ports(PortPreset preset);

/**
 * Open a single TCP connection to host:port.
 * The socket is always closed before returning. Timeouts and connection
 * errors are both reported as false.
 * @param host Hostname, IPv4 or IPv6 literal
 * @param port TCP port
 * @param timeout_ms Connect deadline in milliseconds
 * @return true if the connection was established
 */
bool probe_port(const std::string& host, int port, int timeout_ms = DEFAULT_PORT_PROBE_TIMEOUT_MS);

/**
 * Probe a list of ports in fixed-size concurrent batches.
 * Batches run one after another in submission order.
 * @param host Host to probe
 * @param ports Ports to probe
 * @param concurrency Maximum number of connects in flight at once (0 is treated as 1)
 * @param timeout_ms Per-connect deadline
 * @return Open ports sorted ascending
 */
std::vector<int> probe_ports(const std::string& host,
                             const std::vector<int>& ports,
                             size_t concurrency = DEFAULT_PORT_PROBE_CONCURRENCY,
                             int timeout_ms = DEFAULT_PORT_PROBE_TIMEOUT_MS);

std::vector<int> scan_ports(const std::string& host, PortPreset preset,
                            size_t concurrency = DEFAULT_PORT_PROBE_CONCURRENCY,
                            int timeout_ms = DEFAULT_PORT_PROBE_TIMEOUT_MS);

/**
 * Parse a port list argument: "basic", "deep" or a comma separated list.
 * Returns false when a list entry is not a port number.
 */
bool parse_port_spec(const std::string& spec, std::vector<int>& ports_out);

} // namespace netlaunch
