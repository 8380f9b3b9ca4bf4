#pragma once

#include "subprocess.h"
#include "share_registry.h"
#include <string>
#include <vector>
#include <functional>
#include <optional>

namespace netlaunch {

// A DNS-SD service type browsed during discovery and the share type it maps to
struct BrowsedServiceType {
    std::string service_type;  // e.g. "_smb._tcp"
    ShareType share_type;
};

/**
 * Service types browsed by default: SMB, AFP, NFS and generic device info
 */
const std::vector<BrowsedServiceType>& default_service_types();

/**
 * Extract the instance name from an "Add" line of `dns-sd -B` output:
 *   "12:00:01.123  Add  3  4 local.  _smb._tcp.  Living Room NAS" -> "Living Room NAS"
 * @return instance name, or std::nullopt for any other line
 */
std::optional<std::string> parse_browse_line(const std::string& line, const std::string& service_type);

using InstanceCallback = std::function<void(const std::string& instance_name)>;

/**
 * Browses one service type with `dns-sd -B <type> local`.
 */
class ServiceBrowser {
public:
    ServiceBrowser(const std::string& dns_sd_path, ProcessTracker* tracker = nullptr);

    /**
     * Stream instance names for duration_ms, then kill the browse process.
     * on_instance is called from the browsing thread as soon as each name is
     * seen and must not block for long.
     * @return false if the browse process could not be started
     */
    bool browse(const std::string& service_type, int duration_ms, const InstanceCallback& on_instance);

private:
    std::string dns_sd_path_;
    ProcessTracker* tracker_;
};

} // namespace netlaunch
