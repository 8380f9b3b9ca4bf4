#include "service_browser.h"
#include <chrono>

#define LOG_BROWSER_DEBUG(message) LOG_DEBUG("browser", message)
#define LOG_BROWSER_INFO(message)  LOG_INFO("browser", message)
#define LOG_BROWSER_WARN(message)  LOG_WARN("browser", message)

namespace netlaunch {

const std::vector<BrowsedServiceType>& default_service_types() {
    static const std::vector<BrowsedServiceType> types = {
        {"_smb._tcp", ShareType::SMB},
        {"_afpovertcp._tcp", ShareType::AFP},
        {"_nfs._tcp", ShareType::NFS},
        {"_device-info._tcp", ShareType::OTHER}
    };
    return types;
}

std::optional<std::string> parse_browse_line(const std::string& line, const std::string& service_type) {
    if (line.find("Add") == std::string::npos || line.find(service_type) == std::string::npos) {
        return std::nullopt;
    }

    std::string separator = service_type + ".";
    size_t pos = line.find(separator);
    if (pos == std::string::npos) {
        return std::nullopt;
    }

    std::string name = line.substr(pos + separator.size());
    size_t first = name.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return std::nullopt;
    }
    size_t last = name.find_last_not_of(" \t\r");
    return name.substr(first, last - first + 1);
}

ServiceBrowser::ServiceBrowser(const std::string& dns_sd_path, ProcessTracker* tracker)
    : dns_sd_path_(dns_sd_path), tracker_(tracker) {
}

bool ServiceBrowser::browse(const std::string& service_type, int duration_ms, const InstanceCallback& on_instance) {
    auto process = std::make_shared<Subprocess>(
        std::vector<std::string>{dns_sd_path_, "-B", service_type, "local"});

    if (!process->start()) {
        LOG_BROWSER_WARN("dns-sd browse for " << service_type << " could not be started");
        return false;
    }

    if (tracker_) {
        tracker_->track(process);
    }

    LOG_BROWSER_DEBUG("Browsing " << service_type << " for " << duration_ms << "ms");

    auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms);
    size_t found = 0;
    std::string line;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now()).count();
        if (remaining <= 0) {
            break;
        }

        ReadStatus status = process->read_line(line, static_cast<int>(remaining));
        if (status == ReadStatus::TIMEOUT) {
            break;
        }
        if (status != ReadStatus::LINE) {
            // Browser exited or was killed by stop_scanning()
            break;
        }

        auto instance = parse_browse_line(line, service_type);
        if (instance) {
            ++found;
            LOG_BROWSER_DEBUG("Found " << service_type << " instance '" << *instance << "'");
            if (on_instance) {
                on_instance(*instance);
            }
        }
    }

    process->kill();
    if (tracker_) {
        tracker_->untrack(process);
    }

    LOG_BROWSER_INFO("Finished browsing " << service_type << ", " << found << " instance(s)");
    return true;
}

} // namespace netlaunch
