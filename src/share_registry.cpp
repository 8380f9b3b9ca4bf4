#include "share_registry.h"
#include "logger.h"

#define LOG_REGISTRY_DEBUG(message) LOG_DEBUG("registry", message)

namespace netlaunch {

const char* share_type_to_string(ShareType type) {
    switch (type) {
        case ShareType::SMB: return "smb";
        case ShareType::AFP: return "afp";
        case ShareType::NFS: return "nfs";
        case ShareType::OTHER: return "other";
    }
    return "other";
}

std::optional<ShareType> share_type_from_string(const std::string& name) {
    if (name == "smb") return ShareType::SMB;
    if (name == "afp") return ShareType::AFP;
    if (name == "nfs") return ShareType::NFS;
    if (name == "other") return ShareType::OTHER;
    return std::nullopt;
}

std::string DiscoveredShare::key() const {
    return std::string(share_type_to_string(type)) + ":" + host;
}

void to_json(nlohmann::json& j, const DiscoveredShare& share) {
    j = nlohmann::json{
        {"name", share.name},
        {"type", share_type_to_string(share.type)},
        {"host", share.host}
    };
    if (share.address) {
        j["address"] = *share.address;
    }
    if (share.open_ports) {
        j["openPorts"] = *share.open_ports;
    }
}

void ShareRegistry::clear() {
    std::lock_guard<std::mutex> lock(mutex_);
    shares_.clear();
}

bool ShareRegistry::same_machine(const DiscoveredShare& a, const DiscoveredShare& b) {
    if (a.address && b.address && *a.address == *b.address) {
        return true;
    }
    return !a.host.empty() && a.host == b.host;
}

void ShareRegistry::upsert_resolved(const DiscoveredShare& share) {
    std::lock_guard<std::mutex> lock(mutex_);

    DiscoveredShare merged = share;

    for (auto it = shares_.begin(); it != shares_.end();) {
        const DiscoveredShare& existing = it->second.share;
        bool replaceable = it->second.from_neighbor_sweep || existing.type == share.type;
        if (replaceable && same_machine(existing, share)) {
            if (!merged.open_ports && existing.open_ports) {
                merged.open_ports = existing.open_ports;
            }
            if (!merged.address && existing.address) {
                merged.address = existing.address;
            }
            LOG_REGISTRY_DEBUG("Replacing " << it->first << " with resolved " << merged.key());
            it = shares_.erase(it);
        } else {
            ++it;
        }
    }

    shares_[merged.key()] = Entry{merged, false};
}

bool ShareRegistry::merge_neighbor(const DiscoveredShare& share) {
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& entry : shares_) {
        DiscoveredShare& existing = entry.second.share;
        if (same_machine(existing, share)) {
            bool missing_ports = !existing.open_ports || existing.open_ports->empty();
            if (missing_ports && share.open_ports) {
                existing.open_ports = share.open_ports;
            }
            LOG_REGISTRY_DEBUG("Neighbor " << share.host << " already known as " << entry.first);
            return false;
        }
    }

    shares_[share.key()] = Entry{share, true};
    return true;
}

std::vector<DiscoveredShare> ShareRegistry::values() const {
    std::lock_guard<std::mutex> lock(mutex_);

    std::vector<DiscoveredShare> result;
    result.reserve(shares_.size());
    for (const auto& entry : shares_) {
        result.push_back(entry.second.share);
    }
    return result;
}

size_t ShareRegistry::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return shares_.size();
}

} // namespace netlaunch
