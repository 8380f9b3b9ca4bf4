#pragma once

#include <string>
#include <vector>
#include <map>
#include <mutex>
#include <optional>
#include <nlohmann/json.hpp>

namespace netlaunch {

enum class ShareType {
    SMB,
    AFP,
    NFS,
    OTHER
};

const char* share_type_to_string(ShareType type);
std::optional<ShareType> share_type_from_string(const std::string& name);

// A network service endpoint found during one discovery session
struct DiscoveredShare {
    std::string name;
    ShareType type;
    std::string host;
    std::optional<std::string> address;          // resolved IP
    std::optional<std::vector<int>> open_ports;  // ascending

    DiscoveredShare() : type(ShareType::OTHER) {}
    DiscoveredShare(const std::string& n, ShareType t, const std::string& h)
        : name(n), type(t), host(h) {}

    // Registry key, "<type>:<host>"
    std::string key() const;

    bool operator==(const DiscoveredShare& other) const {
        return name == other.name && type == other.type && host == other.host &&
               address == other.address && open_ports == other.open_ports;
    }
};

void to_json(nlohmann::json& j, const DiscoveredShare& share);

/**
 * In-memory share map of a discovery session, keyed by (type, host).
 *
 * Two discovery paths write into it concurrently: service resolution
 * (authoritative for name and host) and the neighbor sweep (authoritative for
 * open ports when resolution did not provide them). All methods are
 * thread-safe.
 */
class ShareRegistry {
public:
    void clear();

    /**
     * Insert a share produced by service resolution.
     * An entry for the same machine (same IP or same host) is replaced when it
     * came from the neighbor sweep or has the same type; its open ports and
     * address are kept if the new share has none.
     */
    void upsert_resolved(const DiscoveredShare& share);

    /**
     * Merge a share produced by the neighbor sweep.
     * If an entry already matches by IP or hostname only its open ports are
     * backfilled (when empty), otherwise the share is inserted.
     * @return true if a new entry was inserted
     */
    bool merge_neighbor(const DiscoveredShare& share);

    std::vector<DiscoveredShare> values() const;
    size_t size() const;

private:
    struct Entry {
        DiscoveredShare share;
        bool from_neighbor_sweep;
    };

    static bool same_machine(const DiscoveredShare& a, const DiscoveredShare& b);

    mutable std::mutex mutex_;
    std::map<std::string, Entry> shares_;
};

} // namespace netlaunch
