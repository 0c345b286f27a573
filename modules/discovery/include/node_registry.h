#ifndef NODE_REGISTRY_H
#define NODE_REGISTRY_H

#include "interface_classifier.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

enum class NodeStatus {
    ACTIVE,
    STALE      // missed announcements or said goodbye, not yet evicted
};

const char* node_status_name(NodeStatus status);

struct DiscoveredNode {
    std::string id;
    std::string name;
    std::string ip;
    uint16_t port = 0;
    InterfaceKind interface_kind = InterfaceKind::OTHER;
    std::vector<std::string> capabilities;
    std::string version;
    std::chrono::steady_clock::time_point last_seen{};
    NodeStatus status = NodeStatus::ACTIVE;

    std::string address() const { return ip + ":" + std::to_string(port); }
    bool has_capability(const std::string& cap) const;
};

/**
 * Peers keyed by node id.
 *
 * Readers take a shared lock and get copies; writers are exclusive for one
 * entry update at a time. An entry is flagged STALE once it misses
 * announcements for stale_after and removed outright once its age exceeds
 * the staleness timeout.
 */
class NodeRegistry {
public:
    using Clock = std::chrono::steady_clock;

    enum class UpsertResult { INSERTED, REFRESHED };

    explicit NodeRegistry(std::chrono::milliseconds staleness_timeout = std::chrono::milliseconds(15000),
                          std::chrono::milliseconds stale_after = std::chrono::milliseconds(10000));

    // Inserts or refreshes. last_seen never moves backwards and a STALE entry
    // becomes ACTIVE again.
    UpsertResult upsert(const DiscoveredNode& node, Clock::time_point now = Clock::now());

    bool remove(const std::string& id);

    // Marks and evicts by age. Returns the evicted ids.
    std::vector<std::string> sweep(Clock::time_point now = Clock::now());

    std::vector<DiscoveredNode> snapshot() const;
    std::optional<DiscoveredNode> find_by_id(const std::string& id) const;
    // Names are not unique; returns the most recently seen ACTIVE match.
    std::optional<DiscoveredNode> find_by_name(const std::string& name) const;

    size_t size() const;
    void clear();

    void set_timeouts(std::chrono::milliseconds staleness_timeout, std::chrono::milliseconds stale_after);
    std::chrono::milliseconds staleness_timeout() const;

private:
    mutable std::shared_mutex m_mutex;
    std::unordered_map<std::string, DiscoveredNode> m_nodes;
    std::chrono::milliseconds m_staleness_timeout;
    std::chrono::milliseconds m_stale_after;
};

#endif // NODE_REGISTRY_H
