#include "node_registry.h"
#include "logger.h"
#include "telemetry.h"

#include <algorithm>
#include <mutex>

const char* node_status_name(NodeStatus status) {
    return status == NodeStatus::ACTIVE ? "active" : "stale";
}

bool DiscoveredNode::has_capability(const std::string& cap) const {
    return std::find(capabilities.begin(), capabilities.end(), cap) != capabilities.end();
}

NodeRegistry::NodeRegistry(std::chrono::milliseconds staleness_timeout, std::chrono::milliseconds stale_after)
    : m_staleness_timeout(staleness_timeout),
      m_stale_after(std::min(stale_after, staleness_timeout)) {}

NodeRegistry::UpsertResult NodeRegistry::upsert(const DiscoveredNode& node, Clock::time_point now) {
    UpsertResult result;
    size_t count;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        auto it = m_nodes.find(node.id);
        if (it == m_nodes.end()) {
            DiscoveredNode entry = node;
            entry.last_seen = now;
            entry.status = NodeStatus::ACTIVE;
            m_nodes.emplace(entry.id, std::move(entry));
            result = UpsertResult::INSERTED;
        } else {
            DiscoveredNode& entry = it->second;
            entry.name = node.name;
            entry.ip = node.ip;
            entry.port = node.port;
            entry.interface_kind = node.interface_kind;
            entry.capabilities = node.capabilities;
            entry.version = node.version;
            entry.last_seen = std::max(entry.last_seen, now);
            entry.status = NodeStatus::ACTIVE;
            result = UpsertResult::REFRESHED;
        }
        count = m_nodes.size();
    }

    if (result == UpsertResult::INSERTED) {
        LOG_INFO("REG: New node " + node.name + " (" + node.id + ") at " + node.address());
        Telemetry::getInstance().inc_counter("disc.nodes_discovered");
    }
    Telemetry::getInstance().set_gauge("disc.registry_size", static_cast<int64_t>(count));
    return result;
}

bool NodeRegistry::remove(const std::string& id) {
    size_t count;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        if (m_nodes.erase(id) == 0) {
            return false;
        }
        count = m_nodes.size();
    }
    LOG_INFO("REG: Removed node " + id);
    Telemetry::getInstance().set_gauge("disc.registry_size", static_cast<int64_t>(count));
    return true;
}

std::vector<std::string> NodeRegistry::sweep(Clock::time_point now) {
    std::vector<std::string> evicted;
    size_t count;
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        for (auto it = m_nodes.begin(); it != m_nodes.end(); ) {
            const auto age = now - it->second.last_seen;
            if (age > m_staleness_timeout) {
                evicted.push_back(it->first);
                it = m_nodes.erase(it);
                continue;
            }
            if (age > m_stale_after) {
                it->second.status = NodeStatus::STALE;
            }
            ++it;
        }
        count = m_nodes.size();
    }

    for (const auto& id : evicted) {
        LOG_INFO("REG: Evicted stale node " + id);
    }
    if (!evicted.empty()) {
        Telemetry::getInstance().inc_counter("disc.nodes_evicted", static_cast<int64_t>(evicted.size()));
    }
    Telemetry::getInstance().set_gauge("disc.registry_size", static_cast<int64_t>(count));
    return evicted;
}

std::vector<DiscoveredNode> NodeRegistry::snapshot() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    std::vector<DiscoveredNode> nodes;
    nodes.reserve(m_nodes.size());
    for (const auto& kv : m_nodes) {
        nodes.push_back(kv.second);
    }
    return nodes;
}

std::optional<DiscoveredNode> NodeRegistry::find_by_id(const std::string& id) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    auto it = m_nodes.find(id);
    if (it == m_nodes.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<DiscoveredNode> NodeRegistry::find_by_name(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    const DiscoveredNode* best = nullptr;
    for (const auto& kv : m_nodes) {
        const DiscoveredNode& n = kv.second;
        if (n.name != name) continue;
        if (!best ||
            (n.status == NodeStatus::ACTIVE && best->status != NodeStatus::ACTIVE) ||
            (n.status == best->status && n.last_seen > best->last_seen)) {
            best = &n;
        }
    }
    if (!best) {
        return std::nullopt;
    }
    return *best;
}

size_t NodeRegistry::size() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_nodes.size();
}

void NodeRegistry::clear() {
    {
        std::unique_lock<std::shared_mutex> lock(m_mutex);
        m_nodes.clear();
    }
    Telemetry::getInstance().set_gauge("disc.registry_size", 0);
}

void NodeRegistry::set_timeouts(std::chrono::milliseconds staleness_timeout, std::chrono::milliseconds stale_after) {
    std::unique_lock<std::shared_mutex> lock(m_mutex);
    m_staleness_timeout = staleness_timeout;
    m_stale_after = std::min(stale_after, staleness_timeout);
}

std::chrono::milliseconds NodeRegistry::staleness_timeout() const {
    std::shared_lock<std::shared_mutex> lock(m_mutex);
    return m_staleness_timeout;
}
