#ifndef NODE_DISCOVERY_SERVICE_H
#define NODE_DISCOVERY_SERVICE_H

#include "discovery_channel.h"
#include "discovery_record.h"
#include "interface_classifier.h"
#include "node_registry.h"

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

class EpollReactor;

struct DiscoveryConfig {
    uint16_t port;                      // UDP multicast port
    std::string multicast_group;
    int announce_interval_ms;
    int staleness_timeout_ms;
    int sweep_interval_ms;
    int retry_interval_ms;              // failed start() is retried this often, 0 disables
    bool send_goodbye = true;
    uint16_t service_port;              // advertised transfer port unless start() overrides it
    std::vector<std::string> capabilities{"discovery", "transfer"};

    DiscoveryConfig();
    static DiscoveryConfig from_config_manager();
};

enum class DiscoveryError {
    NONE,
    INTERFACE_ENUMERATION,
    BIND,
    ALREADY_RUNNING
};

const char* discovery_error_name(DiscoveryError error);

struct DiscoveryResult {
    bool ok = true;
    DiscoveryError error = DiscoveryError::NONE;
    std::string message;

    static DiscoveryResult success() { return {}; }
    static DiscoveryResult failure(DiscoveryError e, std::string msg) { return {false, e, std::move(msg)}; }
};

// What this node advertises.
struct NodeInfo {
    std::string id;
    std::string name;
    std::string ip;
    uint16_t port = 0;
    InterfaceKind interface_kind = InterfaceKind::OTHER;
    std::string interface_name;
    std::vector<std::string> capabilities;
    std::string version;
};

enum class NodeEvent {
    DISCOVERED,
    LOST       // said goodbye or evicted
};

/**
 * Advertises this node and browses for peers on one multicast group.
 *
 * Receive, announce and sweep all run on a private reactor thread; results
 * land in the shared NodeRegistry. Discovery failures never touch transfers.
 */
class NodeDiscoveryService {
public:
    // Must return interfaces already ranked.
    using InterfaceProvider = std::function<std::vector<NetworkInterface>()>;
    using ChannelFactory = std::function<std::unique_ptr<DiscoveryChannel>()>;
    using NodeCallback = std::function<void(NodeEvent, const DiscoveredNode&)>;

    NodeDiscoveryService(std::shared_ptr<NodeRegistry> registry, DiscoveryConfig config);
    NodeDiscoveryService(std::shared_ptr<NodeRegistry> registry, DiscoveryConfig config,
                         InterfaceProvider interfaces, ChannelFactory channels);
    ~NodeDiscoveryService();

    NodeDiscoveryService(const NodeDiscoveryService&) = delete;
    NodeDiscoveryService& operator=(const NodeDiscoveryService&) = delete;

    /**
     * Binds the best interface and starts advertising and browsing.
     * On INTERFACE_ENUMERATION or BIND failure the error is returned and the
     * service keeps retrying every retry_interval_ms until it starts or
     * stop() is called; is_running() turns true once a retry succeeds.
     */
    DiscoveryResult start(const std::string& node_name, std::optional<uint16_t> port = std::nullopt);
    // Withdraws the advertisement and cancels pending retries. Registry entries are kept.
    void stop();
    bool is_retrying() const;
    bool is_running() const { return m_running.load(); }

    std::vector<DiscoveredNode> get_discovered_nodes() const;
    NodeInfo get_local_node() const;
    const std::string& node_id() const { return m_node_id; }
    std::shared_ptr<NodeRegistry> registry() const { return m_registry; }

    // Takes effect on the next announcement.
    void set_capabilities(std::vector<std::string> capabilities);
    void set_node_callback(NodeCallback cb);

private:
    DiscoveryResult start_once(const std::string& node_name, std::optional<uint16_t> port);
    void schedule_retry(const std::string& node_name, std::optional<uint16_t> port);
    bool bind_channel(const NetworkInterface& iface, std::string* error);
    void on_readable();
    void handle_record(const DiscoveryRecord& record);
    void announce();
    void reevaluate_interface();
    void sweep();
    DiscoveryRecord make_record(RecordType type) const;
    void notify(NodeEvent event, const DiscoveredNode& node);

    std::shared_ptr<NodeRegistry> m_registry;
    DiscoveryConfig m_config;
    InterfaceProvider m_interfaces;
    ChannelFactory m_channels;
    const std::string m_node_id;

    std::atomic<bool> m_running{false};
    std::mutex m_lifecycle_mutex;
    std::unique_ptr<EpollReactor> m_reactor;
    std::unique_ptr<DiscoveryChannel> m_channel;   // reactor thread only while running
    bool m_channel_registered = false;

    mutable std::mutex m_retry_mutex;
    std::unique_ptr<EpollReactor> m_retry_reactor;

    mutable std::mutex m_local_mutex;
    NodeInfo m_local;

    std::mutex m_callback_mutex;
    NodeCallback m_callback;
};

#endif // NODE_DISCOVERY_SERVICE_H
