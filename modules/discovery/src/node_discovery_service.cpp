#include "node_discovery_service.h"
#include "config_manager.h"
#include "constants.h"
#include "epoll_reactor.h"
#include "id_utils.h"
#include "logger.h"

#include <algorithm>
#include <system_error>

#include <sys/epoll.h>

DiscoveryConfig::DiscoveryConfig()
    : port(DISCOVERY_PORT),
      multicast_group(DISCOVERY_MULTICAST_GROUP),
      announce_interval_ms(DISCOVERY_ANNOUNCE_INTERVAL_MS),
      staleness_timeout_ms(DISCOVERY_STALENESS_TIMEOUT_MS),
      sweep_interval_ms(DISCOVERY_SWEEP_INTERVAL_MS),
      retry_interval_ms(DISCOVERY_RETRY_INTERVAL_MS),
      service_port(DEFAULT_TRANSFER_PORT) {}

DiscoveryConfig DiscoveryConfig::from_config_manager() {
    auto& cfg = ConfigManager::getInstance();
    DiscoveryConfig c;
    c.port = static_cast<uint16_t>(cfg.getDiscoveryPort());
    c.multicast_group = cfg.getMulticastGroup();
    c.announce_interval_ms = std::max(10, cfg.getAnnounceInterval());
    c.staleness_timeout_ms = std::max(c.announce_interval_ms, cfg.getStalenessTimeout());
    c.sweep_interval_ms = std::max(10, std::min(cfg.getSweepInterval(), c.staleness_timeout_ms));
    c.retry_interval_ms = std::max(0, cfg.getDiscoveryRetryInterval());
    c.send_goodbye = cfg.shouldSendGoodbye();
    c.service_port = static_cast<uint16_t>(cfg.getTransferPort());
    return c;
}

const char* discovery_error_name(DiscoveryError error) {
    switch (error) {
        case DiscoveryError::NONE: return "none";
        case DiscoveryError::INTERFACE_ENUMERATION: return "interface_enumeration";
        case DiscoveryError::BIND: return "bind";
        case DiscoveryError::ALREADY_RUNNING: return "already_running";
    }
    return "unknown";
}

NodeDiscoveryService::NodeDiscoveryService(std::shared_ptr<NodeRegistry> registry, DiscoveryConfig config)
    : NodeDiscoveryService(std::move(registry), config,
                           [] {
                               InterfaceClassifier classifier;
                               return classifier.rank(classifier.enumerate());
                           },
                           [config] {
                               return std::unique_ptr<DiscoveryChannel>(
                                   new MulticastChannel(config.multicast_group, config.port));
                           }) {}

NodeDiscoveryService::NodeDiscoveryService(std::shared_ptr<NodeRegistry> registry, DiscoveryConfig config,
                                           InterfaceProvider interfaces, ChannelFactory channels)
    : m_registry(std::move(registry)),
      m_config(std::move(config)),
      m_interfaces(std::move(interfaces)),
      m_channels(std::move(channels)),
      m_node_id(generate_uuid_v4()) {
    if (!m_registry) {
        m_registry = std::make_shared<NodeRegistry>();
    }
}

NodeDiscoveryService::~NodeDiscoveryService() {
    stop();
}

DiscoveryResult NodeDiscoveryService::start(const std::string& node_name, std::optional<uint16_t> port) {
    DiscoveryResult result = start_once(node_name, port);
    if (!result.ok && result.error != DiscoveryError::ALREADY_RUNNING) {
        schedule_retry(node_name, port);
    }
    return result;
}

void NodeDiscoveryService::schedule_retry(const std::string& node_name, std::optional<uint16_t> port) {
    if (m_config.retry_interval_ms <= 0) {
        return;
    }
    std::lock_guard<std::mutex> lock(m_retry_mutex);
    if (m_retry_reactor) {
        return;
    }
    try {
        m_retry_reactor = std::make_unique<EpollReactor>();
    } catch (const std::system_error& e) {
        LOG_ERROR("DISC: Cannot schedule start retries: " + std::string(e.what()));
        return;
    }
    m_retry_reactor->runEvery(m_config.retry_interval_ms, [this, node_name, port] {
        if (m_running.load()) {
            return;
        }
        const DiscoveryResult r = start_once(node_name, port);
        if (r.ok) {
            LOG_INFO("DISC: Started after retry");
        } else {
            LOG_WARN(std::string("DISC: Start retry failed: ") + discovery_error_name(r.error) + " " + r.message);
        }
    });
    m_retry_reactor->start();
    LOG_INFO("DISC: Retrying start every " + std::to_string(m_config.retry_interval_ms) + "ms");
}

bool NodeDiscoveryService::is_retrying() const {
    std::lock_guard<std::mutex> lock(m_retry_mutex);
    return m_retry_reactor != nullptr && !m_running.load();
}

DiscoveryResult NodeDiscoveryService::start_once(const std::string& node_name, std::optional<uint16_t> port) {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_running) {
        return DiscoveryResult::failure(DiscoveryError::ALREADY_RUNNING, "discovery already running");
    }

    std::vector<NetworkInterface> ranked;
    try {
        ranked = m_interfaces();
    } catch (const std::system_error& e) {
        LOG_ERROR("DISC: Interface enumeration failed: " + std::string(e.what()));
        return DiscoveryResult::failure(DiscoveryError::INTERFACE_ENUMERATION, e.what());
    }
    const auto best = InterfaceClassifier::best_interface(ranked);
    if (!best) {
        LOG_ERROR("DISC: No interface with an IPv4 address");
        return DiscoveryResult::failure(DiscoveryError::INTERFACE_ENUMERATION, "no usable IPv4 interface");
    }

    {
        std::lock_guard<std::mutex> local_lock(m_local_mutex);
        m_local.id = m_node_id;
        m_local.name = node_name;
        m_local.port = port.value_or(m_config.service_port);
        if (m_local.capabilities.empty()) {
            m_local.capabilities = m_config.capabilities;
        }
        m_local.version = NODELINK_VERSION;
    }

    m_channel = m_channels();
    std::string error;
    if (!bind_channel(*best, &error)) {
        m_channel.reset();
        return DiscoveryResult::failure(DiscoveryError::BIND, error);
    }

    // Mark a peer stale once it misses two announcements
    m_registry->set_timeouts(std::chrono::milliseconds(m_config.staleness_timeout_ms),
                             std::chrono::milliseconds(2 * m_config.announce_interval_ms));

    try {
        m_reactor = std::make_unique<EpollReactor>();
    } catch (const std::system_error& e) {
        m_channel.reset();
        return DiscoveryResult::failure(DiscoveryError::BIND, e.what());
    }
    if (!m_reactor->add(m_channel->fd(), EPOLLIN, [this](int, uint32_t) { on_readable(); })) {
        m_channel.reset();
        m_reactor.reset();
        return DiscoveryResult::failure(DiscoveryError::BIND, "cannot register discovery socket");
    }
    m_channel_registered = true;

    m_reactor->runEvery(m_config.announce_interval_ms, [this] {
        reevaluate_interface();
        announce();
    });
    m_reactor->runEvery(m_config.sweep_interval_ms, [this] { sweep(); });
    m_running = true;
    m_reactor->start();
    m_reactor->post([this] { announce(); });

    const NodeInfo local = get_local_node();
    LOG_INFO("DISC: Node '" + local.name + "' (" + local.id + ") advertising " + local.ip + ":" +
             std::to_string(local.port) + " on " + local.interface_name + " [" +
             interface_kind_name(local.interface_kind) + "]");
    return DiscoveryResult::success();
}

void NodeDiscoveryService::stop() {
    // Joined before taking the lifecycle lock, a retry tick may be inside start_once()
    std::unique_ptr<EpollReactor> retry;
    {
        std::lock_guard<std::mutex> lock(m_retry_mutex);
        retry = std::move(m_retry_reactor);
    }
    if (retry) {
        retry->stop();
    }

    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!m_running) {
        return;
    }
    m_running = false;

    // After the reactor is joined the channel is owned by this thread again
    m_reactor->stop();
    m_reactor.reset();
    m_channel_registered = false;

    if (m_channel) {
        if (m_config.send_goodbye) {
            m_channel->send(encode_record(make_record(RecordType::BYE)));
        }
        m_channel->close();
        m_channel.reset();
    }
    LOG_INFO("DISC: Stopped, " + std::to_string(m_registry->size()) + " known node(s) kept");
}

std::vector<DiscoveredNode> NodeDiscoveryService::get_discovered_nodes() const {
    return m_registry->snapshot();
}

NodeInfo NodeDiscoveryService::get_local_node() const {
    std::lock_guard<std::mutex> lock(m_local_mutex);
    NodeInfo info = m_local;
    info.id = m_node_id;
    return info;
}

void NodeDiscoveryService::set_capabilities(std::vector<std::string> capabilities) {
    std::lock_guard<std::mutex> lock(m_local_mutex);
    m_local.capabilities = std::move(capabilities);
}

void NodeDiscoveryService::set_node_callback(NodeCallback cb) {
    std::lock_guard<std::mutex> lock(m_callback_mutex);
    m_callback = std::move(cb);
}

bool NodeDiscoveryService::bind_channel(const NetworkInterface& iface, std::string* error) {
    try {
        m_channel->open(iface.ipv4());
    } catch (const DiscoveryBindError& e) {
        LOG_ERROR("DISC: Bind on " + iface.name + " failed: " + e.what());
        if (error) *error = e.what();
        return false;
    }
    std::lock_guard<std::mutex> lock(m_local_mutex);
    m_local.ip = iface.ipv4();
    m_local.interface_kind = iface.kind;
    m_local.interface_name = iface.name;
    return true;
}

void NodeDiscoveryService::on_readable() {
    if (!m_channel) return;
    while (auto datagram = m_channel->receive()) {
        if (datagram->wire_size > DISCOVERY_MAX_DATAGRAM) {
            LOG_DEBUG("DISC: Dropping oversized datagram from " + datagram->sender_ip);
            continue;
        }
        auto record = decode_record(datagram->payload);
        if (!record || record->id == m_node_id) {
            continue;
        }
        // Records from older agents may omit the ip
        if (record->ip.empty()) {
            record->ip = datagram->sender_ip;
        }
        handle_record(*record);
    }
}

void NodeDiscoveryService::handle_record(const DiscoveryRecord& record) {
    if (record.type == RecordType::BYE) {
        auto existing = m_registry->find_by_id(record.id);
        if (existing && m_registry->remove(record.id)) {
            LOG_INFO("DISC: Node " + existing->name + " (" + record.id + ") said goodbye");
            existing->status = NodeStatus::STALE;
            notify(NodeEvent::LOST, *existing);
        }
        return;
    }

    DiscoveredNode node;
    node.id = record.id;
    node.name = record.name;
    node.ip = record.ip;
    node.port = record.port;
    node.interface_kind = record.interface_kind;
    node.capabilities = record.capabilities;
    node.version = record.version;

    if (m_registry->upsert(node) == NodeRegistry::UpsertResult::INSERTED) {
        if (auto stored = m_registry->find_by_id(node.id)) {
            notify(NodeEvent::DISCOVERED, *stored);
        }
    }
}

void NodeDiscoveryService::announce() {
    if (!m_channel || !m_channel_registered) return;
    if (!m_channel->send(encode_record(make_record(RecordType::ANNOUNCE)))) {
        LOG_WARN("DISC: Announcement not sent, retrying next interval");
    }
}

// Interfaces can flap; follow the best one and rebind when its address moves.
void NodeDiscoveryService::reevaluate_interface() {
    std::vector<NetworkInterface> ranked;
    try {
        ranked = m_interfaces();
    } catch (const std::system_error& e) {
        LOG_WARN("DISC: Interface re-check failed: " + std::string(e.what()));
        return;
    }
    const auto best = InterfaceClassifier::best_interface(ranked);
    if (!best) {
        LOG_WARN("DISC: No usable interface, keeping current binding");
        return;
    }

    std::string current_ip;
    {
        std::lock_guard<std::mutex> lock(m_local_mutex);
        current_ip = m_local.ip;
    }
    if (m_channel_registered && best->ipv4() == current_ip) {
        return;
    }

    LOG_INFO("DISC: Best interface is now " + best->name + " (" + best->ipv4() + "), rebinding");
    if (m_channel_registered) {
        m_reactor->remove(m_channel->fd());
        m_channel_registered = false;
    }
    std::string error;
    if (!bind_channel(*best, &error)) {
        return;
    }
    m_channel_registered = m_reactor->add(m_channel->fd(), EPOLLIN, [this](int, uint32_t) { on_readable(); });
    if (!m_channel_registered) {
        LOG_ERROR("DISC: Cannot register rebound socket");
    }
}

void NodeDiscoveryService::sweep() {
    std::vector<DiscoveredNode> before;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        if (m_callback) before = m_registry->snapshot();
    }
    const auto evicted = m_registry->sweep();
    if (evicted.empty() || before.empty()) {
        return;
    }
    for (const auto& node : before) {
        if (std::find(evicted.begin(), evicted.end(), node.id) != evicted.end()) {
            notify(NodeEvent::LOST, node);
        }
    }
}

DiscoveryRecord NodeDiscoveryService::make_record(RecordType type) const {
    std::lock_guard<std::mutex> lock(m_local_mutex);
    DiscoveryRecord r;
    r.type = type;
    r.id = m_node_id;
    r.name = m_local.name;
    r.ip = m_local.ip;
    r.port = m_local.port;
    r.interface_kind = m_local.interface_kind;
    r.capabilities = m_local.capabilities;
    r.version = m_local.version;
    return r;
}

void NodeDiscoveryService::notify(NodeEvent event, const DiscoveredNode& node) {
    NodeCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_callback_mutex);
        cb = m_callback;
    }
    if (cb) cb(event, node);
}
