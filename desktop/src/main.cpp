#include "config_manager.h"
#include "constants.h"
#include "file_transfer_manager.h"
#include "logger.h"
#include "node_discovery_service.h"
#include "rdma_transport.h"
#include "resume_store.h"
#include "telemetry.h"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <signal.h>
#include <string>
#include <thread>
#include <vector>

namespace {
std::atomic<bool> g_stop_requested{false};

void handle_stop_signal(int) {
    g_stop_requested.store(true);
}

void print_usage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [config.json]\n\n"
              << "Runs a nodelink agent: advertises this node on the local network,\n"
              << "tracks peers and receives files into file_transfer.receive_dir.\n"
              << "Without an argument, config.json is looked up next to the working\n"
              << "directory and the executable; built-in defaults apply if none is found.\n"
              << std::endl;
}

std::string load_configuration(const std::string& explicit_path, const char* argv0) {
    auto& cfg = ConfigManager::getInstance();
    if (!explicit_path.empty()) {
        return cfg.loadConfig(explicit_path) ? explicit_path : "";
    }

    std::vector<std::string> candidates = {"config.json", "../config.json", "../../config.json"};
    std::error_code ec;
    const auto exe_dir = std::filesystem::absolute(argv0, ec).parent_path();
    if (!ec) {
        candidates.push_back((exe_dir / "config.json").string());
        candidates.push_back((exe_dir / "../config.json").lexically_normal().string());
    }
    for (const auto& c : candidates) {
        if (std::filesystem::exists(c, ec) && cfg.loadConfig(c)) {
            return c;
        }
    }
    return "";
}

void log_peers(const NodeDiscoveryService& discovery) {
    const auto nodes = discovery.get_discovered_nodes();
    LOG_INFO("MAIN: " + std::to_string(nodes.size()) + " peer(s) known");
    for (const auto& n : nodes) {
        std::string caps;
        for (const auto& c : n.capabilities) {
            caps += (caps.empty() ? "" : ",") + c;
        }
        LOG_INFO("MAIN:   " + n.name + " " + n.address() + " [" + interface_kind_name(n.interface_kind) +
                 ", " + node_status_name(n.status) + "] caps=" + caps);
    }
}
} // namespace

int main(int argc, char* argv[]) {
    // Ignore SIGPIPE to prevent process termination on socket write errors
    signal(SIGPIPE, SIG_IGN);
    signal(SIGINT, handle_stop_signal);
    signal(SIGTERM, handle_stop_signal);

    std::string config_path;
    if (argc > 2) {
        print_usage(argv[0]);
        return 1;
    }
    if (argc == 2) {
        const std::string arg = argv[1];
        if (arg == "--help" || arg == "-h") {
            print_usage(argv[0]);
            return 0;
        }
        config_path = arg;
    }

    const std::string loaded = load_configuration(config_path, argv[0]);
    if (!config_path.empty() && loaded.empty()) {
        std::cerr << "Error: Failed to load configuration from " << config_path << std::endl;
        return 1;
    }

    auto& cfg = ConfigManager::getInstance();
    set_log_level(parse_log_level(cfg.getLogLevel()));
    if (cfg.isAsyncLogging()) {
        enable_async_logging();
    }
    LOG_INFO("MAIN: nodelink " + std::string(NODELINK_VERSION) + " starting, config " +
             (loaded.empty() ? std::string("built-in defaults") : loaded));

    DiscoveryConfig discovery_config = DiscoveryConfig::from_config_manager();
    auto registry = std::make_shared<NodeRegistry>();
    NodeDiscoveryService discovery(registry, discovery_config);
    setSessionId(discovery.node_id().substr(0, 8));

    Telemetry::Config telemetry_config;
    telemetry_config.enabled = cfg.isTelemetryEnabled();
    telemetry_config.flush_interval_ms = cfg.getTelemetryFlushInterval();
    telemetry_config.file_path = cfg.getTelemetryFilePath();
    Telemetry::getInstance().initialize(discovery.node_id(), telemetry_config);

    std::shared_ptr<RdmaTransport> rdma;
    if (cfg.isRdmaEnabled()) {
        rdma = make_default_rdma_transport();
    }
    TransferConfig transfer_config = TransferConfig::from_config_manager();
    FileTransferManager transfers(transfer_config, registry, rdma);
    transfers.on_transfer_event([](const TransferEvent& ev) {
        if (ev.type == TransferEventType::PROGRESS) {
            return;
        }
        const char* verb = ev.type == TransferEventType::STARTED   ? "started"
                           : ev.type == TransferEventType::COMPLETED ? "completed"
                                                                     : "failed";
        LOG_INFO(std::string("MAIN: ") + (ev.direction == TransferDirection::RECEIVE ? "Receive" : "Send") +
                 " of '" + ev.file_name + "' " + verb +
                 (ev.type == TransferEventType::FAILED ? std::string(": ") + transfer_error_name(ev.error) : ""));
    });

    const std::string listen_address = transfers.start_server();
    if (listen_address.empty()) {
        std::cerr << "Error: Failed to start transfer server on port " << transfer_config.port << std::endl;
        return 1;
    }

    const auto pending = ResumeStore(transfers.receive_directory()).load_all();
    if (!pending.empty()) {
        LOG_INFO("MAIN: " + std::to_string(pending.size()) + " interrupted inbound transfer(s) can be resumed");
    }

    const RdmaSupport rdma_support = transfers.rdma_support();
    LOG_INFO(std::string("MAIN: RDMA ") + rdma_support_name(rdma_support) +
             (rdma && rdma_support == RdmaSupport::SUPPORTED ? " (" + rdma->device_name() + ")" : ""));

    if (cfg.isDiscoveryEnabled()) {
        if (rdma_support == RdmaSupport::SUPPORTED) {
            discovery.set_capabilities({"discovery", "transfer", "rdma"});
        }
        discovery.set_node_callback([](NodeEvent event, const DiscoveredNode& node) {
            LOG_INFO(std::string("MAIN: Peer ") + (event == NodeEvent::DISCOVERED ? "joined: " : "left: ") +
                     node.name + " (" + node.address() + ")");
        });
        const auto result = discovery.start(cfg.getNodeName(), transfers.server_port());
        if (!result.ok) {
            // Transfers keep working by address while discovery retries in the background.
            LOG_ERROR(std::string("MAIN: Discovery unavailable: ") + discovery_error_name(result.error) + " " +
                      result.message + (discovery.is_retrying() ? ", retrying" : ""));
        }
    } else {
        LOG_INFO("MAIN: Discovery disabled by configuration");
    }

    LOG_INFO("MAIN: Ready, receiving on " + listen_address);

    const auto peer_log_interval = std::chrono::milliseconds(std::max(1000, discovery_config.announce_interval_ms * 6));
    auto next_peer_log = std::chrono::steady_clock::now() + peer_log_interval;
    while (!g_stop_requested.load()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
        Telemetry::getInstance().tick();
        if (discovery.is_running() && std::chrono::steady_clock::now() >= next_peer_log) {
            log_peers(discovery);
            next_peer_log = std::chrono::steady_clock::now() + peer_log_interval;
        }
    }

    LOG_INFO("MAIN: Shutting down");
    discovery.stop();
    transfers.stop_server();
    Telemetry::getInstance().flush("shutdown");
    disable_async_logging();
    return 0;
}
