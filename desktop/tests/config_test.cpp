#include "config_manager.h"
#include "constants.h"
#include "id_utils.h"
#include "logger.h"
#include "node_discovery_service.h"
#include "telemetry.h"
#include "transfer_types.h"
#include "test_support.h"

#include <fstream>
#include <iostream>
#include <mutex>
#include <set>
#include <vector>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

static bool test_defaults() {
    auto& cfg = ConfigManager::getInstance();
    cfg.reset();
    TEST_ASSERT(cfg.getTransferPort() == DEFAULT_TRANSFER_PORT, "transfer port default");
    TEST_ASSERT(cfg.getDiscoveryPort() == DISCOVERY_PORT, "discovery port default");
    TEST_ASSERT(cfg.getMulticastGroup() == DISCOVERY_MULTICAST_GROUP, "group default");
    TEST_ASSERT(cfg.getChunkSize() == DEFAULT_CHUNK_SIZE, "chunk default");
    TEST_ASSERT(cfg.getConcurrentStreams() == DEFAULT_CONCURRENT_STREAMS, "streams default");
    TEST_ASSERT(cfg.isRdmaEnabled(), "rdma on by default");
    TEST_ASSERT(cfg.getLogLevel() == "info", "log level default");
    TEST_ASSERT(cfg.getDiscoveryRetryInterval() == DISCOVERY_RETRY_INTERVAL_MS, "discovery retry default");
    TEST_ASSERT(!cfg.getReceiveDirectory().empty(), "receive dir always set");
    return true;
}

static bool test_load_and_override() {
    auto& cfg = ConfigManager::getInstance();
    TEST_ASSERT(cfg.loadFromString(R"({
        "node": {"name": "rack-7"},
        "file_transfer": {"port": 9000, "chunk_size": 65536, "concurrent_streams": 8},
        "discovery": {"announce_interval_ms": 250},
        "rdma": {"enabled": false, "cooldown_ms": 1000}
    })"), "valid document");
    TEST_ASSERT(cfg.getNodeName() == "rack-7", "node name");
    TEST_ASSERT(cfg.getTransferPort() == 9000, "port");
    TEST_ASSERT(cfg.getChunkSize() == 65536, "chunk size");
    TEST_ASSERT(cfg.getAnnounceInterval() == 250, "announce interval");
    TEST_ASSERT(!cfg.isRdmaEnabled() && cfg.getRdmaCooldownMs() == 1000, "rdma section");
    TEST_ASSERT(cfg.getSweepInterval() == DISCOVERY_SWEEP_INTERVAL_MS, "unset keys keep defaults");

    TEST_ASSERT(cfg.setValueAtPath({"file_transfer", "port"}, 9100), "override");
    TEST_ASSERT(cfg.getTransferPort() == 9100, "override visible");
    TEST_ASSERT(cfg.setValueAtPath({"logging", "level"}, "debug"), "new section");
    TEST_ASSERT(cfg.snapshot()["logging"]["level"] == "debug", "snapshot reflects override");
    TEST_ASSERT(!cfg.setValueAtPath({}, 1), "empty path refused");

    TEST_ASSERT(!cfg.loadFromString("[1, 2]"), "non-object root refused");
    TEST_ASSERT(!cfg.loadFromString("{ broken"), "parse error refused");
    TEST_ASSERT(cfg.getTransferPort() == 9100, "failed load keeps previous config");

    TEST_ASSERT(cfg.setValueAtPath({"file_transfer", "port"}, "not a number"), "wrong type stored");
    TEST_ASSERT(cfg.getTransferPort() == DEFAULT_TRANSFER_PORT, "wrong type falls back to default");

    TEST_ASSERT(!cfg.loadConfig("/nonexistent/nodelink.json"), "missing file");
    cfg.reset();
    return true;
}

static bool test_load_file(const std::filesystem::path& dir) {
    const auto path = dir / "node.json";
    {
        std::ofstream(path) << R"({"file_transfer": {"receive_dir": "/srv/inbox"}})";
    }
    auto& cfg = ConfigManager::getInstance();
    TEST_ASSERT(cfg.loadConfig(path.string()), "file loads");
    TEST_ASSERT(cfg.getReceiveDirectory() == "/srv/inbox", "receive dir from file");
    cfg.reset();
    return true;
}

static bool test_typed_configs() {
    auto& cfg = ConfigManager::getInstance();
    TEST_ASSERT(cfg.loadFromString(R"({
        "file_transfer": {"chunk_size": 0, "buffer_pool_size": 0, "concurrent_streams": 2,
                          "max_stream_retries": 5, "receive_dir": "/tmp/in"},
        "rdma": {"enabled": false},
        "discovery": {"announce_interval_ms": 1, "staleness_timeout_ms": 5, "sweep_interval_ms": 100000}
    })"), "load");

    const auto t = TransferConfig::from_config_manager();
    TEST_ASSERT(t.chunk_size == DEFAULT_CHUNK_SIZE, "zero chunk size replaced");
    TEST_ASSERT(t.buffer_pool_size == DEFAULT_BUFFER_POOL_SIZE, "zero pool size replaced");
    TEST_ASSERT(t.concurrent_streams == 2 && t.max_stream_retries == 5, "copied fields");
    TEST_ASSERT(t.receive_dir == "/tmp/in" && !t.rdma_enabled, "directory and rdma");

    const auto d = DiscoveryConfig::from_config_manager();
    TEST_ASSERT(d.announce_interval_ms == 10, "announce interval floor");
    TEST_ASSERT(d.staleness_timeout_ms == 10, "staleness never below announce interval");
    TEST_ASSERT(d.sweep_interval_ms == 10, "sweep never above staleness");
    TEST_ASSERT(d.service_port == DEFAULT_TRANSFER_PORT, "advertises transfer port");
    TEST_ASSERT(d.retry_interval_ms == DISCOVERY_RETRY_INTERVAL_MS, "retry interval default");
    cfg.reset();
    return true;
}

static bool test_log_levels() {
    TEST_ASSERT(parse_log_level("debug") == LogLevel::DEBUG, "debug");
    TEST_ASSERT(parse_log_level("WARN") == LogLevel::WARNING, "warn, any case");
    TEST_ASSERT(parse_log_level("warning") == LogLevel::WARNING, "warning");
    TEST_ASSERT(parse_log_level("none") == LogLevel::NONE, "none");
    TEST_ASSERT(parse_log_level("chatty") == LogLevel::INFO, "unknown maps to info");

    std::mutex mu;
    std::vector<std::string> lines;
    setLogCallback([&](const std::string& line) {
        std::lock_guard<std::mutex> lock(mu);
        lines.push_back(line);
    });
    set_log_level(LogLevel::WARNING);
    setSessionId("cfgtest1");
    LOG_INFO("CFG: hidden");
    LOG_WARN("CFG: visible");

    enable_async_logging();
    TEST_ASSERT(is_async_logging_enabled(), "async mode on");
    LOG_ERROR("CFG: queued");
    disable_async_logging();
    TEST_ASSERT(!is_async_logging_enabled(), "async mode off");
    setLogCallback(nullptr);
    set_log_level(LogLevel::NONE);

    std::lock_guard<std::mutex> lock(mu);
    TEST_ASSERT(lines.size() == 2, "level filters messages, queue drained on disable");
    TEST_ASSERT(lines[0].find("CFG: visible") != std::string::npos, "message text kept");
    TEST_ASSERT(lines[0].find("[cfgtest1]") != std::string::npos, "session id prefix");
    TEST_ASSERT(lines[1].find("CFG: queued") != std::string::npos, "async message delivered");
    return true;
}

static bool test_uuid() {
    std::set<std::string> ids;
    for (int i = 0; i < 200; ++i) {
        const std::string id = generate_uuid_v4();
        TEST_ASSERT(id.size() == 36, "canonical length");
        TEST_ASSERT(id[8] == '-' && id[13] == '-' && id[18] == '-' && id[23] == '-', "dash positions");
        TEST_ASSERT(id[14] == '4', "version nibble");
        TEST_ASSERT(id[19] == '8' || id[19] == '9' || id[19] == 'a' || id[19] == 'b', "variant nibble");
        ids.insert(id);
    }
    TEST_ASSERT(ids.size() == 200, "unique");
    return true;
}

static bool test_telemetry() {
    auto& t = Telemetry::getInstance();
    Telemetry::Config tc;
    tc.log_json = false;
    tc.flush_interval_ms = 0;
    t.initialize("node-under-test", tc);

    const int64_t before = t.counter_value("transfers_started");
    t.inc_counter("transfers_started");
    t.inc_counter("transfers_started", 2);
    TEST_ASSERT(t.counter_value("transfers_started") == before + 3, "counter accumulates");
    t.set_gauge("active_transfers", 4);
    t.set_gauge("active_transfers", 2);
    TEST_ASSERT(t.gauge_value("active_transfers") == 2, "gauge keeps last value");
    t.observe_hist_ms("verify_ms", 10);
    t.record_progress({"abc", 50, 100, 1.0, 50.0});

    const auto snap = json::parse(t.snapshot_json("test"));
    TEST_ASSERT(snap["node_id"] == "node-under-test", "node id");
    TEST_ASSERT(snap["reason"] == "test", "reason");
    TEST_ASSERT(snap.dump().find("abc") != std::string::npos, "progress entry present");
    t.clear_progress("abc");
    TEST_ASSERT(json::parse(t.snapshot_json()).dump().find("\"abc\"") == std::string::npos, "progress cleared");

    tc.enabled = false;
    t.initialize("node-under-test", tc);
    t.inc_counter("transfers_started");
    TEST_ASSERT(t.snapshot_json() == "{}", "disabled telemetry is silent");
    return true;
}

int main() {
    set_log_level(LogLevel::NONE);
    const auto workdir = test_support::make_workdir("config");
    std::cout << "--- Config and core tests ---" << std::endl;

    if (test_defaults()) std::cout << "PASS: defaults" << std::endl;
    if (test_load_and_override()) std::cout << "PASS: load and override" << std::endl;
    if (test_load_file(workdir)) std::cout << "PASS: load file" << std::endl;
    if (test_typed_configs()) std::cout << "PASS: typed configs" << std::endl;
    if (test_log_levels()) std::cout << "PASS: log levels" << std::endl;
    if (test_uuid()) std::cout << "PASS: uuid" << std::endl;
    if (test_telemetry()) std::cout << "PASS: telemetry" << std::endl;

    std::error_code ec;
    std::filesystem::remove_all(workdir, ec);

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
