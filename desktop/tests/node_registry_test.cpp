#include "node_registry.h"
#include "logger.h"

#include <atomic>
#include <chrono>
#include <iostream>
#include <thread>
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

using namespace std::chrono;

static DiscoveredNode make_node(const std::string& id, const std::string& name, const std::string& ip) {
    DiscoveredNode n;
    n.id = id;
    n.name = name;
    n.ip = ip;
    n.port = 7879;
    n.interface_kind = InterfaceKind::ETHERNET;
    n.capabilities = {"discovery", "transfer"};
    n.version = "0.2.0";
    return n;
}

static bool test_upsert_and_refresh() {
    NodeRegistry reg(milliseconds(1000), milliseconds(500));
    const auto t0 = NodeRegistry::Clock::now();

    TEST_ASSERT(reg.upsert(make_node("a", "alpha", "10.0.0.1"), t0) == NodeRegistry::UpsertResult::INSERTED,
                "first sighting inserts");
    auto moved = make_node("a", "alpha", "10.0.0.9");
    TEST_ASSERT(reg.upsert(moved, t0 + milliseconds(100)) == NodeRegistry::UpsertResult::REFRESHED,
                "second sighting refreshes");
    TEST_ASSERT(reg.size() == 1, "one entry per id");

    auto found = reg.find_by_id("a");
    TEST_ASSERT(found.has_value(), "found by id");
    TEST_ASSERT(found->ip == "10.0.0.9", "address updated on refresh");
    TEST_ASSERT(found->address() == "10.0.0.9:7879", "address string");
    TEST_ASSERT(found->has_capability("transfer"), "capabilities copied");
    TEST_ASSERT(!found->has_capability("rdma"), "no rdma capability");
    TEST_ASSERT(found->last_seen == t0 + milliseconds(100), "last_seen refreshed");

    reg.upsert(make_node("a", "alpha", "10.0.0.9"), t0);
    found = reg.find_by_id("a");
    TEST_ASSERT(found->last_seen == t0 + milliseconds(100), "last_seen never moves backwards");
    return true;
}

static bool test_sweep_marks_then_evicts() {
    NodeRegistry reg(milliseconds(1000), milliseconds(400));
    const auto t0 = NodeRegistry::Clock::now();
    reg.upsert(make_node("a", "alpha", "10.0.0.1"), t0);
    reg.upsert(make_node("b", "beta", "10.0.0.2"), t0 + milliseconds(800));

    auto evicted = reg.sweep(t0 + milliseconds(500));
    TEST_ASSERT(evicted.empty(), "nothing evicted before the timeout");
    TEST_ASSERT(reg.find_by_id("a")->status == NodeStatus::STALE, "missed announcements mark stale");
    TEST_ASSERT(reg.find_by_id("b")->status == NodeStatus::ACTIVE, "recent node active");

    reg.upsert(make_node("a", "alpha", "10.0.0.1"), t0 + milliseconds(600));
    TEST_ASSERT(reg.find_by_id("a")->status == NodeStatus::ACTIVE, "announcement revives a stale node");

    evicted = reg.sweep(t0 + milliseconds(1700));
    TEST_ASSERT(evicted.size() == 1 && evicted[0] == "a", "node past the timeout evicted");
    TEST_ASSERT(!reg.find_by_id("a").has_value(), "evicted node gone");
    TEST_ASSERT(reg.size() == 1, "other node kept");
    return true;
}

static bool test_find_by_name_prefers_active_recent() {
    NodeRegistry reg(milliseconds(10000), milliseconds(5000));
    const auto t0 = NodeRegistry::Clock::now();
    reg.upsert(make_node("a", "shared", "10.0.0.1"), t0);
    reg.upsert(make_node("b", "shared", "10.0.0.2"), t0 + milliseconds(10));
    reg.upsert(make_node("c", "other", "10.0.0.3"), t0 + milliseconds(20));

    auto hit = reg.find_by_name("shared");
    TEST_ASSERT(hit && hit->id == "b", "most recently seen match wins");

    TEST_ASSERT(reg.sweep(t0 + milliseconds(5005)).empty(), "nothing old enough to evict");
    TEST_ASSERT(reg.find_by_id("a")->status == NodeStatus::STALE, "a went stale");
    hit = reg.find_by_name("shared");
    TEST_ASSERT(hit && hit->id == "b" && hit->status == NodeStatus::ACTIVE, "stale match skipped");

    reg.upsert(make_node("a", "shared", "10.0.0.1"), t0 + milliseconds(5010));
    hit = reg.find_by_name("shared");
    TEST_ASSERT(hit && hit->id == "a" && hit->status == NodeStatus::ACTIVE, "refreshed entry wins again");

    TEST_ASSERT(!reg.find_by_name("missing").has_value(), "unknown name");
    return true;
}

static bool test_remove_and_clear() {
    NodeRegistry reg;
    reg.upsert(make_node("a", "alpha", "10.0.0.1"));
    reg.upsert(make_node("b", "beta", "10.0.0.2"));
    TEST_ASSERT(reg.remove("a"), "remove existing");
    TEST_ASSERT(!reg.remove("a"), "remove twice fails");
    reg.clear();
    TEST_ASSERT(reg.size() == 0 && reg.snapshot().empty(), "cleared");
    return true;
}

static bool test_concurrent_readers_and_writers() {
    NodeRegistry reg(milliseconds(60000), milliseconds(30000));
    std::atomic<bool> stop{false};
    std::atomic<bool> torn{false};

    std::vector<std::thread> readers;
    for (int r = 0; r < 4; ++r) {
        readers.emplace_back([&] {
            while (!stop.load()) {
                for (const auto& n : reg.snapshot()) {
                    if (n.id.empty() || n.name != n.id) torn.store(true);
                }
                reg.find_by_name("node-3");
            }
        });
    }
    std::vector<std::thread> writers;
    for (int w = 0; w < 2; ++w) {
        writers.emplace_back([&reg, w] {
            for (int i = 0; i < 500; ++i) {
                const std::string id = "node-" + std::to_string((i + w) % 50);
                reg.upsert(make_node(id, id, "10.0.1." + std::to_string(i % 250)));
                if (i % 10 == 0) reg.sweep();
            }
        });
    }
    for (auto& t : writers) t.join();
    stop.store(true);
    for (auto& t : readers) t.join();

    TEST_ASSERT(reg.size() == 50, "every id present exactly once");
    TEST_ASSERT(!torn.load(), "readers never saw a half-written entry");
    return true;
}

int main() {
    set_log_level(LogLevel::WARNING);
    std::cout << "--- NodeRegistry tests ---" << std::endl;

    if (test_upsert_and_refresh()) std::cout << "PASS: upsert and refresh" << std::endl;
    if (test_sweep_marks_then_evicts()) std::cout << "PASS: sweep" << std::endl;
    if (test_find_by_name_prefers_active_recent()) std::cout << "PASS: find by name" << std::endl;
    if (test_remove_and_clear()) std::cout << "PASS: remove and clear" << std::endl;
    if (test_concurrent_readers_and_writers()) std::cout << "PASS: concurrent access" << std::endl;

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
