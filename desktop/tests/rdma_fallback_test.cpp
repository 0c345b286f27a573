#include "file_transfer_manager.h"
#include "rdma_transport.h"
#include "transfer_errors.h"
#include "logger.h"
#include "test_support.h"

#include <atomic>
#include <chrono>
#include <cstring>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

static int tests_failed = 0;

#define TEST_ASSERT(cond, msg) \
    do { \
        if (!(cond)) { \
            std::cerr << "FAIL: " << msg << " [" << __FILE__ << ":" << __LINE__ << "]" << std::endl; \
            tests_failed++; \
            return false; \
        } \
    } while (0)

namespace fs = std::filesystem;
using test_support::read_all_bytes;
using test_support::write_random_file;

// ============================================================================
// IN-PROCESS RDMA
// ============================================================================

// Sender and receiver share one address space, so a "remote" address is a
// plain pointer and an RDMA WRITE is a memcpy.
class LoopbackRdmaConnection : public RdmaConnection {
public:
    LoopbackRdmaConnection(std::atomic<int>& writes, bool fail_writes)
        : m_writes(writes), m_fail_writes(fail_writes) {}

    wire::RdmaEndpoint local_endpoint() const override {
        wire::RdmaEndpoint ep;
        ep.lid = 1;
        ep.qpn = 0x42;
        return ep;
    }

    void connect(const wire::RdmaEndpoint&) override {}

    RdmaMemoryRegion register_region(void* addr, size_t length, bool) override {
        RdmaMemoryRegion r;
        r.addr = reinterpret_cast<uint64_t>(addr);
        r.length = length;
        r.lkey = 7;
        r.rkey = 9;
        return r;
    }

    void write(const RdmaMemoryRegion& local, uint64_t local_offset, size_t length,
               uint64_t remote_addr, uint32_t) override {
        if (m_fail_writes) {
            throw RdmaUnavailable("completion error: remote access");
        }
        std::memcpy(reinterpret_cast<void*>(remote_addr),
                    reinterpret_cast<const void*>(local.addr + local_offset), length);
        m_writes.fetch_add(1);
    }

private:
    std::atomic<int>& m_writes;
    bool m_fail_writes;
};

class LoopbackRdmaTransport : public RdmaTransport {
public:
    explicit LoopbackRdmaTransport(RdmaSupport support = RdmaSupport::SUPPORTED, bool fail_writes = false)
        : m_support(support), m_fail_writes(fail_writes) {}

    RdmaSupport probe() override { return m_support; }
    std::string device_name() const override { return "loop0"; }
    std::unique_ptr<RdmaConnection> open_connection() override {
        opened.fetch_add(1);
        return std::unique_ptr<RdmaConnection>(new LoopbackRdmaConnection(writes, m_fail_writes));
    }

    std::atomic<int> opened{0};
    std::atomic<int> writes{0};

private:
    RdmaSupport m_support;
    bool m_fail_writes;
};

static TransferConfig make_config(const fs::path& receive_dir) {
    TransferConfig c;
    c.port = 0;
    c.bind_address = "127.0.0.1";
    c.receive_dir = receive_dir.string();
    c.chunk_size = 256 * 1024;
    c.rdma_enabled = true;
    c.rdma_cooldown_ms = 60000;
    return c;
}

static std::string target_of(FileTransferManager& receiver) {
    return "127.0.0.1:" + std::to_string(receiver.server_port());
}

static bool received_intact(const fs::path& received, const fs::path& src) {
    if (!test_support::wait_until([&] { return fs::exists(received); }, std::chrono::seconds(5))) {
        return false;
    }
    return read_all_bytes(received) == read_all_bytes(src);
}

// ============================================================================
// TESTS
// ============================================================================

static bool test_rdma_path(const fs::path& dir) {
    const auto src = dir / "rdma.bin";
    TEST_ASSERT(write_random_file(src, 3 * 1024 * 1024 + 5, 1), "write source");

    auto rx_rdma = std::make_shared<LoopbackRdmaTransport>();
    auto tx_rdma = std::make_shared<LoopbackRdmaTransport>();
    FileTransferManager receiver(make_config(dir / "rx_rdma"), nullptr, rx_rdma);
    TEST_ASSERT(!receiver.start_server().empty(), "receiver listening");
    FileTransferManager sender(make_config(dir / "tx_rdma"), nullptr, tx_rdma);
    TEST_ASSERT(sender.rdma_support() == RdmaSupport::SUPPORTED, "sender reports rdma");

    const std::string id = sender.send_file(src.string(), target_of(receiver));
    const auto result = sender.wait_for_completion(id, std::chrono::seconds(30));
    TEST_ASSERT(result.ok, "completed: " + result.message);

    const auto status = sender.get_transfer_status(id);
    TEST_ASSERT(status->uses_rdma(), "rdma strategy used");
    TEST_ASSERT(tx_rdma->writes.load() >= 13, "data moved by rdma writes");
    TEST_ASSERT(sender.get_statistics().rdma_fallbacks == 0, "no fallback");
    TEST_ASSERT(receiver.get_statistics().bytes_received == fs::file_size(src), "receiver counted the bytes");
    TEST_ASSERT(received_intact(dir / "rx_rdma" / "rdma.bin", src), "contents identical");
    TEST_ASSERT(!fs::exists(dir / "rx_rdma" / ("rdma.bin." + id + ".rdma.part")), "staging file renamed");
    return true;
}

static bool test_fallback_and_cooldown(const fs::path& dir) {
    const auto src = dir / "fallback.bin";
    TEST_ASSERT(write_random_file(src, 1024 * 1024, 2), "write source");

    FileTransferManager receiver(make_config(dir / "rx_fallback"));
    TEST_ASSERT(!receiver.start_server().empty(), "receiver listening");
    auto tx_rdma = std::make_shared<LoopbackRdmaTransport>();
    FileTransferManager sender(make_config(dir / "tx_fallback"), nullptr, tx_rdma);

    std::string id = sender.send_file(src.string(), target_of(receiver));
    auto result = sender.wait_for_completion(id, std::chrono::seconds(30));
    TEST_ASSERT(result.ok, "tcp fallback completed: " + result.message);
    TEST_ASSERT(!sender.get_transfer_status(id)->uses_rdma(), "finished over tcp");
    TEST_ASSERT(tx_rdma->opened.load() == 1, "rdma attempted once");
    TEST_ASSERT(sender.get_statistics().rdma_fallbacks == 1, "fallback counted");
    TEST_ASSERT(received_intact(dir / "rx_fallback" / "fallback.bin", src), "contents identical");

    id = sender.send_file(src.string(), target_of(receiver));
    result = sender.wait_for_completion(id, std::chrono::seconds(30));
    TEST_ASSERT(result.ok, "second send completed: " + result.message);
    TEST_ASSERT(tx_rdma->opened.load() == 1, "peer on cooldown, no new rdma attempt");
    TEST_ASSERT(sender.get_statistics().rdma_fallbacks == 1, "no second fallback");
    return true;
}

static bool test_write_failure_falls_back(const fs::path& dir) {
    const auto src = dir / "broken.bin";
    TEST_ASSERT(write_random_file(src, 2 * 1024 * 1024, 3), "write source");

    auto rx_rdma = std::make_shared<LoopbackRdmaTransport>();
    auto tx_rdma = std::make_shared<LoopbackRdmaTransport>(RdmaSupport::SUPPORTED, true);
    FileTransferManager receiver(make_config(dir / "rx_broken"), nullptr, rx_rdma);
    TEST_ASSERT(!receiver.start_server().empty(), "receiver listening");
    FileTransferManager sender(make_config(dir / "tx_broken"), nullptr, tx_rdma);

    const std::string id = sender.send_file(src.string(), target_of(receiver));
    const auto result = sender.wait_for_completion(id, std::chrono::seconds(30));
    TEST_ASSERT(result.ok, "tcp fallback completed: " + result.message);
    TEST_ASSERT(!sender.get_transfer_status(id)->uses_rdma(), "finished over tcp");
    TEST_ASSERT(sender.get_statistics().rdma_fallbacks == 1, "fallback counted");
    TEST_ASSERT(received_intact(dir / "rx_broken" / "broken.bin", src), "contents identical");
    TEST_ASSERT(test_support::wait_until(
                    [&] { return !fs::exists(dir / "rx_broken" / ("broken.bin." + id + ".rdma.part")); },
                    std::chrono::seconds(5)),
                "abandoned rdma staging file removed");
    return true;
}

static bool test_no_attempt_without_support(const fs::path& dir) {
    const auto src = dir / "plain.bin";
    TEST_ASSERT(write_random_file(src, 512 * 1024, 4), "write source");

    FileTransferManager receiver(make_config(dir / "rx_plain"));
    TEST_ASSERT(!receiver.start_server().empty(), "receiver listening");

    auto limited = std::make_shared<LoopbackRdmaTransport>(RdmaSupport::LIMITED);
    FileTransferManager limited_sender(make_config(dir / "tx_limited"), nullptr, limited);
    std::string id = limited_sender.send_file(src.string(), target_of(receiver));
    TEST_ASSERT(limited_sender.wait_for_completion(id, std::chrono::seconds(30)).ok, "tcp transfer");
    TEST_ASSERT(limited->opened.load() == 0, "no connection without an active port");
    TEST_ASSERT(limited_sender.get_statistics().rdma_fallbacks == 0, "not a fallback");

    auto registry = std::make_shared<NodeRegistry>();
    DiscoveredNode peer;
    peer.id = "peer-without-rdma";
    peer.name = "gamma";
    peer.ip = "127.0.0.1";
    peer.port = receiver.server_port();
    peer.capabilities = {"discovery", "transfer"};
    registry->upsert(peer);

    auto capable = std::make_shared<LoopbackRdmaTransport>();
    FileTransferManager no_capability(make_config(dir / "tx_nocap"), registry, capable);
    id = no_capability.send_file(src.string(), "gamma");
    TEST_ASSERT(no_capability.wait_for_completion(id, std::chrono::seconds(30)).ok, "tcp transfer");
    TEST_ASSERT(capable->opened.load() == 0, "peer without the rdma capability is not tried");

    TransferConfig disabled_config = make_config(dir / "tx_disabled");
    disabled_config.rdma_enabled = false;
    auto unused = std::make_shared<LoopbackRdmaTransport>();
    FileTransferManager disabled(disabled_config, nullptr, unused);
    id = disabled.send_file(src.string(), target_of(receiver));
    TEST_ASSERT(disabled.wait_for_completion(id, std::chrono::seconds(30)).ok, "tcp transfer");
    TEST_ASSERT(unused->opened.load() == 0, "disabled by configuration");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    const auto workdir = test_support::make_workdir("rdma_fallback");
    std::cout << "--- RDMA path and fallback tests (" << workdir << ") ---" << std::endl;

    if (test_rdma_path(workdir)) std::cout << "PASS: rdma path" << std::endl;
    if (test_fallback_and_cooldown(workdir)) std::cout << "PASS: fallback and cooldown" << std::endl;
    if (test_write_failure_falls_back(workdir)) std::cout << "PASS: write failure fallback" << std::endl;
    if (test_no_attempt_without_support(workdir)) std::cout << "PASS: no attempt without support" << std::endl;

    std::error_code ec;
    fs::remove_all(workdir, ec);

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
