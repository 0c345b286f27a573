#include "file_transfer_manager.h"
#include "resume_store.h"
#include "logger.h"
#include "test_support.h"

#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <string>
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

namespace fs = std::filesystem;
using test_support::FaultProxy;

static TransferConfig make_config(const fs::path& receive_dir) {
    TransferConfig c;
    c.port = 0;
    c.bind_address = "127.0.0.1";
    c.receive_dir = receive_dir.string();
    c.chunk_size = 256 * 1024;
    c.concurrent_streams = 2;
    c.rdma_enabled = false;
    return c;
}

static bool test_corrupted_stream_detected(const fs::path& dir) {
    const auto src = dir / "fragile.bin";
    TEST_ASSERT(test_support::write_random_file(src, 4 * 1024 * 1024, 77), "write source");

    FileTransferManager receiver(make_config(dir / "rx"));
    TEST_ASSERT(!receiver.start_server().empty(), "receiver listening");

    std::mutex mu;
    std::vector<TransferEvent> rx_failures;
    receiver.on_transfer_event([&](const TransferEvent& ev) {
        if (ev.type != TransferEventType::FAILED) return;
        std::lock_guard<std::mutex> lock(mu);
        rx_failures.push_back(ev);
    });

    // Past the handshake, inside the raw file bytes of the first stream.
    FaultProxy proxy(receiver.server_port(), FaultProxy::Mode::CORRUPT, 100000);
    FileTransferManager sender(make_config(dir / "tx"));

    const std::string id = sender.send_file(src.string(), proxy.address());
    const auto result = sender.wait_for_completion(id, std::chrono::seconds(60));
    TEST_ASSERT(proxy.triggered(), "byte flipped in flight");
    TEST_ASSERT(!result.ok, "transfer must not succeed");
    TEST_ASSERT(result.error == TransferError::CHECKSUM_MISMATCH, "sender sees the mismatch");
    TEST_ASSERT(sender.get_transfer_status(id)->state() == TransferState::FAILED, "sender session failed");

    const auto info = receiver.server().session_info(id);
    TEST_ASSERT(info.has_value(), "receiver still knows the transfer");
    TEST_ASSERT(info->state == TransferState::FAILED && info->error == TransferError::CHECKSUM_MISMATCH,
                "receiver session failed with checksum mismatch");
    TEST_ASSERT(!info->computed_hash.empty() && info->computed_hash != info->expected_hash,
                "computed hash differs");

    TEST_ASSERT(!fs::exists(dir / "rx" / "fragile.bin"), "corrupt data never becomes the final file");
    TEST_ASSERT(fs::exists(info->part_path), "partial file kept for inspection");
    TEST_ASSERT(!ResumeStore((dir / "rx").string()).load(id).has_value(), "no checkpoint to resume from");
    {
        std::lock_guard<std::mutex> lock(mu);
        TEST_ASSERT(rx_failures.size() == 1, "receiver reported one failure");
        TEST_ASSERT(rx_failures[0].direction == TransferDirection::RECEIVE, "receive direction");
        TEST_ASSERT(rx_failures[0].error == TransferError::CHECKSUM_MISMATCH, "failure reason");
    }

    TEST_ASSERT(!sender.resume_transfer(id), "a checksum mismatch is not resumable");

    const std::string retry = sender.send_file(src.string(), proxy.address());
    TEST_ASSERT(retry != id, "a fresh transfer gets a new id");
    const auto second = sender.wait_for_completion(retry, std::chrono::seconds(60));
    TEST_ASSERT(second.ok, "clean connections deliver the file: " + second.message);
    TEST_ASSERT(test_support::read_all_bytes(dir / "rx" / "fragile.bin") == test_support::read_all_bytes(src),
                "contents identical");
    return true;
}

int main() {
    set_log_level(LogLevel::ERROR);
    const auto workdir = test_support::make_workdir("checksum_mismatch");
    std::cout << "--- Checksum mismatch tests (" << workdir << ") ---" << std::endl;

    if (test_corrupted_stream_detected(workdir)) std::cout << "PASS: corrupted stream detected" << std::endl;

    std::error_code ec;
    fs::remove_all(workdir, ec);

    if (tests_failed != 0) {
        std::cerr << "FAILED: " << tests_failed << " test(s)" << std::endl;
        return 1;
    }
    std::cout << "ALL PASS" << std::endl;
    return 0;
}
