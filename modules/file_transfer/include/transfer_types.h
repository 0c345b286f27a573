#ifndef TRANSFER_TYPES_H
#define TRANSFER_TYPES_H

#include <cstdint>
#include <chrono>
#include <functional>
#include <string>

/**
 * TRANSFER TYPES AND COMMON DEFINITIONS
 *
 * Shared by FileTransferManager (sender) and TransferServer (receiver).
 */

// ============================================================================
// ENUMS
// ============================================================================

enum class TransferState {
    PENDING,        // Created, nothing exchanged yet
    NEGOTIATING,    // Handshakes in flight
    IN_PROGRESS,    // Streams moving bytes
    VERIFYING,      // Whole-file hash check
    COMPLETED,
    FAILED,
    RESUMING        // Retrying a failed transfer under the same id
};

enum class TransferDirection {
    SEND,
    RECEIVE
};

enum class TransferError {
    NONE,
    CONNECT_FAILED,
    TIMEOUT,
    CHECKSUM_MISMATCH,
    IO_ERROR,
    PROTOCOL_ERROR,
    CANCELLED,
    RESUME_UNAVAILABLE,
    REJECTED,
    RDMA_UNAVAILABLE
};

const char* transfer_state_name(TransferState state);
const char* transfer_error_name(TransferError error);

// ============================================================================
// RESULTS AND EVENTS
// ============================================================================

struct TransferResult {
    bool ok = false;
    TransferError error = TransferError::NONE;
    std::string message;
    std::string transfer_id;
    uint64_t bytes_transferred = 0;
    double elapsed_seconds = 0.0;

    static TransferResult success(const std::string& id, uint64_t bytes, double elapsed) {
        return {true, TransferError::NONE, "", id, bytes, elapsed};
    }
    static TransferResult failure(const std::string& id, TransferError e, const std::string& msg) {
        return {false, e, msg, id, 0, 0.0};
    }
};

enum class TransferEventType {
    STARTED,
    PROGRESS,
    COMPLETED,
    FAILED
};

struct TransferEvent {
    TransferEventType type = TransferEventType::PROGRESS;
    TransferDirection direction = TransferDirection::SEND;
    std::string transfer_id;
    std::string file_name;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    double percent_complete = 0.0;
    double elapsed_seconds = 0.0;
    double throughput_mbps = 0.0;      // megabytes per second
    TransferError error = TransferError::NONE;
    std::string message;
};

using TransferEventCallback = std::function<void(const TransferEvent&)>;

struct TransferStatistics {
    uint64_t transfers_started = 0;
    uint64_t transfers_completed = 0;
    uint64_t transfers_failed = 0;
    uint64_t bytes_sent = 0;
    uint64_t bytes_received = 0;
    uint64_t stream_retries = 0;
    uint64_t rdma_fallbacks = 0;
};

// ============================================================================
// CONFIGURATION
// ============================================================================

struct TransferConfig {
    uint32_t chunk_size;
    uint16_t port;                     // 0 = pick an ephemeral port
    std::string bind_address = "0.0.0.0";
    std::string receive_dir;
    uint32_t concurrent_streams;
    uint32_t buffer_pool_size;
    int max_stream_retries;
    int retry_backoff_ms;
    int io_timeout_ms;
    int session_timeout_ms;            // no progress for this long fails the session
    int progress_interval_ms;
    int verify_timeout_ms;
    int session_retention_ms;          // terminal sessions kept this long for resume/verify
    uint32_t checkpoint_interval_chunks;
    bool rdma_enabled = true;
    int rdma_cooldown_ms;
    TransferEventCallback on_event;

    TransferConfig();
    static TransferConfig from_config_manager();
};

#endif // TRANSFER_TYPES_H
