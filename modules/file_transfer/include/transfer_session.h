#ifndef TRANSFER_SESSION_H
#define TRANSFER_SESSION_H

#include "transfer_types.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <mutex>
#include <set>
#include <string>
#include <variant>
#include <vector>

enum class RangeState {
    PENDING,
    SENT,           // sender: bytes on the wire
    RECEIVED,       // receiver: bytes on disk
    ACKNOWLEDGED
};

const char* range_state_name(RangeState state);

struct Range {
    uint32_t stream_index = 0;
    uint64_t offset = 0;
    uint64_t length = 0;
    RangeState state = RangeState::PENDING;
    uint64_t cursor = 0;        // bytes done, relative to offset

    uint64_t end() const { return offset + length; }
    uint64_t remaining() const { return length - cursor; }
};

/**
 * Splits [0, file_size) into contiguous ranges, one per stream.
 * The stream count is clamped to [1, file_size] (an empty file still gets one
 * zero-length range) and the last range absorbs file_size % count.
 */
std::vector<Range> partition_ranges(uint64_t file_size, uint32_t stream_count);

// Data path chosen once per session.
struct TcpStrategy {};
struct RdmaStrategy {
    std::string device;
};
using TransferStrategy = std::variant<TcpStrategy, RdmaStrategy>;

/**
 * One file transfer, on either side.
 *
 * PENDING -> NEGOTIATING -> IN_PROGRESS -> VERIFYING -> COMPLETED | FAILED,
 * FAILED -> RESUMING -> IN_PROGRESS. IN_PROGRESS may drop back to NEGOTIATING
 * when the session switches data path.
 */
class TransferSession {
public:
    using Clock = std::chrono::steady_clock;

    TransferSession(std::string transfer_id,
                    TransferDirection direction,
                    std::string file_path,
                    std::string file_name,
                    uint64_t file_size,
                    uint32_t chunk_size,
                    uint32_t stream_count);

    TransferSession(const TransferSession&) = delete;
    TransferSession& operator=(const TransferSession&) = delete;

    const std::string& transfer_id() const { return m_transfer_id; }
    TransferDirection direction() const { return m_direction; }
    const std::string& file_path() const { return m_file_path; }
    const std::string& file_name() const { return m_file_name; }
    uint64_t file_size() const { return m_file_size; }
    uint32_t chunk_size() const { return m_chunk_size; }
    uint32_t stream_count() const { return static_cast<uint32_t>(m_ranges.size()); }
    Clock::time_point created_at() const { return m_created_at; }

    void set_hash(const std::string& hash);
    std::string hash() const;

    void set_peer(const std::string& peer);
    std::string peer() const;

    // ==================== STATE ====================

    static bool is_valid_transition(TransferState from, TransferState to);
    // False (and no change) for illegal or same-state transitions.
    bool transition(TransferState next);
    TransferState state() const;
    bool is_terminal() const;

    // Moves to FAILED from any non-terminal state; the first reason wins.
    void fail(TransferError error, const std::string& message);
    TransferError error() const;
    std::string error_message() const;

    // Blocks until COMPLETED/FAILED or timeout. Returns is_terminal().
    bool wait_terminal(std::chrono::milliseconds timeout) const;
    Clock::time_point terminal_at() const;

    // ==================== RANGES ====================

    std::vector<Range> ranges() const;
    Range range(uint32_t stream_index) const;
    void set_range_state(uint32_t stream_index, RangeState state);
    // Repositions a stream (resume/restart); the aggregate counter follows.
    void set_range_cursor(uint32_t stream_index, uint64_t cursor);
    // Returns the new cursor.
    uint64_t advance(uint32_t stream_index, uint64_t bytes);
    void reset_ranges();
    bool all_ranges_acknowledged() const;

    uint64_t bytes_transferred() const { return m_bytes.load(); }
    double elapsed_seconds() const;
    double throughput_mbps() const;

    Clock::time_point last_progress() const;
    void touch();

    // ==================== STRATEGY ====================

    void set_strategy(TransferStrategy strategy);
    TransferStrategy strategy() const;
    bool uses_rdma() const;

    // ==================== CANCELLATION ====================

    // Sockets registered here are shut down on cancel() so blocked I/O returns.
    void register_socket(int fd);
    void unregister_socket(int fd);
    void cancel();
    bool is_cancelled() const { return m_cancelled.load(); }
    const std::atomic<bool>& cancel_flag() const { return m_cancelled; }
    // Re-arms a cancelled session before a resume.
    void clear_cancel();

private:
    void check_index(uint32_t stream_index) const;

    const std::string m_transfer_id;
    const TransferDirection m_direction;
    const std::string m_file_path;
    const std::string m_file_name;
    const uint64_t m_file_size;
    const uint32_t m_chunk_size;
    const Clock::time_point m_created_at;

    mutable std::mutex m_mutex;
    mutable std::condition_variable m_cv;
    TransferState m_state = TransferState::PENDING;
    TransferError m_error = TransferError::NONE;
    std::string m_error_message;
    std::string m_hash;
    std::string m_peer;
    std::vector<Range> m_ranges;
    TransferStrategy m_strategy = TcpStrategy{};
    Clock::time_point m_started_at;
    Clock::time_point m_finished_at;
    Clock::time_point m_last_progress;
    std::set<int> m_sockets;

    std::atomic<uint64_t> m_bytes{0};
    std::atomic<bool> m_cancelled{false};
};

#endif // TRANSFER_SESSION_H
