#include "transfer_session.h"
#include "logger.h"

#include <algorithm>
#include <stdexcept>

#include <sys/socket.h>

const char* range_state_name(RangeState state) {
    switch (state) {
        case RangeState::PENDING: return "pending";
        case RangeState::SENT: return "sent";
        case RangeState::RECEIVED: return "received";
        case RangeState::ACKNOWLEDGED: return "acknowledged";
    }
    return "unknown";
}

std::vector<Range> partition_ranges(uint64_t file_size, uint32_t stream_count) {
    uint64_t n = std::max<uint32_t>(stream_count, 1);
    if (file_size < n) {
        n = std::max<uint64_t>(file_size, 1);
    }

    const uint64_t base = file_size / n;
    std::vector<Range> ranges;
    ranges.reserve(static_cast<size_t>(n));
    for (uint64_t i = 0; i < n; ++i) {
        Range r;
        r.stream_index = static_cast<uint32_t>(i);
        r.offset = i * base;
        r.length = (i + 1 == n) ? file_size - r.offset : base;
        ranges.push_back(r);
    }
    return ranges;
}

TransferSession::TransferSession(std::string transfer_id,
                                 TransferDirection direction,
                                 std::string file_path,
                                 std::string file_name,
                                 uint64_t file_size,
                                 uint32_t chunk_size,
                                 uint32_t stream_count)
    : m_transfer_id(std::move(transfer_id)),
      m_direction(direction),
      m_file_path(std::move(file_path)),
      m_file_name(std::move(file_name)),
      m_file_size(file_size),
      m_chunk_size(chunk_size > 0 ? chunk_size : 1),
      m_created_at(Clock::now()),
      m_ranges(partition_ranges(file_size, stream_count)),
      m_started_at(m_created_at),
      m_finished_at(m_created_at),
      m_last_progress(m_created_at) {}

void TransferSession::set_hash(const std::string& hash) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_hash = hash;
}

std::string TransferSession::hash() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_hash;
}

void TransferSession::set_peer(const std::string& peer) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_peer = peer;
}

std::string TransferSession::peer() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_peer;
}

// ============================================================================
// STATE MACHINE
// ============================================================================

bool TransferSession::is_valid_transition(TransferState from, TransferState to) {
    switch (from) {
        case TransferState::PENDING:
            return to == TransferState::NEGOTIATING || to == TransferState::FAILED;
        case TransferState::NEGOTIATING:
            return to == TransferState::IN_PROGRESS || to == TransferState::VERIFYING ||
                   to == TransferState::FAILED;
        case TransferState::IN_PROGRESS:
            return to == TransferState::VERIFYING || to == TransferState::NEGOTIATING ||
                   to == TransferState::FAILED;
        case TransferState::VERIFYING:
            return to == TransferState::COMPLETED || to == TransferState::FAILED;
        case TransferState::FAILED:
            return to == TransferState::RESUMING;
        case TransferState::RESUMING:
            return to == TransferState::IN_PROGRESS || to == TransferState::VERIFYING ||
                   to == TransferState::FAILED;
        case TransferState::COMPLETED:
            return false;
    }
    return false;
}

bool TransferSession::transition(TransferState next) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == next) {
            return false;
        }
        if (!is_valid_transition(m_state, next)) {
            LOG_DEBUG("FT: " + m_transfer_id + " ignoring " + transfer_state_name(m_state) +
                      " -> " + transfer_state_name(next));
            return false;
        }
        const auto now = Clock::now();
        if (m_state == TransferState::PENDING) {
            m_started_at = now;
        }
        if (next == TransferState::RESUMING) {
            m_error = TransferError::NONE;
            m_error_message.clear();
        }
        m_state = next;
        m_last_progress = now;
        if (next == TransferState::COMPLETED || next == TransferState::FAILED) {
            m_finished_at = now;
        }
    }
    m_cv.notify_all();
    return true;
}

TransferState TransferSession::state() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state;
}

bool TransferSession::is_terminal() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_state == TransferState::COMPLETED || m_state == TransferState::FAILED;
}

void TransferSession::fail(TransferError error, const std::string& message) {
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        if (m_state == TransferState::COMPLETED || m_state == TransferState::FAILED) {
            return;
        }
        m_state = TransferState::FAILED;
        m_error = error;
        m_error_message = message;
        m_finished_at = Clock::now();
    }
    m_cv.notify_all();
}

TransferError TransferSession::error() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error;
}

std::string TransferSession::error_message() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_error_message;
}

bool TransferSession::wait_terminal(std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(m_mutex);
    return m_cv.wait_for(lock, timeout, [this] {
        return m_state == TransferState::COMPLETED || m_state == TransferState::FAILED;
    });
}

TransferSession::Clock::time_point TransferSession::terminal_at() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_finished_at;
}

// ============================================================================
// RANGES
// ============================================================================

void TransferSession::check_index(uint32_t stream_index) const {
    if (stream_index >= m_ranges.size()) {
        throw std::out_of_range("stream index " + std::to_string(stream_index) +
                                " >= " + std::to_string(m_ranges.size()));
    }
}

std::vector<Range> TransferSession::ranges() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ranges;
}

Range TransferSession::range(uint32_t stream_index) const {
    check_index(stream_index);
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_ranges[stream_index];
}

void TransferSession::set_range_state(uint32_t stream_index, RangeState state) {
    check_index(stream_index);
    std::lock_guard<std::mutex> lock(m_mutex);
    m_ranges[stream_index].state = state;
}

void TransferSession::set_range_cursor(uint32_t stream_index, uint64_t cursor) {
    check_index(stream_index);
    std::lock_guard<std::mutex> lock(m_mutex);
    Range& r = m_ranges[stream_index];
    cursor = std::min(cursor, r.length);
    if (cursor >= r.cursor) {
        m_bytes.fetch_add(cursor - r.cursor);
    } else {
        m_bytes.fetch_sub(r.cursor - cursor);
    }
    r.cursor = cursor;
}

uint64_t TransferSession::advance(uint32_t stream_index, uint64_t bytes) {
    check_index(stream_index);
    std::lock_guard<std::mutex> lock(m_mutex);
    Range& r = m_ranges[stream_index];
    bytes = std::min(bytes, r.length - r.cursor);
    r.cursor += bytes;
    m_bytes.fetch_add(bytes);
    m_last_progress = Clock::now();
    return r.cursor;
}

void TransferSession::reset_ranges() {
    std::lock_guard<std::mutex> lock(m_mutex);
    for (auto& r : m_ranges) {
        r.cursor = 0;
        r.state = RangeState::PENDING;
    }
    m_bytes.store(0);
}

bool TransferSession::all_ranges_acknowledged() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::all_of(m_ranges.begin(), m_ranges.end(),
                       [](const Range& r) { return r.state == RangeState::ACKNOWLEDGED; });
}

double TransferSession::elapsed_seconds() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    const bool done = m_state == TransferState::COMPLETED || m_state == TransferState::FAILED;
    const auto end = done ? m_finished_at : Clock::now();
    return std::chrono::duration<double>(end - m_started_at).count();
}

double TransferSession::throughput_mbps() const {
    const double elapsed = elapsed_seconds();
    if (elapsed <= 0.0) return 0.0;
    return static_cast<double>(bytes_transferred()) / (1024.0 * 1024.0) / elapsed;
}

TransferSession::Clock::time_point TransferSession::last_progress() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_last_progress;
}

void TransferSession::touch() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_last_progress = Clock::now();
}

// ============================================================================
// STRATEGY
// ============================================================================

void TransferSession::set_strategy(TransferStrategy strategy) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_strategy = std::move(strategy);
}

TransferStrategy TransferSession::strategy() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_strategy;
}

bool TransferSession::uses_rdma() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return std::holds_alternative<RdmaStrategy>(m_strategy);
}

// ============================================================================
// CANCELLATION
// ============================================================================

void TransferSession::register_socket(int fd) {
    bool cancelled;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_sockets.insert(fd);
        cancelled = m_cancelled.load();
    }
    if (cancelled) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void TransferSession::unregister_socket(int fd) {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_sockets.erase(fd);
}

void TransferSession::cancel() {
    std::lock_guard<std::mutex> lock(m_mutex);
    m_cancelled.store(true);
    for (int fd : m_sockets) {
        ::shutdown(fd, SHUT_RDWR);
    }
}

void TransferSession::clear_cancel() {
    m_cancelled.store(false);
}
