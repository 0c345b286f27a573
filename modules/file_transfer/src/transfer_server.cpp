#include "transfer_server.h"
#include "transfer_errors.h"
#include "socket_utils.h"
#include "file_hasher.h"
#include "epoll_reactor.h"
#include "event_thread_pool.h"
#include "constants.h"
#include "telemetry.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <cstdio>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/epoll.h>
#include <sys/mman.h>
#include <sys/socket.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {

bool valid_transfer_id(const std::string& id) {
    if (id.empty() || id.size() > 128) return false;
    return std::all_of(id.begin(), id.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') ||
               (c >= 'A' && c <= 'Z') || c == '-' || c == '_';
    });
}

bool valid_hash(const std::string& hash) {
    return hash.size() == 64 && std::all_of(hash.begin(), hash.end(), [](char c) {
        return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f');
    });
}

void pwrite_all(int fd, const uint8_t* data, size_t len, uint64_t offset) {
    while (len > 0) {
        ssize_t n = ::pwrite(fd, data, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransferIoError("pwrite: " + std::string(strerror(errno)));
        }
        data += n;
        len -= static_cast<size_t>(n);
        offset += static_cast<uint64_t>(n);
    }
}

void send_handshake_reply(int fd, wire::HandshakeStatus status, uint64_t offset, const std::string& msg) {
    wire::HandshakeReply reply;
    reply.status = status;
    reply.resume_offset = offset;
    reply.message = msg;
    send_frame(fd, wire::FrameType::HANDSHAKE_REPLY, reply.encode());
}

std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}
} // namespace

TransferServer::TransferServer(const TransferConfig& config,
                               std::shared_ptr<BufferPool> pool,
                               std::shared_ptr<RdmaTransport> rdma)
    : m_config(config),
      m_pool(std::move(pool)),
      m_rdma(std::move(rdma)),
      m_store(config.receive_dir),
      m_callback(config.on_event) {
    if (!m_pool) {
        m_pool = std::make_shared<BufferPool>(m_config.buffer_pool_size, m_config.chunk_size);
    }
}

TransferServer::~TransferServer() {
    stop();
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    for (auto& kv : m_sessions) {
        close_part(*kv.second);
    }
}

std::string TransferServer::sanitize_file_name(const std::string& name) {
    const auto slash = name.find_last_of("/\\");
    std::string base = slash == std::string::npos ? name : name.substr(slash + 1);
    if (base.empty() || base == "." || base == ".." || base.find('\0') != std::string::npos) {
        return "";
    }
    return base;
}

// ============================================================================
// LIFECYCLE
// ============================================================================

std::string TransferServer::start() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (m_running.load()) {
        return address();
    }

    try {
        std::error_code ec;
        fs::create_directories(m_config.receive_dir, ec);
        if (ec) {
            LOG_ERROR("SRV: Cannot create receive directory " + m_config.receive_dir + ": " + ec.message());
            return "";
        }

        Socket listener = listen_tcp(m_config.bind_address, m_config.port, DEFAULT_LISTEN_BACKLOG);
        m_port = local_port(listener.fd());

        auto reactor = std::make_unique<EpollReactor>();
        if (!reactor->add(listener.fd(), EPOLLIN, [this](int, uint32_t) { on_accept(); })) {
            LOG_ERROR("SRV: Failed to register listener with reactor");
            return "";
        }
        m_listen_fd = listener.release();
        m_verifiers = std::make_unique<EventThreadPool>(2);
        m_reactor = std::move(reactor);
        m_reactor->runEvery(1000, [this] { sweep(); });
        m_running.store(true);
        m_reactor->start();
    } catch (const std::exception& e) {
        LOG_ERROR("SRV: Failed to start on " + m_config.bind_address + ":" +
                  std::to_string(m_config.port) + ": " + e.what());
        return "";
    }

    LOG_INFO("SRV: Listening on " + address() + ", receive dir " + m_config.receive_dir);
    return address();
}

void TransferServer::stop() {
    std::lock_guard<std::mutex> lock(m_lifecycle_mutex);
    if (!m_running.exchange(false)) {
        return;
    }

    m_reactor->stop();
    m_reactor.reset();
    ::close(m_listen_fd);
    m_listen_fd = -1;

    {
        std::lock_guard<std::mutex> conn_lock(m_conn_mutex);
        for (auto& c : m_connections) {
            if (c->fd >= 0) {
                ::shutdown(c->fd, SHUT_RDWR);
            }
        }
    }
    reap_connections(true);

    m_verifiers->shutdown(true);
    m_verifiers.reset();

    std::vector<std::shared_ptr<Inbound>> open;
    {
        std::lock_guard<std::mutex> sessions_lock(m_sessions_mutex);
        for (auto& kv : m_sessions) {
            open.push_back(kv.second);
        }
    }
    for (auto& in : open) {
        if (!in->session->is_terminal()) {
            save_checkpoint(*in);
        }
        close_part(*in);
    }
    LOG_INFO("SRV: Stopped");
}

std::string TransferServer::address() const {
    return m_config.bind_address + ":" + std::to_string(m_port);
}

uint16_t TransferServer::port() const {
    return m_port;
}

void TransferServer::set_event_callback(TransferEventCallback cb) {
    std::lock_guard<std::mutex> lock(m_cb_mutex);
    m_callback = std::move(cb);
}

// ============================================================================
// CONNECTIONS
// ============================================================================

void TransferServer::on_accept() {
    for (;;) {
        int fd = ::accept4(m_listen_fd, nullptr, nullptr, SOCK_CLOEXEC);
        if (fd < 0) {
            if (errno == EINTR) continue;
            if (errno != EAGAIN && errno != EWOULDBLOCK) {
                LOG_WARN("SRV: accept failed: " + std::string(strerror(errno)));
            }
            return;
        }
        set_io_timeout(fd, m_config.io_timeout_ms);

        auto conn = std::make_unique<Connection>();
        conn->fd = fd;
        Connection* raw = conn.get();
        std::lock_guard<std::mutex> lock(m_conn_mutex);
        m_connections.push_back(std::move(conn));
        raw->thread = std::thread(&TransferServer::serve_connection, this, raw);
    }
}

void TransferServer::serve_connection(Connection* conn) {
    const int fd = conn->fd;
    try {
        wire::FrameType type;
        const std::string payload = recv_any_frame(fd, type);
        switch (type) {
            case wire::FrameType::HANDSHAKE:
                handle_stream(fd, wire::Handshake::decode(payload));
                break;
            case wire::FrameType::VERIFY:
                handle_verify(fd, wire::VerifyRequest::decode(payload));
                break;
            case wire::FrameType::RDMA_SETUP:
                handle_rdma(fd, wire::RdmaSetup::decode(payload));
                break;
            default:
                throw ProtocolError(std::string("unexpected opening frame ") + wire::frame_type_name(type));
        }
    } catch (const TransferException& e) {
        LOG_WARN("SRV: Connection ended: " + std::string(e.what()));
    } catch (const std::exception& e) {
        LOG_ERROR("SRV: Connection handler error: " + std::string(e.what()));
    }

    {
        std::lock_guard<std::mutex> lock(m_conn_mutex);
        conn->fd = -1;
    }
    ::close(fd);
    conn->done.store(true);
}

void TransferServer::reap_connections(bool all) {
    std::list<std::unique_ptr<Connection>> finished;
    {
        std::lock_guard<std::mutex> lock(m_conn_mutex);
        for (auto it = m_connections.begin(); it != m_connections.end();) {
            if (all || (*it)->done.load()) {
                finished.push_back(std::move(*it));
                it = m_connections.erase(it);
            } else {
                ++it;
            }
        }
    }
    for (auto& c : finished) {
        if (c->thread.joinable()) {
            c->thread.join();
        }
    }
}

// ============================================================================
// SESSION ADMISSION
// ============================================================================

bool TransferServer::layout_matches(const Inbound& in, const wire::Handshake& hs) const {
    const auto& s = *in.session;
    return s.file_size() == hs.total_size && s.hash() == hs.hash &&
           s.stream_count() == hs.stream_count &&
           s.file_name() == sanitize_file_name(hs.filename);
}

std::shared_ptr<TransferServer::Inbound> TransferServer::create_inbound(const wire::Handshake& hs,
                                                                       const std::string& name,
                                                                       const char* part_suffix) {
    auto in = std::make_shared<Inbound>();
    in->part_path = (fs::path(m_config.receive_dir) / (name + "." + hs.transfer_id + part_suffix)).string();
    in->final_path = (fs::path(m_config.receive_dir) / name).string();

    int fd = ::open(in->part_path.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0644);
    if (fd < 0) {
        throw TransferIoError("open " + in->part_path + ": " + strerror(errno));
    }
    if (::ftruncate(fd, static_cast<off_t>(hs.total_size)) != 0) {
        const int err = errno;
        ::close(fd);
        throw TransferIoError("ftruncate " + in->part_path + ": " + strerror(err));
    }
    in->part_fd = fd;

    in->session = std::make_shared<TransferSession>(hs.transfer_id, TransferDirection::RECEIVE,
                                                    in->part_path, name, hs.total_size,
                                                    m_config.chunk_size, hs.stream_count);
    in->session->set_hash(hs.hash);
    in->slots.resize(in->session->stream_count());
    return in;
}

std::shared_ptr<TransferServer::Inbound> TransferServer::restore_inbound(const wire::Handshake& hs,
                                                                        const std::string& name) {
    auto cp = m_store.load(hs.transfer_id);
    if (!cp) {
        return nullptr;
    }

    const auto expected = partition_ranges(hs.total_size, hs.stream_count);
    bool matches = cp->total_size == hs.total_size && cp->hash == hs.hash &&
                   cp->file_name == name && cp->ranges.size() == expected.size();
    for (size_t i = 0; matches && i < expected.size(); ++i) {
        matches = cp->ranges[i].offset == expected[i].offset && cp->ranges[i].length == expected[i].length;
    }
    struct stat st;
    if (!matches || ::stat(cp->part_path.c_str(), &st) != 0 ||
        static_cast<uint64_t>(st.st_size) != cp->total_size) {
        LOG_WARN("FT: Checkpoint for " + hs.transfer_id + " does not match the resumed transfer");
        return nullptr;
    }

    auto in = std::make_shared<Inbound>();
    in->part_path = cp->part_path;
    in->final_path = (fs::path(m_config.receive_dir) / name).string();
    in->part_fd = ::open(in->part_path.c_str(), O_RDWR | O_CLOEXEC);
    if (in->part_fd < 0) {
        LOG_WARN("FT: Cannot reopen " + in->part_path + ": " + strerror(errno));
        return nullptr;
    }
    in->session = std::make_shared<TransferSession>(hs.transfer_id, TransferDirection::RECEIVE,
                                                    in->part_path, name, hs.total_size,
                                                    m_config.chunk_size, hs.stream_count);
    in->session->set_hash(hs.hash);
    in->slots.resize(in->session->stream_count());
    for (uint32_t i = 0; i < cp->ranges.size(); ++i) {
        in->session->set_range_cursor(i, cp->ranges[i].contiguous);
        if (cp->ranges[i].contiguous == cp->ranges[i].length) {
            in->session->set_range_state(i, RangeState::RECEIVED);
        }
    }
    LOG_INFO("SRV: Restored " + short_id(hs.transfer_id) + " from checkpoint at " +
             std::to_string(in->session->bytes_transferred()) + "/" + std::to_string(hs.total_size) + " bytes");
    return in;
}

std::shared_ptr<TransferServer::Inbound> TransferServer::admit(int fd, const wire::Handshake& hs) {
    const std::string name = sanitize_file_name(hs.filename);
    std::string problem;
    if (!valid_transfer_id(hs.transfer_id)) {
        problem = "invalid transfer id";
    } else if (name.empty()) {
        problem = "invalid file name '" + hs.filename + "'";
    } else if (!valid_hash(hs.hash)) {
        problem = "invalid hash";
    } else if (hs.stream_count == 0 || hs.stream_count > MAX_STREAMS_PER_TRANSFER ||
               hs.stream_index >= hs.stream_count) {
        problem = "invalid stream layout";
    } else {
        const auto ranges = partition_ranges(hs.total_size, hs.stream_count);
        if (ranges.size() != hs.stream_count || ranges[hs.stream_index].offset != hs.range_offset ||
            ranges[hs.stream_index].length != hs.range_length) {
            problem = "range does not match partition";
        }
    }
    if (!problem.empty()) {
        LOG_WARN("SRV: Rejecting handshake: " + problem);
        send_handshake_reply(fd, wire::HandshakeStatus::REJECTED, 0, problem);
        return nullptr;
    }

    std::shared_ptr<Inbound> in;
    bool created = false;
    wire::HandshakeStatus refusal = wire::HandshakeStatus::READY;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        auto it = m_sessions.find(hs.transfer_id);
        if (it == m_sessions.end()) {
            try {
                in = hs.resume() ? restore_inbound(hs, name) : create_inbound(hs, name);
            } catch (const TransferIoError& e) {
                LOG_ERROR("SRV: " + std::string(e.what()));
                problem = e.what();
                refusal = wire::HandshakeStatus::REJECTED;
            }
            if (in) {
                m_sessions[hs.transfer_id] = in;
                created = true;
            } else if (refusal == wire::HandshakeStatus::READY) {
                refusal = wire::HandshakeStatus::UNKNOWN_TRANSFER;
                problem = "no state for transfer " + hs.transfer_id;
            }
        } else {
            in = it->second;
            auto& s = *in->session;
            if (!layout_matches(*in, hs)) {
                refusal = wire::HandshakeStatus::REJECTED;
                problem = "transfer id reused with a different file";
            } else if (s.state() == TransferState::COMPLETED) {
                refusal = wire::HandshakeStatus::ALREADY_COMPLETE;
            } else if (s.state() == TransferState::FAILED) {
                if (s.error() == TransferError::CHECKSUM_MISMATCH) {
                    refusal = wire::HandshakeStatus::REJECTED;
                    problem = "checksum mismatch; start a new transfer";
                } else {
                    if (in->part_fd < 0) {
                        std::unique_lock<std::shared_mutex> fd_lock(in->fd_mu);
                        in->part_fd = ::open(in->part_path.c_str(), O_RDWR | O_CLOEXEC);
                    }
                    if (in->part_fd < 0) {
                        refusal = wire::HandshakeStatus::UNKNOWN_TRANSFER;
                        problem = "partial file is gone";
                    } else {
                        s.clear_cancel();
                        s.transition(TransferState::RESUMING);
                        std::lock_guard<std::mutex> in_lock(in->mu);
                        in->verify_scheduled = false;
                        in->failure_reported = false;
                        LOG_INFO("SRV: Resuming " + short_id(hs.transfer_id));
                    }
                }
            }
        }
    }

    if (refusal != wire::HandshakeStatus::READY) {
        LOG_INFO("SRV: Stream " + std::to_string(hs.stream_index) + " of " + short_id(hs.transfer_id) +
                 ": " + wire::handshake_status_name(refusal) + (problem.empty() ? "" : " (" + problem + ")"));
        send_handshake_reply(fd, refusal, refusal == wire::HandshakeStatus::ALREADY_COMPLETE ? hs.range_length : 0,
                             problem);
        return nullptr;
    }

    if (created) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.transfers_started++;
        }
        LOG_INFO("SRV: New transfer " + short_id(hs.transfer_id) + " '" + name + "' " +
                 std::to_string(hs.total_size) + " bytes over " + std::to_string(hs.stream_count) + " stream(s)");
        emit(*in, TransferEventType::STARTED, true);
    }
    return in;
}

// ============================================================================
// STREAMS
// ============================================================================

void TransferServer::claim_slot(Inbound& in, uint32_t index, int fd, uint64_t& generation) {
    std::unique_lock<std::mutex> lock(in.mu);
    StreamSlot& slot = in.slots[index];
    if (slot.active) {
        // Reconnect for a stream whose old connection has not noticed the drop yet.
        LOG_DEBUG("SRV: Stream " + std::to_string(index) + " superseded by a new connection");
        ::shutdown(slot.fd, SHUT_RDWR);
        const bool freed = in.cv.wait_for(lock, std::chrono::milliseconds(m_config.io_timeout_ms),
                                          [&] { return !in.slots[index].active; });
        if (!freed) {
            throw TransferIoError("stream " + std::to_string(index) + " still busy");
        }
    }
    slot.active = true;
    slot.fd = fd;
    generation = ++slot.generation;
}

void TransferServer::release_slot(Inbound& in, uint32_t index, uint64_t generation) {
    {
        std::lock_guard<std::mutex> lock(in.mu);
        StreamSlot& slot = in.slots[index];
        if (slot.generation == generation) {
            slot.active = false;
            slot.fd = -1;
        }
    }
    in.cv.notify_all();
}

void TransferServer::handle_stream(int fd, const wire::Handshake& hs) {
    auto in = admit(fd, hs);
    if (!in) {
        return;
    }
    auto& s = *in->session;
    const uint32_t index = hs.stream_index;

    uint64_t generation = 0;
    claim_slot(*in, index, fd, generation);
    s.register_socket(fd);
    try {
        s.transition(TransferState::NEGOTIATING);
        const Range r = s.range(index);
        send_handshake_reply(fd, wire::HandshakeStatus::READY, r.cursor, "");
        if (r.cursor > 0) {
            LOG_INFO("SRV: Stream " + std::to_string(index) + " of " + short_id(hs.transfer_id) +
                     " resumes at " + std::to_string(r.cursor) + "/" + std::to_string(r.length));
        }
        s.transition(TransferState::IN_PROGRESS);
        s.touch();
        receive_range(in, fd, index, generation);
    } catch (const TransferException& e) {
        LOG_WARN("SRV: Stream " + std::to_string(index) + " of " + short_id(hs.transfer_id) +
                 " interrupted: " + e.what());
        save_checkpoint(*in);
    }
    s.unregister_socket(fd);
    release_slot(*in, index, generation);
}

void TransferServer::receive_range(const std::shared_ptr<Inbound>& in, int fd, uint32_t index,
                                   uint64_t generation) {
    auto& s = *in->session;
    Range r = s.range(index);

    while (r.cursor < r.length) {
        if (s.is_cancelled() || s.is_terminal()) {
            throw TransferCancelled("session " + short_id(s.transfer_id()) + " no longer active");
        }
        PooledBuffer buf = m_pool->acquire_unless(s.cancel_flag());
        if (!buf) {
            throw TransferCancelled("cancelled while waiting for a buffer");
        }
        const size_t want = static_cast<size_t>(std::min<uint64_t>(buf.size(), r.length - r.cursor));
        recv_all(fd, buf.data(), want);
        {
            std::lock_guard<std::mutex> lock(in->mu);
            if (in->slots[index].generation != generation) {
                throw TransferIoError("superseded");
            }
        }
        {
            std::shared_lock<std::shared_mutex> fd_lock(in->fd_mu);
            if (in->part_fd < 0) {
                throw TransferIoError("partial file closed");
            }
            pwrite_all(in->part_fd, buf.data(), want, r.offset + r.cursor);
        }
        buf.release();
        r.cursor = s.advance(index, want);

        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.bytes_received += want;
        }
        Telemetry::getInstance().inc_counter("ft.bytes_received", static_cast<int64_t>(want));

        bool checkpoint_due = false;
        {
            std::lock_guard<std::mutex> lock(in->mu);
            if (++in->chunks_since_checkpoint >= std::max<uint32_t>(m_config.checkpoint_interval_chunks, 1)) {
                in->chunks_since_checkpoint = 0;
                checkpoint_due = true;
            }
        }
        if (checkpoint_due) {
            save_checkpoint(*in);
        }
        emit(*in, TransferEventType::PROGRESS);
    }

    if (s.range(index).state != RangeState::ACKNOWLEDGED) {
        s.set_range_state(index, RangeState::RECEIVED);
        save_checkpoint(*in);
        s.set_range_state(index, RangeState::ACKNOWLEDGED);
    }
    if (s.all_ranges_acknowledged() && s.transition(TransferState::VERIFYING)) {
        emit(*in, TransferEventType::PROGRESS, true);
        schedule_verify(in);
    }

    wire::StreamAck ack;
    ack.stream_index = index;
    ack.bytes = r.length;
    send_frame(fd, wire::FrameType::STREAM_ACK, ack.encode());
    LOG_DEBUG("SRV: Stream " + std::to_string(index) + " of " + short_id(s.transfer_id()) + " acknowledged");
}

// ============================================================================
// CHECKPOINT / VERIFY
// ============================================================================

void TransferServer::save_checkpoint(Inbound& in) {
    std::lock_guard<std::mutex> lock(in.checkpoint_mu);
    {
        std::shared_lock<std::shared_mutex> fd_lock(in.fd_mu);
        if (in.part_fd < 0) {
            return;
        }
        // Offsets recorded below must already be on disk.
        if (::fdatasync(in.part_fd) != 0) {
            LOG_WARN("FT: fdatasync " + in.part_path + ": " + strerror(errno));
            return;
        }
    }

    const auto& s = *in.session;
    ResumeCheckpoint cp;
    cp.transfer_id = s.transfer_id();
    cp.file_name = s.file_name();
    cp.total_size = s.file_size();
    cp.hash = s.hash();
    cp.part_path = in.part_path;
    for (const auto& r : s.ranges()) {
        cp.ranges.push_back({r.offset, r.length, r.cursor});
    }
    m_store.save(cp);
}

void TransferServer::close_part(Inbound& in) {
    std::unique_lock<std::shared_mutex> fd_lock(in.fd_mu);
    if (in.part_fd >= 0) {
        ::close(in.part_fd);
        in.part_fd = -1;
    }
}

void TransferServer::schedule_verify(const std::shared_ptr<Inbound>& in) {
    {
        std::lock_guard<std::mutex> lock(in->mu);
        if (in->verify_scheduled) {
            return;
        }
        in->verify_scheduled = true;
    }
    const std::string id = in->session->transfer_id();
    if (!m_verifiers || !m_verifiers->submit(id, [this, in] { verify(in); })) {
        in->session->fail(TransferError::IO_ERROR, "server stopping");
        finish_failed(in);
    }
}

void TransferServer::verify(const std::shared_ptr<Inbound>& in) {
    auto& s = *in->session;
    const auto started = std::chrono::steady_clock::now();
    try {
        {
            std::shared_lock<std::shared_mutex> fd_lock(in->fd_mu);
            if (in->part_fd >= 0 && ::fdatasync(in->part_fd) != 0) {
                throw TransferIoError("fdatasync: " + std::string(strerror(errno)));
            }
        }
        const std::string computed = FileHasher::hash_file(in->part_path, m_config.chunk_size, &s.cancel_flag());
        {
            std::lock_guard<std::mutex> lock(in->mu);
            in->computed_hash = computed;
        }

        if (computed != s.hash()) {
            LOG_ERROR("SRV: Checksum mismatch for " + short_id(s.transfer_id()) + ": expected " + s.hash() +
                      ", computed " + computed + "; keeping " + in->part_path);
            close_part(*in);
            m_store.remove(s.transfer_id());
            throw ChecksumMismatchError("expected " + s.hash() + ", computed " + computed);
        }

        if (s.state() != TransferState::VERIFYING) {
            return;
        }
        close_part(*in);
        if (std::rename(in->part_path.c_str(), in->final_path.c_str()) != 0) {
            throw TransferIoError("rename to " + in->final_path + ": " + strerror(errno));
        }
        m_store.remove(s.transfer_id());
        if (!s.transition(TransferState::COMPLETED)) {
            return;
        }

        const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started).count();
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.transfers_completed++;
        }
        auto& telemetry = Telemetry::getInstance();
        telemetry.inc_counter("ft.transfers_completed");
        telemetry.observe_hist_ms("ft.transfer_duration_ms", static_cast<int64_t>(s.elapsed_seconds() * 1000.0));
        telemetry.clear_progress(s.transfer_id());
        LOG_INFO("SRV: Received '" + s.file_name() + "' (" + std::to_string(s.file_size()) +
                 " bytes) in " + std::to_string(s.elapsed_seconds()) + "s, hash verified in " +
                 std::to_string(ms) + "ms");
        emit(*in, TransferEventType::COMPLETED, true);
    } catch (const TransferException& e) {
        s.fail(e.code(), e.what());
        finish_failed(in);
    }
}

void TransferServer::handle_verify(int fd, const wire::VerifyRequest& req) {
    wire::VerifyReply reply;
    auto in = find(req.transfer_id);
    if (!in) {
        reply.verdict = wire::VerifyVerdict::UNKNOWN;
        reply.message = "unknown transfer";
    } else {
        auto& s = *in->session;
        const auto deadline = std::chrono::steady_clock::now() +
                              std::chrono::milliseconds(m_config.verify_timeout_ms);
        while (!s.wait_terminal(std::chrono::milliseconds(200))) {
            if (!m_running.load() || std::chrono::steady_clock::now() >= deadline) {
                break;
            }
        }
        {
            std::lock_guard<std::mutex> lock(in->mu);
            reply.hash = in->computed_hash;
        }
        switch (s.state()) {
            case TransferState::COMPLETED:
                reply.verdict = wire::VerifyVerdict::COMPLETED;
                break;
            case TransferState::FAILED:
                reply.verdict = s.error() == TransferError::CHECKSUM_MISMATCH
                                    ? wire::VerifyVerdict::CHECKSUM_MISMATCH
                                    : wire::VerifyVerdict::FAILED;
                reply.message = s.error_message();
                break;
            default:
                reply.verdict = wire::VerifyVerdict::TIMEOUT;
                reply.message = std::string("still ") + transfer_state_name(s.state());
                break;
        }
    }
    send_frame(fd, wire::FrameType::VERIFY_REPLY, reply.encode());
}

// ============================================================================
// RDMA
// ============================================================================

void TransferServer::handle_rdma(int fd, const wire::RdmaSetup& setup) {
    const auto& hs = setup.handshake;
    bool replied = false;
    auto reject = [&](const std::string& why) {
        LOG_INFO("RDMA: Declining " + short_id(hs.transfer_id) + ": " + why);
        wire::RdmaSetupReply reply;
        reply.status = wire::HandshakeStatus::REJECTED;
        reply.message = why;
        send_frame(fd, wire::FrameType::RDMA_SETUP_REPLY, reply.encode());
    };

    if (!m_rdma || !m_config.rdma_enabled) {
        reject("rdma disabled on receiver");
        return;
    }
    if (m_rdma->probe() != RdmaSupport::SUPPORTED) {
        reject("no active rdma device on receiver");
        return;
    }
    const std::string name = sanitize_file_name(hs.filename);
    if (!valid_transfer_id(hs.transfer_id) || name.empty() || !valid_hash(hs.hash) ||
        hs.total_size == 0 || hs.stream_count != 1) {
        reject("invalid rdma setup");
        return;
    }
    if (find(hs.transfer_id)) {
        reject("transfer already known");
        return;
    }

    std::shared_ptr<Inbound> in;
    try {
        // Separate file: a TCP fallback for the same id must not share it.
        in = create_inbound(hs, name, ".rdma.part");
    } catch (const TransferIoError& e) {
        reject(e.what());
        return;
    }
    auto& s = *in->session;
    const size_t length = static_cast<size_t>(hs.total_size);

    void* map = ::mmap(nullptr, length, PROT_READ | PROT_WRITE, MAP_SHARED, in->part_fd, 0);
    if (map == MAP_FAILED) {
        reject("mmap: " + std::string(strerror(errno)));
        close_part(*in);
        ::unlink(in->part_path.c_str());
        return;
    }

    bool landed = false;
    try {
        auto conn = m_rdma->open_connection();
        const RdmaMemoryRegion region = conn->register_region(map, length, true);
        conn->connect(setup.endpoint);

        s.transition(TransferState::NEGOTIATING);
        s.set_strategy(RdmaStrategy{m_rdma->device_name()});
        wire::RdmaSetupReply reply;
        reply.status = wire::HandshakeStatus::READY;
        reply.endpoint = conn->local_endpoint();
        reply.remote_addr = region.addr;
        reply.rkey = region.rkey;
        send_frame(fd, wire::FrameType::RDMA_SETUP_REPLY, reply.encode());
        replied = true;
        s.transition(TransferState::IN_PROGRESS);

        // The sender writes the whole file before RDMA_DONE arrives.
        set_io_timeout(fd, m_config.session_timeout_ms);
        const auto done = wire::RdmaDone::decode(recv_frame(fd, wire::FrameType::RDMA_DONE));
        if (done.transfer_id != hs.transfer_id || done.bytes != hs.total_size) {
            throw ProtocolError("RDMA_DONE does not match the setup");
        }
        if (::msync(map, length, MS_SYNC) != 0) {
            throw TransferIoError("msync: " + std::string(strerror(errno)));
        }
        landed = true;
    } catch (const TransferException& e) {
        if (!replied) {
            reject(e.what());
        } else {
            LOG_WARN("RDMA: Receive of " + short_id(hs.transfer_id) + " aborted: " + e.what());
        }
    }
    ::munmap(map, length);

    if (!landed) {
        close_part(*in);
        ::unlink(in->part_path.c_str());
        return;
    }

    s.set_range_cursor(0, hs.total_size);
    s.set_range_state(0, RangeState::ACKNOWLEDGED);
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        m_sessions[hs.transfer_id] = in;
    }
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.transfers_started++;
        m_stats.bytes_received += hs.total_size;
    }
    Telemetry::getInstance().inc_counter("ft.bytes_received", static_cast<int64_t>(hs.total_size));
    emit(*in, TransferEventType::STARTED, true);
    s.transition(TransferState::VERIFYING);
    schedule_verify(in);

    wire::StreamAck ack;
    ack.stream_index = 0;
    ack.bytes = hs.total_size;
    send_frame(fd, wire::FrameType::STREAM_ACK, ack.encode());
    LOG_INFO("RDMA: Received " + std::to_string(hs.total_size) + " bytes for " + short_id(hs.transfer_id));
}

// ============================================================================
// HOUSEKEEPING
// ============================================================================

void TransferServer::sweep() {
    reap_connections(false);

    const auto now = std::chrono::steady_clock::now();
    const auto timeout = std::chrono::milliseconds(m_config.session_timeout_ms);
    const auto retention = std::chrono::milliseconds(m_config.session_retention_ms);

    std::vector<std::shared_ptr<Inbound>> stalled;
    std::vector<std::shared_ptr<Inbound>> expired;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        for (auto it = m_sessions.begin(); it != m_sessions.end();) {
            auto& s = *it->second->session;
            const TransferState state = s.state();
            if (state == TransferState::COMPLETED || state == TransferState::FAILED) {
                if (now - s.terminal_at() > retention) {
                    expired.push_back(it->second);
                    it = m_sessions.erase(it);
                    continue;
                }
            } else if (state != TransferState::VERIFYING && now - s.last_progress() > timeout) {
                stalled.push_back(it->second);
            }
            ++it;
        }
    }

    for (auto& in : stalled) {
        auto& s = *in->session;
        LOG_WARN("SRV: Transfer " + short_id(s.transfer_id()) + " made no progress for " +
                 std::to_string(m_config.session_timeout_ms) + "ms");
        s.fail(TransferError::TIMEOUT, "no progress for " + std::to_string(m_config.session_timeout_ms) + "ms");
        s.cancel();
        save_checkpoint(*in);
        finish_failed(in);
    }
    for (auto& in : expired) {
        close_part(*in);
        LOG_DEBUG("SRV: Dropped " + short_id(in->session->transfer_id()) + " from memory");
    }
}

bool TransferServer::cancel_session(const std::string& transfer_id, bool delete_partial) {
    auto in = find(transfer_id);
    if (!in) {
        return false;
    }
    auto& s = *in->session;
    const bool was_active = !s.is_terminal();
    s.fail(TransferError::CANCELLED, "cancelled by receiver");
    s.cancel();
    {
        std::unique_lock<std::mutex> lock(in->mu);
        in->cv.wait_for(lock, std::chrono::milliseconds(m_config.io_timeout_ms), [&] {
            return std::none_of(in->slots.begin(), in->slots.end(),
                                [](const StreamSlot& slot) { return slot.active; });
        });
    }

    if (delete_partial) {
        close_part(*in);
        std::error_code ec;
        fs::remove(in->part_path, ec);
        m_store.remove(transfer_id);
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        m_sessions.erase(transfer_id);
    } else {
        save_checkpoint(*in);
    }
    LOG_INFO("SRV: Cancelled " + short_id(transfer_id) + (delete_partial ? ", partial file removed" : ""));
    if (was_active) {
        finish_failed(in);
    }
    return true;
}

// ============================================================================
// EVENTS / QUERIES
// ============================================================================

void TransferServer::emit(Inbound& in, TransferEventType type, bool force) {
    const auto& s = *in.session;
    const auto now = std::chrono::steady_clock::now();
    if (type == TransferEventType::PROGRESS && !force) {
        std::lock_guard<std::mutex> lock(in.mu);
        if (now - in.last_event < std::chrono::milliseconds(m_config.progress_interval_ms)) {
            return;
        }
        in.last_event = now;
    }

    TransferEvent ev;
    ev.type = type;
    ev.direction = TransferDirection::RECEIVE;
    ev.transfer_id = s.transfer_id();
    ev.file_name = s.file_name();
    ev.bytes_transferred = s.bytes_transferred();
    ev.total_bytes = s.file_size();
    ev.percent_complete = s.file_size() == 0 ? 100.0
                          : 100.0 * static_cast<double>(ev.bytes_transferred) / static_cast<double>(s.file_size());
    ev.elapsed_seconds = s.elapsed_seconds();
    ev.throughput_mbps = s.throughput_mbps();
    ev.error = s.error();
    ev.message = s.error_message();

    if (type == TransferEventType::PROGRESS) {
        Telemetry::getInstance().record_progress(
            {ev.transfer_id, ev.bytes_transferred, ev.total_bytes, ev.elapsed_seconds, ev.throughput_mbps});
    }

    TransferEventCallback cb;
    {
        std::lock_guard<std::mutex> lock(m_cb_mutex);
        cb = m_callback;
    }
    if (cb) {
        cb(ev);
    }
}

void TransferServer::finish_failed(const std::shared_ptr<Inbound>& in) {
    {
        // Verifier and cancel_session can both get here for the same attempt.
        std::lock_guard<std::mutex> lock(in->mu);
        if (in->failure_reported) {
            return;
        }
        in->failure_reported = true;
    }
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.transfers_failed++;
    }
    auto& telemetry = Telemetry::getInstance();
    telemetry.inc_counter("ft.transfers_failed");
    telemetry.clear_progress(in->session->transfer_id());
    LOG_WARN("SRV: Transfer " + short_id(in->session->transfer_id()) + " failed: " +
             transfer_error_name(in->session->error()) + " " + in->session->error_message());
    emit(*in, TransferEventType::FAILED, true);
}

std::shared_ptr<TransferServer::Inbound> TransferServer::find(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(m_sessions_mutex);
    auto it = m_sessions.find(transfer_id);
    return it == m_sessions.end() ? nullptr : it->second;
}

InboundSessionInfo TransferServer::info_of(Inbound& in) const {
    const auto& s = *in.session;
    InboundSessionInfo info;
    info.transfer_id = s.transfer_id();
    info.file_name = s.file_name();
    info.part_path = in.part_path;
    info.final_path = in.final_path;
    info.state = s.state();
    info.error = s.error();
    info.error_message = s.error_message();
    info.bytes_received = s.bytes_transferred();
    info.total_size = s.file_size();
    info.expected_hash = s.hash();
    info.stream_count = s.stream_count();
    std::lock_guard<std::mutex> lock(in.mu);
    info.computed_hash = in.computed_hash;
    return info;
}

std::optional<InboundSessionInfo> TransferServer::session_info(const std::string& transfer_id) const {
    auto in = find(transfer_id);
    if (!in) {
        return std::nullopt;
    }
    return info_of(*in);
}

std::vector<InboundSessionInfo> TransferServer::sessions() const {
    std::vector<std::shared_ptr<Inbound>> all;
    {
        std::lock_guard<std::mutex> lock(m_sessions_mutex);
        for (const auto& kv : m_sessions) {
            all.push_back(kv.second);
        }
    }
    std::vector<InboundSessionInfo> out;
    for (auto& in : all) {
        out.push_back(info_of(*in));
    }
    return out;
}

TransferStatistics TransferServer::statistics() const {
    std::lock_guard<std::mutex> lock(m_stats_mutex);
    return m_stats;
}
