#include "file_transfer_manager.h"
#include "transfer_errors.h"
#include "transfer_wire.h"
#include "file_hasher.h"
#include "epoll_reactor.h"
#include "id_utils.h"
#include "telemetry.h"
#include "constants.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace {
std::string short_id(const std::string& id) {
    return id.substr(0, 8);
}

void pread_all(int fd, uint8_t* data, size_t len, uint64_t offset) {
    while (len > 0) {
        ssize_t n = ::pread(fd, data, len, static_cast<off_t>(offset));
        if (n < 0) {
            if (errno == EINTR) continue;
            throw TransferIoError("pread: " + std::string(strerror(errno)));
        }
        if (n == 0) {
            throw TransferIoError("source file shrank during transfer");
        }
        data += n;
        len -= static_cast<size_t>(n);
        offset += static_cast<uint64_t>(n);
    }
}

// Keeps a socket visible to TransferSession::cancel() while it is in use.
class SocketRegistration {
public:
    SocketRegistration(TransferSession& session, int fd) : m_session(session), m_fd(fd) {
        m_session.register_socket(fd);
    }
    ~SocketRegistration() { m_session.unregister_socket(m_fd); }

    SocketRegistration(const SocketRegistration&) = delete;
    SocketRegistration& operator=(const SocketRegistration&) = delete;

private:
    TransferSession& m_session;
    int m_fd;
};

// Sleeps in short slices so a cancel is noticed promptly.
void backoff(const TransferSession& session, int total_ms) {
    const auto until = std::chrono::steady_clock::now() + std::chrono::milliseconds(total_ms);
    while (!session.is_cancelled() && std::chrono::steady_clock::now() < until) {
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
}
} // namespace

FileTransferManager::FileTransferManager(const TransferConfig& config,
                                         std::shared_ptr<NodeRegistry> registry,
                                         std::shared_ptr<RdmaTransport> rdma)
    : m_config(config),
      m_registry(std::move(registry)),
      m_rdma(std::move(rdma)),
      m_callback(config.on_event) {
    if (m_config.chunk_size == 0) m_config.chunk_size = DEFAULT_CHUNK_SIZE;
    if (m_config.buffer_pool_size == 0) m_config.buffer_pool_size = DEFAULT_BUFFER_POOL_SIZE;
    m_config.concurrent_streams =
        std::min(std::max<uint32_t>(m_config.concurrent_streams, 1), MAX_STREAMS_PER_TRANSFER);

    std::error_code ec;
    fs::create_directories(m_config.receive_dir, ec);
    if (ec) {
        LOG_WARN("FT: Cannot create receive directory " + m_config.receive_dir + ": " + ec.message());
    }

    m_pool = std::make_shared<BufferPool>(m_config.buffer_pool_size, m_config.chunk_size);
    m_server = std::make_unique<TransferServer>(m_config, m_pool, m_rdma);

    m_reactor = std::make_unique<EpollReactor>();
    m_reactor->runEvery(500, [this] { watchdog(); });
    m_reactor->start();

    LOG_INFO("FT: Manager ready: chunk " + std::to_string(m_config.chunk_size) + " bytes, " +
             std::to_string(m_config.concurrent_streams) + " streams, pool " +
             std::to_string(m_config.buffer_pool_size) + (m_rdma ? ", rdma available" : ""));
}

FileTransferManager::~FileTransferManager() {
    m_reactor->stop();
    m_reactor.reset();

    std::vector<std::shared_ptr<Outbound>> all;
    {
        std::lock_guard<std::mutex> lock(m_transfers_mutex);
        for (auto& kv : m_transfers) {
            all.push_back(kv.second);
        }
    }
    for (auto& out : all) {
        if (!out->session->is_terminal()) {
            out->session->fail(TransferError::CANCELLED, "manager shutting down");
        }
        out->session->cancel();
    }
    for (auto& out : all) {
        std::thread worker;
        {
            std::lock_guard<std::mutex> lock(out->mu);
            worker = std::move(out->worker);
        }
        if (worker.joinable()) {
            worker.join();
        }
    }
    m_server->stop();
}

// ============================================================================
// RECEIVE SIDE
// ============================================================================

std::string FileTransferManager::start_server() {
    return m_server->start();
}

std::string FileTransferManager::start_server(const TransferConfig& config) {
    if (m_server->is_running()) {
        LOG_WARN("FT: Server already running on " + m_server->address());
        return m_server->address();
    }
    TransferConfig server_config = config;
    {
        std::lock_guard<std::mutex> lock(m_cb_mutex);
        server_config.on_event = m_callback;
    }
    m_server = std::make_unique<TransferServer>(server_config, m_pool, m_rdma);
    return m_server->start();
}

void FileTransferManager::stop_server() {
    m_server->stop();
}

std::string FileTransferManager::server_address() const {
    return m_server->is_running() ? m_server->address() : "";
}

uint16_t FileTransferManager::server_port() const {
    return m_server->port();
}

std::string FileTransferManager::receive_directory() const {
    return m_server->receive_directory();
}

// ============================================================================
// TRANSFER INITIATION
// ============================================================================

std::string FileTransferManager::send_file(const std::string& file_path, const std::string& target) {
    return send_file(file_path, target, m_config);
}

std::string FileTransferManager::send_file(const std::string& file_path, const std::string& target,
                                           const TransferConfig& options) {
    const std::string transfer_id = generate_uuid_v4();

    auto out = std::make_shared<Outbound>();
    out->options = options;
    out->options.concurrent_streams =
        std::min(std::max<uint32_t>(options.concurrent_streams, 1), MAX_STREAMS_PER_TRANSFER);
    // Every chunk must fit one pool buffer.
    out->options.chunk_size = std::min<uint32_t>(options.chunk_size > 0 ? options.chunk_size : m_config.chunk_size,
                                                 static_cast<uint32_t>(m_pool->buffer_size()));

    struct stat st;
    const bool readable = ::stat(file_path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
    const uint64_t size = readable ? static_cast<uint64_t>(st.st_size) : 0;
    const std::string name = fs::path(file_path).filename().string();

    out->session = std::make_shared<TransferSession>(transfer_id, TransferDirection::SEND, file_path, name, size,
                                                     out->options.chunk_size, out->options.concurrent_streams);
    {
        std::lock_guard<std::mutex> lock(m_transfers_mutex);
        m_transfers[transfer_id] = out;
    }
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.transfers_started++;
    }

    if (!readable) {
        fail_early(out, TransferError::IO_ERROR, "cannot read " + file_path);
        return transfer_id;
    }
    if (!resolve_target(target, out->endpoint, out->peer_node)) {
        fail_early(out, TransferError::CONNECT_FAILED, "cannot resolve target '" + target + "'");
        return transfer_id;
    }
    out->session->set_peer(out->endpoint.to_string());

    LOG_INFO("FT: Sending '" + name + "' (" + std::to_string(size) + " bytes) to " +
             out->endpoint.to_string() + " as " + transfer_id);
    launch(out, false);
    return transfer_id;
}

void FileTransferManager::fail_early(const std::shared_ptr<Outbound>& out, TransferError error,
                                     const std::string& message) {
    LOG_ERROR("FT: " + message);
    out->session->fail(error, message);
    finish(*out);
}

void FileTransferManager::launch(const std::shared_ptr<Outbound>& out, bool resume) {
    std::lock_guard<std::mutex> lock(out->mu);
    out->finished = false;
    out->worker = std::thread(&FileTransferManager::run_session, this, out, resume);
}

bool FileTransferManager::resolve_target(const std::string& target, Endpoint& endpoint,
                                         std::optional<DiscoveredNode>& node) const {
    if (parse_endpoint(target, endpoint)) {
        return true;
    }
    if (!m_registry) {
        return false;
    }
    node = m_registry->find_by_id(target);
    if (!node) {
        node = m_registry->find_by_name(target);
    }
    if (!node || node->port == 0) {
        return false;
    }
    endpoint.ip = node->ip;
    endpoint.port = node->port;
    LOG_DEBUG("FT: Resolved '" + target + "' to " + endpoint.to_string());
    return true;
}

// ============================================================================
// SESSION
// ============================================================================

void FileTransferManager::run_session(std::shared_ptr<Outbound> out, bool resume) {
    auto& s = *out->session;
    try {
        out->file_fd = ::open(s.file_path().c_str(), O_RDONLY | O_CLOEXEC);
        if (out->file_fd < 0) {
            throw TransferIoError("open " + s.file_path() + ": " + strerror(errno));
        }

        if (resume) {
            LOG_INFO("FT: Resuming " + short_id(s.transfer_id()) + " at " +
                     std::to_string(s.bytes_transferred()) + "/" + std::to_string(s.file_size()) + " bytes");
            run_tcp(*out, true);
        } else {
            s.set_hash(FileHasher::hash_file(s.file_path(), s.chunk_size(), &s.cancel_flag()));
            if (!s.transition(TransferState::NEGOTIATING)) {
                throw TransferCancelled("session ended while hashing");
            }
            LOG_DEBUG("FT: " + short_id(s.transfer_id()) + " sha256 " + s.hash());
            emit(*out, TransferEventType::STARTED, true);

            bool sent = false;
            if (should_try_rdma(*out)) {
                sent = try_rdma(*out);
            }
            if (!sent) {
                run_tcp(*out, false);
            }
        }

        if (s.state() == TransferState::VERIFYING) {
            verify_remote(*out);
        }
    } catch (const TransferException& e) {
        s.fail(e.code(), e.what());
        s.cancel();
    } catch (const std::exception& e) {
        s.fail(TransferError::IO_ERROR, e.what());
        s.cancel();
    }

    if (out->file_fd >= 0) {
        ::close(out->file_fd);
        out->file_fd = -1;
    }
    finish(*out);
}

void FileTransferManager::run_tcp(Outbound& out, bool resume) {
    auto& s = *out.session;
    s.set_strategy(TcpStrategy{});

    std::vector<std::thread> streams;
    for (uint32_t i = 0; i < s.stream_count(); ++i) {
        if (s.range(i).state == RangeState::ACKNOWLEDGED) {
            continue;
        }
        streams.emplace_back(&FileTransferManager::run_stream, this, std::ref(out), i, resume);
    }
    for (auto& t : streams) {
        t.join();
    }

    if (s.is_terminal()) {
        return;
    }
    if (!s.all_ranges_acknowledged()) {
        throw TransferIoError("streams ended without acknowledgement");
    }
    s.transition(TransferState::VERIFYING);
}

void FileTransferManager::run_stream(Outbound& out, uint32_t index, bool resume) {
    auto& s = *out.session;
    const int max_retries = std::max(out.options.max_stream_retries, 0);
    int attempt = 0;
    for (;;) {
        try {
            stream_once(out, index, resume || out.receiver_knows.load());
            return;
        } catch (const TransferException& e) {
            if (s.is_cancelled() || s.is_terminal()) {
                return;
            }
            if (!e.retriable() || attempt >= max_retries) {
                LOG_ERROR("FT: Stream " + std::to_string(index) + " of " + short_id(s.transfer_id()) +
                          " failed after " + std::to_string(attempt + 1) + " attempt(s): " + e.what());
                s.fail(e.code(), "stream " + std::to_string(index) + ": " + e.what());
                s.cancel();
                return;
            }
            ++attempt;
            {
                std::lock_guard<std::mutex> lock(m_stats_mutex);
                m_stats.stream_retries++;
            }
            Telemetry::getInstance().inc_counter("ft.stream_retries");
            LOG_WARN("FT: Stream " + std::to_string(index) + " of " + short_id(s.transfer_id()) + ": " +
                     e.what() + "; retry " + std::to_string(attempt) + "/" + std::to_string(max_retries));
            backoff(s, out.options.retry_backoff_ms * attempt);
        } catch (const std::exception& e) {
            s.fail(TransferError::IO_ERROR, "stream " + std::to_string(index) + ": " + e.what());
            s.cancel();
            return;
        }
    }
}

void FileTransferManager::stream_once(Outbound& out, uint32_t index, bool resume) {
    auto& s = *out.session;
    const Range r = s.range(index);

    Socket sock = connect_tcp(out.endpoint, out.options.io_timeout_ms);
    set_io_timeout(sock.fd(), out.options.io_timeout_ms);
    SocketRegistration registration(s, sock.fd());

    wire::Handshake hs;
    hs.flags = resume ? wire::kFlagResume : 0;
    hs.transfer_id = s.transfer_id();
    hs.filename = s.file_name();
    hs.total_size = s.file_size();
    hs.hash = s.hash();
    hs.stream_count = s.stream_count();
    hs.stream_index = index;
    hs.range_offset = r.offset;
    hs.range_length = r.length;
    send_frame(sock.fd(), wire::FrameType::HANDSHAKE, hs.encode());

    const auto reply = wire::HandshakeReply::decode(recv_frame(sock.fd(), wire::FrameType::HANDSHAKE_REPLY));
    switch (reply.status) {
        case wire::HandshakeStatus::READY:
            break;
        case wire::HandshakeStatus::ALREADY_COMPLETE:
            out.receiver_knows.store(true);
            s.set_range_cursor(index, r.length);
            s.set_range_state(index, RangeState::ACKNOWLEDGED);
            return;
        case wire::HandshakeStatus::REJECTED:
            throw TransferException(TransferError::REJECTED, "receiver rejected stream: " + reply.message);
        case wire::HandshakeStatus::UNKNOWN_TRANSFER:
            throw TransferException(TransferError::RESUME_UNAVAILABLE,
                                    "receiver has no state for this transfer: " + reply.message);
    }
    if (reply.resume_offset > r.length) {
        throw ProtocolError("resume offset " + std::to_string(reply.resume_offset) + " beyond range length " +
                            std::to_string(r.length));
    }
    out.receiver_knows.store(true);

    s.set_range_cursor(index, reply.resume_offset);
    if (reply.resume_offset > 0) {
        LOG_INFO("FT: Stream " + std::to_string(index) + " of " + short_id(s.transfer_id()) + " resumes at " +
                 std::to_string(reply.resume_offset) + "/" + std::to_string(r.length));
    }
    s.transition(TransferState::IN_PROGRESS);
    s.touch();

    uint64_t cursor = reply.resume_offset;
    while (cursor < r.length) {
        if (s.is_cancelled()) {
            throw TransferCancelled("cancelled");
        }
        PooledBuffer buf = m_pool->acquire_unless(s.cancel_flag());
        if (!buf) {
            throw TransferCancelled("cancelled while waiting for a buffer");
        }
        const size_t len = static_cast<size_t>(
            std::min<uint64_t>({static_cast<uint64_t>(s.chunk_size()), buf.size(), r.length - cursor}));
        pread_all(out.file_fd, buf.data(), len, r.offset + cursor);
        send_all(sock.fd(), buf.data(), len);
        buf.release();

        cursor = s.advance(index, len);
        count_bytes_sent(len);
        emit(out, TransferEventType::PROGRESS);
    }
    s.set_range_state(index, RangeState::SENT);

    const auto ack = wire::StreamAck::decode(recv_frame(sock.fd(), wire::FrameType::STREAM_ACK));
    if (ack.stream_index != index || ack.bytes != r.length) {
        throw ProtocolError("bad ack for stream " + std::to_string(index));
    }
    s.set_range_state(index, RangeState::ACKNOWLEDGED);
    LOG_DEBUG("FT: Stream " + std::to_string(index) + " of " + short_id(s.transfer_id()) + " acknowledged");
}

void FileTransferManager::count_bytes_sent(uint64_t bytes) {
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        m_stats.bytes_sent += bytes;
    }
    Telemetry::getInstance().inc_counter("ft.bytes_sent", static_cast<int64_t>(bytes));
}

// ============================================================================
// RDMA
// ============================================================================

bool FileTransferManager::should_try_rdma(Outbound& out) {
    auto& s = *out.session;
    if (!m_rdma || !out.options.rdma_enabled || s.file_size() == 0) {
        return false;
    }
    if (out.peer_node && !out.peer_node->has_capability("rdma")) {
        return false;
    }
    const std::string peer = out.endpoint.to_string();
    {
        std::lock_guard<std::mutex> lock(m_cooldown_mutex);
        auto it = m_rdma_cooldown.find(peer);
        if (it != m_rdma_cooldown.end()) {
            if (std::chrono::steady_clock::now() < it->second) {
                LOG_DEBUG("RDMA: " + peer + " on cooldown, using TCP");
                return false;
            }
            m_rdma_cooldown.erase(it);
        }
    }
    const RdmaSupport support = m_rdma->probe();
    if (support != RdmaSupport::SUPPORTED) {
        LOG_DEBUG(std::string("RDMA: device reports ") + rdma_support_name(support) + ", using TCP");
        return false;
    }
    return true;
}

bool FileTransferManager::try_rdma(Outbound& out) {
    auto& s = *out.session;
    bool committed = false;
    try {
        run_rdma(out, committed);
        return true;
    } catch (const TransferException& e) {
        if (committed || s.is_cancelled() || s.is_terminal()) {
            throw;
        }
        const std::string peer = out.endpoint.to_string();
        LOG_WARN("RDMA: " + short_id(s.transfer_id()) + " falling back to TCP: " + e.what());
        {
            std::lock_guard<std::mutex> lock(m_cooldown_mutex);
            m_rdma_cooldown[peer] = std::chrono::steady_clock::now() +
                                    std::chrono::milliseconds(out.options.rdma_cooldown_ms);
        }
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.rdma_fallbacks++;
        }
        Telemetry::getInstance().inc_counter("ft.rdma_fallbacks");

        s.set_strategy(TcpStrategy{});
        s.reset_ranges();
        if (s.state() == TransferState::IN_PROGRESS) {
            s.transition(TransferState::NEGOTIATING);
        }
        return false;
    }
}

void FileTransferManager::run_rdma(Outbound& out, bool& committed) {
    auto& s = *out.session;
    const size_t length = static_cast<size_t>(s.file_size());

    auto conn = m_rdma->open_connection();

    void* map = ::mmap(nullptr, length, PROT_READ, MAP_PRIVATE, out.file_fd, 0);
    if (map == MAP_FAILED) {
        throw RdmaUnavailable("mmap source: " + std::string(strerror(errno)));
    }
    struct Unmap {
        void* addr;
        size_t len;
        ~Unmap() { ::munmap(addr, len); }
    } unmap{map, length};

    const RdmaMemoryRegion region = conn->register_region(map, length, false);

    Socket sock = connect_tcp(out.endpoint, out.options.io_timeout_ms);
    set_io_timeout(sock.fd(), out.options.io_timeout_ms);
    SocketRegistration registration(s, sock.fd());

    wire::RdmaSetup setup;
    setup.handshake.transfer_id = s.transfer_id();
    setup.handshake.filename = s.file_name();
    setup.handshake.total_size = s.file_size();
    setup.handshake.hash = s.hash();
    setup.handshake.stream_count = 1;
    setup.handshake.stream_index = 0;
    setup.handshake.range_offset = 0;
    setup.handshake.range_length = s.file_size();
    setup.endpoint = conn->local_endpoint();
    send_frame(sock.fd(), wire::FrameType::RDMA_SETUP, setup.encode());

    const auto reply = wire::RdmaSetupReply::decode(recv_frame(sock.fd(), wire::FrameType::RDMA_SETUP_REPLY));
    if (reply.status != wire::HandshakeStatus::READY) {
        throw RdmaUnavailable("receiver declined: " + reply.message);
    }
    conn->connect(reply.endpoint);

    s.set_strategy(RdmaStrategy{m_rdma->device_name()});
    s.transition(TransferState::IN_PROGRESS);
    LOG_INFO("RDMA: " + short_id(s.transfer_id()) + " writing " + std::to_string(length) + " bytes via " +
             m_rdma->device_name());

    for (uint32_t i = 0; i < s.stream_count(); ++i) {
        const Range r = s.range(i);
        uint64_t cursor = r.cursor;
        while (cursor < r.length) {
            if (s.is_cancelled()) {
                throw TransferCancelled("cancelled");
            }
            const size_t len = static_cast<size_t>(std::min<uint64_t>(s.chunk_size(), r.length - cursor));
            const uint64_t offset = r.offset + cursor;
            conn->write(region, offset, len, reply.remote_addr + offset, reply.rkey);
            cursor = s.advance(i, len);
            count_bytes_sent(len);
            emit(out, TransferEventType::PROGRESS);
        }
        s.set_range_state(i, RangeState::SENT);
    }

    wire::RdmaDone done;
    done.transfer_id = s.transfer_id();
    done.bytes = s.file_size();
    send_frame(sock.fd(), wire::FrameType::RDMA_DONE, done.encode());
    committed = true;

    const auto ack = wire::StreamAck::decode(recv_frame(sock.fd(), wire::FrameType::STREAM_ACK));
    if (ack.bytes != s.file_size()) {
        throw ProtocolError("bad rdma ack");
    }
    for (uint32_t i = 0; i < s.stream_count(); ++i) {
        s.set_range_state(i, RangeState::ACKNOWLEDGED);
    }
    s.transition(TransferState::VERIFYING);
}

// ============================================================================
// VERIFY / FINISH
// ============================================================================

void FileTransferManager::verify_remote(Outbound& out) {
    auto& s = *out.session;
    int attempt = 0;
    for (;;) {
        try {
            Socket sock = connect_tcp(out.endpoint, out.options.io_timeout_ms);
            set_io_timeout(sock.fd(), out.options.verify_timeout_ms + out.options.io_timeout_ms);
            SocketRegistration registration(s, sock.fd());

            wire::VerifyRequest req;
            req.transfer_id = s.transfer_id();
            send_frame(sock.fd(), wire::FrameType::VERIFY, req.encode());
            const auto reply = wire::VerifyReply::decode(recv_frame(sock.fd(), wire::FrameType::VERIFY_REPLY));

            switch (reply.verdict) {
                case wire::VerifyVerdict::COMPLETED:
                    s.transition(TransferState::COMPLETED);
                    break;
                case wire::VerifyVerdict::CHECKSUM_MISMATCH:
                    s.fail(TransferError::CHECKSUM_MISMATCH,
                           "receiver computed " + reply.hash + ", expected " + s.hash());
                    break;
                case wire::VerifyVerdict::TIMEOUT:
                    s.fail(TransferError::TIMEOUT, "receiver verification timed out: " + reply.message);
                    break;
                case wire::VerifyVerdict::FAILED:
                    s.fail(TransferError::IO_ERROR, "receiver failed: " + reply.message);
                    break;
                case wire::VerifyVerdict::UNKNOWN:
                    s.fail(TransferError::PROTOCOL_ERROR, "receiver does not know this transfer");
                    break;
            }
            return;
        } catch (const TransferException& e) {
            if (!e.retriable() || s.is_cancelled() || attempt >= out.options.max_stream_retries) {
                throw;
            }
            ++attempt;
            LOG_WARN("FT: Verify of " + short_id(s.transfer_id()) + ": " + e.what() + "; retry " +
                     std::to_string(attempt));
            backoff(s, out.options.retry_backoff_ms * attempt);
        }
    }
}

void FileTransferManager::finish(Outbound& out) {
    auto& s = *out.session;
    auto& telemetry = Telemetry::getInstance();
    if (s.state() == TransferState::COMPLETED) {
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.transfers_completed++;
        }
        telemetry.inc_counter("ft.transfers_completed");
        telemetry.observe_hist_ms("ft.transfer_duration_ms", static_cast<int64_t>(s.elapsed_seconds() * 1000.0));
        LOG_INFO("FT: Sent '" + s.file_name() + "' (" + std::to_string(s.file_size()) + " bytes) in " +
                 std::to_string(s.elapsed_seconds()) + "s, " + std::to_string(s.throughput_mbps()) + " MB/s" +
                 (s.uses_rdma() ? " over RDMA" : ""));
        emit(out, TransferEventType::COMPLETED, true);
    } else {
        if (!s.is_terminal()) {
            s.fail(TransferError::IO_ERROR, "transfer ended in state " + std::string(transfer_state_name(s.state())));
        }
        {
            std::lock_guard<std::mutex> lock(m_stats_mutex);
            m_stats.transfers_failed++;
        }
        telemetry.inc_counter("ft.transfers_failed");
        LOG_ERROR("FT: Transfer " + short_id(s.transfer_id()) + " failed: " + transfer_error_name(s.error()) +
                  " (" + s.error_message() + ")");
        emit(out, TransferEventType::FAILED, true);
    }
    telemetry.clear_progress(s.transfer_id());

    {
        std::lock_guard<std::mutex> lock(out.mu);
        out.finished = true;
        out.finished_at = std::chrono::steady_clock::now();
    }
    out.cv.notify_all();
}

void FileTransferManager::watchdog() {
    const auto now = std::chrono::steady_clock::now();
    std::vector<std::shared_ptr<Outbound>> all;
    std::vector<std::thread> retired_workers;
    {
        std::lock_guard<std::mutex> lock(m_transfers_mutex);
        for (auto it = m_transfers.begin(); it != m_transfers.end();) {
            auto& out = it->second;
            std::lock_guard<std::mutex> out_lock(out->mu);
            if (out->finished &&
                now - out->finished_at > std::chrono::milliseconds(out->options.session_retention_ms)) {
                out->retired = true;
                retired_workers.push_back(std::move(out->worker));
                LOG_DEBUG("FT: Dropped " + short_id(it->first) + " from memory");
                it = m_transfers.erase(it);
                continue;
            }
            all.push_back(out);
            ++it;
        }
    }
    // Workers of finished sessions have already returned from finish().
    for (auto& worker : retired_workers) {
        if (worker.joinable()) {
            worker.join();
        }
    }
    for (auto& out : all) {
        auto& s = *out->session;
        const TransferState state = s.state();
        if (state != TransferState::NEGOTIATING && state != TransferState::IN_PROGRESS &&
            state != TransferState::RESUMING) {
            continue;
        }
        if (now - s.last_progress() > std::chrono::milliseconds(out->options.session_timeout_ms)) {
            LOG_WARN("FT: " + short_id(s.transfer_id()) + " made no progress for " +
                     std::to_string(out->options.session_timeout_ms) + "ms");
            s.fail(TransferError::TIMEOUT,
                   "no progress for " + std::to_string(out->options.session_timeout_ms) + "ms");
            s.cancel();
        }
    }
}

// ============================================================================
// CONTROL / STATUS
// ============================================================================

TransferResult FileTransferManager::wait_for_completion(const std::string& transfer_id,
                                                        std::chrono::milliseconds timeout) {
    auto out = find(transfer_id);
    if (!out) {
        return TransferResult::failure(transfer_id, TransferError::NONE, "unknown transfer id");
    }
    {
        std::unique_lock<std::mutex> lock(out->mu);
        if (!out->cv.wait_for(lock, timeout, [&] { return out->finished; })) {
            return TransferResult::failure(transfer_id, TransferError::TIMEOUT,
                                           std::string("still ") + transfer_state_name(out->session->state()));
        }
    }

    const auto& s = *out->session;
    TransferResult result = s.state() == TransferState::COMPLETED
        ? TransferResult::success(transfer_id, s.bytes_transferred(), s.elapsed_seconds())
        : TransferResult::failure(transfer_id, s.error(), s.error_message());
    result.bytes_transferred = s.bytes_transferred();
    result.elapsed_seconds = s.elapsed_seconds();
    return result;
}

bool FileTransferManager::resume_transfer(const std::string& transfer_id) {
    auto out = find(transfer_id);
    if (!out) {
        return false;
    }
    auto& s = *out->session;

    std::lock_guard<std::mutex> lock(out->mu);
    if (out->retired) {
        return false;
    }
    if (!out->finished) {
        LOG_WARN("FT: " + short_id(transfer_id) + " is still running");
        return false;
    }
    if (out->worker.joinable()) {
        out->worker.join();
    }
    if (s.state() != TransferState::FAILED || s.hash().empty() || out->endpoint.port == 0 ||
        s.error() == TransferError::CHECKSUM_MISMATCH) {
        LOG_WARN("FT: " + short_id(transfer_id) + " cannot be resumed (" + transfer_state_name(s.state()) +
                 ", " + transfer_error_name(s.error()) + ")");
        return false;
    }

    s.clear_cancel();
    if (!s.transition(TransferState::RESUMING)) {
        return false;
    }
    s.touch();
    out->finished = false;
    out->worker = std::thread(&FileTransferManager::run_session, this, out, true);
    LOG_INFO("FT: Resume requested for " + short_id(transfer_id));
    return true;
}

bool FileTransferManager::cancel_transfer(const std::string& transfer_id) {
    auto out = find(transfer_id);
    if (!out || out->session->is_terminal()) {
        return false;
    }
    out->session->fail(TransferError::CANCELLED, "cancelled by caller");
    out->session->cancel();
    LOG_INFO("FT: Cancelled " + short_id(transfer_id));
    return true;
}

std::shared_ptr<const TransferSession> FileTransferManager::get_transfer_status(
    const std::string& transfer_id) const {
    auto out = find(transfer_id);
    return out ? out->session : nullptr;
}

std::vector<std::string> FileTransferManager::get_active_transfers() const {
    std::vector<std::string> ids;
    std::lock_guard<std::mutex> lock(m_transfers_mutex);
    for (const auto& kv : m_transfers) {
        if (!kv.second->session->is_terminal()) {
            ids.push_back(kv.first);
        }
    }
    return ids;
}

TransferStatistics FileTransferManager::get_statistics() const {
    TransferStatistics stats;
    {
        std::lock_guard<std::mutex> lock(m_stats_mutex);
        stats = m_stats;
    }
    stats.bytes_received = m_server->statistics().bytes_received;
    return stats;
}

void FileTransferManager::on_transfer_event(TransferEventCallback cb) {
    {
        std::lock_guard<std::mutex> lock(m_cb_mutex);
        m_callback = cb;
    }
    m_server->set_event_callback(std::move(cb));
}

RdmaSupport FileTransferManager::rdma_support() const {
    return m_rdma ? m_rdma->probe() : RdmaSupport::UNSUPPORTED;
}

void FileTransferManager::emit(Outbound& out, TransferEventType type, bool force) {
    const auto& s = *out.session;
    const auto now = std::chrono::steady_clock::now();
    if (type == TransferEventType::PROGRESS && !force) {
        std::lock_guard<std::mutex> lock(out.mu);
        if (now - out.last_event < std::chrono::milliseconds(out.options.progress_interval_ms)) {
            return;
        }
        out.last_event = now;
    }

    TransferEvent ev;
    ev.type = type;
    ev.direction = TransferDirection::SEND;
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

std::shared_ptr<FileTransferManager::Outbound> FileTransferManager::find(const std::string& transfer_id) const {
    std::lock_guard<std::mutex> lock(m_transfers_mutex);
    auto it = m_transfers.find(transfer_id);
    return it == m_transfers.end() ? nullptr : it->second;
}
