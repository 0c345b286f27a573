#ifndef TRANSFER_SERVER_H
#define TRANSFER_SERVER_H

#include "transfer_types.h"
#include "transfer_session.h"
#include "transfer_wire.h"
#include "buffer_pool.h"
#include "resume_store.h"
#include "rdma_transport.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <list>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <thread>
#include <vector>

class EpollReactor;
class EventThreadPool;

// What the receiver knows about one inbound transfer.
struct InboundSessionInfo {
    std::string transfer_id;
    std::string file_name;
    std::string part_path;
    std::string final_path;
    TransferState state = TransferState::PENDING;
    TransferError error = TransferError::NONE;
    std::string error_message;
    uint64_t bytes_received = 0;
    uint64_t total_size = 0;
    std::string expected_hash;
    std::string computed_hash;
    uint32_t stream_count = 0;
};

/**
 * TRANSFER SERVER (receiver side)
 *
 * Accepts connections on the reactor thread and serves each on its own
 * thread. The first frame selects the job: HANDSHAKE (one stream of a
 * transfer), VERIFY (wait for the whole-file verdict) or RDMA_SETUP.
 *
 * Data lands in <receive_dir>/<name>.<id>.part at range.offset + cursor and is
 * renamed to <receive_dir>/<name> once the SHA-256 matches. A mismatch leaves
 * the .part file in place.
 */
class TransferServer {
public:
    TransferServer(const TransferConfig& config,
                   std::shared_ptr<BufferPool> pool = nullptr,
                   std::shared_ptr<RdmaTransport> rdma = nullptr);
    ~TransferServer();

    TransferServer(const TransferServer&) = delete;
    TransferServer& operator=(const TransferServer&) = delete;

    // Returns "ip:port" of the listener, empty on failure.
    std::string start();
    void stop();
    bool is_running() const { return m_running.load(); }

    std::string address() const;
    uint16_t port() const;
    const std::string& receive_directory() const { return m_config.receive_dir; }
    std::shared_ptr<BufferPool> buffer_pool() const { return m_pool; }

    void set_event_callback(TransferEventCallback cb);

    // Stops a session's streams. The partial file is kept unless delete_partial.
    bool cancel_session(const std::string& transfer_id, bool delete_partial);

    std::optional<InboundSessionInfo> session_info(const std::string& transfer_id) const;
    std::vector<InboundSessionInfo> sessions() const;
    TransferStatistics statistics() const;

    // Final component only; empty for "", "." and "..".
    static std::string sanitize_file_name(const std::string& name);

private:
    struct StreamSlot {
        bool active = false;
        int fd = -1;
        uint64_t generation = 0;
    };

    struct Inbound {
        std::shared_ptr<TransferSession> session;
        std::string part_path;
        std::string final_path;
        int part_fd = -1;

        std::mutex mu;
        std::condition_variable cv;
        std::vector<StreamSlot> slots;
        uint32_t chunks_since_checkpoint = 0;
        bool verify_scheduled = false;
        bool failure_reported = false;
        std::string computed_hash;
        std::chrono::steady_clock::time_point last_event;

        std::mutex checkpoint_mu;       // serialises checkpoint writes
        std::shared_mutex fd_mu;        // writers shared, close_part exclusive
    };

    struct Connection {
        std::thread thread;
        std::atomic<bool> done{false};
        int fd = -1;
    };

    void on_accept();
    void serve_connection(Connection* conn);
    void handle_stream(int fd, const wire::Handshake& hs);
    void handle_verify(int fd, const wire::VerifyRequest& req);
    void handle_rdma(int fd, const wire::RdmaSetup& setup);

    // Looks up or creates the session for a handshake. Sends the error reply
    // itself and returns nullptr when the stream must not proceed.
    std::shared_ptr<Inbound> admit(int fd, const wire::Handshake& hs);
    std::shared_ptr<Inbound> create_inbound(const wire::Handshake& hs, const std::string& name,
                                            const char* part_suffix = ".part");
    std::shared_ptr<Inbound> restore_inbound(const wire::Handshake& hs, const std::string& name);
    bool layout_matches(const Inbound& in, const wire::Handshake& hs) const;

    void receive_range(const std::shared_ptr<Inbound>& in, int fd, uint32_t index, uint64_t generation);
    void claim_slot(Inbound& in, uint32_t index, int fd, uint64_t& generation);
    void release_slot(Inbound& in, uint32_t index, uint64_t generation);

    void save_checkpoint(Inbound& in);
    void schedule_verify(const std::shared_ptr<Inbound>& in);
    void verify(const std::shared_ptr<Inbound>& in);
    void close_part(Inbound& in);

    void sweep();
    void reap_connections(bool all);

    void emit(Inbound& in, TransferEventType type, bool force = false);
    void finish_failed(const std::shared_ptr<Inbound>& in);
    std::shared_ptr<Inbound> find(const std::string& transfer_id) const;
    InboundSessionInfo info_of(Inbound& in) const;

    TransferConfig m_config;
    std::shared_ptr<BufferPool> m_pool;
    std::shared_ptr<RdmaTransport> m_rdma;
    ResumeStore m_store;

    std::unique_ptr<EpollReactor> m_reactor;
    std::unique_ptr<EventThreadPool> m_verifiers;
    int m_listen_fd = -1;
    uint16_t m_port = 0;
    std::atomic<bool> m_running{false};
    std::mutex m_lifecycle_mutex;

    mutable std::mutex m_sessions_mutex;
    std::map<std::string, std::shared_ptr<Inbound>> m_sessions;

    std::mutex m_conn_mutex;
    std::list<std::unique_ptr<Connection>> m_connections;

    mutable std::mutex m_cb_mutex;
    TransferEventCallback m_callback;

    mutable std::mutex m_stats_mutex;
    TransferStatistics m_stats;
};

#endif // TRANSFER_SERVER_H
