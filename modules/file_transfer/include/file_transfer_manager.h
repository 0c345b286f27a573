#ifndef FILE_TRANSFER_MANAGER_H
#define FILE_TRANSFER_MANAGER_H

#include "transfer_types.h"
#include "transfer_session.h"
#include "transfer_server.h"
#include "buffer_pool.h"
#include "rdma_transport.h"
#include "socket_utils.h"
#include "node_registry.h"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

class EpollReactor;

/**
 * FILE TRANSFER MODULE
 *
 * Features:
 * - Whole-file SHA-256 computed once, verified by the receiver
 * - N parallel TCP streams, each owning one contiguous byte range
 * - Shared buffer pool as the only memory bound on in-flight data
 * - Per-stream retry with resume from the receiver's offset
 * - RDMA WRITE path when both sides have an active verbs device,
 *   falling back to TCP for the whole session on any failure
 * - Embedded TransferServer so a node both sends and receives
 */
class FileTransferManager {
public:
    /**
     * @param config   defaults for every send and for the embedded server
     * @param registry resolves node ids and names to addresses (may be null)
     * @param rdma     zero-copy transport (null disables the RDMA path)
     */
    explicit FileTransferManager(const TransferConfig& config = TransferConfig(),
                                 std::shared_ptr<NodeRegistry> registry = nullptr,
                                 std::shared_ptr<RdmaTransport> rdma = nullptr);
    ~FileTransferManager();

    FileTransferManager(const FileTransferManager&) = delete;
    FileTransferManager& operator=(const FileTransferManager&) = delete;

    // ==================== RECEIVE SIDE ====================

    /**
     * Starts the embedded TransferServer.
     * @return bound "ip:port", empty on failure
     */
    std::string start_server();
    std::string start_server(const TransferConfig& config);
    void stop_server();
    std::string server_address() const;
    uint16_t server_port() const;
    std::string receive_directory() const;
    TransferServer& server() { return *m_server; }

    // Shared by outbound streams and the embedded server.
    std::shared_ptr<BufferPool> buffer_pool() const { return m_pool; }

    // ==================== TRANSFER INITIATION ====================

    /**
     * Start sending a file.
     * @param target "ip:port", a node id or a node name
     * @return transfer id. Always a valid id: failures (missing file,
     *         unresolvable target) are recorded on the session.
     */
    std::string send_file(const std::string& file_path, const std::string& target);
    std::string send_file(const std::string& file_path, const std::string& target,
                          const TransferConfig& options);

    // ==================== TRANSFER CONTROL ====================

    // Blocks until the transfer settles (COMPLETED or FAILED) or timeout.
    TransferResult wait_for_completion(const std::string& transfer_id,
                                       std::chrono::milliseconds timeout);

    /**
     * Retry a FAILED transfer under the same id. Every unacknowledged stream
     * re-handshakes with the resume flag and continues from the receiver's offset.
     * @return false if unknown, still running, or not resumable
     */
    bool resume_transfer(const std::string& transfer_id);

    bool cancel_transfer(const std::string& transfer_id);

    // ==================== TRANSFER STATUS ====================

    std::shared_ptr<const TransferSession> get_transfer_status(const std::string& transfer_id) const;
    std::vector<std::string> get_active_transfers() const;

    // Outbound totals plus bytes received by the embedded server.
    TransferStatistics get_statistics() const;

    // Receives events for both directions.
    void on_transfer_event(TransferEventCallback cb);

    RdmaSupport rdma_support() const;

private:
    struct Outbound {
        std::shared_ptr<TransferSession> session;
        TransferConfig options;
        Endpoint endpoint;
        std::optional<DiscoveredNode> peer_node;
        int file_fd = -1;
        std::atomic<bool> receiver_knows{false};

        std::thread worker;
        std::mutex mu;
        std::condition_variable cv;
        bool finished = false;
        bool retired = false;               // dropped from m_transfers
        std::chrono::steady_clock::time_point finished_at;
        std::chrono::steady_clock::time_point last_event;
    };

    void launch(const std::shared_ptr<Outbound>& out, bool resume);
    void run_session(std::shared_ptr<Outbound> out, bool resume);
    void run_tcp(Outbound& out, bool resume);
    void run_stream(Outbound& out, uint32_t index, bool resume);
    void stream_once(Outbound& out, uint32_t index, bool resume);
    bool should_try_rdma(Outbound& out);
    bool try_rdma(Outbound& out);
    void run_rdma(Outbound& out, bool& committed);
    void verify_remote(Outbound& out);
    void finish(Outbound& out);
    void fail_early(const std::shared_ptr<Outbound>& out, TransferError error, const std::string& message);

    bool resolve_target(const std::string& target, Endpoint& endpoint,
                        std::optional<DiscoveredNode>& node) const;
    void watchdog();
    void emit(Outbound& out, TransferEventType type, bool force = false);
    void count_bytes_sent(uint64_t bytes);
    std::shared_ptr<Outbound> find(const std::string& transfer_id) const;

    TransferConfig m_config;
    std::shared_ptr<NodeRegistry> m_registry;
    std::shared_ptr<RdmaTransport> m_rdma;
    std::shared_ptr<BufferPool> m_pool;
    std::unique_ptr<TransferServer> m_server;
    std::unique_ptr<EpollReactor> m_reactor;

    mutable std::mutex m_transfers_mutex;
    std::unordered_map<std::string, std::shared_ptr<Outbound>> m_transfers;

    std::mutex m_cooldown_mutex;
    std::map<std::string, std::chrono::steady_clock::time_point> m_rdma_cooldown;

    mutable std::mutex m_cb_mutex;
    TransferEventCallback m_callback;

    mutable std::mutex m_stats_mutex;
    TransferStatistics m_stats;
};

#endif // FILE_TRANSFER_MANAGER_H
