#ifndef RDMA_TRANSPORT_H
#define RDMA_TRANSPORT_H

#include "transfer_wire.h"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

enum class RdmaSupport {
    UNSUPPORTED,    // no verbs devices
    LIMITED,        // devices present, no active port
    SUPPORTED
};

const char* rdma_support_name(RdmaSupport support);

struct RdmaMemoryRegion {
    uint64_t addr = 0;
    size_t length = 0;
    uint32_t lkey = 0;
    uint32_t rkey = 0;
};

/**
 * One reliable-connected queue pair plus the regions registered on it.
 * Endpoints are exchanged out of band (RDMA_SETUP on the control socket),
 * then connect() moves the pair to ready-to-send.
 * All failures throw RdmaUnavailable.
 */
class RdmaConnection {
public:
    virtual ~RdmaConnection() = default;

    virtual wire::RdmaEndpoint local_endpoint() const = 0;
    virtual void connect(const wire::RdmaEndpoint& remote) = 0;

    // remote_write: the peer may RDMA-WRITE into this region.
    virtual RdmaMemoryRegion register_region(void* addr, size_t length, bool remote_write) = 0;

    // Blocks until the write completes.
    virtual void write(const RdmaMemoryRegion& local, uint64_t local_offset, size_t length,
                       uint64_t remote_addr, uint32_t rkey) = 0;
};

class RdmaTransport {
public:
    virtual ~RdmaTransport() = default;

    // Cheap and side-effect free; never blocks the TCP path.
    virtual RdmaSupport probe() = 0;
    virtual std::string device_name() const = 0;
    virtual std::unique_ptr<RdmaConnection> open_connection() = 0;
};

// libibverbs: first device with an active port wins.
class VerbsRdmaTransport : public RdmaTransport {
public:
    explicit VerbsRdmaTransport(int completion_timeout_ms = 10000);

    RdmaSupport probe() override;
    std::string device_name() const override;
    std::unique_ptr<RdmaConnection> open_connection() override;

private:
    int m_completion_timeout_ms;
    mutable std::mutex m_mutex;
    std::string m_device;
    uint8_t m_port = 1;
};

std::shared_ptr<RdmaTransport> make_default_rdma_transport();

#endif // RDMA_TRANSPORT_H
