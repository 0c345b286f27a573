#include "rdma_transport.h"
#include "transfer_errors.h"
#include "logger.h"

#include <infiniband/verbs.h>

#include <chrono>
#include <cerrno>
#include <cstring>
#include <mutex>
#include <random>
#include <thread>
#include <vector>

const char* rdma_support_name(RdmaSupport support) {
    switch (support) {
        case RdmaSupport::UNSUPPORTED: return "unsupported";
        case RdmaSupport::LIMITED: return "limited";
        case RdmaSupport::SUPPORTED: return "supported";
    }
    return "unknown";
}

namespace {

// ibv_get_device_list wrapper
struct DeviceList {
    ibv_device** list = nullptr;
    int count = 0;

    DeviceList() { list = ibv_get_device_list(&count); }
    ~DeviceList() {
        if (list) ibv_free_device_list(list);
    }
    DeviceList(const DeviceList&) = delete;
    DeviceList& operator=(const DeviceList&) = delete;
};

uint32_t random_psn() {
    static std::mt19937 rng{std::random_device{}()};
    static std::mutex mu;
    std::lock_guard<std::mutex> lock(mu);
    return rng() & 0xFFFFFF;
}

bool gid_is_zero(const uint8_t* gid) {
    for (int i = 0; i < 16; ++i) {
        if (gid[i] != 0) return false;
    }
    return true;
}

class VerbsConnection : public RdmaConnection {
public:
    VerbsConnection(const std::string& device, uint8_t port, int timeout_ms)
        : m_port(port), m_timeout_ms(timeout_ms) {
        DeviceList devices;
        if (!devices.list) {
            throw RdmaUnavailable("ibv_get_device_list: " + std::string(strerror(errno)));
        }
        for (int i = 0; i < devices.count; ++i) {
            if (device == ibv_get_device_name(devices.list[i])) {
                m_ctx = ibv_open_device(devices.list[i]);
                break;
            }
        }
        if (!m_ctx) {
            throw RdmaUnavailable("cannot open device " + device);
        }
        try {
            setup();
        } catch (...) {
            teardown();
            throw;
        }
    }

    ~VerbsConnection() override { teardown(); }

    wire::RdmaEndpoint local_endpoint() const override { return m_local; }

    void connect(const wire::RdmaEndpoint& remote) override {
        ibv_qp_attr attr;
        std::memset(&attr, 0, sizeof(attr));
        attr.qp_state = IBV_QPS_RTR;
        attr.path_mtu = m_mtu;
        attr.dest_qp_num = remote.qpn;
        attr.rq_psn = remote.psn;
        attr.max_dest_rd_atomic = 1;
        attr.min_rnr_timer = 12;
        attr.ah_attr.dlid = remote.lid;
        attr.ah_attr.sl = 0;
        attr.ah_attr.src_path_bits = 0;
        attr.ah_attr.port_num = m_port;
        if (!gid_is_zero(remote.gid)) {
            attr.ah_attr.is_global = 1;
            std::memcpy(attr.ah_attr.grh.dgid.raw, remote.gid, 16);
            attr.ah_attr.grh.sgid_index = 0;
            attr.ah_attr.grh.hop_limit = 1;
        }
        int rc = ibv_modify_qp(m_qp, &attr,
                               IBV_QP_STATE | IBV_QP_AV | IBV_QP_PATH_MTU | IBV_QP_DEST_QPN |
                               IBV_QP_RQ_PSN | IBV_QP_MAX_DEST_RD_ATOMIC | IBV_QP_MIN_RNR_TIMER);
        if (rc != 0) {
            throw RdmaUnavailable("QP -> RTR failed: " + std::string(strerror(rc)));
        }

        std::memset(&attr, 0, sizeof(attr));
        attr.qp_state = IBV_QPS_RTS;
        attr.timeout = 14;
        attr.retry_cnt = 7;
        attr.rnr_retry = 7;
        attr.sq_psn = m_local.psn;
        attr.max_rd_atomic = 1;
        rc = ibv_modify_qp(m_qp, &attr,
                           IBV_QP_STATE | IBV_QP_TIMEOUT | IBV_QP_RETRY_CNT | IBV_QP_RNR_RETRY |
                           IBV_QP_SQ_PSN | IBV_QP_MAX_QP_RD_ATOMIC);
        if (rc != 0) {
            throw RdmaUnavailable("QP -> RTS failed: " + std::string(strerror(rc)));
        }
        LOG_DEBUG("RDMA: QP " + std::to_string(m_local.qpn) + " connected to remote QP " +
                  std::to_string(remote.qpn));
    }

    RdmaMemoryRegion register_region(void* addr, size_t length, bool remote_write) override {
        int access = remote_write ? (IBV_ACCESS_LOCAL_WRITE | IBV_ACCESS_REMOTE_WRITE) : 0;
        ibv_mr* mr = ibv_reg_mr(m_pd, addr, length, access);
        if (!mr) {
            throw RdmaUnavailable("ibv_reg_mr(" + std::to_string(length) + "): " + strerror(errno));
        }
        m_regions.push_back(mr);

        RdmaMemoryRegion region;
        region.addr = reinterpret_cast<uint64_t>(addr);
        region.length = length;
        region.lkey = mr->lkey;
        region.rkey = mr->rkey;
        return region;
    }

    void write(const RdmaMemoryRegion& local, uint64_t local_offset, size_t length,
               uint64_t remote_addr, uint32_t rkey) override {
        ibv_sge sge;
        std::memset(&sge, 0, sizeof(sge));
        sge.addr = local.addr + local_offset;
        sge.length = static_cast<uint32_t>(length);
        sge.lkey = local.lkey;

        ibv_send_wr wr;
        std::memset(&wr, 0, sizeof(wr));
        wr.wr_id = ++m_wr_id;
        wr.sg_list = &sge;
        wr.num_sge = 1;
        wr.opcode = IBV_WR_RDMA_WRITE;
        wr.send_flags = IBV_SEND_SIGNALED;
        wr.wr.rdma.remote_addr = remote_addr;
        wr.wr.rdma.rkey = rkey;

        ibv_send_wr* bad = nullptr;
        int rc = ibv_post_send(m_qp, &wr, &bad);
        if (rc != 0) {
            throw RdmaUnavailable("ibv_post_send: " + std::string(strerror(rc)));
        }

        const auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(m_timeout_ms);
        ibv_wc wc;
        for (;;) {
            int n = ibv_poll_cq(m_cq, 1, &wc);
            if (n < 0) {
                throw RdmaUnavailable("ibv_poll_cq failed");
            }
            if (n == 1) break;
            if (std::chrono::steady_clock::now() > deadline) {
                throw RdmaUnavailable("RDMA write completion timed out");
            }
            std::this_thread::yield();
        }
        if (wc.status != IBV_WC_SUCCESS) {
            throw RdmaUnavailable(std::string("RDMA write failed: ") + ibv_wc_status_str(wc.status));
        }
    }

private:
    void setup() {
        m_pd = ibv_alloc_pd(m_ctx);
        if (!m_pd) throw RdmaUnavailable("ibv_alloc_pd failed");

        m_cq = ibv_create_cq(m_ctx, 16, nullptr, nullptr, 0);
        if (!m_cq) throw RdmaUnavailable("ibv_create_cq failed");

        ibv_qp_init_attr init;
        std::memset(&init, 0, sizeof(init));
        init.send_cq = m_cq;
        init.recv_cq = m_cq;
        init.qp_type = IBV_QPT_RC;
        init.cap.max_send_wr = 16;
        init.cap.max_recv_wr = 1;
        init.cap.max_send_sge = 1;
        init.cap.max_recv_sge = 1;
        m_qp = ibv_create_qp(m_pd, &init);
        if (!m_qp) throw RdmaUnavailable("ibv_create_qp failed");

        ibv_qp_attr attr;
        std::memset(&attr, 0, sizeof(attr));
        attr.qp_state = IBV_QPS_INIT;
        attr.pkey_index = 0;
        attr.port_num = m_port;
        attr.qp_access_flags = IBV_ACCESS_LOCAL_WRITE | IBV_ACCESS_REMOTE_WRITE;
        int rc = ibv_modify_qp(m_qp, &attr,
                               IBV_QP_STATE | IBV_QP_PKEY_INDEX | IBV_QP_PORT | IBV_QP_ACCESS_FLAGS);
        if (rc != 0) throw RdmaUnavailable("QP -> INIT failed: " + std::string(strerror(rc)));

        ibv_port_attr port_attr;
        if (ibv_query_port(m_ctx, m_port, &port_attr) != 0) {
            throw RdmaUnavailable("ibv_query_port failed");
        }
        m_mtu = port_attr.active_mtu;

        m_local.lid = port_attr.lid;
        m_local.qpn = m_qp->qp_num;
        m_local.psn = random_psn();
        ibv_gid gid;
        if (ibv_query_gid(m_ctx, m_port, 0, &gid) == 0) {
            std::memcpy(m_local.gid, gid.raw, 16);
        }
    }

    void teardown() {
        for (ibv_mr* mr : m_regions) {
            ibv_dereg_mr(mr);
        }
        m_regions.clear();
        if (m_qp) { ibv_destroy_qp(m_qp); m_qp = nullptr; }
        if (m_cq) { ibv_destroy_cq(m_cq); m_cq = nullptr; }
        if (m_pd) { ibv_dealloc_pd(m_pd); m_pd = nullptr; }
        if (m_ctx) { ibv_close_device(m_ctx); m_ctx = nullptr; }
    }

    uint8_t m_port;
    int m_timeout_ms;
    ibv_context* m_ctx = nullptr;
    ibv_pd* m_pd = nullptr;
    ibv_cq* m_cq = nullptr;
    ibv_qp* m_qp = nullptr;
    ibv_mtu m_mtu = IBV_MTU_1024;
    std::vector<ibv_mr*> m_regions;
    wire::RdmaEndpoint m_local;
    uint64_t m_wr_id = 0;
};

} // namespace

VerbsRdmaTransport::VerbsRdmaTransport(int completion_timeout_ms)
    : m_completion_timeout_ms(completion_timeout_ms) {}

RdmaSupport VerbsRdmaTransport::probe() {
    DeviceList devices;
    if (!devices.list || devices.count == 0) {
        LOG_DEBUG("RDMA: no verbs devices");
        return RdmaSupport::UNSUPPORTED;
    }

    bool any_opened = false;
    for (int i = 0; i < devices.count; ++i) {
        const char* name = ibv_get_device_name(devices.list[i]);
        ibv_context* ctx = ibv_open_device(devices.list[i]);
        if (!ctx) continue;
        any_opened = true;

        ibv_device_attr dev_attr;
        if (ibv_query_device(ctx, &dev_attr) == 0) {
            for (uint8_t port = 1; port <= dev_attr.phys_port_cnt; ++port) {
                ibv_port_attr port_attr;
                if (ibv_query_port(ctx, port, &port_attr) == 0 && port_attr.state == IBV_PORT_ACTIVE) {
                    {
                        std::lock_guard<std::mutex> lock(m_mutex);
                        m_device = name;
                        m_port = port;
                    }
                    ibv_close_device(ctx);
                    LOG_INFO("RDMA: " + m_device + " port " + std::to_string(port) + " active");
                    return RdmaSupport::SUPPORTED;
                }
            }
        }
        ibv_close_device(ctx);
    }
    LOG_INFO(std::string("RDMA: ") + std::to_string(devices.count) + " device(s), " +
             (any_opened ? "no active port" : "none could be opened"));
    return RdmaSupport::LIMITED;
}

std::string VerbsRdmaTransport::device_name() const {
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_device;
}

std::unique_ptr<RdmaConnection> VerbsRdmaTransport::open_connection() {
    if (device_name().empty() && probe() != RdmaSupport::SUPPORTED) {
        throw RdmaUnavailable("no active RDMA device");
    }
    std::string device;
    uint8_t port;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        device = m_device;
        port = m_port;
    }
    return std::make_unique<VerbsConnection>(device, port, m_completion_timeout_ms);
}

std::shared_ptr<RdmaTransport> make_default_rdma_transport() {
    return std::make_shared<VerbsRdmaTransport>();
}
