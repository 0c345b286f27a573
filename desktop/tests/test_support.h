#ifndef NODELINK_TEST_SUPPORT_H
#define NODELINK_TEST_SUPPORT_H

// Helpers shared by the desktop tests: temp files, a loopback discovery
// channel and a TCP proxy that injects faults into the first connection.

#include "discovery_channel.h"
#include "interface_classifier.h"

#include <algorithm>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <random>
#include <set>
#include <string>
#include <thread>
#include <vector>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

namespace test_support {

// ============================================================================
// FILES
// ============================================================================

inline std::filesystem::path make_workdir(const std::string& name) {
    const auto dir = std::filesystem::temp_directory_path() /
                     ("nodelink_" + name + "_" + std::to_string(::getpid()));
    std::error_code ec;
    std::filesystem::remove_all(dir, ec);
    std::filesystem::create_directories(dir, ec);
    return dir;
}

inline bool write_random_file(const std::filesystem::path& p, size_t bytes, uint32_t seed) {
    std::ofstream out(p, std::ios::binary);
    if (!out.is_open()) return false;

    std::mt19937 rng(seed);
    std::uniform_int_distribution<int> dist(0, 255);

    std::vector<uint8_t> buf(64 * 1024);
    size_t remaining = bytes;
    while (remaining > 0) {
        const size_t chunk = std::min(remaining, buf.size());
        for (size_t i = 0; i < chunk; i++) {
            buf[i] = static_cast<uint8_t>(dist(rng));
        }
        out.write(reinterpret_cast<const char*>(buf.data()), static_cast<std::streamsize>(chunk));
        remaining -= chunk;
    }
    out.flush();
    return static_cast<bool>(out);
}

inline std::vector<uint8_t> read_all_bytes(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    if (!in.is_open()) return {};
    in.seekg(0, std::ios::end);
    const auto n = static_cast<size_t>(in.tellg());
    in.seekg(0, std::ios::beg);
    std::vector<uint8_t> data(n);
    if (n > 0) in.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(n));
    return data;
}

inline bool wait_until(const std::function<bool()>& pred, std::chrono::milliseconds timeout) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) return true;
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    return pred();
}

// ============================================================================
// LOOPBACK DISCOVERY
// ============================================================================

// Every channel opened on the same mesh sees every datagram sent on it,
// including its own, like multicast with IP_MULTICAST_LOOP.
struct LoopbackMesh {
    std::mutex mu;
    std::set<uint16_t> ports;
};

class LoopbackChannel : public DiscoveryChannel {
public:
    explicit LoopbackChannel(std::shared_ptr<LoopbackMesh> mesh) : m_mesh(std::move(mesh)) {}
    ~LoopbackChannel() override { close(); }

    void open(const std::string&) override {
        close();
        m_sock = ::socket(AF_INET, SOCK_DGRAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
        if (m_sock < 0) {
            throw DiscoveryBindError(std::string("socket: ") + strerror(errno));
        }
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = 0;
        socklen_t len = sizeof(addr);
        if (::bind(m_sock, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0 ||
            ::getsockname(m_sock, reinterpret_cast<sockaddr*>(&addr), &len) != 0) {
            const int err = errno;
            ::close(m_sock);
            m_sock = -1;
            throw DiscoveryBindError(std::string("bind: ") + strerror(err));
        }
        m_port = ntohs(addr.sin_port);
        std::lock_guard<std::mutex> lock(m_mesh->mu);
        m_mesh->ports.insert(m_port);
    }

    void close() override {
        if (m_sock < 0) return;
        {
            std::lock_guard<std::mutex> lock(m_mesh->mu);
            m_mesh->ports.erase(m_port);
        }
        ::close(m_sock);
        m_sock = -1;
    }

    int fd() const override { return m_sock; }

    bool send(const std::string& payload) override {
        if (m_sock < 0) return false;
        std::set<uint16_t> ports;
        {
            std::lock_guard<std::mutex> lock(m_mesh->mu);
            ports = m_mesh->ports;
        }
        bool ok = true;
        for (uint16_t port : ports) {
            sockaddr_in to{};
            to.sin_family = AF_INET;
            to.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
            to.sin_port = htons(port);
            if (::sendto(m_sock, payload.data(), payload.size(), 0,
                         reinterpret_cast<sockaddr*>(&to), sizeof(to)) < 0) {
                ok = false;
            }
        }
        return ok;
    }

    std::optional<Datagram> receive() override {
        if (m_sock < 0) return std::nullopt;
        char buf[4096];
        sockaddr_in from{};
        socklen_t len = sizeof(from);
        const ssize_t n = ::recvfrom(m_sock, buf, sizeof(buf), MSG_TRUNC,
                                     reinterpret_cast<sockaddr*>(&from), &len);
        if (n < 0) return std::nullopt;
        Datagram d;
        d.wire_size = static_cast<size_t>(n);
        d.payload.assign(buf, std::min(static_cast<size_t>(n), sizeof(buf)));
        char ip[INET_ADDRSTRLEN] = {};
        ::inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));
        d.sender_ip = ip;
        return d;
    }

private:
    std::shared_ptr<LoopbackMesh> m_mesh;
    int m_sock = -1;
    uint16_t m_port = 0;
};

inline std::vector<NetworkInterface> loopback_only() {
    InterfaceClassifier classifier;
    return {classifier.describe("lo", {"127.0.0.1"}, "", true)};
}

// ============================================================================
// FAULT PROXY
// ============================================================================

/**
 * Forwards 127.0.0.1:port() to 127.0.0.1:upstream. The first accepted
 * connection is faulty: KILL closes it once `trigger` client bytes went
 * through, CORRUPT flips the byte at offset `trigger`. Later connections
 * pass through untouched.
 */
class FaultProxy {
public:
    enum class Mode { KILL, CORRUPT };

    FaultProxy(uint16_t upstream, Mode mode, uint64_t trigger)
        : m_upstream(upstream), m_mode(mode), m_trigger(trigger) {
        m_listen = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        int one = 1;
        ::setsockopt(m_listen, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        socklen_t len = sizeof(addr);
        if (m_listen >= 0 &&
            ::bind(m_listen, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0 &&
            ::listen(m_listen, 64) == 0 &&
            ::getsockname(m_listen, reinterpret_cast<sockaddr*>(&addr), &len) == 0) {
            m_port = ntohs(addr.sin_port);
            m_acceptor = std::thread(&FaultProxy::accept_loop, this);
        }
    }

    ~FaultProxy() {
        m_stop.store(true);
        if (m_acceptor.joinable()) m_acceptor.join();
        if (m_listen >= 0) ::close(m_listen);
        {
            std::lock_guard<std::mutex> lock(m_mu);
            for (int fd : m_open) ::shutdown(fd, SHUT_RDWR);
        }
        for (auto& t : m_pumps) {
            if (t.joinable()) t.join();
        }
    }

    FaultProxy(const FaultProxy&) = delete;
    FaultProxy& operator=(const FaultProxy&) = delete;

    uint16_t port() const { return m_port; }
    std::string address() const { return "127.0.0.1:" + std::to_string(m_port); }
    bool triggered() const { return m_triggered.load(); }
    void set_upstream(uint16_t port) { m_upstream.store(port); }

private:
    void accept_loop() {
        bool first = true;
        while (!m_stop.load()) {
            pollfd p{m_listen, POLLIN, 0};
            if (::poll(&p, 1, 50) <= 0) continue;
            int client = ::accept4(m_listen, nullptr, nullptr, SOCK_CLOEXEC);
            if (client < 0) continue;
            const bool faulty = first;
            first = false;
            std::lock_guard<std::mutex> lock(m_mu);
            m_open.insert(client);
            m_pumps.emplace_back(&FaultProxy::pump, this, client, faulty);
        }
    }

    void pump(int client, bool faulty) {
        int upstream = ::socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
        sockaddr_in addr{};
        addr.sin_family = AF_INET;
        addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
        addr.sin_port = htons(m_upstream.load());
        if (upstream < 0 || ::connect(upstream, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) != 0) {
            if (upstream >= 0) ::close(upstream);
            finish(client, -1);
            return;
        }
        {
            std::lock_guard<std::mutex> lock(m_mu);
            m_open.insert(upstream);
        }

        uint64_t forwarded = 0;
        std::vector<char> buf(64 * 1024);
        pollfd fds[2] = {{client, POLLIN, 0}, {upstream, POLLIN, 0}};
        while (!m_stop.load()) {
            if (::poll(fds, 2, 50) <= 0) continue;
            if (fds[0].revents) {
                ssize_t n = ::recv(client, buf.data(), buf.size(), 0);
                if (n <= 0) break;
                if (faulty && m_mode == Mode::KILL && forwarded + static_cast<uint64_t>(n) >= m_trigger) {
                    const size_t keep = static_cast<size_t>(m_trigger - forwarded);
                    send_fully(upstream, buf.data(), keep);
                    m_triggered.store(true);
                    break;
                }
                if (faulty && m_mode == Mode::CORRUPT && !m_triggered.load() &&
                    forwarded + static_cast<uint64_t>(n) > m_trigger) {
                    buf[static_cast<size_t>(m_trigger - forwarded)] ^= 0x5a;
                    m_triggered.store(true);
                }
                if (!send_fully(upstream, buf.data(), static_cast<size_t>(n))) break;
                forwarded += static_cast<uint64_t>(n);
            }
            if (fds[1].revents) {
                ssize_t n = ::recv(upstream, buf.data(), buf.size(), 0);
                if (n <= 0) break;
                if (!send_fully(client, buf.data(), static_cast<size_t>(n))) break;
            }
        }
        finish(client, upstream);
    }

    static bool send_fully(int fd, const char* data, size_t len) {
        while (len > 0) {
            ssize_t n = ::send(fd, data, len, MSG_NOSIGNAL);
            if (n < 0) {
                if (errno == EINTR) continue;
                return false;
            }
            data += n;
            len -= static_cast<size_t>(n);
        }
        return true;
    }

    void finish(int client, int upstream) {
        std::lock_guard<std::mutex> lock(m_mu);
        for (int fd : {client, upstream}) {
            if (fd < 0) continue;
            ::shutdown(fd, SHUT_RDWR);
            ::close(fd);
            m_open.erase(fd);
        }
    }

    std::atomic<uint16_t> m_upstream;
    const Mode m_mode;
    const uint64_t m_trigger;
    int m_listen = -1;
    uint16_t m_port = 0;
    std::atomic<bool> m_stop{false};
    std::atomic<bool> m_triggered{false};
    std::thread m_acceptor;

    std::mutex m_mu;
    std::set<int> m_open;
    std::vector<std::thread> m_pumps;
};

} // namespace test_support

#endif // NODELINK_TEST_SUPPORT_H
