#include "discovery_channel.h"
#include "discovery_record.h"
#include "logger.h"

#include <algorithm>
#include <cerrno>
#include <cstring>

#include <arpa/inet.h>
#include <fcntl.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

namespace {

std::string errno_text(int err) {
    return std::string(std::strerror(err)) + " (errno=" + std::to_string(err) + ")";
}

} // namespace

MulticastChannel::MulticastChannel(std::string group, uint16_t port)
    : m_group(std::move(group)), m_port(port) {}

MulticastChannel::~MulticastChannel() {
    close();
}

void MulticastChannel::open(const std::string& interface_ip) {
    close();

    in_addr group_addr{};
    if (inet_pton(AF_INET, m_group.c_str(), &group_addr) != 1) {
        throw DiscoveryBindError("invalid multicast group " + m_group);
    }
    in_addr iface_addr{};
    iface_addr.s_addr = htonl(INADDR_ANY);
    if (!interface_ip.empty() && inet_pton(AF_INET, interface_ip.c_str(), &iface_addr) != 1) {
        throw DiscoveryBindError("invalid interface address " + interface_ip);
    }

    int sock = socket(AF_INET, SOCK_DGRAM | SOCK_CLOEXEC, 0);
    if (sock < 0) {
        throw DiscoveryBindError("socket: " + errno_text(errno));
    }

    auto fail = [&](const std::string& what) {
        const int err = errno;
        ::close(sock);
        throw DiscoveryBindError(what + ": " + errno_text(err));
    };

    int reuse = 1;
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) < 0) fail("SO_REUSEADDR");
#ifdef SO_REUSEPORT
    if (setsockopt(sock, SOL_SOCKET, SO_REUSEPORT, &reuse, sizeof(reuse)) < 0) fail("SO_REUSEPORT");
#endif

    sockaddr_in bind_addr{};
    bind_addr.sin_family = AF_INET;
    bind_addr.sin_addr.s_addr = htonl(INADDR_ANY);
    bind_addr.sin_port = htons(m_port);
    if (bind(sock, reinterpret_cast<sockaddr*>(&bind_addr), sizeof(bind_addr)) < 0) {
        fail("bind port " + std::to_string(m_port));
    }

    ip_mreq mreq{};
    mreq.imr_multiaddr = group_addr;
    mreq.imr_interface = iface_addr;
    if (setsockopt(sock, IPPROTO_IP, IP_ADD_MEMBERSHIP, &mreq, sizeof(mreq)) < 0) fail("IP_ADD_MEMBERSHIP");
    if (setsockopt(sock, IPPROTO_IP, IP_MULTICAST_IF, &iface_addr, sizeof(iface_addr)) < 0) fail("IP_MULTICAST_IF");

    unsigned char ttl = 1;
    unsigned char loop = 1;
    if (setsockopt(sock, IPPROTO_IP, IP_MULTICAST_TTL, &ttl, sizeof(ttl)) < 0) fail("IP_MULTICAST_TTL");
    if (setsockopt(sock, IPPROTO_IP, IP_MULTICAST_LOOP, &loop, sizeof(loop)) < 0) fail("IP_MULTICAST_LOOP");

    const int flags = fcntl(sock, F_GETFL, 0);
    if (flags < 0 || fcntl(sock, F_SETFL, flags | O_NONBLOCK) < 0) fail("O_NONBLOCK");

    m_sock = sock;
    m_interface_ip = interface_ip;
    LOG_INFO("DISC: Joined " + m_group + ":" + std::to_string(m_port) +
             " on " + (interface_ip.empty() ? std::string("any") : interface_ip));
}

void MulticastChannel::close() {
    if (m_sock >= 0) {
        ::close(m_sock);
        m_sock = -1;
    }
}

bool MulticastChannel::send(const std::string& payload) {
    if (m_sock < 0) return false;

    sockaddr_in dst{};
    dst.sin_family = AF_INET;
    dst.sin_port = htons(m_port);
    inet_pton(AF_INET, m_group.c_str(), &dst.sin_addr);

    const ssize_t sent = sendto(m_sock, payload.data(), payload.size(), 0,
                                reinterpret_cast<const sockaddr*>(&dst), sizeof(dst));
    if (sent < 0) {
        LOG_WARN("DISC: sendto failed: " + errno_text(errno));
        return false;
    }
    return true;
}

std::optional<Datagram> MulticastChannel::receive() {
    if (m_sock < 0) return std::nullopt;

    char buf[DISCOVERY_MAX_DATAGRAM + 1];
    sockaddr_in from{};
    socklen_t from_len = sizeof(from);
    const ssize_t n = recvfrom(m_sock, buf, sizeof(buf), MSG_TRUNC,
                               reinterpret_cast<sockaddr*>(&from), &from_len);
    if (n < 0) {
        if (errno != EAGAIN && errno != EWOULDBLOCK && errno != EINTR) {
            LOG_WARN("DISC: recvfrom failed: " + errno_text(errno));
        }
        return std::nullopt;
    }

    Datagram d;
    d.wire_size = static_cast<size_t>(n);
    d.payload.assign(buf, std::min(static_cast<size_t>(n), sizeof(buf)));
    char ip[INET_ADDRSTRLEN] = {0};
    inet_ntop(AF_INET, &from.sin_addr, ip, sizeof(ip));
    d.sender_ip = ip;
    return d;
}
