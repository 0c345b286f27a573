#include "socket_utils.h"
#include "transfer_errors.h"
#include "logger.h"

#include <arpa/inet.h>
#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netinet/in.h>
#include <netinet/tcp.h>
#include <poll.h>
#include <sys/socket.h>
#include <system_error>
#include <unistd.h>

Socket::~Socket() {
    close();
}

Socket::Socket(Socket&& other) noexcept : m_fd(other.m_fd) {
    other.m_fd = -1;
}

Socket& Socket::operator=(Socket&& other) noexcept {
    if (this != &other) {
        close();
        m_fd = other.m_fd;
        other.m_fd = -1;
    }
    return *this;
}

int Socket::release() {
    int fd = m_fd;
    m_fd = -1;
    return fd;
}

void Socket::close() {
    if (m_fd >= 0) {
        ::close(m_fd);
        m_fd = -1;
    }
}

bool parse_endpoint(const std::string& text, Endpoint& out) {
    const auto colon = text.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 >= text.size()) {
        return false;
    }
    const std::string ip = text.substr(0, colon);
    const std::string port_str = text.substr(colon + 1);

    in_addr addr{};
    if (inet_pton(AF_INET, ip.c_str(), &addr) != 1) {
        return false;
    }
    if (port_str.find_first_not_of("0123456789") != std::string::npos || port_str.size() > 5) {
        return false;
    }
    const unsigned long port = std::stoul(port_str);
    if (port == 0 || port > 65535) {
        return false;
    }
    out.ip = ip;
    out.port = static_cast<uint16_t>(port);
    return true;
}

void set_blocking(int fd, bool blocking) {
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl(F_GETFL)");
    }
    flags = blocking ? (flags & ~O_NONBLOCK) : (flags | O_NONBLOCK);
    if (fcntl(fd, F_SETFL, flags) < 0) {
        throw std::system_error(errno, std::generic_category(), "fcntl(F_SETFL)");
    }
}

void set_io_timeout(int fd, int timeout_ms) {
    timeval tv;
    tv.tv_sec = timeout_ms / 1000;
    tv.tv_usec = (timeout_ms % 1000) * 1000;
    if (setsockopt(fd, SOL_SOCKET, SO_RCVTIMEO, &tv, sizeof(tv)) < 0 ||
        setsockopt(fd, SOL_SOCKET, SO_SNDTIMEO, &tv, sizeof(tv)) < 0) {
        LOG_WARN("FT: Failed to set socket timeouts: " + std::string(strerror(errno)));
    }
}

Socket connect_tcp(const Endpoint& endpoint, int timeout_ms) {
    const std::string target = endpoint.to_string();
    Socket sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) {
        throw TransferConnectError("socket(): " + std::string(strerror(errno)));
    }

    int nodelay_flag = 1;
    if (setsockopt(sock.fd(), IPPROTO_TCP, TCP_NODELAY, &nodelay_flag, sizeof(int)) < 0) {
        LOG_DEBUG("FT: Failed to set TCP_NODELAY: " + std::string(strerror(errno)));
    }

    sockaddr_in dest_addr{};
    dest_addr.sin_family = AF_INET;
    dest_addr.sin_port = htons(endpoint.port);
    if (inet_pton(AF_INET, endpoint.ip.c_str(), &dest_addr.sin_addr) != 1) {
        throw TransferConnectError("invalid address " + endpoint.ip);
    }

    set_blocking(sock.fd(), false);
    int result = ::connect(sock.fd(), reinterpret_cast<sockaddr*>(&dest_addr), sizeof(dest_addr));
    if (result < 0) {
        if (errno != EINPROGRESS) {
            throw TransferConnectError("connect to " + target + ": " + strerror(errno));
        }
        pollfd pfd{sock.fd(), POLLOUT, 0};
        do {
            result = ::poll(&pfd, 1, timeout_ms);
        } while (result < 0 && errno == EINTR);
        if (result <= 0) {
            throw TransferConnectError("connect to " + target + ": " +
                                       (result == 0 ? std::string("timeout") : std::string(strerror(errno))));
        }
        int error = 0;
        socklen_t len = sizeof(error);
        if (getsockopt(sock.fd(), SOL_SOCKET, SO_ERROR, &error, &len) < 0 || error != 0) {
            throw TransferConnectError("connect to " + target + ": " +
                                       (error ? std::string(strerror(error)) : "unknown error"));
        }
    }
    set_blocking(sock.fd(), true);
    return sock;
}

Socket listen_tcp(const std::string& bind_address, uint16_t port, int backlog) {
    Socket sock(::socket(AF_INET, SOCK_STREAM, 0));
    if (!sock.valid()) {
        throw std::system_error(errno, std::generic_category(), "socket");
    }
    int opt = 1;
    setsockopt(sock.fd(), SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    if (inet_pton(AF_INET, bind_address.c_str(), &addr.sin_addr) != 1) {
        throw std::system_error(EINVAL, std::generic_category(), "bad bind address " + bind_address);
    }
    if (::bind(sock.fd(), reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) < 0) {
        throw std::system_error(errno, std::generic_category(),
                                "bind " + bind_address + ":" + std::to_string(port));
    }
    if (::listen(sock.fd(), backlog) < 0) {
        throw std::system_error(errno, std::generic_category(), "listen");
    }
    set_blocking(sock.fd(), false);
    return sock;
}

uint16_t local_port(int fd) {
    sockaddr_in addr{};
    socklen_t len = sizeof(addr);
    if (getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) < 0) {
        return 0;
    }
    return ntohs(addr.sin_port);
}

void send_all(int fd, const void* data, size_t len) {
    const char* p = static_cast<const char*>(data);
    while (len > 0) {
        ssize_t n = ::send(fd, p, len, MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK) {
                throw TransferTimeoutError("send timed out");
            }
            throw TransferIoError("send: " + std::string(strerror(errno)));
        }
        p += n;
        len -= static_cast<size_t>(n);
    }
}

size_t recv_some(int fd, void* data, size_t len) {
    for (;;) {
        ssize_t n = ::recv(fd, data, len, 0);
        if (n >= 0) {
            return static_cast<size_t>(n);
        }
        if (errno == EINTR) continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK) {
            throw TransferTimeoutError("recv timed out");
        }
        throw TransferIoError("recv: " + std::string(strerror(errno)));
    }
}

void recv_all(int fd, void* data, size_t len) {
    char* p = static_cast<char*>(data);
    while (len > 0) {
        size_t n = recv_some(fd, p, len);
        if (n == 0) {
            throw TransferIoError("connection closed by peer");
        }
        p += n;
        len -= n;
    }
}

void send_frame(int fd, wire::FrameType type, const std::string& payload) {
    const std::string frame = wire::encode_frame(type, payload);
    send_all(fd, frame.data(), frame.size());
}

std::string recv_any_frame(int fd, wire::FrameType& type) {
    uint8_t header[wire::kFrameHeaderSize];
    recv_all(fd, header, sizeof(header));
    uint32_t length = 0;
    wire::decode_header(header, type, length);
    std::string payload(length, '\0');
    if (length > 0) {
        recv_all(fd, &payload[0], length);
    }
    return payload;
}

std::string recv_frame(int fd, wire::FrameType expected) {
    wire::FrameType type;
    std::string payload = recv_any_frame(fd, type);
    if (type != expected) {
        throw ProtocolError(std::string("expected ") + wire::frame_type_name(expected) + ", got " +
                            wire::frame_type_name(type));
    }
    return payload;
}
