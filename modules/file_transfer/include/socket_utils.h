#ifndef SOCKET_UTILS_H
#define SOCKET_UTILS_H

#include "transfer_wire.h"

#include <cstddef>
#include <cstdint>
#include <string>

// Owns a socket descriptor; closes it on destruction.
class Socket {
public:
    Socket() = default;
    explicit Socket(int fd) : m_fd(fd) {}
    ~Socket();

    Socket(Socket&& other) noexcept;
    Socket& operator=(Socket&& other) noexcept;
    Socket(const Socket&) = delete;
    Socket& operator=(const Socket&) = delete;

    int fd() const { return m_fd; }
    bool valid() const { return m_fd >= 0; }
    int release();
    void close();

private:
    int m_fd = -1;
};

struct Endpoint {
    std::string ip;
    uint16_t port = 0;

    std::string to_string() const { return ip + ":" + std::to_string(port); }
};

// "a.b.c.d:port". False on anything else.
bool parse_endpoint(const std::string& text, Endpoint& out);

// Blocking TCP connect with a timeout; TCP_NODELAY on. Throws TransferConnectError.
Socket connect_tcp(const Endpoint& endpoint, int timeout_ms);

// Bound, listening, non-blocking. Throws std::system_error.
Socket listen_tcp(const std::string& bind_address, uint16_t port, int backlog);

uint16_t local_port(int fd);

// SO_RCVTIMEO / SO_SNDTIMEO on a blocking socket.
void set_io_timeout(int fd, int timeout_ms);
void set_blocking(int fd, bool blocking);

// Throw TransferTimeoutError on timeout and TransferIoError on reset/EOF.
void send_all(int fd, const void* data, size_t len);
void recv_all(int fd, void* data, size_t len);
// Up to len bytes; 0 on orderly EOF.
size_t recv_some(int fd, void* data, size_t len);

void send_frame(int fd, wire::FrameType type, const std::string& payload);
// Reads one frame. Throws ProtocolError if the type is not the expected one.
std::string recv_frame(int fd, wire::FrameType expected);
std::string recv_any_frame(int fd, wire::FrameType& type);

#endif // SOCKET_UTILS_H
