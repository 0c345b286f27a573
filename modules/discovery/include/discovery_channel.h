#ifndef DISCOVERY_CHANNEL_H
#define DISCOVERY_CHANNEL_H

#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>

// Raised when the discovery socket cannot be created, bound or joined to the group.
class DiscoveryBindError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Datagram {
    std::string payload;
    size_t wire_size = 0;      // actual datagram size, may exceed payload when truncated
    std::string sender_ip;
};

/**
 * Datagram transport used by NodeDiscoveryService.
 * The service registers fd() with its reactor and calls receive() until it
 * returns nullopt.
 */
class DiscoveryChannel {
public:
    virtual ~DiscoveryChannel() = default;

    // Throws DiscoveryBindError. Safe to call again to rebind to another interface.
    virtual void open(const std::string& interface_ip) = 0;
    virtual void close() = 0;
    virtual int fd() const = 0;

    virtual bool send(const std::string& payload) = 0;
    virtual std::optional<Datagram> receive() = 0;
};

// UDP multicast: TTL 1, loopback on, bound to the group port.
class MulticastChannel : public DiscoveryChannel {
public:
    MulticastChannel(std::string group, uint16_t port);
    ~MulticastChannel() override;

    MulticastChannel(const MulticastChannel&) = delete;
    MulticastChannel& operator=(const MulticastChannel&) = delete;

    void open(const std::string& interface_ip) override;
    void close() override;
    int fd() const override { return m_sock; }

    bool send(const std::string& payload) override;
    std::optional<Datagram> receive() override;

private:
    std::string m_group;
    uint16_t m_port;
    std::string m_interface_ip;
    int m_sock = -1;
};

#endif // DISCOVERY_CHANNEL_H
