#pragma once

#include <netinet/in.h>
#include <cstdint>
#include <string>

namespace haven {
namespace network {

// An IPv4 address and port, kept in network byte order.
class InetAddress {
public:
    // INADDR_ANY on the given port.
    explicit InetAddress(uint16_t port = 0);
    // An unparsable ip leaves the address as INADDR_NONE.
    InetAddress(const std::string& ip, uint16_t port);
    explicit InetAddress(const struct sockaddr_in& addr) : addr_(addr) {}

    std::string toIp() const;
    uint16_t toPort() const;
    // "a.b.c.d:port"
    std::string toIpPort() const;

    const struct sockaddr* getSockAddr() const { return reinterpret_cast<const struct sockaddr*>(&addr_); }

    // Blocking lookup of the first IPv4 address for host. On failure *err
    // carries the resolver's message. Loop threads go through Resolver.
    static bool Resolve(const std::string& host, uint16_t port, InetAddress* out, std::string* err);

private:
    struct sockaddr_in addr_;
};

} // namespace network
} // namespace haven
