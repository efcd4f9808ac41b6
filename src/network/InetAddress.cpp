#include "haven/network/InetAddress.h"

#include <arpa/inet.h>
#include <netdb.h>
#include <sys/socket.h>
#include <cstring>

namespace haven {
namespace network {

namespace {

struct sockaddr_in MakeAddr(in_addr_t hostOrderIp, uint16_t port) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(hostOrderIp);
    addr.sin_port = htons(port);
    return addr;
}

} // namespace

InetAddress::InetAddress(uint16_t port) : addr_(MakeAddr(INADDR_ANY, port)) {}

InetAddress::InetAddress(const std::string& ip, uint16_t port) : addr_(MakeAddr(INADDR_NONE, port)) {
    struct in_addr parsed;
    if (::inet_pton(AF_INET, ip.c_str(), &parsed) == 1) {
        addr_.sin_addr = parsed;
    }
}

std::string InetAddress::toIp() const {
    char text[INET_ADDRSTRLEN] = "";
    ::inet_ntop(AF_INET, &addr_.sin_addr, text, sizeof text);
    return text;
}

uint16_t InetAddress::toPort() const {
    return ntohs(addr_.sin_port);
}

std::string InetAddress::toIpPort() const {
    return toIp() + ":" + std::to_string(toPort());
}

bool InetAddress::Resolve(const std::string& host, uint16_t port, InetAddress* out, std::string* err) {
    if (host.empty()) {
        if (err) *err = "empty host name";
        return false;
    }
    struct addrinfo hints;
    std::memset(&hints, 0, sizeof hints);
    hints.ai_family = AF_INET;
    hints.ai_socktype = SOCK_STREAM;

    struct addrinfo* found = nullptr;
    const int rc = ::getaddrinfo(host.c_str(), nullptr, &hints, &found);
    if (rc != 0 || !found) {
        if (err) {
            *err = "failed to resolve " + host + ": " + ::gai_strerror(rc);
#ifdef EAI_ADDRFAMILY
            if (rc == EAI_ADDRFAMILY) *err += " (only IPv4 targets are supported)";
#endif
#ifdef EAI_NODATA
            if (rc == EAI_NODATA) *err += " (only IPv4 targets are supported)";
#endif
        }
        if (found) ::freeaddrinfo(found);
        return false;
    }
    struct sockaddr_in addr;
    std::memcpy(&addr, found->ai_addr, sizeof addr);
    ::freeaddrinfo(found);
    addr.sin_port = htons(port);
    *out = InetAddress(addr);
    return true;
}

} // namespace network
} // namespace haven
