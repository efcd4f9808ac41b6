#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/InetAddress.h"

namespace haven {
namespace network {

// RAII holder of a TCP socket descriptor. Option setters log failures and
// carry on; none of them is essential to correctness.
class Socket : haven::common::noncopyable {
public:
    explicit Socket(int sockfd) : sockfd_(sockfd) {}
    ~Socket();

    int fd() const { return sockfd_; }

    // Failing to bind or listen leaves the process unable to serve, so both are fatal.
    void BindAddress(const InetAddress& localaddr);
    void Listen();
    // Non-blocking, close-on-exec connection fd, or -1 with errno set.
    int Accept(InetAddress* peeraddr);

    void ShutdownWrite();

    void SetTcpNoDelay(bool on);
    void SetReuseAddr(bool on);
    void SetReusePort(bool on);
    void SetKeepAlive(bool on);

    static int CreateNonblocking();
    // Pending SO_ERROR of fd, or errno when getsockopt itself fails.
    static int GetSocketError(int sockfd);
    static InetAddress LocalAddress(int sockfd);
    static InetAddress PeerAddress(int sockfd);
    // A connect to a closed local port can land on its own ephemeral port.
    static bool IsSelfConnect(int sockfd);

private:
    void SetOption(int level, int name, bool on, const char* what);

    const int sockfd_;
};

} // namespace network
} // namespace haven
