#include "haven/network/Socket.h"
#include "haven/common/Logger.h"

#include <netinet/tcp.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace haven {
namespace network {

namespace {

struct sockaddr* AsSockAddr(struct sockaddr_in* addr) {
    return reinterpret_cast<struct sockaddr*>(addr);
}

} // namespace

Socket::~Socket() {
    if (::close(sockfd_) < 0) {
        LOG_SYSERR << "close fd=" << sockfd_;
    }
}

int Socket::CreateNonblocking() {
    int sockfd = ::socket(AF_INET, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, IPPROTO_TCP);
    if (sockfd < 0) {
        LOG_SYSFATAL << "socket";
    }
    return sockfd;
}

int Socket::GetSocketError(int sockfd) {
    int optval = 0;
    socklen_t optlen = sizeof optval;
    if (::getsockopt(sockfd, SOL_SOCKET, SO_ERROR, &optval, &optlen) < 0) {
        return errno;
    }
    return optval;
}

InetAddress Socket::LocalAddress(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getsockname(sockfd, AsSockAddr(&addr), &len) < 0) {
        LOG_SYSERR << "getsockname fd=" << sockfd;
    }
    return InetAddress(addr);
}

InetAddress Socket::PeerAddress(int sockfd) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    if (::getpeername(sockfd, AsSockAddr(&addr), &len) < 0) {
        LOG_SYSERR << "getpeername fd=" << sockfd;
    }
    return InetAddress(addr);
}

bool Socket::IsSelfConnect(int sockfd) {
    const InetAddress local = LocalAddress(sockfd);
    const InetAddress peer = PeerAddress(sockfd);
    return local.toPort() == peer.toPort() && local.toIp() == peer.toIp();
}

void Socket::BindAddress(const InetAddress& localaddr) {
    if (::bind(sockfd_, localaddr.getSockAddr(), sizeof(struct sockaddr_in)) != 0) {
        LOG_SYSFATAL << "bind " << localaddr.toIpPort();
    }
}

void Socket::Listen() {
    if (::listen(sockfd_, SOMAXCONN) != 0) {
        LOG_SYSFATAL << "listen fd=" << sockfd_;
    }
}

int Socket::Accept(InetAddress* peeraddr) {
    struct sockaddr_in addr;
    std::memset(&addr, 0, sizeof addr);
    socklen_t len = sizeof addr;
    int connfd = ::accept4(sockfd_, AsSockAddr(&addr), &len, SOCK_NONBLOCK | SOCK_CLOEXEC);
    if (connfd >= 0) {
        *peeraddr = InetAddress(addr);
    }
    return connfd;
}

void Socket::ShutdownWrite() {
    // ENOTCONN means the peer already reset us; the close path handles that.
    if (::shutdown(sockfd_, SHUT_WR) < 0 && errno != ENOTCONN) {
        LOG_SYSERR << "shutdown fd=" << sockfd_;
    }
}

void Socket::SetOption(int level, int name, bool on, const char* what) {
    int optval = on ? 1 : 0;
    if (::setsockopt(sockfd_, level, name, &optval, static_cast<socklen_t>(sizeof optval)) < 0) {
        LOG_SYSERR << "setsockopt " << what << " fd=" << sockfd_;
    }
}

void Socket::SetTcpNoDelay(bool on) { SetOption(IPPROTO_TCP, TCP_NODELAY, on, "TCP_NODELAY"); }
void Socket::SetReuseAddr(bool on) { SetOption(SOL_SOCKET, SO_REUSEADDR, on, "SO_REUSEADDR"); }
void Socket::SetReusePort(bool on) { SetOption(SOL_SOCKET, SO_REUSEPORT, on, "SO_REUSEPORT"); }
void Socket::SetKeepAlive(bool on) { SetOption(SOL_SOCKET, SO_KEEPALIVE, on, "SO_KEEPALIVE"); }

} // namespace network
} // namespace haven
