#include "haven/network/Acceptor.h"
#include "haven/network/EventLoop.h"
#include "haven/network/InetAddress.h"
#include "haven/common/Logger.h"

#include <fcntl.h>
#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>

namespace haven {
namespace network {

namespace {

int OpenReserveFd() {
    return ::open("/dev/null", O_RDONLY | O_CLOEXEC);
}

} // namespace

Acceptor::Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport)
    : loop_(loop),
      socket_(Socket::CreateNonblocking()),
      channel_(loop, socket_.fd()),
      reserveFd_(OpenReserveFd()) {
    socket_.SetReuseAddr(true);
    socket_.SetReusePort(reuseport);
    socket_.BindAddress(listenAddr);
    channel_.SetReadCallback([this](Channel::Timestamp) { HandleRead(); });
}

Acceptor::~Acceptor() {
    channel_.DisableAll();
    channel_.Remove();
    if (reserveFd_ >= 0) ::close(reserveFd_);
}

void Acceptor::Listen() {
    loop_->AssertInLoopThread();
    socket_.Listen();
    channel_.EnableReading();
}

void Acceptor::HandleRead() {
    for (int i = 0; i < kMaxAcceptsPerEvent; ++i) {
        InetAddress peer;
        int connfd = socket_.Accept(&peer);
        if (connfd < 0) {
            const int err = errno;
            if (err == EAGAIN || err == EWOULDBLOCK || err == EINTR) return;
            LOG_SYSERR << "accept on " << LocalAddress().toIpPort();
            if (err == EMFILE || err == ENFILE) ShedOneConnection();
            return;
        }
        if (newConnectionCallback_) {
            newConnectionCallback_(connfd, peer);
        } else {
            ::close(connfd);
        }
    }
}

// Out of descriptors: the pending connection would keep the level-triggered
// listener readable forever. Spend the reserve fd to accept it and close it.
void Acceptor::ShedOneConnection() {
    if (reserveFd_ < 0) return;
    ::close(reserveFd_);
    int fd = ::accept(socket_.fd(), nullptr, nullptr);
    if (fd >= 0) ::close(fd);
    reserveFd_ = OpenReserveFd();
}

} // namespace network
} // namespace haven
