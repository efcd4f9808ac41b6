#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Channel.h"
#include "haven/network/Socket.h"

#include <functional>

namespace haven {
namespace network {

class EventLoop;
class InetAddress;

// Listening socket on the base loop. Each accepted fd is handed to the
// callback, which takes ownership of it.
class Acceptor : haven::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd, const InetAddress& peer)>;

    Acceptor(EventLoop* loop, const InetAddress& listenAddr, bool reuseport);
    ~Acceptor();

    void SetNewConnectionCallback(NewConnectionCallback cb) { newConnectionCallback_ = std::move(cb); }

    void Listen();

    // Bound address; resolves an ephemeral port chosen by the kernel.
    InetAddress LocalAddress() const { return Socket::LocalAddress(socket_.fd()); }

private:
    // Accepts at most this many connections per readiness event.
    static const int kMaxAcceptsPerEvent = 16;

    void HandleRead();
    void ShedOneConnection();

    EventLoop* loop_;
    Socket socket_;
    Channel channel_;
    NewConnectionCallback newConnectionCallback_;
    // Held open so one descriptor can be freed when the process runs out.
    int reserveFd_;
};

} // namespace network
} // namespace haven
