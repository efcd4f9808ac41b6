#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/network/InetAddress.h"

#include <functional>
#include <memory>

namespace haven {
namespace network {

class Channel;
class EventLoop;

// Drives a single non-blocking connect(). The connected fd goes to the
// new-connection callback; any failure, including a self-connect, goes to the
// failed callback. Nothing is retried. Held by shared_ptr because queued
// loop work keeps it alive.
class Connector : public std::enable_shared_from_this<Connector>,
                  haven::common::noncopyable {
public:
    using NewConnectionCallback = std::function<void(int sockfd)>;

    Connector(EventLoop* loop, const InetAddress& serverAddr);
    ~Connector();

    void SetNewConnectionCallback(const NewConnectionCallback& cb) { onConnected_ = cb; }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb) { onFailed_ = cb; }

    // Both may be called from any thread.
    void Start();
    void Stop();

    const InetAddress& serverAddress() const { return serverAddr_; }

private:
    enum Phase { kIdle, kPending, kDone };

    void Attempt();
    void WatchPending(int sockfd);
    void OnWritable();
    void OnError();
    void Abandon();
    // Detaches the pending channel and returns its fd.
    int ReleasePending();
    void Fail(int sockfd, int err);

    EventLoop* loop_;
    const InetAddress serverAddr_;
    bool wanted_;
    Phase phase_;
    std::unique_ptr<Channel> pending_;
    NewConnectionCallback onConnected_;
    ConnectFailedCallback onFailed_;
};

} // namespace network
} // namespace haven
