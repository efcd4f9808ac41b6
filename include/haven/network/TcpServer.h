#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/network/InetAddress.h"

#include <atomic>
#include <cstdint>
#include <memory>
#include <string>
#include <unordered_map>

namespace haven {
namespace network {

class Acceptor;
class EventLoop;
class EventLoopThreadPool;
class TlsContext;

// Listens on one address. Accepting happens on the base loop; every accepted
// socket is handed round-robin to an I/O loop from the pool.
class TcpServer : haven::common::noncopyable {
public:
    enum Option { kNoReusePort, kReusePort };

    TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name,
              Option option = kNoReusePort);
    ~TcpServer();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    // "ip:port" of the listening socket, with the kernel-chosen port if 0 was asked for.
    const std::string& hostport() const { return hostport_; }

    // Number of I/O threads; 0 keeps every connection on the base loop.
    // Must precede Start().
    void SetThreadNum(int numThreads);

    // Loads a certificate and key. Afterwards each connection sniffs its
    // first byte, so TLS and plaintext clients share the port.
    bool EnableTls(const std::string& certPemPath, const std::string& keyPemPath);

    // Safe to call more than once and from any thread.
    void Start();

    // Live connections, readable from any thread.
    size_t ConnectionCount() const { return liveCount_.load(); }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }

private:
    void OnAccepted(int sockfd, const InetAddress& peerAddr);
    void OnClosed(const TcpConnectionPtr& conn);
    void Forget(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string name_;
    std::unique_ptr<Acceptor> acceptor_;
    const std::string hostport_;
    std::unique_ptr<EventLoopThreadPool> pool_;
    std::shared_ptr<TlsContext> tls_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    std::atomic<bool> started_;
    std::atomic<size_t> liveCount_;
    uint64_t acceptedTotal_;
    // Base loop only.
    std::unordered_map<std::string, TcpConnectionPtr> live_;
};

} // namespace network
} // namespace haven
