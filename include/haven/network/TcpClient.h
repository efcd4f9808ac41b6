#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/network/InetAddress.h"

#include <memory>
#include <mutex>
#include <string>

namespace haven {
namespace network {

class Connector;
class EventLoop;
class TlsContext;

// Owns at most one outbound connection to a fixed address. Connect() makes a
// single attempt; failure is reported once and never retried.
class TcpClient : haven::common::noncopyable {
public:
    TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& name);
    // Safe while connecting or connected: pending callbacks are detached
    // before the connection is closed.
    ~TcpClient();

    void Connect();
    // Half-closes the live connection after its output drains.
    void Disconnect();

    // The connection is wrapped in TLS using tls, which must outlive this
    // client. serverName feeds SNI and host verification.
    void EnableTls(const TlsContext* tls, const std::string& serverName);

    const std::string& name() const { return name_; }
    TcpConnectionPtr connection() const;

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetConnectFailedCallback(const ConnectFailedCallback& cb);

private:
    void OnConnected(int sockfd);
    void OnClosed(const TcpConnectionPtr& conn);

    EventLoop* loop_;
    const std::string name_;
    std::shared_ptr<Connector> connector_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;

    const TlsContext* tls_;
    std::string tlsServerName_;
    int attempts_;

    mutable std::mutex mutex_;
    TcpConnectionPtr connection_;
};

} // namespace network
} // namespace haven
