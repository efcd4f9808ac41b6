#include "haven/network/TcpClient.h"
#include "haven/network/Connector.h"
#include "haven/network/EventLoop.h"
#include "haven/network/Socket.h"
#include "haven/network/TcpConnection.h"
#include "haven/network/TlsContext.h"
#include "haven/common/Logger.h"

#include <unistd.h>

namespace haven {
namespace network {

TcpClient::TcpClient(EventLoop* loop, const InetAddress& serverAddr, const std::string& name)
    : loop_(loop),
      name_(name),
      connector_(std::make_shared<Connector>(loop, serverAddr)),
      tls_(nullptr),
      attempts_(0) {
    connector_->SetNewConnectionCallback([this](int sockfd) { OnConnected(sockfd); });
}

TcpClient::~TcpClient() {
    TcpConnectionPtr conn = connection();
    if (!conn) {
        // Still connecting: a late success must not call back into us.
        connector_->SetNewConnectionCallback([](int sockfd) { ::close(sockfd); });
        connector_->SetConnectFailedCallback(ConnectFailedCallback());
        connector_->Stop();
        return;
    }
    LOG_DEBUG << "TcpClient [" << name_ << "] destroyed with " << conn->name() << " open";
    EventLoop* loop = loop_;
    loop_->RunInLoop([conn, loop]() {
        conn->SetConnectionCallback([](const TcpConnectionPtr&) {});
        conn->SetMessageCallback([](const TcpConnectionPtr&, Buffer* buf, Timestamp) { buf->RetrieveAll(); });
        conn->SetWriteCompleteCallback(WriteCompleteCallback());
        conn->SetCloseCallback([loop](const TcpConnectionPtr& c) {
            loop->QueueInLoop([c]() { c->ConnectDestroyed(); });
        });
        conn->ForceClose();
    });
}

TcpConnectionPtr TcpClient::connection() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connection_;
}

void TcpClient::SetConnectFailedCallback(const ConnectFailedCallback& cb) {
    connector_->SetConnectFailedCallback(cb);
}

void TcpClient::EnableTls(const TlsContext* tls, const std::string& serverName) {
    tls_ = tls;
    tlsServerName_ = serverName;
}

void TcpClient::Connect() {
    LOG_DEBUG << "TcpClient [" << name_ << "] connecting to " << connector_->serverAddress().toIpPort()
              << (tls_ ? " over TLS" : "");
    connector_->Start();
}

void TcpClient::Disconnect() {
    TcpConnectionPtr conn = connection();
    if (conn) {
        conn->Shutdown();
    }
}

void TcpClient::OnConnected(int sockfd) {
    loop_->AssertInLoopThread();
    const InetAddress& peer = connector_->serverAddress();
    const std::string connName = name_ + ":" + peer.toIpPort() + "#" + std::to_string(++attempts_);

    TcpConnectionPtr conn = std::make_shared<TcpConnection>(
        loop_, connName, sockfd, Socket::LocalAddress(sockfd), peer);
    if (tls_ && tls_->ok()) {
        conn->EnableClientTls(tls_->ctx(), tlsServerName_, tls_->verifyPeer());
    }
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { OnClosed(c); });
    {
        std::lock_guard<std::mutex> lock(mutex_);
        connection_ = conn;
    }
    conn->ConnectEstablished();
}

void TcpClient::OnClosed(const TcpConnectionPtr& conn) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (connection_ == conn) connection_.reset();
    }
    loop_->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace haven
