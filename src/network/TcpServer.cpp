#include "haven/network/TcpServer.h"
#include "haven/network/Acceptor.h"
#include "haven/network/EventLoop.h"
#include "haven/network/EventLoopThreadPool.h"
#include "haven/network/Socket.h"
#include "haven/network/TcpConnection.h"
#include "haven/network/TlsContext.h"
#include "haven/common/Logger.h"

namespace haven {
namespace network {

TcpServer::TcpServer(EventLoop* loop, const InetAddress& listenAddr, const std::string& name,
                     Option option)
    : loop_(loop),
      name_(name),
      acceptor_(new Acceptor(loop, listenAddr, option == kReusePort)),
      hostport_(acceptor_->LocalAddress().toIpPort()),
      pool_(new EventLoopThreadPool(loop, name)),
      started_(false),
      liveCount_(0),
      acceptedTotal_(0) {
    acceptor_->SetNewConnectionCallback(
        [this](int sockfd, const InetAddress& peer) { OnAccepted(sockfd, peer); });
}

TcpServer::~TcpServer() {
    LOG_DEBUG << "TcpServer [" << name_ << "] stopping with " << live_.size() << " live connections";
    for (auto& entry : live_) {
        TcpConnectionPtr conn = std::move(entry.second);
        conn->getLoop()->RunInLoop([conn]() { conn->ConnectDestroyed(); });
    }
    live_.clear();
}

void TcpServer::SetThreadNum(int numThreads) {
    pool_->SetThreadNum(numThreads);
}

bool TcpServer::EnableTls(const std::string& certPemPath, const std::string& keyPemPath) {
    std::shared_ptr<TlsContext> ctx = std::make_shared<TlsContext>();
    if (!ctx->InitServer(certPemPath, keyPemPath)) {
        return false;
    }
    tls_ = ctx;
    return true;
}

void TcpServer::Start() {
    bool expected = false;
    if (!started_.compare_exchange_strong(expected, true)) return;
    pool_->Start();
    Acceptor* acceptor = acceptor_.get();
    loop_->RunInLoop([acceptor]() { acceptor->Listen(); });
}

void TcpServer::OnAccepted(int sockfd, const InetAddress& peerAddr) {
    loop_->AssertInLoopThread();
    const std::string connName = name_ + "-" + hostport_ + "#" + std::to_string(++acceptedTotal_);
    LOG_DEBUG << "TcpServer [" << name_ << "] accepted " << connName << " from " << peerAddr.toIpPort();

    EventLoop* ioLoop = pool_->GetNextLoop();
    TcpConnectionPtr conn = std::make_shared<TcpConnection>(
        ioLoop, connName, sockfd, Socket::LocalAddress(sockfd), peerAddr, tls_ ? tls_->ctx() : nullptr);
    conn->SetConnectionCallback(connectionCallback_);
    conn->SetMessageCallback(messageCallback_);
    conn->SetWriteCompleteCallback(writeCompleteCallback_);
    conn->SetCloseCallback([this](const TcpConnectionPtr& c) { OnClosed(c); });
    live_[connName] = conn;
    ++liveCount_;

    ioLoop->RunInLoop([conn]() { conn->ConnectEstablished(); });
}

// Runs on the connection's I/O loop, inside its close handling.
void TcpServer::OnClosed(const TcpConnectionPtr& conn) {
    loop_->QueueInLoop([this, conn]() { Forget(conn); });
}

void TcpServer::Forget(const TcpConnectionPtr& conn) {
    loop_->AssertInLoopThread();
    if (live_.erase(conn->name()) > 0) {
        --liveCount_;
    }
    conn->getLoop()->QueueInLoop([conn]() { conn->ConnectDestroyed(); });
}

} // namespace network
} // namespace haven
