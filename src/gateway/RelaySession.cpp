#include "haven/gateway/RelaySession.h"
#include "haven/gateway/RelayHandler.h"
#include "haven/network/EventLoop.h"
#include "haven/network/TcpConnection.h"
#include "haven/common/Logger.h"

#include <atomic>

namespace haven {
namespace gateway {

using haven::network::TcpConnection;
using haven::network::TcpConnectionPtr;

using protocol::WebSocketClient;
using protocol::WebSocketConnection;
using protocol::WebSocketConnectionPtr;
namespace ws = protocol::ws;

namespace {

std::atomic<int> g_liveSessions{0};

} // namespace

RelaySession::RelaySession(const haven::network::TcpConnectionPtr& clientConn,
                           const std::string& target,
                           const std::string& subprotocol,
                           const haven::network::TlsContext* tls,
                           haven::network::Resolver* resolver,
                           size_t highWaterMark)
    : loop_(clientConn->getLoop()),
      state_(kConnecting),
      target_(target),
      subprotocol_(subprotocol),
      tls_(tls),
      resolver_(resolver),
      highWaterMark_(highWaterMark),
      closeTimeoutMs_(WebSocketConnection::kDefaultCloseTimeoutMs),
      client_(std::make_shared<WebSocketConnection>(clientConn, WebSocketConnection::kServerRole)),
      pendingBytes_(0),
      clientGone_(false),
      upstreamGone_(false) {
    ++g_liveSessions;
}

RelaySession::~RelaySession() {
    --g_liveSessions;
    LOG_DEBUG << "RelaySession::dtor " << target_;
}

int RelaySession::LiveCount() {
    return g_liveSessions.load();
}

void RelaySession::Start() {
    loop_->AssertInLoopThread();
    self_ = shared_from_this();
    std::weak_ptr<RelaySession> weakSelf(self_);
    client_->setCloseTimeout(closeTimeoutMs_);

    client_->setMessageCallback([weakSelf](const WebSocketConnectionPtr&, ws::Opcode op, const std::string& payload) {
        if (auto self = weakSelf.lock()) self->onClientMessage(op, payload);
    });
    client_->setCloseCallback([weakSelf](const WebSocketConnectionPtr&, uint16_t code, const std::string& reason) {
        if (auto self = weakSelf.lock()) self->onClientClose(code, reason);
    });
    client_->setDisconnectCallback([weakSelf](const WebSocketConnectionPtr&) {
        if (auto self = weakSelf.lock()) self->onClientDisconnect();
    });

    protocol::Url url;
    std::string err;
    if (!RelayHandler::ParseTarget(target_, &url, &err)) {
        client_->Start();
        onUpstreamError(err);
        return;
    }

    connector_ = std::make_shared<WebSocketClient>(loop_, url, subprotocol_, tls_, resolver_);
    connector_->setOpenCallback([weakSelf](const WebSocketConnectionPtr& upstream) {
        if (auto self = weakSelf.lock()) self->onUpstreamOpen(upstream);
    });
    connector_->setErrorCallback([weakSelf](const std::string& message) {
        if (auto self = weakSelf.lock()) self->onUpstreamError(message);
    });
    connector_->Connect();
    client_->Start();
}

void RelaySession::onUpstreamOpen(const WebSocketConnectionPtr& upstream) {
    if (state_ != kConnecting) {
        upstream->Close(ws::kGoingAway, std::string());
        return;
    }
    upstream_ = upstream;
    upstream_->setCloseTimeout(closeTimeoutMs_);
    std::weak_ptr<RelaySession> weakSelf(shared_from_this());
    upstream_->setMessageCallback([weakSelf](const WebSocketConnectionPtr&, ws::Opcode op, const std::string& payload) {
        if (auto self = weakSelf.lock()) self->onUpstreamMessage(op, payload);
    });
    upstream_->setCloseCallback([weakSelf](const WebSocketConnectionPtr&, uint16_t code, const std::string& reason) {
        if (auto self = weakSelf.lock()) self->onUpstreamClose(code, reason);
    });
    upstream_->setDisconnectCallback([weakSelf](const WebSocketConnectionPtr&) {
        if (auto self = weakSelf.lock()) self->onUpstreamDisconnect();
    });

    state_ = kOpen;
    LOG_DEBUG << "Relay open " << client_->name() << " <-> " << target_;
    std::vector<std::pair<ws::Opcode, std::string>> queued;
    queued.swap(pending_);
    pendingBytes_ = 0;
    for (const auto& msg : queued) {
        upstream_->Send(msg.first, msg.second);
    }
    linkFlowControl();
    client_->connection()->StartRead();
}

// Each connection's backlog throttles the reader feeding it.
void RelaySession::linkFlowControl() {
    const TcpConnectionPtr& clientConn = client_->connection();
    const TcpConnectionPtr& upstreamConn = upstream_->connection();
    std::weak_ptr<TcpConnection> weakClient(clientConn);
    std::weak_ptr<TcpConnection> weakUpstream(upstreamConn);

    clientConn->SetHighWaterMarkCallback([weakUpstream](const TcpConnectionPtr&, size_t) {
        if (auto upstream = weakUpstream.lock()) upstream->StopRead();
    }, highWaterMark_);
    clientConn->SetWriteCompleteCallback([weakUpstream](const TcpConnectionPtr&) {
        if (auto upstream = weakUpstream.lock()) upstream->StartRead();
    });
    upstreamConn->SetHighWaterMarkCallback([weakClient](const TcpConnectionPtr&, size_t) {
        if (auto client = weakClient.lock()) client->StopRead();
    }, highWaterMark_);
    upstreamConn->SetWriteCompleteCallback([weakClient](const TcpConnectionPtr&) {
        if (auto client = weakClient.lock()) client->StartRead();
    });
}

// The closing handshake needs both sides readable again.
void RelaySession::unlinkFlowControl() {
    const TcpConnectionPtr conns[] = {client_->connection(),
                                      upstream_ ? upstream_->connection() : TcpConnectionPtr()};
    for (const TcpConnectionPtr& conn : conns) {
        if (!conn) continue;
        conn->SetHighWaterMarkCallback(haven::network::HighWaterMarkCallback(), 0);
        conn->SetWriteCompleteCallback(haven::network::WriteCompleteCallback());
        conn->StartRead();
    }
}

void RelaySession::onUpstreamError(const std::string& message) {
    if (state_ != kConnecting) return;
    LOG_WARN << "Relay to " << target_ << " failed: " << message;
    state_ = kClosing;
    upstreamGone_ = true;
    pending_.clear();
    unlinkFlowControl();
    client_->Close(ws::kInternalError, message);
    maybeFinish();
}

void RelaySession::onClientMessage(ws::Opcode opcode, const std::string& payload) {
    if (state_ == kConnecting) {
        pending_.emplace_back(opcode, payload);
        pendingBytes_ += payload.size();
        if (pendingBytes_ >= highWaterMark_) {
            // Resumed once the upstream opens.
            client_->connection()->StopRead();
        }
    } else if (state_ == kOpen) {
        upstream_->Send(opcode, payload);
    }
}

void RelaySession::onUpstreamMessage(ws::Opcode opcode, const std::string& payload) {
    if (state_ == kOpen) {
        client_->Send(opcode, payload);
    }
}

void RelaySession::onClientClose(uint16_t code, const std::string& reason) {
    if (state_ == kConnecting) {
        state_ = kClosing;
        pending_.clear();
        if (connector_) connector_->Cancel();
        upstreamGone_ = true;
        unlinkFlowControl();
        maybeFinish();
        return;
    }
    if (state_ != kOpen) return;
    state_ = kClosing;
    unlinkFlowControl();
    // Codes such as 1005 and 1006 cannot go on the wire; Close() drops them.
    upstream_->Close(code, reason);
}

void RelaySession::onUpstreamClose(uint16_t code, const std::string& reason) {
    if (state_ != kOpen) return;
    state_ = kClosing;
    unlinkFlowControl();
    client_->Close(code, reason);
}

void RelaySession::onClientDisconnect() {
    clientGone_ = true;
    unlinkFlowControl();
    maybeFinish();
}

void RelaySession::onUpstreamDisconnect() {
    upstreamGone_ = true;
    unlinkFlowControl();
    maybeFinish();
}

void RelaySession::maybeFinish() {
    if (!clientGone_ || !upstreamGone_ || state_ == kClosed) return;
    state_ = kClosed;
    LOG_DEBUG << "Relay closed " << client_->name() << " <-> " << target_;

    // Callbacks of the members may still be on the stack.
    std::shared_ptr<RelaySession> self;
    self.swap(self_);
    loop_->QueueInLoop([self]() {});
}

} // namespace gateway
} // namespace haven
