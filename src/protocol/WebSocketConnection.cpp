#include "haven/protocol/WebSocketConnection.h"
#include "haven/network/EventLoop.h"
#include "haven/network/TcpConnection.h"
#include "haven/common/Logger.h"

namespace haven {
namespace protocol {

using haven::network::Buffer;
using haven::network::TcpConnectionPtr;

WebSocketConnection::WebSocketConnection(const TcpConnectionPtr& conn, Role role)
    : conn_(conn),
      role_(role),
      state_(kOpen),
      started_(false),
      closeNotified_(false),
      disconnected_(false),
      closeTimeoutMs_(kDefaultCloseTimeoutMs),
      fragmented_(false),
      fragmentOpcode_(ws::kText) {
}

WebSocketConnection::~WebSocketConnection() {
    LOG_DEBUG << "WebSocketConnection::dtor[" << conn_->name() << "] state=" << state_;
}

const std::string& WebSocketConnection::name() const {
    return conn_->name();
}

void WebSocketConnection::Start() {
    conn_->getLoop()->AssertInLoopThread();
    if (started_) return;
    started_ = true;

    std::weak_ptr<WebSocketConnection> weakSelf(shared_from_this());
    conn_->SetConnectionCallback([weakSelf](const TcpConnectionPtr& c) {
        if (auto self = weakSelf.lock()) self->onTcpConnection(c);
    });
    conn_->SetMessageCallback([weakSelf](const TcpConnectionPtr& c, Buffer* buf, haven::network::Timestamp) {
        if (auto self = weakSelf.lock()) {
            self->onTcpMessage(c, buf);
        } else {
            buf->RetrieveAll();
        }
    });

    if (!conn_->connected()) {
        handleDisconnect();
        return;
    }
    if (conn_->inputBuffer()->ReadableBytes() > 0) {
        onTcpMessage(conn_, conn_->inputBuffer());
    }
}

bool WebSocketConnection::Send(ws::Opcode opcode, const std::string& payload) {
    if (state_ != kOpen || !conn_->connected()) return false;
    if (opcode != ws::kText && opcode != ws::kBinary) return false;
    sendFrame(opcode, payload);
    return true;
}

void WebSocketConnection::sendFrame(uint8_t opcode, const std::string& payload) {
    Buffer out;
    if (!ws::EncodeFrame(&out, opcode, payload.data(), payload.size(), true, role_ == kClientRole)) {
        failConnection(ws::kInternalError, "cannot mask frame");
        return;
    }
    conn_->Send(out.Peek(), out.ReadableBytes());
}

void WebSocketConnection::Close(uint16_t code, const std::string& reason) {
    if (state_ != kOpen) return;
    state_ = kClosing;
    closeNotified_ = true;
    if (!ws::IsSendableCloseCode(code)) code = 0;
    sendFrame(ws::kClose, ws::EncodeClosePayload(code, reason));
    LOG_DEBUG << "WebSocket[" << name() << "] closing with " << code;
    armCloseTimer();
}

void WebSocketConnection::Abort() {
    if (state_ == kClosed) return;
    conn_->ForceClose();
}

void WebSocketConnection::onTcpConnection(const TcpConnectionPtr& conn) {
    if (!conn->connected()) {
        handleDisconnect();
    }
}

void WebSocketConnection::onTcpMessage(const TcpConnectionPtr& conn, Buffer* buf) {
    // Keep ourselves alive while callbacks run; the owner may let go of us.
    WebSocketConnectionPtr guard(shared_from_this());
    while (state_ != kClosed && conn->connected()) {
        ws::Frame frame;
        std::string err;
        const ws::DecodeResult r = ws::DecodeFrame(buf, &frame, &err);
        if (r == ws::kIncomplete) return;
        if (r == ws::kBadFrame) {
            failConnection(ws::kProtocolError, err);
            break;
        }
        if (r == ws::kFrameTooBig) {
            failConnection(ws::kMessageTooBig, err);
            break;
        }
        if (!handleFrame(frame)) break;
    }
    // Nothing after a Close frame or a protocol error is read.
    buf->RetrieveAll();
}

bool WebSocketConnection::handleFrame(ws::Frame& frame) {
    const bool expectMasked = role_ == kServerRole;
    if (frame.masked != expectMasked) {
        failConnection(ws::kProtocolError, expectMasked ? "unmasked client frame" : "masked server frame");
        return false;
    }

    switch (frame.opcode) {
        case ws::kText:
        case ws::kBinary:
            if (fragmented_) {
                failConnection(ws::kProtocolError, "new message inside a fragmented one");
                return false;
            }
            if (!frame.fin) {
                fragmented_ = true;
                fragmentOpcode_ = frame.opcode;
                fragmentBuf_.swap(frame.payload);
                return true;
            }
            if (state_ == kOpen && messageCallback_) {
                messageCallback_(shared_from_this(), static_cast<ws::Opcode>(frame.opcode), frame.payload);
            }
            return true;

        case ws::kContinuation:
            if (!fragmented_) {
                failConnection(ws::kProtocolError, "continuation without a message");
                return false;
            }
            if (fragmentBuf_.size() + frame.payload.size() > ws::kMaxMessageBytes) {
                failConnection(ws::kMessageTooBig, "message too big");
                return false;
            }
            fragmentBuf_.append(frame.payload);
            if (frame.fin) {
                std::string message;
                message.swap(fragmentBuf_);
                fragmented_ = false;
                if (state_ == kOpen && messageCallback_) {
                    messageCallback_(shared_from_this(), static_cast<ws::Opcode>(fragmentOpcode_), message);
                }
            }
            return true;

        case ws::kPing:
            if (state_ == kOpen) {
                sendFrame(ws::kPong, frame.payload);
            }
            return true;

        case ws::kPong:
            return true;

        case ws::kClose:
            return handleClose(frame.payload);

        default:
            failConnection(ws::kProtocolError, "unexpected opcode");
            return false;
    }
}

bool WebSocketConnection::handleClose(const std::string& payload) {
    uint16_t code = ws::kNoStatusReceived;
    std::string reason;
    if (!ws::DecodeClosePayload(payload, &code, &reason)) {
        failConnection(ws::kProtocolError, "malformed close frame");
        return false;
    }

    if (state_ == kOpen) {
        // Peer started the closing handshake: echo its status back.
        state_ = kClosing;
        sendFrame(ws::kClose, ws::EncodeClosePayload(code, std::string()));
        conn_->Shutdown();
        armCloseTimer();
        notifyClose(code, reason);
    } else if (state_ == kClosing) {
        // Reply to our own Close.
        conn_->Shutdown();
    }
    return false;
}

void WebSocketConnection::failConnection(uint16_t code, const std::string& why) {
    LOG_WARN << "WebSocket[" << name() << "] " << why << ", closing with " << code;
    if (state_ == kOpen) {
        state_ = kClosing;
        sendFrame(ws::kClose, ws::EncodeClosePayload(code, why));
    }
    conn_->Shutdown();
    armCloseTimer();
    notifyClose(code, why);
}

void WebSocketConnection::notifyClose(uint16_t code, const std::string& reason) {
    if (closeNotified_) return;
    closeNotified_ = true;
    if (closeCallback_) {
        closeCallback_(shared_from_this(), code, reason);
    }
}

void WebSocketConnection::armCloseTimer() {
    if (closeTimer_ || disconnected_ || closeTimeoutMs_ <= 0) return;
    std::weak_ptr<WebSocketConnection> weakSelf(shared_from_this());
    closeTimer_ = haven::network::OneShotTimer::Start(conn_->getLoop(), closeTimeoutMs_, [weakSelf]() {
        auto self = weakSelf.lock();
        if (!self || self->disconnected_) return;
        LOG_WARN << "WebSocket[" << self->name() << "] peer did not finish closing within "
                 << self->closeTimeoutMs_ << " ms, dropping it";
        self->conn_->ForceClose();
    });
    if (!closeTimer_) {
        // No timer, no grace period.
        conn_->ForceClose();
    }
}

void WebSocketConnection::handleDisconnect() {
    if (disconnected_) return;
    disconnected_ = true;
    WebSocketConnectionPtr guard(shared_from_this());
    state_ = kClosed;
    if (closeTimer_) {
        closeTimer_->Cancel();
        // Its channel may still be in this poll round's ready list.
        haven::network::OneShotTimerPtr timer;
        timer.swap(closeTimer_);
        conn_->getLoop()->QueueInLoop([timer]() {});
    }
    notifyClose(ws::kAbnormalClosure, conn_->errorMessage());
    if (disconnectCallback_) {
        disconnectCallback_(guard);
    }
}

} // namespace protocol
} // namespace haven
