#include "haven/network/TcpConnection.h"
#include "haven/network/Channel.h"
#include "haven/network/EventLoop.h"
#include "haven/network/Socket.h"
#include "haven/network/TlsSession.h"
#include "haven/common/Logger.h"

#include <sys/socket.h>
#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace haven {
namespace network {

TcpConnection::TcpConnection(EventLoop* loop,
                             const std::string& nameArg,
                             int sockfd,
                             const InetAddress& localAddr,
                             const InetAddress& peerAddr,
                             ssl_ctx_st* serverTlsCtx)
    : loop_(loop),
      name_(nameArg),
      state_(kConnecting),
      socket_(new Socket(sockfd)),
      channel_(new Channel(loop, sockfd)),
      localAddr_(localAddr),
      peerAddr_(peerAddr),
      highWaterMark_(64 * 1024 * 1024),
      reading_(true),
      tlsCtx_(serverTlsCtx),
      tlsPhase_(serverTlsCtx ? kTlsSniff : kTlsOff),
      tlsWantWrite_(false),
      tlsClient_(false),
      tlsVerifyHost_(false) {
    channel_->SetReadCallback([this](Timestamp receiveTime) { HandleRead(receiveTime); });
    channel_->SetWriteCallback([this]() { HandleWrite(); });
    channel_->SetCloseCallback([this]() { HandleClose(); });
    channel_->SetErrorCallback([this]() { HandleError(); });

    socket_->SetKeepAlive(true);
    socket_->SetTcpNoDelay(true);
    LOG_DEBUG << "TcpConnection [" << name_ << "] fd=" << sockfd << " created";
}

TcpConnection::~TcpConnection() {
    LOG_DEBUG << "TcpConnection [" << name_ << "] fd=" << channel_->fd() << " destroyed in state " << static_cast<int>(state_.load());
}

void TcpConnection::EnableClientTls(ssl_ctx_st* tlsCtx, const std::string& serverName, bool verifyHost) {
    tlsCtx_ = tlsCtx;
    tlsClient_ = true;
    tlsServerName_ = serverName;
    tlsVerifyHost_ = verifyHost;
}

void TcpConnection::ConnectEstablished() {
    loop_->AssertInLoopThread();
    state_ = kConnected;
    channel_->Tie(shared_from_this());
    channel_->EnableReading();

    bool tlsReady = true;
    if (tlsClient_) {
        // Sends made from the connection callback wait for the handshake.
        tlsPhase_ = kTlsHandshake;
        tls_ = TlsSession::Connect(tlsCtx_, channel_->fd(), tlsServerName_, tlsVerifyHost_, &errorMessage_);
        tlsReady = tls_ != nullptr;
    }

    if (connectionCallback_) {
        connectionCallback_(shared_from_this());
    }

    if (!tlsReady || (tls_ && tlsPhase_ == kTlsHandshake && !DriveHandshake())) {
        HandleClose();
    }
}

void TcpConnection::ConnectDestroyed() {
    loop_->AssertInLoopThread();
    if (state_ == kConnected) {
        state_ = kDisconnected;
        channel_->DisableAll();
        if (connectionCallback_) {
            connectionCallback_(shared_from_this());
        }
    }
    channel_->Remove();
}

void TcpConnection::SniffTls() {
    unsigned char first = 0;
    if (::recv(channel_->fd(), &first, 1, MSG_PEEK) <= 0) {
        // Nothing to look at yet, or EOF/error which the read path reports.
        return;
    }
    if (LooksLikeTlsHandshake(first)) {
        std::string err;
        tls_ = TlsSession::Accept(tlsCtx_, channel_->fd(), &err);
        if (tls_) {
            tlsPhase_ = kTlsHandshake;
            tlsWantWrite_ = false;
            return;
        }
        LOG_WARN << "[" << name_ << "] " << err;
    }
    tlsPhase_ = kTlsOff;
    if (outputBuffer_.ReadableBytes() > 0 && !channel_->IsWriting()) {
        channel_->EnableWriting();
    }
}

bool TcpConnection::DriveHandshake() {
    std::string err;
    switch (tls_->Handshake(&err)) {
        case TlsSession::kOk:
            tlsPhase_ = kTlsReady;
            tlsWantWrite_ = false;
            LOG_DEBUG << "[" << name_ << "] TLS established, " << tls_->protocolVersion();
            if (outputBuffer_.ReadableBytes() > 0 && !channel_->IsWriting()) {
                channel_->EnableWriting();
            }
            return true;
        case TlsSession::kWantRead:
            tlsWantWrite_ = false;
            return true;
        case TlsSession::kWantWrite:
            ArmWriteForTls();
            return true;
        case TlsSession::kClosed:
        case TlsSession::kFailed:
            break;
    }
    errorMessage_ = "TLS handshake failed: " + err;
    LOG_WARN << "[" << name_ << "] " << errorMessage_;
    return false;
}

void TcpConnection::ArmWriteForTls() {
    tlsWantWrite_ = true;
    if (!channel_->IsWriting()) {
        channel_->EnableWriting();
    }
}

void TcpConnection::HandleRead(Timestamp receiveTime) {
    if (tlsPhase_ == kTlsSniff) {
        SniffTls();
    }
    if (tlsPhase_ == kTlsHandshake) {
        if (!DriveHandshake()) {
            HandleClose();
            return;
        }
        if (tlsPhase_ != kTlsReady) return;
    }
    if (tlsPhase_ == kTlsReady) {
        ReadTls(receiveTime);
    } else {
        ReadPlain(receiveTime);
    }
}

void TcpConnection::ReadPlain(Timestamp receiveTime) {
    int savedErrno = 0;
    const ssize_t n = inputBuffer_.ReadFd(channel_->fd(), &savedErrno);
    if (n > 0) {
        if (messageCallback_) {
            messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
        }
    } else if (n == 0) {
        HandleClose();
    } else if (savedErrno != EAGAIN && savedErrno != EINTR) {
        errorMessage_ = std::strerror(savedErrno);
        LOG_WARN << "[" << name_ << "] read failed: " << errorMessage_;
        HandleClose();
    }
}

// Decrypted bytes can sit inside OpenSSL with nothing left on the fd, so the
// session is drained until it would block.
void TcpConnection::ReadTls(Timestamp receiveTime) {
    char chunk[16 * 1024];
    size_t total = 0;
    int savedErrno = 0;
    TlsSession::Result result = TlsSession::kOk;
    for (;;) {
        size_t n = 0;
        result = tls_->Read(chunk, sizeof chunk, &n, &savedErrno);
        if (result != TlsSession::kOk) break;
        inputBuffer_.Append(chunk, n);
        total += n;
    }
    if (result == TlsSession::kWantWrite) {
        ArmWriteForTls();
    }
    if (total > 0 && messageCallback_) {
        messageCallback_(shared_from_this(), &inputBuffer_, receiveTime);
    }
    if (result == TlsSession::kClosed) {
        HandleClose();
    } else if (result == TlsSession::kFailed) {
        errorMessage_ = std::string("TLS read failed: ") + std::strerror(savedErrno);
        LOG_WARN << "[" << name_ << "] " << errorMessage_;
        HandleClose();
    }
}

ssize_t TcpConnection::WriteSome(const void* data, size_t len, int* savedErrno) {
    if (tlsPhase_ == kTlsReady) {
        size_t n = 0;
        switch (tls_->Write(data, len, &n, savedErrno)) {
            case TlsSession::kOk:
                return static_cast<ssize_t>(n);
            case TlsSession::kWantRead:
            case TlsSession::kWantWrite:
                return 0;
            case TlsSession::kClosed:
                *savedErrno = EPIPE;
                return -1;
            case TlsSession::kFailed:
                return -1;
        }
        return -1;
    }
    const ssize_t n = ::write(channel_->fd(), data, len);
    if (n >= 0) return n;
    if (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR) return 0;
    *savedErrno = errno;
    return -1;
}

void TcpConnection::NotifyWriteComplete() {
    if (writeCompleteCallback_) {
        loop_->QueueInLoop(std::bind(writeCompleteCallback_, shared_from_this()));
    }
}

void TcpConnection::HandleWrite() {
    if (tlsPhase_ == kTlsHandshake) {
        if (!DriveHandshake()) {
            HandleClose();
            return;
        }
        if (tlsPhase_ != kTlsReady) {
            if (!tlsWantWrite_ && channel_->IsWriting()) channel_->DisableWriting();
            return;
        }
    }
    if (!channel_->IsWriting()) {
        return;
    }
    tlsWantWrite_ = false;
    if (outputBuffer_.ReadableBytes() == 0) {
        channel_->DisableWriting();
        if (state_ == kDisconnecting) ShutdownInLoop();
        return;
    }

    int savedErrno = 0;
    const ssize_t n = WriteSome(outputBuffer_.Peek(), outputBuffer_.ReadableBytes(), &savedErrno);
    if (n > 0) {
        outputBuffer_.Retrieve(static_cast<size_t>(n));
        if (outputBuffer_.ReadableBytes() == 0) {
            channel_->DisableWriting();
            NotifyWriteComplete();
            if (state_ == kDisconnecting) ShutdownInLoop();
        }
    } else if (n < 0) {
        errorMessage_ = std::strerror(savedErrno);
        LOG_WARN << "[" << name_ << "] write failed: " << errorMessage_;
    }
}

void TcpConnection::HandleClose() {
    if (state_ == kDisconnected) return;
    LOG_DEBUG << "[" << name_ << "] closing from state " << static_cast<int>(state_.load());
    state_ = kDisconnected;
    channel_->DisableAll();

    TcpConnectionPtr guard(shared_from_this());
    if (connectionCallback_) {
        connectionCallback_(guard);
    }
    if (closeCallback_) {
        closeCallback_(guard);
    }
}

void TcpConnection::HandleError() {
    const int err = Socket::GetSocketError(channel_->fd());
    if (err != 0) {
        errorMessage_ = std::strerror(err);
        LOG_WARN << "[" << name_ << "] socket error: " << errorMessage_;
    }
}

void TcpConnection::Send(const std::string& message) {
    Send(message.data(), message.size());
}

void TcpConnection::Send(const void* data, size_t len) {
    if (state_ != kConnected) return;
    if (loop_->IsInLoopThread()) {
        SendInLoop(data, len);
        return;
    }
    std::string copy(static_cast<const char*>(data), len);
    loop_->RunInLoop([self = shared_from_this(), copy = std::move(copy)]() {
        self->SendInLoop(copy.data(), copy.size());
    });
}

void TcpConnection::SendInLoop(const void* data, size_t len) {
    if (state_ == kDisconnected) {
        LOG_DEBUG << "[" << name_ << "] dropped " << len << " bytes sent after close";
        return;
    }
    if (tlsPhase_ == kTlsSniff) {
        SniffTls();
    }

    const char* bytes = static_cast<const char*>(data);
    size_t written = 0;
    bool fatal = false;
    // Only write directly when nothing is queued ahead of these bytes.
    if (!TlsBlocksWrites() && !channel_->IsWriting() && outputBuffer_.ReadableBytes() == 0) {
        int savedErrno = 0;
        const ssize_t n = WriteSome(bytes, len, &savedErrno);
        if (n >= 0) {
            written = static_cast<size_t>(n);
            if (written == len) NotifyWriteComplete();
        } else {
            errorMessage_ = std::strerror(savedErrno);
            LOG_WARN << "[" << name_ << "] send failed: " << errorMessage_;
            fatal = savedErrno == EPIPE || savedErrno == ECONNRESET || tlsPhase_ == kTlsReady;
        }
    }

    if (!fatal && written < len) {
        const size_t queued = outputBuffer_.ReadableBytes();
        const size_t after = queued + (len - written);
        if (highWaterMarkCallback_ && queued < highWaterMark_ && after >= highWaterMark_) {
            loop_->QueueInLoop(std::bind(highWaterMarkCallback_, shared_from_this(), after));
        }
        outputBuffer_.Append(bytes + written, len - written);
        if (!TlsBlocksWrites() && !channel_->IsWriting()) {
            channel_->EnableWriting();
        }
    }
}

void TcpConnection::Shutdown() {
    if (state_ != kConnected) return;
    state_ = kDisconnecting;
    loop_->RunInLoop([self = shared_from_this()]() { self->ShutdownInLoop(); });
}

void TcpConnection::ShutdownInLoop() {
    if (channel_->IsWriting() || outputBuffer_.ReadableBytes() > 0) {
        // HandleWrite comes back here once the queue drains.
        return;
    }
    if (tls_) {
        tls_->Shutdown();
    }
    socket_->ShutdownWrite();
}

void TcpConnection::StartRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StartReadInLoop(); });
}

void TcpConnection::StopRead() {
    loop_->RunInLoop([self = shared_from_this()]() { self->StopReadInLoop(); });
}

void TcpConnection::StartReadInLoop() {
    if (reading_ || state_ == kDisconnected) return;
    reading_ = true;
    channel_->EnableReading();
    LOG_DEBUG << "[" << name_ << "] reading resumed";
}

void TcpConnection::StopReadInLoop() {
    if (!reading_ || state_ == kDisconnected) return;
    reading_ = false;
    channel_->DisableReading();
    LOG_DEBUG << "[" << name_ << "] reading paused";
}

void TcpConnection::ForceClose() {
    if (state_ == kDisconnected) return;
    loop_->RunInLoop([self = shared_from_this()]() {
        if (self->state_ != kDisconnected) self->HandleClose();
    });
}

} // namespace network
} // namespace haven
