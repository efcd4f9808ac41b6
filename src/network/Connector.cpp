#include "haven/network/Connector.h"
#include "haven/network/Channel.h"
#include "haven/network/EventLoop.h"
#include "haven/network/Socket.h"
#include "haven/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace haven {
namespace network {

Connector::Connector(EventLoop* loop, const InetAddress& serverAddr)
    : loop_(loop), serverAddr_(serverAddr), wanted_(false), phase_(kIdle) {}

Connector::~Connector() {
    if (pending_) {
        LOG_WARN << "Connector to " << serverAddr_.toIpPort() << " destroyed mid-connect";
    }
}

void Connector::Start() {
    wanted_ = true;
    std::shared_ptr<Connector> self = shared_from_this();
    loop_->RunInLoop([self]() {
        if (self->wanted_) self->Attempt();
    });
}

void Connector::Stop() {
    wanted_ = false;
    std::shared_ptr<Connector> self = shared_from_this();
    loop_->QueueInLoop([self]() { self->Abandon(); });
}

void Connector::Abandon() {
    if (phase_ != kPending) return;
    phase_ = kIdle;
    ::close(ReleasePending());
}

void Connector::Attempt() {
    const int sockfd = Socket::CreateNonblocking();
    const int rc = ::connect(sockfd, serverAddr_.getSockAddr(), sizeof(struct sockaddr_in));
    const int err = rc == 0 ? 0 : errno;
    switch (err) {
        case 0:
        case EINPROGRESS:
        case EINTR:
        case EISCONN:
            // Writability reports the outcome, even for an immediate success.
            WatchPending(sockfd);
            break;
        default:
            Fail(sockfd, err);
            break;
    }
}

void Connector::WatchPending(int sockfd) {
    phase_ = kPending;
    pending_.reset(new Channel(loop_, sockfd));
    pending_->SetWriteCallback([this]() { OnWritable(); });
    pending_->SetErrorCallback([this]() { OnError(); });
    pending_->EnableWriting();
}

int Connector::ReleasePending() {
    pending_->DisableAll();
    pending_->Remove();
    const int sockfd = pending_->fd();
    // The channel is usually mid-dispatch here; free it on the next turn.
    std::shared_ptr<Connector> self = shared_from_this();
    loop_->QueueInLoop([self]() { self->pending_.reset(); });
    return sockfd;
}

void Connector::OnWritable() {
    if (phase_ != kPending) return;
    const int sockfd = ReleasePending();
    int err = Socket::GetSocketError(sockfd);
    if (err == 0 && Socket::IsSelfConnect(sockfd)) err = ECONNREFUSED;
    if (err != 0) {
        Fail(sockfd, err);
        return;
    }
    phase_ = kDone;
    if (wanted_ && onConnected_) {
        onConnected_(sockfd);
    } else {
        ::close(sockfd);
    }
}

void Connector::OnError() {
    if (phase_ != kPending) return;
    const int sockfd = ReleasePending();
    const int err = Socket::GetSocketError(sockfd);
    Fail(sockfd, err != 0 ? err : ECONNABORTED);
}

void Connector::Fail(int sockfd, int err) {
    ::close(sockfd);
    phase_ = kIdle;
    const std::string reason = "connect to " + serverAddr_.toIpPort() + " failed: " + std::strerror(err);
    LOG_WARN << reason;
    if (wanted_ && onFailed_) {
        onFailed_(err, reason);
    }
}

} // namespace network
} // namespace haven
