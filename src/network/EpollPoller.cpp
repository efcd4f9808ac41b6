#include "haven/network/EpollPoller.h"
#include "haven/network/Channel.h"
#include "haven/common/Logger.h"

#include <unistd.h>
#include <cerrno>
#include <cstring>

namespace haven {
namespace network {

namespace {

// Channel::slot() values. kDetached means the fd left the epoll set while
// the channel stays in channels_ so it can be re-armed with one ADD.
const int kUnknown = Channel::kNoSlot;
const int kArmed = 1;
const int kDetached = 2;

const char* OpName(int op) {
    switch (op) {
        case EPOLL_CTL_ADD: return "ADD";
        case EPOLL_CTL_MOD: return "MOD";
        case EPOLL_CTL_DEL: return "DEL";
    }
    return "???";
}

} // namespace

EpollPoller::EpollPoller(EventLoop* loop)
    : Poller(loop),
      epollfd_(::epoll_create1(EPOLL_CLOEXEC)),
      ready_(kInitialEvents) {
    if (epollfd_ < 0) {
        LOG_SYSFATAL << "epoll_create1";
    }
}

EpollPoller::~EpollPoller() {
    ::close(epollfd_);
}

Poller::Timestamp EpollPoller::Poll(int timeoutMs, ChannelList* activeChannels) {
    int n = ::epoll_wait(epollfd_, ready_.data(), static_cast<int>(ready_.size()), timeoutMs);
    int savedErrno = errno;
    Timestamp now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) {
            errno = savedErrno;
            LOG_SYSERR << "epoll_wait";
        }
        return now;
    }
    for (int i = 0; i < n; ++i) {
        Channel* channel = static_cast<Channel*>(ready_[i].data.ptr);
        channel->set_revents(static_cast<int>(ready_[i].events));
        activeChannels->push_back(channel);
    }
    if (static_cast<size_t>(n) == ready_.size() && ready_.size() < kMaxEvents) {
        ready_.resize(ready_.size() * 2);
    }
    return now;
}

void EpollPoller::UpdateChannel(Channel* channel) {
    AssertInLoopThread();
    const int state = channel->slot();

    if (state == kArmed) {
        if (!channel->IsNoneEvent()) {
            Control(EPOLL_CTL_MOD, channel);
        } else if (Control(EPOLL_CTL_DEL, channel)) {
            channel->set_slot(kDetached);
        }
        return;
    }

    if (state == kUnknown) {
        channels_[channel->fd()] = channel;
        channel->set_slot(kDetached);
    }
    // Nothing to arm for a channel that only cleared its interest.
    if (!channel->IsNoneEvent() && Control(EPOLL_CTL_ADD, channel)) {
        channel->set_slot(kArmed);
    }
}

void EpollPoller::RemoveChannel(Channel* channel) {
    AssertInLoopThread();
    if (channel->slot() == kArmed) {
        Control(EPOLL_CTL_DEL, channel);
    }
    channels_.erase(channel->fd());
    channel->set_slot(kUnknown);
}

bool EpollPoller::Control(int op, Channel* channel) {
    struct epoll_event event;
    std::memset(&event, 0, sizeof event);
    event.events = static_cast<uint32_t>(channel->events());
    event.data.ptr = channel;

    if (::epoll_ctl(epollfd_, op, channel->fd(), &event) == 0) {
        return true;
    }
    // The fd may already be closed by its owner; that is the end state DEL wants.
    if (op == EPOLL_CTL_DEL && (errno == ENOENT || errno == EBADF)) {
        return true;
    }
    if (op == EPOLL_CTL_DEL) {
        LOG_SYSERR << "epoll_ctl " << OpName(op) << " fd=" << channel->fd();
    } else {
        LOG_SYSFATAL << "epoll_ctl " << OpName(op) << " fd=" << channel->fd();
    }
    return false;
}

} // namespace network
} // namespace haven
