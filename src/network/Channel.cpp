#include "haven/network/Channel.h"
#include "haven/network/EventLoop.h"
#include "haven/common/Logger.h"

#include <poll.h>
#include <sys/epoll.h>
#include <sstream>

namespace haven {
namespace network {

// epoll and poll share the bit values for these flags on Linux, so one mask
// serves both backends.
static_assert(EPOLLIN == POLLIN && EPOLLOUT == POLLOUT && EPOLLHUP == POLLHUP,
              "epoll and poll event bits differ");

const int Channel::kNoneEvent = 0;
const int Channel::kReadEvent = EPOLLIN | EPOLLPRI;
const int Channel::kWriteEvent = EPOLLOUT;

Channel::Channel(EventLoop* loop, int fd)
    : loop_(loop),
      fd_(fd),
      events_(kNoneEvent),
      revents_(0),
      slot_(kNoSlot),
      registered_(false),
      dispatching_(false),
      tied_(false) {
}

Channel::~Channel() {
    if (dispatching_) {
        LOG_ERROR << "Channel fd=" << fd_ << " destroyed from inside its own callback";
    }
    if (registered_) {
        LOG_WARN << "Channel fd=" << fd_ << " destroyed while still registered";
    }
}

void Channel::Tie(const std::shared_ptr<void>& obj) {
    tie_ = obj;
    tied_ = true;
}

void Channel::SetInterest(int events) {
    events_ = events;
    registered_ = true;
    loop_->UpdateChannel(this);
}

void Channel::Remove() {
    registered_ = false;
    loop_->RemoveChannel(this);
}

void Channel::HandleEvent(Timestamp receiveTime) {
    std::shared_ptr<void> guard;
    if (tied_) {
        guard = tie_.lock();
        if (!guard) return;
    }
    dispatching_ = true;
    Dispatch(receiveTime);
    dispatching_ = false;
}

void Channel::Dispatch(Timestamp receiveTime) {
    LOG_DEBUG << EventsToString(fd_, revents_);

    if (revents_ & POLLNVAL) {
        LOG_WARN << "Channel fd=" << fd_ << " is not an open descriptor";
    }
    // A hangup with data still queued is reported through the read path.
    if ((revents_ & EPOLLHUP) && !(revents_ & EPOLLIN)) {
        if (closeCallback_) closeCallback_();
    }
    if (revents_ & (EPOLLERR | POLLNVAL)) {
        if (errorCallback_) errorCallback_();
    }
    if (revents_ & (EPOLLIN | EPOLLPRI | EPOLLRDHUP)) {
        if (readCallback_) readCallback_(receiveTime);
    }
    if (revents_ & EPOLLOUT) {
        if (writeCallback_) writeCallback_();
    }
}

std::string Channel::EventsToString(int fd, int events) {
    std::ostringstream os;
    os << "fd " << fd << ":";
    if (events & EPOLLIN) os << " IN";
    if (events & EPOLLPRI) os << " PRI";
    if (events & EPOLLOUT) os << " OUT";
    if (events & EPOLLHUP) os << " HUP";
    if (events & EPOLLRDHUP) os << " RDHUP";
    if (events & EPOLLERR) os << " ERR";
    if (events & POLLNVAL) os << " NVAL";
    return os.str();
}

} // namespace network
} // namespace haven
