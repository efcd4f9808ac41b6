#include "haven/network/Poller.h"
#include "haven/network/Channel.h"
#include "haven/network/EpollPoller.h"
#include "haven/network/EventLoop.h"
#include "haven/network/PollPoller.h"
#include "haven/common/Logger.h"

#include <cstdlib>

namespace haven {
namespace network {

Poller::Poller(EventLoop* loop) : ownerLoop_(loop) {}

Poller::~Poller() = default;

bool Poller::HasChannel(const Channel* channel) const {
    return FindChannel(channel->fd()) == channel;
}

Channel* Poller::FindChannel(int fd) const {
    auto it = channels_.find(fd);
    return it == channels_.end() ? nullptr : it->second;
}

void Poller::AssertInLoopThread() const {
    if (ownerLoop_) ownerLoop_->AssertInLoopThread();
}

std::unique_ptr<Poller> Poller::Create(EventLoop* loop) {
    std::unique_ptr<Poller> poller;
    if (::getenv("HAVEN_USE_POLL")) {
        poller.reset(new PollPoller(loop));
    } else {
        poller.reset(new EpollPoller(loop));
    }
    LOG_DEBUG << "EventLoop " << loop << " polls with " << poller->Name();
    return poller;
}

} // namespace network
} // namespace haven
