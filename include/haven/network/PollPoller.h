#pragma once

#include "haven/network/Poller.h"
#include <poll.h>
#include <vector>

namespace haven {
namespace network {

// poll(2) backend, selected with HAVEN_USE_POLL. Channel::slot() is the
// channel's position in pollfds_; owners_ runs parallel to it.
class PollPoller : public Poller {
public:
    explicit PollPoller(EventLoop* loop);
    ~PollPoller() override;

    Timestamp Poll(int timeoutMs, ChannelList* activeChannels) override;
    void UpdateChannel(Channel* channel) override;
    void RemoveChannel(Channel* channel) override;
    const char* Name() const override { return "poll"; }

private:
    std::vector<struct pollfd> pollfds_;
    std::vector<Channel*> owners_;
};

} // namespace network
} // namespace haven
