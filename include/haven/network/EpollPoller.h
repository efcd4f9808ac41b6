#pragma once

#include "haven/network/Poller.h"
#include <sys/epoll.h>
#include <vector>

namespace haven {
namespace network {

// Level-triggered epoll. Channel::slot() holds the registration state.
class EpollPoller : public Poller {
public:
    explicit EpollPoller(EventLoop* loop);
    ~EpollPoller() override;

    Timestamp Poll(int timeoutMs, ChannelList* activeChannels) override;
    void UpdateChannel(Channel* channel) override;
    void RemoveChannel(Channel* channel) override;
    const char* Name() const override { return "epoll"; }

private:
    // The ready list doubles each time a wait fills it, up to the cap.
    static constexpr size_t kInitialEvents = 16;
    static constexpr size_t kMaxEvents = 4096;

    bool Control(int op, Channel* channel);

    int epollfd_;
    std::vector<struct epoll_event> ready_;
};

} // namespace network
} // namespace haven
