#pragma once

#include "haven/common/noncopyable.h"
#include <chrono>
#include <memory>
#include <unordered_map>
#include <vector>

namespace haven {
namespace network {

class Channel;
class EventLoop;

// Readiness backend behind one EventLoop. Only the loop's thread calls it.
//
// UpdateChannel registers a channel on first use and afterwards applies its
// current interest set. A channel with no interest stays known to the poller
// but is not reported. RemoveChannel forgets it.
class Poller : haven::common::noncopyable {
public:
    using Timestamp = std::chrono::system_clock::time_point;
    using ChannelList = std::vector<Channel*>;

    explicit Poller(EventLoop* loop);
    virtual ~Poller();

    // Waits up to timeoutMs and appends ready channels to activeChannels.
    virtual Timestamp Poll(int timeoutMs, ChannelList* activeChannels) = 0;
    virtual void UpdateChannel(Channel* channel) = 0;
    virtual void RemoveChannel(Channel* channel) = 0;
    virtual const char* Name() const = 0;

    bool HasChannel(const Channel* channel) const;
    size_t ChannelCount() const { return channels_.size(); }

    // epoll, or poll(2) when HAVEN_USE_POLL is set in the environment.
    static std::unique_ptr<Poller> Create(EventLoop* loop);

protected:
    void AssertInLoopThread() const;
    Channel* FindChannel(int fd) const;

    std::unordered_map<int, Channel*> channels_;

private:
    EventLoop* ownerLoop_;
};

} // namespace network
} // namespace haven
