#pragma once

#include "haven/common/noncopyable.h"

#include <functional>
#include <memory>

namespace haven {
namespace network {

class Channel;
class EventLoop;

// A timerfd registered on one loop that fires its callback once. Dropping
// the last reference or calling Cancel() disarms it. Loop thread only.
class OneShotTimer : haven::common::noncopyable,
                     public std::enable_shared_from_this<OneShotTimer> {
public:
    using Callback = std::function<void()>;

    // Null when the timerfd cannot be set up; the failure is logged.
    static std::shared_ptr<OneShotTimer> Start(EventLoop* loop, int delayMs, const Callback& cb);

    OneShotTimer(EventLoop* loop, int fd, const Callback& cb);
    ~OneShotTimer();

    void Cancel();
    bool armed() const { return armed_; }

private:
    void OnExpire();
    void Disarm();

    EventLoop* loop_;
    const int fd_;
    std::unique_ptr<Channel> channel_;
    Callback callback_;
    bool armed_;
};

using OneShotTimerPtr = std::shared_ptr<OneShotTimer>;

} // namespace network
} // namespace haven
