#pragma once

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

#include "haven/common/noncopyable.h"
#include "haven/network/Channel.h"
#include "haven/network/Poller.h"

namespace haven {
namespace network {

// Reactor owned by exactly one thread: the one that constructs it. Channel
// and connection state is touched only there; other threads hand work over
// with RunInLoop / QueueInLoop.
class EventLoop : haven::common::noncopyable {
public:
    using Functor = std::function<void()>;
    using Timestamp = Poller::Timestamp;

    EventLoop();
    ~EventLoop();

    // Dispatches events until Quit(). Must run on the owner thread.
    void Loop();
    // Safe from any thread. The current iteration finishes first.
    void Quit();

    // Runs cb immediately on the owner thread, otherwise queues it.
    void RunInLoop(Functor cb);
    // Always defers cb to the end of the current (or next) iteration.
    void QueueInLoop(Functor cb);
    size_t QueuedFunctorCount() const;

    void WakeUp();

    void UpdateChannel(Channel* channel);
    void RemoveChannel(Channel* channel);
    bool HasChannel(Channel* channel) const;

    bool IsInLoopThread() const { return threadId_ == std::this_thread::get_id(); }
    void AssertInLoopThread() const;

    // When the poller last returned; stamped on every dispatched event.
    const char* PollerName() const { return poller_->Name(); }

    static EventLoop* GetEventLoopOfCurrentThread();

private:
    void DrainWakeup();
    void RunQueuedFunctors();

    std::atomic<bool> looping_;
    std::atomic<bool> quit_;
    std::atomic<bool> runningFunctors_;

    const std::thread::id threadId_;
    Timestamp pollReturnTime_;
    std::unique_ptr<Poller> poller_;

    int wakeupFd_;
    std::unique_ptr<Channel> wakeupChannel_;

    Poller::ChannelList activeChannels_;

    mutable std::mutex mutex_;
    std::vector<Functor> queued_;
};

} // namespace network
} // namespace haven
