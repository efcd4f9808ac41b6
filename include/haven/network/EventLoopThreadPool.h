#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/EventLoopThread.h"
#include <memory>
#include <string>
#include <vector>

namespace haven {
namespace network {

class EventLoop;

// I/O loops that a server spreads its connections over. With zero threads
// every connection stays on the base loop.
class EventLoopThreadPool : haven::common::noncopyable {
public:
    EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg);
    ~EventLoopThreadPool();

    // Negative counts are treated as zero. Call before Start().
    void SetThreadNum(int numThreads) { numThreads_ = numThreads > 0 ? numThreads : 0; }
    void Start(const EventLoopThread::ThreadInitCallback& cb = EventLoopThread::ThreadInitCallback());

    // Round robin over the I/O loops. Base loop thread only.
    EventLoop* GetNextLoop();
    // The I/O loops in start order, or just the base loop when there are none.
    std::vector<EventLoop*> GetAllLoops() const;

    bool started() const { return started_; }
    const std::string& name() const { return name_; }

private:
    EventLoop* baseLoop_;
    const std::string name_;
    bool started_;
    int numThreads_;
    size_t next_;
    std::vector<std::unique_ptr<EventLoopThread>> threads_;
    std::vector<EventLoop*> loops_;
};

} // namespace network
} // namespace haven
