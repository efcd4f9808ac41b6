#pragma once

#include "haven/common/noncopyable.h"
#include <condition_variable>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

namespace haven {
namespace network {

class EventLoop;

// Owns a thread running one EventLoop. The loop lives on that thread's
// stack; destroying the EventLoopThread quits it and joins.
class EventLoopThread : haven::common::noncopyable {
public:
    using ThreadInitCallback = std::function<void(EventLoop*)>;

    // The init callback runs on the new thread before the loop starts.
    explicit EventLoopThread(ThreadInitCallback cb = ThreadInitCallback(),
                             std::string name = std::string());
    ~EventLoopThread();

    // Starts the thread and waits until its loop exists.
    EventLoop* StartLoop();

    const std::string& name() const { return name_; }

private:
    void Run();

    EventLoop* loop_;
    std::thread thread_;
    std::mutex mutex_;
    std::condition_variable ready_;
    ThreadInitCallback initCallback_;
    const std::string name_;
};

} // namespace network
} // namespace haven
