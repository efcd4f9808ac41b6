#include "haven/network/EventLoopThread.h"
#include "haven/network/EventLoop.h"
#include "haven/common/Logger.h"

#include <pthread.h>

namespace haven {
namespace network {

EventLoopThread::EventLoopThread(ThreadInitCallback cb, std::string name)
    : loop_(nullptr),
      initCallback_(std::move(cb)),
      name_(std::move(name)) {
}

EventLoopThread::~EventLoopThread() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (loop_) loop_->Quit();
    }
    if (thread_.joinable()) {
        thread_.join();
    }
}

EventLoop* EventLoopThread::StartLoop() {
    thread_ = std::thread([this]() { Run(); });

    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait(lock, [this]() { return loop_ != nullptr; });
    return loop_;
}

void EventLoopThread::Run() {
    if (!name_.empty()) {
        // Linux limits thread names to 15 characters.
        ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());
    }

    EventLoop loop;
    if (initCallback_) {
        initCallback_(&loop);
    }
    {
        std::lock_guard<std::mutex> lock(mutex_);
        loop_ = &loop;
    }
    ready_.notify_one();

    loop.Loop();
    LOG_DEBUG << "EventLoopThread " << name_ << " exiting";

    std::lock_guard<std::mutex> lock(mutex_);
    loop_ = nullptr;
}

} // namespace network
} // namespace haven
