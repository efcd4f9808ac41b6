#include "haven/network/EventLoopThreadPool.h"
#include "haven/network/EventLoop.h"
#include "haven/common/Logger.h"

namespace haven {
namespace network {

EventLoopThreadPool::EventLoopThreadPool(EventLoop* baseLoop, const std::string& nameArg)
    : baseLoop_(baseLoop),
      name_(nameArg),
      started_(false),
      numThreads_(0),
      next_(0) {
}

// Each EventLoopThread quits and joins its loop when destroyed.
EventLoopThreadPool::~EventLoopThreadPool() = default;

void EventLoopThreadPool::Start(const EventLoopThread::ThreadInitCallback& cb) {
    baseLoop_->AssertInLoopThread();
    if (started_) return;
    started_ = true;

    threads_.reserve(static_cast<size_t>(numThreads_));
    for (int i = 0; i < numThreads_; ++i) {
        threads_.emplace_back(new EventLoopThread(cb, name_ + "-io" + std::to_string(i)));
        loops_.push_back(threads_.back()->StartLoop());
    }
    if (loops_.empty() && cb) {
        cb(baseLoop_);
    }
    LOG_DEBUG << "pool " << name_ << " started with " << loops_.size() << " I/O loops";
}

EventLoop* EventLoopThreadPool::GetNextLoop() {
    baseLoop_->AssertInLoopThread();
    if (loops_.empty()) return baseLoop_;

    EventLoop* loop = loops_[next_];
    next_ = (next_ + 1) % loops_.size();
    return loop;
}

std::vector<EventLoop*> EventLoopThreadPool::GetAllLoops() const {
    if (loops_.empty()) return std::vector<EventLoop*>(1, baseLoop_);
    return loops_;
}

} // namespace network
} // namespace haven
