#include "haven/network/EventLoop.h"
#include "haven/common/Logger.h"

#include <signal.h>
#include <sys/eventfd.h>
#include <unistd.h>

namespace haven {
namespace network {

namespace {

__thread EventLoop* t_loopInThisThread = nullptr;

// Upper bound on one poll wait; wakeups cut it short.
const int kPollTimeMs = 10000;

int CreateWakeupFd() {
    int fd = ::eventfd(0, EFD_NONBLOCK | EFD_CLOEXEC);
    if (fd < 0) {
        LOG_SYSFATAL << "eventfd";
    }
    return fd;
}

// A write to a peer that has gone away must fail with EPIPE instead of
// killing the process.
struct IgnoreSigPipe {
    IgnoreSigPipe() { ::signal(SIGPIPE, SIG_IGN); }
};
IgnoreSigPipe ignoreSigPipe;

} // namespace

EventLoop* EventLoop::GetEventLoopOfCurrentThread() {
    return t_loopInThisThread;
}

EventLoop::EventLoop()
    : looping_(false),
      quit_(false),
      runningFunctors_(false),
      threadId_(std::this_thread::get_id()),
      poller_(Poller::Create(this)),
      wakeupFd_(CreateWakeupFd()),
      wakeupChannel_(new Channel(this, wakeupFd_)) {
    if (t_loopInThisThread) {
        LOG_FATAL << "thread " << threadId_ << " already runs EventLoop " << t_loopInThisThread;
    }
    t_loopInThisThread = this;

    wakeupChannel_->SetReadCallback([this](Timestamp) { DrainWakeup(); });
    wakeupChannel_->EnableReading();
    LOG_DEBUG << "EventLoop " << this << " created on thread " << threadId_;
}

EventLoop::~EventLoop() {
    wakeupChannel_->DisableAll();
    wakeupChannel_->Remove();
    ::close(wakeupFd_);
    if (poller_->ChannelCount() != 0) {
        LOG_WARN << "EventLoop " << this << " destroyed with " << poller_->ChannelCount()
                 << " channels still registered";
    }
    t_loopInThisThread = nullptr;
}

void EventLoop::Loop() {
    AssertInLoopThread();
    looping_ = true;
    quit_ = false;

    // Work queued before the loop started would otherwise wait for the first timeout.
    RunQueuedFunctors();

    while (!quit_) {
        activeChannels_.clear();
        pollReturnTime_ = poller_->Poll(kPollTimeMs, &activeChannels_);
        for (Channel* channel : activeChannels_) {
            channel->HandleEvent(pollReturnTime_);
        }
        RunQueuedFunctors();
    }

    looping_ = false;
    LOG_DEBUG << "EventLoop " << this << " stopped";
}

void EventLoop::Quit() {
    quit_ = true;
    if (!IsInLoopThread()) {
        WakeUp();
    }
}

void EventLoop::RunInLoop(Functor cb) {
    if (IsInLoopThread()) {
        cb();
        return;
    }
    QueueInLoop(std::move(cb));
}

void EventLoop::QueueInLoop(Functor cb) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        queued_.push_back(std::move(cb));
    }
    // The owner thread reaches RunQueuedFunctors on its own unless it is
    // already inside it, in which case the next poll must not block.
    if (!IsInLoopThread() || runningFunctors_) {
        WakeUp();
    }
}

size_t EventLoop::QueuedFunctorCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queued_.size();
}

void EventLoop::AssertInLoopThread() const {
    if (!IsInLoopThread()) {
        LOG_FATAL << "EventLoop " << this << " belongs to thread " << threadId_
                  << " but was used from thread " << std::this_thread::get_id();
    }
}

void EventLoop::WakeUp() {
    uint64_t one = 1;
    if (::write(wakeupFd_, &one, sizeof one) != static_cast<ssize_t>(sizeof one)) {
        LOG_SYSERR << "EventLoop::WakeUp write";
    }
}

void EventLoop::DrainWakeup() {
    uint64_t count = 0;
    if (::read(wakeupFd_, &count, sizeof count) != static_cast<ssize_t>(sizeof count)) {
        LOG_SYSERR << "EventLoop::DrainWakeup read";
    }
}

void EventLoop::UpdateChannel(Channel* channel) {
    poller_->UpdateChannel(channel);
}

void EventLoop::RemoveChannel(Channel* channel) {
    poller_->RemoveChannel(channel);
}

bool EventLoop::HasChannel(Channel* channel) const {
    return poller_->HasChannel(channel);
}

void EventLoop::RunQueuedFunctors() {
    std::vector<Functor> batch;
    runningFunctors_ = true;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        batch.swap(queued_);
    }
    for (const Functor& fn : batch) {
        fn();
    }
    runningFunctors_ = false;
}

} // namespace network
} // namespace haven
