#include "haven/network/OneShotTimer.h"
#include "haven/network/Channel.h"
#include "haven/network/EventLoop.h"
#include "haven/common/Logger.h"

#include <sys/timerfd.h>
#include <unistd.h>
#include <cerrno>
#include <cstdint>
#include <cstring>

namespace haven {
namespace network {

std::shared_ptr<OneShotTimer> OneShotTimer::Start(EventLoop* loop, int delayMs, const Callback& cb) {
    loop->AssertInLoopThread();
    const int fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK | TFD_CLOEXEC);
    if (fd < 0) {
        LOG_SYSERR << "OneShotTimer timerfd_create failed";
        return std::shared_ptr<OneShotTimer>();
    }

    struct itimerspec when;
    std::memset(&when, 0, sizeof when);
    if (delayMs < 1) delayMs = 1;
    when.it_value.tv_sec = delayMs / 1000;
    when.it_value.tv_nsec = static_cast<long>(delayMs % 1000) * 1000 * 1000;
    if (::timerfd_settime(fd, 0, &when, nullptr) != 0) {
        LOG_SYSERR << "OneShotTimer timerfd_settime failed";
        ::close(fd);
        return std::shared_ptr<OneShotTimer>();
    }

    auto timer = std::make_shared<OneShotTimer>(loop, fd, cb);
    std::weak_ptr<OneShotTimer> weakTimer(timer);
    timer->channel_->SetReadCallback([weakTimer](Channel::Timestamp) {
        if (auto self = weakTimer.lock()) self->OnExpire();
    });
    timer->channel_->Tie(timer);
    timer->channel_->EnableReading();
    return timer;
}

OneShotTimer::OneShotTimer(EventLoop* loop, int fd, const Callback& cb)
    : loop_(loop),
      fd_(fd),
      channel_(new Channel(loop, fd)),
      callback_(cb),
      armed_(true) {
}

OneShotTimer::~OneShotTimer() {
    Disarm();
    ::close(fd_);
}

void OneShotTimer::Cancel() {
    loop_->AssertInLoopThread();
    Disarm();
    callback_ = Callback();
}

void OneShotTimer::Disarm() {
    if (!armed_) return;
    armed_ = false;
    channel_->DisableAll();
    channel_->Remove();
}

void OneShotTimer::OnExpire() {
    uint64_t expirations = 0;
    if (::read(fd_, &expirations, sizeof expirations) < 0 && errno != EAGAIN) {
        LOG_SYSERR << "OneShotTimer read failed";
    }
    Disarm();
    Callback cb;
    cb.swap(callback_);
    if (cb) cb();
}

} // namespace network
} // namespace haven
