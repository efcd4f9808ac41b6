#include "haven/network/PollPoller.h"
#include "haven/network/Channel.h"
#include "haven/common/Logger.h"

#include <cerrno>

namespace haven {
namespace network {

namespace {

// poll() skips negative descriptors; this keeps a disabled slot in place.
int Parked(int fd) { return -fd - 1; }

} // namespace

PollPoller::PollPoller(EventLoop* loop) : Poller(loop) {}

PollPoller::~PollPoller() = default;

Poller::Timestamp PollPoller::Poll(int timeoutMs, ChannelList* activeChannels) {
    int n = ::poll(pollfds_.data(), static_cast<nfds_t>(pollfds_.size()), timeoutMs);
    int savedErrno = errno;
    Timestamp now = std::chrono::system_clock::now();

    if (n < 0) {
        if (savedErrno != EINTR) {
            errno = savedErrno;
            LOG_SYSERR << "poll";
        }
        return now;
    }
    for (size_t i = 0; i < pollfds_.size() && n > 0; ++i) {
        if (pollfds_[i].revents == 0) continue;
        --n;
        owners_[i]->set_revents(pollfds_[i].revents);
        activeChannels->push_back(owners_[i]);
    }
    return now;
}

void PollPoller::UpdateChannel(Channel* channel) {
    AssertInLoopThread();
    int slot = channel->slot();
    if (slot == Channel::kNoSlot) {
        slot = static_cast<int>(pollfds_.size());
        pollfds_.push_back(pollfd());
        owners_.push_back(channel);
        channels_[channel->fd()] = channel;
        channel->set_slot(slot);
    }

    struct pollfd& entry = pollfds_[static_cast<size_t>(slot)];
    entry.fd = channel->IsNoneEvent() ? Parked(channel->fd()) : channel->fd();
    entry.events = static_cast<short>(channel->events());
    entry.revents = 0;
}

void PollPoller::RemoveChannel(Channel* channel) {
    AssertInLoopThread();
    const int slot = channel->slot();
    if (slot == Channel::kNoSlot) return;

    // Fill the hole with the last entry so the array stays dense.
    const size_t pos = static_cast<size_t>(slot);
    const size_t last = pollfds_.size() - 1;
    if (pos != last) {
        pollfds_[pos] = pollfds_[last];
        owners_[pos] = owners_[last];
        owners_[pos]->set_slot(slot);
    }
    pollfds_.pop_back();
    owners_.pop_back();

    channels_.erase(channel->fd());
    channel->set_slot(Channel::kNoSlot);
}

} // namespace network
} // namespace haven
