#include "haven/network/Channel.h"
#include "haven/network/EventLoop.h"
#include "haven/network/PollPoller.h"
#include "haven/network/EpollPoller.h"
#include "haven/common/Logger.h"

#include <cassert>
#include <cstdlib>
#include <memory>
#include <string>
#include <thread>
#include <poll.h>
#include <unistd.h>

using haven::common::Logger;
using haven::network::Channel;
using haven::network::EpollPoller;
using haven::network::EventLoop;
using haven::network::Poller;
using haven::network::PollPoller;

void testSelection() {
    ::unsetenv("HAVEN_USE_POLL");
    std::unique_ptr<Poller> poller = Poller::Create(nullptr);
    assert(dynamic_cast<EpollPoller*>(poller.get()) != nullptr);
    assert(std::string(poller->Name()) == "epoll");
    assert(poller->ChannelCount() == 0);

    ::setenv("HAVEN_USE_POLL", "1", 1);
    poller = Poller::Create(nullptr);
    assert(dynamic_cast<PollPoller*>(poller.get()) != nullptr);
    assert(std::string(poller->Name()) == "poll");
    LOG_INFO << "Poller Selection PASS";
}

// A loop on the poll backend still dispatches readiness and cross-thread wakeups.
void testLoopOnPollBackend() {
    ::setenv("HAVEN_USE_POLL", "1", 1);
    EventLoop loop;
    assert(std::string(loop.PollerName()) == "poll");

    int fds[2];
    int rc = ::pipe(fds);
    assert(rc == 0);

    std::string got;
    Channel channel(&loop, fds[0]);
    channel.SetReadCallback([&](std::chrono::system_clock::time_point) {
        char buf[64];
        ssize_t n = ::read(fds[0], buf, sizeof buf);
        if (n > 0) got.append(buf, static_cast<size_t>(n));
        if (got == "ping") {
            channel.DisableAll();
            channel.Remove();
            loop.Quit();
        }
    });
    channel.EnableReading();
    assert(loop.HasChannel(&channel));

    std::thread writer([&]() {
        ssize_t n = ::write(fds[1], "ping", 4);
        (void)n;
    });
    loop.Loop();
    writer.join();
    assert(got == "ping");

    ::close(fds[0]);
    ::close(fds[1]);
    ::unsetenv("HAVEN_USE_POLL");
    LOG_INFO << "Loop On Poll Backend PASS";
}

// Slots stay dense when channels leave from the middle of the poll set.
void testPollSlotsAfterRemoval() {
    PollPoller poller(nullptr);
    int a[2], b[2], c[2];
    int rc = ::pipe(a) | ::pipe(b) | ::pipe(c);
    assert(rc == 0);

    Channel first(nullptr, a[0]);
    Channel second(nullptr, b[0]);
    Channel third(nullptr, c[0]);
    for (Channel* ch : {&first, &second, &third}) {
        poller.UpdateChannel(ch);
    }
    assert(poller.ChannelCount() == 3);
    assert(third.slot() == 2);

    poller.RemoveChannel(&first);
    assert(first.slot() == Channel::kNoSlot);
    assert(third.slot() == 0);
    assert(!poller.HasChannel(&first));
    assert(poller.HasChannel(&third));

    // Registered but without interest: never reported.
    ssize_t n = ::write(b[1], "x", 1);
    assert(n == 1);
    n = ::write(c[1], "x", 1);
    assert(n == 1);
    Poller::ChannelList active;
    poller.Poll(0, &active);
    assert(active.empty());

    for (int* p : {a, b, c}) {
        ::close(p[0]);
        ::close(p[1]);
    }
    LOG_INFO << "Poll Slots After Removal PASS";
}

void testEventsToString() {
    assert(Channel::EventsToString(7, POLLIN | POLLHUP) == "fd 7: IN HUP");
    assert(Channel::EventsToString(3, 0) == "fd 3:");
    LOG_INFO << "Events To String PASS";
}

int main() {
    Logger::Instance().SetLevel(haven::common::LogLevel::INFO);
    testSelection();
    testLoopOnPollBackend();
    testPollSlotsAfterRemoval();
    testEventsToString();
    return 0;
}
