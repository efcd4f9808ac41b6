#pragma once

#include "haven/common/noncopyable.h"
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace haven {
namespace network {

class EventLoop;

// Dispatches readiness on one fd to its callbacks. The fd belongs to the
// owner (Socket, TcpConnection, Connector, ...), never to the Channel.
// Every method runs on the owning loop's thread.
class Channel : haven::common::noncopyable {
public:
    using Timestamp = std::chrono::system_clock::time_point;
    using EventCallback = std::function<void()>;
    using ReadEventCallback = std::function<void(Timestamp)>;

    // Poller bookkeeping for a channel the poller has never seen.
    static const int kNoSlot = -1;

    Channel(EventLoop* loop, int fd);
    ~Channel();

    void HandleEvent(Timestamp receiveTime);

    void SetReadCallback(ReadEventCallback cb) { readCallback_ = std::move(cb); }
    void SetWriteCallback(EventCallback cb) { writeCallback_ = std::move(cb); }
    void SetCloseCallback(EventCallback cb) { closeCallback_ = std::move(cb); }
    void SetErrorCallback(EventCallback cb) { errorCallback_ = std::move(cb); }

    // Events are dropped once obj has expired, and obj stays alive while they run.
    void Tie(const std::shared_ptr<void>& obj);

    int fd() const { return fd_; }
    int events() const { return events_; }
    void set_revents(int revents) { revents_ = revents; }

    bool IsNoneEvent() const { return events_ == kNoneEvent; }
    bool IsWriting() const { return (events_ & kWriteEvent) != 0; }
    bool IsReading() const { return (events_ & kReadEvent) != 0; }

    void EnableReading() { SetInterest(events_ | kReadEvent); }
    void DisableReading() { SetInterest(events_ & ~kReadEvent); }
    void EnableWriting() { SetInterest(events_ | kWriteEvent); }
    void DisableWriting() { SetInterest(events_ & ~kWriteEvent); }
    void DisableAll() { SetInterest(kNoneEvent); }

    // Unregisters from the poller; interest should be disabled first.
    void Remove();

    // Opaque to everyone but the poller (epoll state or pollfd position).
    int slot() const { return slot_; }
    void set_slot(int slot) { slot_ = slot; }

    // "IN HUP" style rendering of an event mask, for debug logs.
    static std::string EventsToString(int fd, int events);

private:
    void SetInterest(int events);
    void Dispatch(Timestamp receiveTime);

    static const int kNoneEvent;
    static const int kReadEvent;
    static const int kWriteEvent;

    EventLoop* loop_;
    const int fd_;
    int events_;
    int revents_;
    int slot_;
    bool registered_;
    bool dispatching_;
    bool tied_;
    std::weak_ptr<void> tie_;

    ReadEventCallback readCallback_;
    EventCallback writeCallback_;
    EventCallback closeCallback_;
    EventCallback errorCallback_;
};

} // namespace network
} // namespace haven
