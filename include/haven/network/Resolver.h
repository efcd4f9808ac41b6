#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/InetAddress.h"

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace haven {
namespace network {

class EventLoop;

// Host name lookups on worker threads, so no I/O loop ever blocks inside
// getaddrinfo. The answer is queued onto the loop that asked; it never runs
// inside Resolve() itself. Numeric IPv4 hosts are answered without a worker.
//
// Loops handed to Resolve() must outlive the resolver or its Stop().
class Resolver : haven::common::noncopyable {
public:
    // ok false means err says why; addr is then unspecified.
    using ResolveCallback = std::function<void(bool ok, const InetAddress& addr, const std::string& err)>;

    explicit Resolver(int threads = 2, const std::string& name = "resolver");
    ~Resolver();

    void Resolve(EventLoop* loop, const std::string& host, uint16_t port, ResolveCallback cb);

    // Joins the workers after their current lookup. Queued lookups are
    // dropped without a callback.
    void Stop();

    size_t queued() const;

private:
    struct Job {
        EventLoop* loop;
        std::string host;
        uint16_t port;
        ResolveCallback cb;
    };

    void WorkerMain();

    const std::string name_;
    mutable std::mutex mutex_;
    std::condition_variable cond_;
    std::deque<Job> jobs_;
    bool stopping_;
    std::vector<std::thread> workers_;
};

} // namespace network
} // namespace haven
