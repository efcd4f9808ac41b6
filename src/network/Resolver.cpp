#include "haven/network/Resolver.h"
#include "haven/network/EventLoop.h"
#include "haven/common/Logger.h"

#include <arpa/inet.h>
#include <pthread.h>

namespace haven {
namespace network {

Resolver::Resolver(int threads, const std::string& name)
    : name_(name),
      stopping_(false) {
    if (threads < 1) threads = 1;
    workers_.reserve(static_cast<size_t>(threads));
    for (int i = 0; i < threads; ++i) {
        workers_.emplace_back([this]() { WorkerMain(); });
    }
    LOG_DEBUG << "Resolver " << name_ << " started " << threads << " workers";
}

Resolver::~Resolver() {
    Stop();
}

void Resolver::Resolve(EventLoop* loop, const std::string& host, uint16_t port, ResolveCallback cb) {
    struct in_addr numeric;
    if (::inet_pton(AF_INET, host.c_str(), &numeric) == 1) {
        InetAddress addr(host, port);
        loop->QueueInLoop([cb, addr]() { cb(true, addr, std::string()); });
        return;
    }
    if (host.find(':') != std::string::npos) {
        const std::string err = "IPv6 address " + host + " is not supported, use an IPv4 address or host name";
        loop->QueueInLoop([cb, err]() { cb(false, InetAddress(), err); });
        return;
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!stopping_) {
            jobs_.push_back(Job{loop, host, port, std::move(cb)});
            cond_.notify_one();
            return;
        }
    }
    const std::string err = "resolver is shut down, cannot look up " + host;
    loop->QueueInLoop([cb, err]() { cb(false, InetAddress(), err); });
}

void Resolver::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        stopping_ = true;
        if (!jobs_.empty()) {
            LOG_DEBUG << "Resolver " << name_ << " dropping " << jobs_.size() << " queued lookups";
        }
        jobs_.clear();
    }
    cond_.notify_all();
    for (auto& worker : workers_) {
        if (worker.joinable()) worker.join();
    }
}

size_t Resolver::queued() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return jobs_.size();
}

void Resolver::WorkerMain() {
    ::pthread_setname_np(::pthread_self(), name_.substr(0, 15).c_str());
    for (;;) {
        Job job;
        {
            std::unique_lock<std::mutex> lock(mutex_);
            cond_.wait(lock, [this]() { return stopping_ || !jobs_.empty(); });
            if (stopping_) return;
            job = std::move(jobs_.front());
            jobs_.pop_front();
        }

        InetAddress addr;
        std::string err;
        const bool ok = InetAddress::Resolve(job.host, job.port, &addr, &err);
        LOG_DEBUG << "Resolved " << job.host << " -> " << (ok ? addr.toIp() : err);

        // Holding the lock keeps Stop() from returning while the loop is used.
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_) return;
        ResolveCallback cb = std::move(job.cb);
        job.loop->QueueInLoop([cb, ok, addr, err]() { cb(ok, addr, err); });
    }
}

} // namespace network
} // namespace haven
