#include "haven/gateway/GatewayServer.h"
#include "haven/network/EventLoop.h"
#include "haven/common/Logger.h"

#include "TestSupport.h"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <cassert>
#include <chrono>
#include <cstring>
#include <string>
#include <thread>

using namespace haven::network;
using namespace haven::common;
using namespace testsupport;

namespace {

int listenOnLoopback(uint16_t* portOut) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int opt = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &opt, sizeof(opt));
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    int rc = ::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(rc == 0);
    rc = ::listen(fd, 16);
    assert(rc == 0);
    socklen_t len = sizeof(addr);
    rc = ::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len);
    assert(rc == 0);
    (void)rc;
    *portOut = ntohs(addr.sin_port);
    return fd;
}

// Answers every request with a chunked body in two parts, the second one late.
void slowChunkedOrigin(int lfd, std::atomic<bool>* stop) {
    while (!stop->load()) {
        if (!pollReadable(lfd, 200)) continue;
        int cfd = ::accept(lfd, nullptr, nullptr);
        if (cfd < 0) continue;

        std::string in;
        while (!stop->load() && in.find("\r\n\r\n") == std::string::npos) {
            if (!pollReadable(cfd, 200)) continue;
            char buf[4096];
            ssize_t n = ::recv(cfd, buf, sizeof(buf), 0);
            if (n <= 0) break;
            in.append(buf, buf + n);
        }

        sendAll(cfd, "HTTP/1.1 200 OK\r\n"
                     "Content-Type: text/event-stream\r\n"
                     "Cache-Control: max-age=60\r\n"
                     "Transfer-Encoding: chunked\r\n"
                     "\r\n");
        sendAll(cfd, "6\r\nfirst;\r\n");
        std::this_thread::sleep_for(std::chrono::milliseconds(400));
        sendAll(cfd, "6\r\nlater;\r\n");
        sendAll(cfd, "0\r\n\r\n");

        ::shutdown(cfd, SHUT_RDWR);
        ::close(cfd);
    }
    ::close(lfd);
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);

    uint16_t originPort = 0;
    const int lfd = listenOnLoopback(&originPort);
    const uint16_t gatewayPort = pickFreePort();

    std::atomic<bool> stop{false};
    std::thread origin([&]() { slowChunkedOrigin(lfd, &stop); });

    EventLoop loop;
    haven::gateway::GatewayConfig config;
    config.listenPort = gatewayPort;
    config.siteDir = "/nonexistent-haven-site";
    haven::gateway::GatewayServer gateway(&loop, config, "StreamingGateway");
    assert(gateway.Init());
    gateway.Start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        int fd = connectTo(gatewayPort);
        sendAll(fd, "GET /fetch HTTP/1.1\r\n"
                    "Host: gateway\r\n"
                    "x-url: http://127.0.0.1:" + std::to_string(originPort) + "/events\r\n"
                    "x-headers: {\"accept\": \"text/event-stream\"}\r\n"
                    "Connection: close\r\n"
                    "\r\n");

        // The first part must reach the client before the origin sends the second.
        const auto start = std::chrono::steady_clock::now();
        std::string got = recvUntil(fd, "first;", 1000);
        const auto firstMs = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        assert(got.find("first;") != std::string::npos);
        assert(got.find("later;") == std::string::npos);
        assert(firstMs < 350);
        LOG_INFO << "Forward streams first chunk early PASS";

        got += recvUntilClose(fd);
        ::close(fd);
        assert(statusOf(got) == 200);
        assert(headerOf(got, "transfer-encoding") == "chunked");
        assert(headerOf(got, "cache-control") == "no-cache");
        assert(headerOf(got, "content-type") == "text/event-stream");
        assert(dechunk(bodyOf(got)) == "first;later;");
        LOG_INFO << "Forward streams whole body PASS";

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    stop.store(true);
    origin.join();
    return 0;
}
