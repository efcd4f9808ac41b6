#include "haven/gateway/GatewayServer.h"
#include "haven/protocol/HttpServer.h"
#include "haven/protocol/HttpRequest.h"
#include "haven/protocol/HttpResponse.h"
#include "haven/network/EventLoop.h"
#include "haven/network/InetAddress.h"
#include "haven/common/Logger.h"

#include "TestSupport.h"

#include <atomic>
#include <cassert>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace haven::protocol;
using namespace haven::network;
using namespace haven::common;
using namespace testsupport;

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    LOG_INFO << "Main thread ID: " << std::this_thread::get_id();

    const uint16_t originPort = pickFreePort();
    const uint16_t gatewayPort = pickFreePort();
    constexpr int kClients = 8;
    constexpr int kRequestsPerClient = 5;

    EventLoop loop;
    HttpServer origin(&loop, InetAddress(originPort), "MT-Origin");
    std::atomic<int> handled{0};
    origin.setHttpCallback([&](const HttpRequest& req, HttpResponse* resp) {
        ++handled;
        resp->setStatusCode(HttpResponse::k200Ok);
        resp->setBody("origin saw " + req.query());
    });
    origin.setThreadNum(2);
    origin.start();

    haven::gateway::GatewayConfig config;
    config.listenPort = gatewayPort;
    config.threads = 3;
    config.siteDir = "/nonexistent-haven-site";
    haven::gateway::GatewayServer gateway(&loop, config, "MT-Gateway");
    assert(gateway.Init());
    gateway.Start();

    std::atomic<int> ok{0};
    std::thread driver([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        // Concurrent forwards, each fetch running on whichever I/O loop took the client.
        std::vector<std::thread> clients;
        for (int c = 0; c < kClients; ++c) {
            clients.emplace_back([&, c]() {
                for (int i = 0; i < kRequestsPerClient; ++i) {
                    const std::string tag = std::to_string(c) + "-" + std::to_string(i);
                    const std::string resp = httpRoundTrip(gatewayPort,
                        "GET /fetch HTTP/1.1\r\nHost: gateway\r\nConnection: close\r\n"
                        "x-url: http://127.0.0.1:" + std::to_string(originPort) + "/?id=" + tag + "\r\n"
                        "x-headers: {}\r\n\r\n");
                    if (statusOf(resp) == 200 && bodyOf(resp) == "origin saw ?id=" + tag) {
                        ++ok;
                    }
                }
            });
        }
        for (auto& t : clients) t.join();
        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    driver.join();

    assert(ok.load() == kClients * kRequestsPerClient);
    assert(handled.load() == kClients * kRequestsPerClient);
    LOG_INFO << "Concurrent Forwards On I/O Threads PASS";
    return 0;
}
