#include "haven/gateway/GatewayServer.h"
#include "haven/protocol/HttpServer.h"
#include "haven/protocol/HttpRequest.h"
#include "haven/protocol/HttpResponse.h"
#include "haven/network/EventLoop.h"
#include "haven/network/InetAddress.h"
#include "haven/common/Logger.h"

#include "TestSupport.h"

#include <cassert>
#include <chrono>
#include <string>
#include <thread>

using namespace haven::protocol;
using namespace haven::network;
using namespace haven::common;
using namespace testsupport;

namespace {

// Stand-in for an arbitrary site on the internet.
void handleUpstream(const HttpExchangePtr& exchange) {
    const HttpRequest& req = exchange->request();
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);

    if (req.path() == "/hello") {
        resp.setContentType("text/plain");
        resp.addHeader("Cache-Control", "max-age=600");
        resp.addHeader("Age", "10");
        resp.addHeader("Expires", "Thu, 01 Dec 2094 16:00:00 GMT");
        resp.addHeader("X-Upstream", "yes");
        resp.setBody("hello upstream");
        exchange->Respond(resp);
    } else if (req.path() == "/echo") {
        std::string body = req.methodString() + "|" + req.getHeader("X-Custom") + "|" + req.body() + "|";
        body += req.hasHeader("x-url") || req.hasHeader("x-headers") ? "leak" : "clean";
        resp.setBody(body);
        exchange->Respond(resp);
    } else if (req.path() == "/teapot") {
        resp.setStatusCode(418);
        resp.setStatusMessage("I'm a teapot");
        resp.setBody("short and stout");
        exchange->Respond(resp);
    } else if (req.path() == "/redirect") {
        resp.setStatusCode(302);
        resp.setHeader("Location", "/hello");
        exchange->Respond(resp);
    } else if (req.path() == "/loop") {
        resp.setStatusCode(302);
        resp.setHeader("Location", "/loop");
        exchange->Respond(resp);
    } else if (req.path() == "/stream") {
        // No declared length: the upstream answers chunked.
        resp.setContentType("text/plain");
        exchange->BeginStream(resp, -1);
        exchange->WriteBody("part1", 5);
        exchange->WriteBody("part2", 5);
        exchange->EndStream();
    } else {
        resp.setStatusCode(HttpResponse::k404NotFound);
        exchange->Respond(resp);
    }
}

std::string fetchRequest(const std::string& method,
                         const std::string& url,
                         const std::string& xHeaders,
                         const std::string& body = std::string()) {
    std::string req = method + " /fetch HTTP/1.1\r\nHost: gateway\r\nConnection: close\r\n";
    if (!url.empty()) req += "x-url: " + url + "\r\n";
    if (!xHeaders.empty()) req += "x-headers: " + xHeaders + "\r\n";
    if (!body.empty() || method == "POST") req += "Content-Length: " + std::to_string(body.size()) + "\r\n";
    req += "\r\n" + body;
    return req;
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);

    const uint16_t upstreamPort = pickFreePort();
    const uint16_t gatewayPort = pickFreePort();
    const uint16_t deadPort = pickFreePort();
    const std::string upstream = "http://127.0.0.1:" + std::to_string(upstreamPort);

    EventLoop loop;
    HttpServer origin(&loop, InetAddress(upstreamPort), "Origin");
    origin.setExchangeCallback(handleUpstream);
    origin.start();

    haven::gateway::GatewayConfig config;
    config.listenPort = gatewayPort;
    config.debug = true;
    config.siteDir = "/nonexistent-haven-site";
    haven::gateway::GatewayServer gateway(&loop, config, "ForwardGateway");
    assert(gateway.Init());
    gateway.Start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        // Status, headers and body come from the upstream; caching is disabled.
        {
            std::string resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/hello", "{}"));
            assert(statusOf(resp) == 200);
            assert(bodyOf(resp) == "hello upstream");
            assert(headerOf(resp, "cache-control") == "no-cache");
            assert(!hasHeader(resp, "age"));
            assert(!hasHeader(resp, "expires"));
            assert(headerOf(resp, "x-upstream") == "yes");
            assert(headerOf(resp, "content-length") == "14");
            LOG_INFO << "Forward GET PASS";
        }

        // POST body and x-headers reach the upstream; the gateway fields do not.
        {
            std::string resp = httpRoundTrip(gatewayPort,
                                             fetchRequest("POST", upstream + "/echo", "{\"X-Custom\": \"v1\"}", "payload"));
            assert(statusOf(resp) == 200);
            assert(bodyOf(resp) == "POST|v1|payload|clean");
            LOG_INFO << "Forward POST PASS";
        }

        // Any other method goes out without a body.
        {
            std::string resp = httpRoundTrip(gatewayPort,
                                             fetchRequest("PUT", upstream + "/echo", "{\"X-Custom\": 7}", "dropped"));
            assert(statusOf(resp) == 200);
            assert(bodyOf(resp) == "PUT|7||clean");
            LOG_INFO << "Forward PUT drops body PASS";
        }

        {
            std::string resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/teapot", "{}"));
            assert(statusOf(resp) == 418);
            assert(bodyOf(resp) == "short and stout");
            assert(headerOf(resp, "cache-control") == "no-cache");
            LOG_INFO << "Forward mirrors status PASS";
        }

        {
            std::string resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/redirect", "{}"));
            assert(statusOf(resp) == 200);
            assert(bodyOf(resp) == "hello upstream");
            LOG_INFO << "Forward follows redirect PASS";
        }

        {
            std::string resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/loop", "{}"));
            assert(statusOf(resp) == 500);
            assert(bodyOf(resp) == "Too many redirects");
            LOG_INFO << "Forward redirect limit PASS";
        }

        // Unknown length upstream: re-framed as chunked for an HTTP/1.1 client.
        {
            std::string resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/stream", "{}"));
            assert(statusOf(resp) == 200);
            assert(headerOf(resp, "transfer-encoding") == "chunked");
            assert(dechunk(bodyOf(resp)) == "part1part2");
            LOG_INFO << "Forward streams unknown length PASS";
        }

        {
            std::string resp = httpRoundTrip(gatewayPort,
                                             fetchRequest("GET", "http://127.0.0.1:" + std::to_string(deadPort) + "/", "{}"));
            assert(statusOf(resp) == 500);
            assert(!bodyOf(resp).empty());
            LOG_INFO << "Forward unreachable target PASS";
        }

        {
            std::string resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/hello", "{bad json"));
            assert(statusOf(resp) == 500);
            assert(bodyOf(resp).find("x-headers") != std::string::npos);
            resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/hello", "[1,2]"));
            assert(statusOf(resp) == 500);
            resp = httpRoundTrip(gatewayPort, fetchRequest("GET", upstream + "/hello", ""));
            assert(statusOf(resp) == 500);
            LOG_INFO << "Forward malformed x-headers PASS";
        }

        {
            std::string resp = httpRoundTrip(gatewayPort, fetchRequest("GET", "", "{}"));
            assert(statusOf(resp) == 500);
            assert(bodyOf(resp).find("Invalid URL") != std::string::npos);
            resp = httpRoundTrip(gatewayPort, fetchRequest("GET", "not a url", "{}"));
            assert(statusOf(resp) == 500);
            LOG_INFO << "Forward invalid URL PASS";
        }

        // /fetch is an exact match; sub-paths fall through to the site.
        {
            std::string resp = httpRoundTrip(gatewayPort, "GET /fetch/x HTTP/1.1\r\nHost: g\r\nConnection: close\r\n\r\n");
            assert(statusOf(resp) == 404);
            LOG_INFO << "Forward path is exact PASS";
        }

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    return 0;
}
