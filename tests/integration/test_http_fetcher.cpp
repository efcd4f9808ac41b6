#include "haven/protocol/HttpFetcher.h"
#include "haven/protocol/HttpServer.h"
#include "haven/protocol/HttpRequest.h"
#include "haven/protocol/HttpResponse.h"
#include "haven/network/EventLoop.h"
#include "haven/network/InetAddress.h"
#include "haven/network/Resolver.h"
#include "haven/common/Logger.h"

#include "TestSupport.h"

#include <cassert>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>

using namespace haven::protocol;
using namespace haven::network;
using namespace haven::common;
using namespace testsupport;

namespace {

struct FetchResult {
    bool completed = false;
    int status = 0;
    HeaderList headers;
    std::string body;
    std::string error;
    std::string finalUrl;
};

uint16_t g_otherPort = 0;
Resolver* g_resolver = nullptr;

void handleOrigin(const HttpExchangePtr& exchange) {
    const HttpRequest& req = exchange->request();
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);

    if (req.path() == "/see-other") {
        resp.setStatusCode(303);
        resp.setHeader("Location", "/inspect?from=303");
        exchange->Respond(resp);
    } else if (req.path() == "/temporary") {
        resp.setStatusCode(307);
        resp.setHeader("Location", "inspect");
        exchange->Respond(resp);
    } else if (req.path() == "/elsewhere") {
        resp.setStatusCode(302);
        resp.setHeader("Location", "http://127.0.0.1:" + std::to_string(g_otherPort) + "/inspect");
        exchange->Respond(resp);
    } else if (req.path() == "/inspect") {
        // Reports what arrived so the redirect rules can be checked.
        resp.setBody(req.methodString() + " " + req.path() + req.query() +
                     " body=" + req.body() +
                     " type=" + req.getHeader("Content-Type") +
                     " auth=" + req.getHeader("Authorization"));
        exchange->Respond(resp);
    } else if (req.path() == "/chunked") {
        exchange->BeginStream(resp, -1);
        for (int i = 0; i < 50; ++i) {
            std::string piece = "line " + std::to_string(i) + "\n";
            exchange->WriteBody(piece.data(), piece.size());
        }
        exchange->EndStream();
    } else if (req.path() == "/big") {
        resp.setBody(std::string(256 * 1024, 'z'));
        exchange->Respond(resp);
    } else {
        resp.setStatusCode(HttpResponse::k404NotFound);
        resp.setBody("nothing here");
        exchange->Respond(resp);
    }
}

// Runs one fetch on the loop and waits for it to end. stopAfter > 0 makes the
// body consumer give up once that many bytes have arrived.
FetchResult runFetch(EventLoop* loop, const FetchRequest& request, size_t stopAfter = 0) {
    auto done = std::make_shared<std::promise<FetchResult>>();
    std::future<FetchResult> future = done->get_future();

    loop->RunInLoop([loop, request, stopAfter, done]() {
        auto result = std::make_shared<FetchResult>();
        auto fetcher = std::make_shared<HttpFetcher>(loop, nullptr, g_resolver);
        fetcher->setResponseCallback([result](const FetchResponseHead& head) {
            result->status = head.status;
            result->headers = head.headers;
            result->finalUrl = head.url.toString();
        });
        fetcher->setBodyCallback([result, stopAfter, done](const char* data, size_t len) {
            result->body.append(data, len);
            if (stopAfter > 0 && result->body.size() >= stopAfter) {
                done->set_value(*result);
                return false;
            }
            return true;
        });
        fetcher->setCompleteCallback([result, done]() {
            result->completed = true;
            done->set_value(*result);
        });
        fetcher->setErrorCallback([result, done](const std::string& message) {
            result->error = message;
            done->set_value(*result);
        });
        fetcher->Fetch(request);
    });

    assert(future.wait_for(std::chrono::seconds(5)) == std::future_status::ready);
    return future.get();
}

FetchRequest makeRequest(const std::string& method, const std::string& url) {
    FetchRequest request;
    request.method = method;
    std::string err;
    assert(Url::Parse(url, &request.url, &err));
    return request;
}

} // namespace

int main() {
    Logger::Instance().SetLevel(LogLevel::ERROR);

    const uint16_t originPort = pickFreePort();
    g_otherPort = pickFreePort();
    const uint16_t deadPort = pickFreePort();
    const std::string origin = "http://127.0.0.1:" + std::to_string(originPort);

    EventLoop loop;
    Resolver resolver(1, "fetch-dns");
    g_resolver = &resolver;
    HttpServer server(&loop, InetAddress(originPort), "FetchOrigin");
    server.setExchangeCallback(handleOrigin);
    server.start();
    HttpServer other(&loop, InetAddress(g_otherPort), "OtherOrigin");
    other.setExchangeCallback(handleOrigin);
    other.start();

    std::thread client([&]() {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));

        {
            FetchResult r = runFetch(&loop, makeRequest("GET", origin + "/chunked"));
            assert(r.completed);
            assert(r.status == 200);
            assert(r.body.find("line 0\n") == 0);
            assert(r.body.find("line 49\n") != std::string::npos);
            assert(FindHeader(r.headers, "Transfer-Encoding") != nullptr);
            LOG_INFO << "Fetch chunked body PASS";
        }

        {
            FetchResult r = runFetch(&loop, makeRequest("GET", origin + "/big"));
            assert(r.completed);
            assert(r.body.size() == 256 * 1024);
            LOG_INFO << "Fetch large body PASS";
        }

        {
            FetchResult r = runFetch(&loop, makeRequest("GET", "http://localhost:" + std::to_string(originPort) + "/chunked"));
            assert(r.completed);
            assert(r.status == 200);
            assert(r.body.find("line 49\n") != std::string::npos);
            LOG_INFO << "Fetch by host name PASS";
        }

        {
            FetchResult r = runFetch(&loop, makeRequest("GET", "http://[::1]:" + std::to_string(originPort) + "/"));
            assert(!r.completed);
            assert(r.error.find("IPv6") != std::string::npos);
            LOG_INFO << "Fetch IPv6 target rejected PASS";
        }

        {
            FetchResult r = runFetch(&loop, makeRequest("GET", origin + "/missing"));
            assert(r.completed);
            assert(r.status == 404);
            assert(r.body == "nothing here");
            LOG_INFO << "Fetch error status is not a failure PASS";
        }

        {
            FetchRequest req = makeRequest("POST", origin + "/see-other");
            req.body = "form=1";
            req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
            FetchResult r = runFetch(&loop, req);
            assert(r.completed);
            assert(r.body == "GET /inspect?from=303 body= type= auth=");
            assert(r.finalUrl == origin + "/inspect?from=303");

            req = makeRequest("POST", origin + "/temporary");
            req.body = "form=1";
            req.headers.emplace_back("Content-Type", "text/plain");
            r = runFetch(&loop, req);
            assert(r.completed);
            assert(r.body == "POST /inspect body=form=1 type=text/plain auth=");
            LOG_INFO << "Fetch redirect method rules PASS";
        }

        {
            FetchRequest req = makeRequest("GET", origin + "/elsewhere");
            req.headers.emplace_back("Authorization", "Bearer t");
            FetchResult r = runFetch(&loop, req);
            assert(r.completed);
            assert(r.body == "GET /inspect body= type= auth=");

            req = makeRequest("GET", origin + "/inspect");
            req.headers.emplace_back("Authorization", "Bearer t");
            r = runFetch(&loop, req);
            assert(r.body == "GET /inspect body= type= auth=Bearer t");
            LOG_INFO << "Fetch cross-origin redirect drops credentials PASS";
        }

        {
            FetchResult r = runFetch(&loop, makeRequest("HEAD", origin + "/big"));
            assert(r.completed);
            assert(r.status == 200);
            assert(r.body.empty());
            LOG_INFO << "Fetch HEAD PASS";
        }

        {
            FetchResult r = runFetch(&loop, makeRequest("GET", origin + "/big"), 1024);
            assert(!r.completed);
            assert(r.error.empty());
            assert(r.body.size() >= 1024);
            LOG_INFO << "Fetch cancelled by consumer PASS";
        }

        {
            FetchResult r = runFetch(&loop, makeRequest("GET", "http://127.0.0.1:" + std::to_string(deadPort) + "/"));
            assert(!r.completed);
            assert(!r.error.empty());
            r = runFetch(&loop, makeRequest("GET", "https://127.0.0.1:" + std::to_string(deadPort) + "/"));
            assert(r.error.find("TLS") != std::string::npos);
            r = runFetch(&loop, makeRequest("GET", "ws://127.0.0.1:" + std::to_string(deadPort) + "/"));
            assert(r.error.find("scheme") != std::string::npos);
            LOG_INFO << "Fetch failures reported PASS";
        }

        loop.QueueInLoop([&]() { loop.Quit(); });
    });

    loop.Loop();
    client.join();
    return 0;
}
