#include "haven/gateway/ForwardHandler.h"
#include "haven/gateway/GatewayConfig.h"
#include "haven/protocol/HttpFetcher.h"
#include "haven/protocol/JsonHeaders.h"
#include "haven/common/Logger.h"

#include <memory>

namespace haven {
namespace gateway {

using protocol::HeaderList;
using protocol::HttpExchangePtr;
using protocol::HttpFetcher;
using protocol::HttpRequest;
using protocol::HttpResponse;

namespace {

bool IsStrippedResponseHeader(const std::string& lowerName) {
    return lowerName == "age" || lowerName == "cache-control" || lowerName == "expires" ||
           lowerName == "connection" || lowerName == "keep-alive" ||
           lowerName == "transfer-encoding" || lowerName == "content-length";
}

} // namespace

ForwardHandler::ForwardHandler(const GatewayConfig& config,
                               const haven::network::TlsContext* tls,
                               haven::network::Resolver* resolver)
    : debug_(config.debug),
      highWaterMark_(config.highWaterMark),
      tls_(tls),
      resolver_(resolver) {
}

bool ForwardHandler::BuildForwardRequest(const HttpRequest& req, ForwardRequest* out, std::string* err) {
    out->targetUrl = req.getHeader("x-url");
    if (out->targetUrl.empty()) {
        *err = "Invalid URL: missing x-url header";
        return false;
    }
    if (!protocol::Url::Parse(out->targetUrl, &out->url, err)) {
        return false;
    }
    if (!req.hasHeader("x-headers")) {
        *err = "Invalid x-headers: missing x-headers header";
        return false;
    }
    out->headers.clear();
    if (!protocol::ParseHeaderObject(req.getHeader("x-headers"), &out->headers, err)) {
        return false;
    }
    out->method = req.methodString();
    out->body.clear();
    if (req.getMethod() == HttpRequest::kPost) {
        out->body = req.body();
    }
    return true;
}

HeaderList ForwardHandler::SanitizeResponseHeaders(const HeaderList& upstream) {
    HeaderList out;
    out.reserve(upstream.size() + 1);
    for (const auto& kv : upstream) {
        std::string name = protocol::ToLowerAscii(kv.first);
        if (IsStrippedResponseHeader(name)) continue;
        out.emplace_back(std::move(name), kv.second);
    }
    out.emplace_back("cache-control", "no-cache");
    return out;
}

void ForwardHandler::RespondError(const HttpExchangePtr& exchange, const std::string& message) {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k500InternalServerError);
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody(message);
    exchange->Respond(resp);
}

void ForwardHandler::Handle(const HttpExchangePtr& exchange) {
    ForwardRequest fwd;
    std::string err;
    if (!BuildForwardRequest(exchange->request(), &fwd, &err)) {
        LOG_WARN << "Forward request rejected: " << err;
        RespondError(exchange, err);
        return;
    }
    if (exchange->request().getMethod() == HttpRequest::kPost) {
        LOG_INFO << "POST " << fwd.targetUrl;
    }
    if (debug_) {
        LOG_INFO << "Handling " << fwd.targetUrl;
    }

    protocol::FetchRequest request;
    request.method = fwd.method;
    request.url = fwd.url;
    request.headers.swap(fwd.headers);
    request.body.swap(fwd.body);

    auto fetcher = std::make_shared<HttpFetcher>(exchange->loop(), tls_, resolver_);
    // Set once the response head has been written to the client.
    auto streaming = std::make_shared<bool>(false);

    fetcher->setResponseCallback([exchange, streaming](const protocol::FetchResponseHead& head) {
        HttpResponse resp(false);
        resp.setStatusCode(head.status);
        resp.setStatusMessage(head.reason);
        for (const auto& kv : SanitizeResponseHeaders(head.headers)) {
            resp.addHeader(kv.first, kv.second);
        }
        *streaming = true;
        exchange->BeginStream(resp, head.contentLength);
    });
    fetcher->setBodyCallback([exchange](const char* data, size_t len) {
        return exchange->WriteBody(data, len);
    });
    fetcher->setCompleteCallback([exchange]() {
        exchange->EndStream();
    });
    fetcher->setErrorCallback([exchange, streaming](const std::string& message) {
        if (*streaming) {
            exchange->Abort();
        } else {
            RespondError(exchange, message);
        }
    });

    std::weak_ptr<HttpFetcher> weakFetcher(fetcher);
    exchange->SetFlowCallback([weakFetcher](protocol::HttpExchange::Flow flow) {
        auto fetcher = weakFetcher.lock();
        if (!fetcher) return;
        switch (flow) {
            case protocol::HttpExchange::kPause:
                fetcher->PauseReading();
                break;
            case protocol::HttpExchange::kResume:
                fetcher->ResumeReading();
                break;
            case protocol::HttpExchange::kClientGone:
                LOG_DEBUG << "Client left, cancelling fetch";
                fetcher->Cancel();
                break;
        }
    }, highWaterMark_);
    fetcher->Fetch(request);
}

} // namespace gateway
} // namespace haven
