#pragma once

#include "haven/common/noncopyable.h"
#include "haven/protocol/HttpExchange.h"
#include "haven/protocol/HttpHeaders.h"
#include "haven/protocol/Url.h"

#include <string>

namespace haven {
namespace network {
class Resolver;
class TlsContext;
}
namespace gateway {

struct GatewayConfig;

// What the caller asked to be fetched, taken from the x-url and x-headers
// fields of the inbound request.
struct ForwardRequest {
    std::string method;
    std::string targetUrl;
    protocol::Url url;
    protocol::HeaderList headers;
    // Only POST bodies are forwarded.
    std::string body;
};

// Replays an inbound request against the URL it names and streams the
// upstream answer back with caching disabled. Every failure becomes a 500
// carrying the error message, unless the response head already went out, in
// which case the client connection is dropped. A client that reads slower
// than the upstream sends pauses the upstream instead of buffering its body.
class ForwardHandler : haven::common::noncopyable {
public:
    // tls is used for https targets and may be null.
    ForwardHandler(const GatewayConfig& config,
                   const haven::network::TlsContext* tls,
                   haven::network::Resolver* resolver);

    void Handle(const protocol::HttpExchangePtr& exchange);

    static bool BuildForwardRequest(const protocol::HttpRequest& req, ForwardRequest* out, std::string* err);

    // Upstream headers minus age, cache-control, expires and the framing
    // fields, names lower-cased, plus "cache-control: no-cache".
    static protocol::HeaderList SanitizeResponseHeaders(const protocol::HeaderList& upstream);

private:
    static void RespondError(const protocol::HttpExchangePtr& exchange, const std::string& message);

    const bool debug_;
    const size_t highWaterMark_;
    const haven::network::TlsContext* tls_;
    haven::network::Resolver* resolver_;
};

} // namespace gateway
} // namespace haven
