#pragma once

#include "haven/common/noncopyable.h"
#include "haven/protocol/HttpExchange.h"
#include "haven/protocol/Url.h"

#include <string>

namespace haven {
namespace network {
class Resolver;
class TlsContext;
}
namespace gateway {

struct GatewayConfig;

// Upgrades a client request to a WebSocket and relays it to the URL given in
// its "url" query parameter. Requests that are not WebSocket upgrades get a
// plain 200 "Not a WS connection".
class RelayHandler : haven::common::noncopyable {
public:
    // tls is used for wss targets and may be null.
    RelayHandler(const GatewayConfig& config,
                 const haven::network::TlsContext* tls,
                 haven::network::Resolver* resolver);

    void Handle(const protocol::HttpExchangePtr& exchange);

    // GET with "Upgrade: websocket", an "upgrade" Connection token and a key.
    static bool IsUpgradeRequest(const protocol::HttpRequest& req);
    // First subprotocol the client offered, empty when none.
    static std::string OfferedSubprotocol(const protocol::HttpRequest& req);
    // Parses a relay target; http and https are mapped to ws and wss.
    static bool ParseTarget(const std::string& text, protocol::Url* out, std::string* err);

private:
    const bool debug_;
    const size_t highWaterMark_;
    const int closeTimeoutMs_;
    const haven::network::TlsContext* tls_;
    haven::network::Resolver* resolver_;
};

} // namespace gateway
} // namespace haven
