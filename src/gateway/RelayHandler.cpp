#include "haven/gateway/RelayHandler.h"
#include "haven/gateway/GatewayConfig.h"
#include "haven/gateway/RelaySession.h"
#include "haven/protocol/WebSocketCodec.h"
#include "haven/network/TcpConnection.h"
#include "haven/common/Logger.h"

namespace haven {
namespace gateway {

using protocol::HttpExchangePtr;
using protocol::HttpRequest;
using protocol::HttpResponse;

RelayHandler::RelayHandler(const GatewayConfig& config,
                           const haven::network::TlsContext* tls,
                           haven::network::Resolver* resolver)
    : debug_(config.debug),
      highWaterMark_(config.highWaterMark),
      closeTimeoutMs_(config.wsCloseTimeoutMs),
      tls_(tls),
      resolver_(resolver) {
}

bool RelayHandler::IsUpgradeRequest(const HttpRequest& req) {
    return req.getMethod() == HttpRequest::kGet &&
           protocol::HeaderHasToken(req.getHeader("Upgrade"), "websocket") &&
           protocol::HeaderHasToken(req.getHeader("Connection"), "upgrade") &&
           !protocol::TrimOws(req.getHeader("Sec-WebSocket-Key")).empty();
}

std::string RelayHandler::OfferedSubprotocol(const HttpRequest& req) {
    const std::string offered = req.getHeader("Sec-WebSocket-Protocol");
    return protocol::TrimOws(offered.substr(0, offered.find(',')));
}

bool RelayHandler::ParseTarget(const std::string& text, protocol::Url* out, std::string* err) {
    if (text.empty()) {
        *err = "Invalid URL: missing url parameter";
        return false;
    }
    if (!protocol::Url::Parse(text, out, err)) {
        return false;
    }
    if (out->scheme == "http") {
        out->scheme = "ws";
    } else if (out->scheme == "https") {
        out->scheme = "wss";
    }
    return true;
}

void RelayHandler::Handle(const HttpExchangePtr& exchange) {
    const HttpRequest& req = exchange->request();
    if (!IsUpgradeRequest(req)) {
        HttpResponse resp(false);
        resp.setStatusCode(HttpResponse::k200Ok);
        resp.setContentType("text/plain; charset=utf-8");
        resp.setBody("Not a WS connection");
        exchange->Respond(resp);
        return;
    }

    std::string target;
    protocol::GetQueryParam(req.query(), "url", &target);
    // Only the first offer goes upstream, so the 101 sent below before the
    // upstream answers cannot promise a protocol the upstream then refuses.
    const std::string subprotocol = OfferedSubprotocol(req);
    if (debug_) {
        LOG_INFO << "Handling WS " << target;
    }

    HttpResponse switching(false);
    switching.setStatusCode(HttpResponse::k101SwitchingProtocols);
    switching.setHeader("Upgrade", "websocket");
    switching.setHeader("Connection", "Upgrade");
    switching.setHeader("Sec-WebSocket-Accept",
                        protocol::ws::ComputeAcceptKey(protocol::TrimOws(req.getHeader("Sec-WebSocket-Key"))));
    if (!subprotocol.empty()) {
        switching.setHeader("Sec-WebSocket-Protocol", subprotocol);
    }

    haven::network::TcpConnectionPtr conn = exchange->Upgrade(switching);
    if (!conn) {
        LOG_DEBUG << "Client left before the relay to " << target << " started";
        return;
    }
    auto session = std::make_shared<RelaySession>(conn, target, subprotocol, tls_, resolver_, highWaterMark_);
    session->setCloseTimeout(closeTimeoutMs_);
    session->Start();
}

} // namespace gateway
} // namespace haven
