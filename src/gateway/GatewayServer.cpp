#include "haven/gateway/GatewayServer.h"
#include "haven/network/InetAddress.h"
#include "haven/common/Logger.h"

namespace haven {
namespace gateway {

using protocol::HttpExchangePtr;
using protocol::HttpRequest;
using protocol::HttpResponse;

GatewayServer::GatewayServer(haven::network::EventLoop* loop,
                             const GatewayConfig& config,
                             const std::string& name)
    : config_(config),
      server_(loop, haven::network::InetAddress(config.listenPort), name),
      resolver_(config_.resolverThreads, name.substr(0, 8) + "-dns"),
      routes_(config_),
      gate_(config_.requireUnlock, config_.unlockKey),
      site_(config_.siteDir, true, true),
      blocked_(config_.blockedDir, false, true),
      forward_(config_, &upstreamTls_, &resolver_),
      relay_(config_, &upstreamTls_, &resolver_) {
    server_.setExchangeCallback(
        std::bind(&GatewayServer::onExchange, this, std::placeholders::_1));
}

GatewayServer::~GatewayServer() {
    // Lookups in flight post back to I/O loops that go away with server_.
    resolver_.Stop();
}

bool GatewayServer::Init() {
    if (!upstreamTls_.InitClient(config_.verifyUpstreamTls, config_.caFile)) {
        // Plain http and ws targets keep working.
        LOG_WARN << "Upstream TLS unavailable, https and wss targets will fail: "
                 << haven::network::TlsContext::LastErrorString();
    }
    if (config_.tlsEnable) {
        if (!server_.enableTls(config_.tlsCertPath, config_.tlsKeyPath)) {
            LOG_ERROR << "Failed to enable TLS with cert=" << config_.tlsCertPath
                      << " key=" << config_.tlsKeyPath;
            return false;
        }
        LOG_INFO << "TLS enabled: cert=" << config_.tlsCertPath;
    }
    server_.setThreadNum(config_.threads);
    return true;
}

void GatewayServer::Start() {
    LOG_INFO << "Gateway site=" << config_.siteDir
             << " forward=" << config_.forwardPath
             << " relay=" << config_.relayPrefix
             << " require_unlock=" << (config_.requireUnlock ? "on" : "off");
    server_.start();
}

void GatewayServer::onExchange(const HttpExchangePtr& exchange) {
    const HttpRequest& req = exchange->request();

    if (!gate_.Allow(req)) {
        HttpResponse blocked = blocked_.Serve(req);
        // Only pages are swapped out; assets still come from the site.
        if (blocked.getHeader("Content-Type").find("text/html") != std::string::npos) {
            exchange->Respond(blocked);
            return;
        }
    }

    const std::string& path = req.path();
    if (routes_.IsForwardPath(path)) {
        forward_.Handle(exchange);
        return;
    }
    if (routes_.IsRelayPath(path)) {
        relay_.Handle(exchange);
        return;
    }
    if (!config_.swPrefix.empty() && path.compare(0, config_.swPrefix.size(), config_.swPrefix) == 0) {
        HttpResponse resp(false);
        resp.setStatusCode(HttpResponse::k404NotFound);
        resp.setContentType("text/plain; charset=utf-8");
        resp.setBody("Failed to start the service worker");
        exchange->Respond(resp);
        return;
    }

    HttpResponse resp = site_.Serve(req);
    if (UnlockGate::HasUnlockCode(req)) {
        resp.setHeader("Set-Cookie", gate_.UnlockCookie());
    }
    exchange->Respond(resp);
}

} // namespace gateway
} // namespace haven
