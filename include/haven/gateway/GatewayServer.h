#pragma once

#include "haven/common/noncopyable.h"
#include "haven/gateway/ForwardHandler.h"
#include "haven/gateway/GatewayConfig.h"
#include "haven/gateway/RelayHandler.h"
#include "haven/gateway/RouteMatcher.h"
#include "haven/gateway/StaticFileHandler.h"
#include "haven/gateway/UnlockGate.h"
#include "haven/network/Resolver.h"
#include "haven/network/TlsContext.h"
#include "haven/protocol/HttpServer.h"

#include <string>

namespace haven {
namespace gateway {

// The site: unlock gate, forward and relay endpoints, then static files.
class GatewayServer : haven::common::noncopyable {
public:
    GatewayServer(haven::network::EventLoop* loop,
                  const GatewayConfig& config,
                  const std::string& name = "HavenGateway");
    ~GatewayServer();

    // Sets up TLS. False when inbound TLS is enabled but cannot be loaded.
    bool Init();
    void Start();

    const std::string& hostport() const { return server_.hostport(); }
    const GatewayConfig& config() const { return config_; }

private:
    void onExchange(const protocol::HttpExchangePtr& exchange);

    const GatewayConfig config_;
    protocol::HttpServer server_;
    haven::network::TlsContext upstreamTls_;
    haven::network::Resolver resolver_;
    RouteMatcher routes_;
    UnlockGate gate_;
    StaticFileHandler site_;
    StaticFileHandler blocked_;
    ForwardHandler forward_;
    RelayHandler relay_;
};

} // namespace gateway
} // namespace haven
