#include "haven/gateway/GatewayConfig.h"
#include "haven/common/Config.h"

namespace haven {
namespace gateway {

GatewayConfig GatewayConfig::FromConfig(const haven::common::Config& conf) {
    GatewayConfig c;
    c.listenPort = static_cast<uint16_t>(conf.GetInt("global", "listen_port", c.listenPort));
    c.threads = conf.GetInt("global", "threads", c.threads);

    c.forwardPath = conf.GetString("gateway", "forward_path", c.forwardPath);
    c.relayPrefix = conf.GetString("gateway", "relay_prefix", c.relayPrefix);
    c.debug = conf.GetBool("gateway", "debug", c.debug);
    c.verifyUpstreamTls = conf.GetBool("gateway", "verify_upstream_tls", c.verifyUpstreamTls);
    c.caFile = conf.GetString("gateway", "ca_file", c.caFile);
    const int markKb = conf.GetInt("gateway", "high_water_mark_kb", static_cast<int>(c.highWaterMark / 1024));
    c.highWaterMark = markKb > 0 ? static_cast<size_t>(markKb) * 1024 : 0;
    c.resolverThreads = conf.GetInt("gateway", "resolver_threads", c.resolverThreads);
    c.wsCloseTimeoutMs = conf.GetInt("gateway", "ws_close_timeout_ms", c.wsCloseTimeoutMs);

    c.siteDir = conf.GetString("site", "dir", c.siteDir);
    c.blockedDir = conf.GetString("site", "blocked_dir", c.blockedDir);
    c.requireUnlock = conf.GetBool("site", "require_unlock", c.requireUnlock);
    c.unlockKey = conf.GetString("site", "key", c.unlockKey);
    c.swPrefix = conf.GetString("site", "sw_prefix", c.swPrefix);

    c.tlsEnable = conf.GetBool("tls", "enable", c.tlsEnable);
    c.tlsCertPath = conf.GetString("tls", "cert_path", c.tlsCertPath);
    c.tlsKeyPath = conf.GetString("tls", "key_path", c.tlsKeyPath);
    return c;
}

std::string GatewayConfig::Validate() const {
    if (forwardPath.empty() || forwardPath[0] != '/') {
        return "gateway.forward_path must start with '/'";
    }
    if (relayPrefix.empty() || relayPrefix[0] != '/') {
        return "gateway.relay_prefix must start with '/'";
    }
    if (forwardPath == relayPrefix) {
        return "gateway.forward_path and gateway.relay_prefix must differ";
    }
    if (threads < 0) {
        return "global.threads must not be negative";
    }
    if (highWaterMark == 0) {
        return "gateway.high_water_mark_kb must be positive";
    }
    if (resolverThreads < 1) {
        return "gateway.resolver_threads must be at least 1";
    }
    if (wsCloseTimeoutMs <= 0) {
        return "gateway.ws_close_timeout_ms must be positive";
    }
    if (requireUnlock && unlockKey.empty()) {
        return "site.key must be set when site.require_unlock is on";
    }
    if (tlsEnable && (tlsCertPath.empty() || tlsKeyPath.empty())) {
        return "tls.cert_path and tls.key_path are required when tls.enable is on";
    }
    return std::string();
}

} // namespace gateway
} // namespace haven
