#include "haven/gateway/RouteMatcher.h"
#include "haven/gateway/GatewayConfig.h"

namespace haven {
namespace gateway {

RouteMatcher::RouteMatcher(const GatewayConfig& config)
    : forwardPath_(config.forwardPath),
      relayPrefix_(config.relayPrefix) {
}

RouteMatcher::RouteMatcher(const std::string& forwardPath, const std::string& relayPrefix)
    : forwardPath_(forwardPath),
      relayPrefix_(relayPrefix) {
}

} // namespace gateway
} // namespace haven
