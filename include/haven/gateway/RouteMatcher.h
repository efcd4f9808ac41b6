#pragma once

#include <string>

namespace haven {
namespace gateway {

struct GatewayConfig;

// Classifies request paths. Check IsForwardPath first, then IsRelayPath.
class RouteMatcher {
public:
    explicit RouteMatcher(const GatewayConfig& config);
    RouteMatcher(const std::string& forwardPath, const std::string& relayPrefix);

    // Exact match on the forward path; "/fetch/x" is not a forward path.
    bool IsForwardPath(const std::string& path) const { return path == forwardPath_; }
    // Anything under the relay prefix, the prefix itself included.
    bool IsRelayPath(const std::string& path) const {
        return path.compare(0, relayPrefix_.size(), relayPrefix_) == 0;
    }

private:
    const std::string forwardPath_;
    const std::string relayPrefix_;
};

} // namespace gateway
} // namespace haven
