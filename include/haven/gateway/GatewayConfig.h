#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace haven {
namespace common {
class Config;
}
namespace gateway {

// Settings snapshot taken once at startup; never modified afterwards.
struct GatewayConfig {
    uint16_t listenPort = 8080;
    int threads = 0;

    std::string forwardPath = "/fetch";
    std::string relayPrefix = "/fetchWs";
    bool debug = false;
    bool verifyUpstreamTls = true;
    std::string caFile;
    // Bytes queued toward one side before reading from the other pauses.
    size_t highWaterMark = 1024 * 1024;
    int resolverThreads = 2;
    int wsCloseTimeoutMs = 5000;

    std::string siteDir = "./site";
    std::string blockedDir = "./blocked";
    bool requireUnlock = false;
    std::string unlockKey = "unlock";
    std::string swPrefix = "/go/";

    bool tlsEnable = false;
    std::string tlsCertPath;
    std::string tlsKeyPath;

    static GatewayConfig FromConfig(const haven::common::Config& conf);

    // Empty when the settings are usable, otherwise what is wrong.
    std::string Validate() const;
};

} // namespace gateway
} // namespace haven
