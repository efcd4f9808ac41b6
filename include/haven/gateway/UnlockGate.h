#pragma once

#include <string>

namespace haven {
namespace protocol {
class HttpRequest;
}
namespace gateway {

// Shared-secret check in front of the site.
class UnlockGate {
public:
    UnlockGate(bool requireUnlock, const std::string& key);

    // True when unlocking is off, the "key" cookie matches, the query starts
    // with "unlock", or the client is a Chromebook.
    bool Allow(const protocol::HttpRequest& req) const;

    static bool HasUnlockCode(const protocol::HttpRequest& req);

    // Set-Cookie value that unlocks later requests.
    std::string UnlockCookie() const;

    bool requireUnlock() const { return requireUnlock_; }

private:
    const bool requireUnlock_;
    const std::string key_;
};

} // namespace gateway
} // namespace haven
