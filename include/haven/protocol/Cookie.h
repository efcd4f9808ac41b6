#pragma once

#include <string>

namespace haven {
namespace protocol {

// Looks up name in a Cookie request header ("a=1; b=2"). The first match
// wins and surrounding double quotes are removed from its value.
bool GetCookieValue(const std::string& cookieHeader, const std::string& name, std::string* value);

// "name=value; SameSite=None; Secure", so the cookie is also sent on
// cross-site requests.
std::string CrossSiteCookie(const std::string& name, const std::string& value);

} // namespace protocol
} // namespace haven
