#include "haven/protocol/Cookie.h"
#include "haven/protocol/HttpHeaders.h"

#include <algorithm>

namespace haven {
namespace protocol {

bool GetCookieValue(const std::string& cookieHeader, const std::string& name, std::string* value) {
    if (name.empty()) return false;

    size_t begin = 0;
    while (begin < cookieHeader.size()) {
        const size_t semi = std::min(cookieHeader.find(';', begin), cookieHeader.size());
        const std::string pair = cookieHeader.substr(begin, semi - begin);
        begin = semi + 1;

        const size_t eq = pair.find('=');
        if (eq == std::string::npos || TrimOws(pair.substr(0, eq)) != name) continue;

        std::string v = TrimOws(pair.substr(eq + 1));
        if (v.size() >= 2 && v.front() == '"' && v.back() == '"') {
            v = v.substr(1, v.size() - 2);
        }
        *value = v;
        return true;
    }
    return false;
}

std::string CrossSiteCookie(const std::string& name, const std::string& value) {
    return name + "=" + value + "; SameSite=None; Secure";
}

} // namespace protocol
} // namespace haven
