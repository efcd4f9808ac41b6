#include "haven/protocol/Url.h"
#include "haven/protocol/HttpHeaders.h"

#include <cctype>
#include <cstdlib>
#include <vector>

namespace haven {
namespace protocol {

namespace {

uint16_t DefaultPortFor(const std::string& scheme) {
    return (scheme == "https" || scheme == "wss") ? 443 : 80;
}

int HexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

// Removes "." and ".." segments (RFC 3986 section 5.2.4).
std::string RemoveDotSegments(const std::string& path) {
    std::vector<std::string> out;
    size_t pos = 1;
    bool trailingSlash = false;
    while (pos <= path.size()) {
        size_t slash = path.find('/', pos);
        if (slash == std::string::npos) slash = path.size();
        const std::string seg = path.substr(pos, slash - pos);
        trailingSlash = false;
        if (seg == "..") {
            if (!out.empty()) out.pop_back();
            trailingSlash = true;
        } else if (seg == ".") {
            trailingSlash = true;
        } else {
            out.push_back(seg);
        }
        pos = slash + 1;
    }
    std::string result;
    for (const auto& seg : out) {
        result += "/";
        result += seg;
    }
    if (result.empty() || trailingSlash) result += "/";
    return result;
}

} // namespace

bool Url::defaultPort() const {
    return port == DefaultPortFor(scheme);
}

std::string Url::hostHeader() const {
    std::string h = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    if (!defaultPort()) {
        h += ":" + std::to_string(port);
    }
    return h;
}

std::string Url::target() const {
    return query.empty() ? path : path + "?" + query;
}

std::string Url::toString() const {
    return scheme + "://" + hostHeader() + target();
}

bool Url::Parse(const std::string& text, Url* out, std::string* err) {
    const std::string invalid = "Invalid URL: " + text;
    const std::string trimmed = TrimOws(text);

    const size_t colon = trimmed.find("://");
    if (colon == std::string::npos || colon == 0) {
        *err = invalid;
        return false;
    }
    Url url;
    url.scheme = ToLowerAscii(trimmed.substr(0, colon));
    if (url.scheme != "http" && url.scheme != "https" && url.scheme != "ws" && url.scheme != "wss") {
        *err = "Unsupported URL scheme: " + url.scheme;
        return false;
    }

    size_t pos = colon + 3;
    const size_t authEnd = trimmed.find_first_of("/?#", pos);
    std::string authority = trimmed.substr(pos, authEnd == std::string::npos ? std::string::npos : authEnd - pos);
    if (authority.find('@') != std::string::npos) {
        *err = "URL includes credentials: " + text;
        return false;
    }

    std::string portText;
    if (!authority.empty() && authority[0] == '[') {
        const size_t close = authority.find(']');
        if (close == std::string::npos) {
            *err = invalid;
            return false;
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                *err = invalid;
                return false;
            }
            portText = authority.substr(close + 2);
        }
    } else {
        const size_t pc = authority.rfind(':');
        if (pc != std::string::npos) {
            url.host = authority.substr(0, pc);
            portText = authority.substr(pc + 1);
        } else {
            url.host = authority;
        }
    }
    url.host = ToLowerAscii(url.host);
    if (url.host.empty()) {
        *err = invalid;
        return false;
    }
    for (unsigned char c : url.host) {
        if (std::isspace(c) || c == '/' || c == '\\' || c == '%') {
            *err = invalid;
            return false;
        }
    }

    url.port = DefaultPortFor(url.scheme);
    if (!portText.empty()) {
        char* endp = nullptr;
        const long p = std::strtol(portText.c_str(), &endp, 10);
        if (*endp != '\0' || p <= 0 || p > 65535) {
            *err = invalid;
            return false;
        }
        url.port = static_cast<uint16_t>(p);
    }

    if (authEnd != std::string::npos) {
        std::string rest = trimmed.substr(authEnd);
        const size_t hash = rest.find('#');
        if (hash != std::string::npos) rest.resize(hash);
        const size_t q = rest.find('?');
        if (q != std::string::npos) {
            url.query = rest.substr(q + 1);
            rest.resize(q);
        }
        url.path = rest;
    }
    if (url.path.empty() || url.path[0] != '/') {
        url.path = "/" + url.path;
    }
    for (unsigned char c : url.path) {
        if (c <= 0x20 || c == 0x7f) {
            *err = invalid;
            return false;
        }
    }

    *out = url;
    return true;
}

bool Url::Resolve(const std::string& refText, Url* out, std::string* err) const {
    const std::string ref = TrimOws(refText);
    if (ref.find("://") != std::string::npos && ref.find("://") < ref.find_first_of("/?#")) {
        return Parse(ref, out, err);
    }
    if (ref.compare(0, 2, "//") == 0) {
        return Parse(scheme + ":" + ref, out, err);
    }

    Url url = *this;
    std::string rest = ref;
    const size_t hash = rest.find('#');
    if (hash != std::string::npos) rest.resize(hash);
    std::string newQuery;
    bool hasQuery = false;
    const size_t q = rest.find('?');
    if (q != std::string::npos) {
        newQuery = rest.substr(q + 1);
        hasQuery = true;
        rest.resize(q);
    }

    if (rest.empty()) {
        // Same path, maybe a new query.
        if (hasQuery) url.query = newQuery;
    } else if (rest[0] == '/') {
        url.path = RemoveDotSegments(rest);
        url.query = newQuery;
    } else {
        const size_t lastSlash = path.rfind('/');
        url.path = RemoveDotSegments(path.substr(0, lastSlash + 1) + rest);
        url.query = newQuery;
    }
    if (url.path.empty()) {
        *err = "Invalid redirect location: " + refText;
        return false;
    }
    *out = url;
    return true;
}

std::string PercentDecode(const std::string& s, bool plusAsSpace) {
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); ++i) {
        const char c = s[i];
        if (c == '%' && i + 2 < s.size() && HexValue(s[i + 1]) >= 0 && HexValue(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(HexValue(s[i + 1]) * 16 + HexValue(s[i + 2])));
            i += 2;
        } else if (c == '+' && plusAsSpace) {
            out.push_back(' ');
        } else {
            out.push_back(c);
        }
    }
    return out;
}

bool GetQueryParam(const std::string& query, const std::string& name, std::string* value) {
    size_t pos = (!query.empty() && query[0] == '?') ? 1 : 0;
    while (pos <= query.size()) {
        size_t amp = query.find('&', pos);
        if (amp == std::string::npos) amp = query.size();
        const std::string pair = query.substr(pos, amp - pos);
        const size_t eq = pair.find('=');
        const std::string key = PercentDecode(pair.substr(0, eq), true);
        if (!pair.empty() && key == name) {
            *value = eq == std::string::npos ? std::string() : PercentDecode(pair.substr(eq + 1), true);
            return true;
        }
        pos = amp + 1;
    }
    return false;
}

} // namespace protocol
} // namespace haven
