#pragma once

#include <cstdint>
#include <string>

namespace haven {
namespace protocol {

// Absolute http, https, ws or wss URL. The fragment is dropped.
struct Url {
    std::string scheme; // lower case
    std::string host;   // lower case, no brackets
    uint16_t port = 0;
    std::string path;   // always begins with '/'
    std::string query;  // without the '?'

    bool secure() const { return scheme == "https" || scheme == "wss"; }
    bool defaultPort() const;

    // host, plus ":port" when the port is not the scheme default.
    std::string hostHeader() const;
    // Origin-form request target: path and query.
    std::string target() const;
    std::string toString() const;

    // Returns false and fills *err for anything that is not an absolute URL
    // with a supported scheme.
    static bool Parse(const std::string& text, Url* out, std::string* err);

    // Resolves a reference such as a Location value against this URL.
    bool Resolve(const std::string& ref, Url* out, std::string* err) const;
};

// %XX sequences are decoded; invalid ones are kept as is.
std::string PercentDecode(const std::string& s, bool plusAsSpace);

// Looks up name in a query string ("a=1&b=2", with or without the leading
// '?'). The value is percent-decoded with '+' as space.
bool GetQueryParam(const std::string& query, const std::string& name, std::string* value);

} // namespace protocol
} // namespace haven
