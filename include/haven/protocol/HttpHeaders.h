#pragma once

#include <string>
#include <utility>
#include <vector>

namespace haven {
namespace protocol {

// Header fields in wire order. Names keep their original case; duplicates
// (Set-Cookie) are allowed.
using HeaderList = std::vector<std::pair<std::string, std::string>>;

std::string ToLowerAscii(const std::string& s);
bool IEquals(const std::string& a, const std::string& b);

// Orders header names ignoring ASCII case.
struct CaseInsensitiveLess {
    bool operator()(const std::string& a, const std::string& b) const;
};

// True when the comma separated header value carries token (ASCII case ignored).
// "keep-alive, Upgrade" contains "upgrade".
bool HeaderHasToken(const std::string& value, const std::string& token);

// First value for name, or nullptr.
const std::string* FindHeader(const HeaderList& headers, const std::string& name);
// Removes every field called name. Returns how many were removed.
size_t RemoveHeader(HeaderList* headers, const std::string& name);
// Replaces all fields called name with a single one.
void SetHeader(HeaderList* headers, const std::string& name, const std::string& value);

// Strips leading and trailing spaces and tabs.
std::string TrimOws(const std::string& s);

} // namespace protocol
} // namespace haven
