#include "haven/protocol/HttpHeaders.h"

#include <algorithm>
#include <cctype>

namespace haven {
namespace protocol {

std::string ToLowerAscii(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) out.push_back(static_cast<char>(std::tolower(c)));
    return out;
}

bool IEquals(const std::string& a, const std::string& b) {
    if (a.size() != b.size()) return false;
    for (size_t i = 0; i < a.size(); ++i) {
        if (std::tolower(static_cast<unsigned char>(a[i])) !=
            std::tolower(static_cast<unsigned char>(b[i]))) {
            return false;
        }
    }
    return true;
}

bool CaseInsensitiveLess::operator()(const std::string& a, const std::string& b) const {
    return std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(),
        [](unsigned char x, unsigned char y) { return std::tolower(x) < std::tolower(y); });
}

std::string TrimOws(const std::string& s) {
    size_t i = 0;
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t')) ++i;
    size_t j = s.size();
    while (j > i && (s[j - 1] == ' ' || s[j - 1] == '\t')) --j;
    return s.substr(i, j - i);
}

bool HeaderHasToken(const std::string& value, const std::string& token) {
    size_t pos = 0;
    while (pos <= value.size()) {
        size_t comma = value.find(',', pos);
        if (comma == std::string::npos) comma = value.size();
        if (IEquals(TrimOws(value.substr(pos, comma - pos)), token)) return true;
        pos = comma + 1;
    }
    return false;
}

const std::string* FindHeader(const HeaderList& headers, const std::string& name) {
    for (const auto& kv : headers) {
        if (IEquals(kv.first, name)) return &kv.second;
    }
    return nullptr;
}

size_t RemoveHeader(HeaderList* headers, const std::string& name) {
    const size_t before = headers->size();
    headers->erase(std::remove_if(headers->begin(), headers->end(),
                                  [&name](const std::pair<std::string, std::string>& kv) {
                                      return IEquals(kv.first, name);
                                  }),
                   headers->end());
    return before - headers->size();
}

void SetHeader(HeaderList* headers, const std::string& name, const std::string& value) {
    RemoveHeader(headers, name);
    headers->emplace_back(name, value);
}

} // namespace protocol
} // namespace haven
