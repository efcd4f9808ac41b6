#include "haven/protocol/JsonHeaders.h"

#include <cctype>
#include <cstring>

namespace haven {
namespace protocol {

namespace {

bool IsTokenChar(unsigned char c) {
    return std::isalnum(c) || std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

void AppendUtf8(unsigned long cp, std::string* out) {
    if (cp < 0x80) {
        out->push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
        out->push_back(static_cast<char>(0xC0 | (cp >> 6)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
        out->push_back(static_cast<char>(0xE0 | (cp >> 12)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
        out->push_back(static_cast<char>(0xF0 | (cp >> 18)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
        out->push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
}

class Reader {
public:
    Reader(const std::string& text, std::string* err) : s_(text), err_(err) {}

    bool parseObject(HeaderList* out) {
        skipWs();
        if (!expect('{', "expected '{'")) return false;
        skipWs();
        if (peek() == '}') {
            ++pos_;
            return finish();
        }
        while (true) {
            skipWs();
            std::string name;
            if (peek() != '"') return fail("expected a member name");
            if (!parseString(&name)) return false;
            skipWs();
            if (!expect(':', "expected ':'")) return false;
            skipWs();
            std::string value;
            if (!parseScalar(name, &value)) return false;
            if (!checkHeader(name, value)) return false;
            SetHeader(out, name, value);
            skipWs();
            if (peek() == ',') {
                ++pos_;
                continue;
            }
            if (!expect('}', "expected ',' or '}'")) return false;
            return finish();
        }
    }

private:
    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }
    bool atEnd() const { return pos_ >= s_.size(); }

    void skipWs() {
        while (!atEnd() && (s_[pos_] == ' ' || s_[pos_] == '\t' || s_[pos_] == '\n' || s_[pos_] == '\r')) ++pos_;
    }

    bool fail(const char* what) {
        *err_ = std::string("Invalid x-headers JSON at position ") + std::to_string(pos_) + ": " + what;
        return false;
    }

    bool expect(char c, const char* what) {
        if (peek() != c || atEnd()) return fail(what);
        ++pos_;
        return true;
    }

    bool finish() {
        skipWs();
        if (!atEnd()) return fail("unexpected data after the object");
        return true;
    }

    bool parseHex4(unsigned long* out) {
        if (pos_ + 4 > s_.size()) return fail("truncated \\u escape");
        unsigned long v = 0;
        for (int i = 0; i < 4; ++i) {
            const char c = s_[pos_++];
            v <<= 4;
            if (c >= '0' && c <= '9') v |= static_cast<unsigned long>(c - '0');
            else if (c >= 'a' && c <= 'f') v |= static_cast<unsigned long>(c - 'a' + 10);
            else if (c >= 'A' && c <= 'F') v |= static_cast<unsigned long>(c - 'A' + 10);
            else return fail("bad \\u escape");
        }
        *out = v;
        return true;
    }

    bool parseString(std::string* out) {
        ++pos_; // opening quote
        while (true) {
            if (atEnd()) return fail("unterminated string");
            const unsigned char c = static_cast<unsigned char>(s_[pos_++]);
            if (c == '"') return true;
            if (c < 0x20) return fail("control character in string");
            if (c != '\\') {
                out->push_back(static_cast<char>(c));
                continue;
            }
            if (atEnd()) return fail("unterminated escape");
            const char e = s_[pos_++];
            switch (e) {
                case '"': out->push_back('"'); break;
                case '\\': out->push_back('\\'); break;
                case '/': out->push_back('/'); break;
                case 'b': out->push_back('\b'); break;
                case 'f': out->push_back('\f'); break;
                case 'n': out->push_back('\n'); break;
                case 'r': out->push_back('\r'); break;
                case 't': out->push_back('\t'); break;
                case 'u': {
                    unsigned long cp = 0;
                    if (!parseHex4(&cp)) return false;
                    if (cp >= 0xD800 && cp <= 0xDBFF && s_.compare(pos_, 2, "\\u") == 0) {
                        pos_ += 2;
                        unsigned long lo = 0;
                        if (!parseHex4(&lo)) return false;
                        if (lo < 0xDC00 || lo > 0xDFFF) return fail("bad surrogate pair");
                        cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
                    }
                    AppendUtf8(cp, out);
                    break;
                }
                default:
                    return fail("bad escape");
            }
        }
    }

    bool parseNumber(std::string* out) {
        const size_t start = pos_;
        if (peek() == '-') ++pos_;
        if (peek() == '0') {
            ++pos_;
        } else if (std::isdigit(static_cast<unsigned char>(peek()))) {
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        } else {
            return fail("bad number");
        }
        if (peek() == '.') {
            ++pos_;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) return fail("bad number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') ++pos_;
            if (!std::isdigit(static_cast<unsigned char>(peek()))) return fail("bad number");
            while (std::isdigit(static_cast<unsigned char>(peek()))) ++pos_;
        }
        out->assign(s_, start, pos_ - start);
        return true;
    }

    bool parseLiteral(const char* word, std::string* out) {
        const size_t n = std::strlen(word);
        if (s_.compare(pos_, n, word) != 0) return fail("unexpected token");
        pos_ += n;
        out->assign(word);
        return true;
    }

    bool parseScalar(const std::string& name, std::string* out) {
        const char c = peek();
        if (c == '"') return parseString(out);
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber(out);
        if (c == 't') return parseLiteral("true", out);
        if (c == 'f') return parseLiteral("false", out);
        if (c == 'n') return parseLiteral("null", out);
        if (c == '{' || c == '[') {
            *err_ = "Invalid x-headers: value of \"" + name + "\" must be a string";
            return false;
        }
        return fail("unexpected token");
    }

    bool checkHeader(const std::string& name, const std::string& value) {
        if (name.empty()) {
            *err_ = "Invalid x-headers: empty header name";
            return false;
        }
        for (unsigned char c : name) {
            if (!IsTokenChar(c)) {
                *err_ = "Invalid x-headers: invalid header name \"" + name + "\"";
                return false;
            }
        }
        for (unsigned char c : value) {
            if (c == '\r' || c == '\n' || c == '\0') {
                *err_ = "Invalid x-headers: invalid value for header \"" + name + "\"";
                return false;
            }
        }
        return true;
    }

    const std::string& s_;
    std::string* err_;
    size_t pos_ = 0;
};

} // namespace

bool ParseHeaderObject(const std::string& json, HeaderList* out, std::string* err) {
    HeaderList parsed;
    Reader reader(json, err);
    if (!reader.parseObject(&parsed)) {
        return false;
    }
    out->swap(parsed);
    return true;
}

} // namespace protocol
} // namespace haven
