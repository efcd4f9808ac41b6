#include "haven/protocol/HttpResponseContext.h"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include <cstring>

namespace haven {
namespace protocol {

namespace {

const size_t kMaxChunkLine = 1024;

bool AllDigits(const std::string& s) {
    return !s.empty() && std::all_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // namespace

void HttpResponseContext::reset() {
    step_ = kStatusLine;
    line_.clear();
    headBytes_ = 0;
    error_.clear();
    minorVersion_ = 1;
    statusCode_ = 0;
    reason_.clear();
    headers_.clear();
    keepAlive_ = false;
    chunked_ = false;
    contentLength_ = -1;
    remaining_ = 0;
}

bool HttpResponseContext::fail(const std::string& why) {
    step_ = kFailed;
    error_ = why;
    return false;
}

bool HttpResponseContext::lineStep() const {
    return step_ == kStatusLine || step_ == kHeaderLines || step_ == kChunkSize ||
           step_ == kChunkEnd || step_ == kTrailers;
}

bool HttpResponseContext::feed(const char* data, size_t len, size_t* consumed) {
    size_t off = 0;
    while (off < len && step_ != kComplete && step_ != kFailed) {
        if (lineStep()) {
            if (!takeLine(data, len, &off)) break;
            std::string line;
            line.swap(line_);
            line.pop_back();
            if (!line.empty() && line.back() == '\r') line.pop_back();
            if (!onLine(line)) break;
        } else {
            off += takeBody(data + off, len - off);
        }
    }
    if (consumed) *consumed = off;
    return step_ == kComplete;
}

bool HttpResponseContext::takeLine(const char* data, size_t len, size_t* off) {
    const char* begin = data + *off;
    const char* lf = static_cast<const char*>(std::memchr(begin, '\n', len - *off));
    const size_t n = lf ? static_cast<size_t>(lf - begin) + 1 : len - *off;
    line_.append(begin, n);
    *off += n;

    const bool inHead = step_ == kStatusLine || step_ == kHeaderLines || step_ == kTrailers;
    if (inHead) {
        headBytes_ += n;
        if (headBytes_ > kMaxHeaderBytes) {
            return fail(step_ == kTrailers ? "chunked trailer too large" : "response head too large");
        }
    } else if (line_.size() > kMaxChunkLine) {
        return fail("chunk size line too long");
    }
    return lf != nullptr;
}

bool HttpResponseContext::onLine(const std::string& line) {
    switch (step_) {
        case kStatusLine:
            return onStatusLine(line);
        case kHeaderLines: {
            if (line.empty()) return onHeadComplete();
            const size_t colon = line.find(':');
            // Lines without a usable name are skipped.
            if (colon != std::string::npos && colon > 0) {
                headers_.emplace_back(line.substr(0, colon), TrimOws(line.substr(colon + 1)));
            }
            return true;
        }
        case kChunkSize:
            return onChunkSize(line);
        case kChunkEnd:
            if (!line.empty()) return fail("missing CRLF after chunk");
            step_ = kChunkSize;
            return true;
        case kTrailers:
            // Trailer fields are dropped.
            if (line.empty()) step_ = kComplete;
            return true;
        default:
            return true;
    }
}

// HTTP/1.x SP 3DIGIT [SP reason]
bool HttpResponseContext::onStatusLine(const std::string& line) {
    if (line.compare(0, 5, "HTTP/") != 0) return fail("malformed status line");
    const size_t sp1 = line.find(' ');
    if (sp1 == std::string::npos) return fail("malformed status line");

    const std::string version = line.substr(5, sp1 - 5);
    const size_t dot = version.find('.');
    if (dot == std::string::npos || !AllDigits(version.substr(0, dot)) || !AllDigits(version.substr(dot + 1))) {
        return fail("malformed HTTP version");
    }
    minorVersion_ = std::atoi(version.c_str() + dot + 1);

    const size_t sp2 = std::min(line.find(' ', sp1 + 1), line.size());
    const std::string code = line.substr(sp1 + 1, sp2 - sp1 - 1);
    if (code.size() != 3 || !AllDigits(code)) return fail("malformed status code");
    statusCode_ = std::atoi(code.c_str());
    reason_ = sp2 < line.size() ? line.substr(sp2 + 1) : std::string();
    step_ = kHeaderLines;
    return true;
}

bool HttpResponseContext::onHeadComplete() {
    if (statusCode_ >= 100 && statusCode_ < 200 && statusCode_ != 101) {
        // Interim head; the final one follows on the same stream.
        const BodyCallback cb = bodyCallback_;
        const bool noBody = expectNoBody_;
        reset();
        bodyCallback_ = cb;
        expectNoBody_ = noBody;
        return true;
    }

    const std::string* te = FindHeader(headers_, "Transfer-Encoding");
    const std::string* cl = FindHeader(headers_, "Content-Length");
    const std::string* connection = FindHeader(headers_, "Connection");

    chunked_ = te && HeaderHasToken(*te, "chunked");
    if (cl && !chunked_) {
        char* end = nullptr;
        const long long n = std::strtoll(cl->c_str(), &end, 10);
        if (end == cl->c_str() || n < 0) return fail("invalid Content-Length");
        contentLength_ = n;
    }
    if (minorVersion_ == 0) {
        keepAlive_ = connection && HeaderHasToken(*connection, "keep-alive");
    } else {
        keepAlive_ = !(connection && HeaderHasToken(*connection, "close"));
    }

    if (expectNoBody_ || statusCode_ < 200 || statusCode_ == 204 || statusCode_ == 304) {
        step_ = kComplete;
    } else if (chunked_) {
        step_ = kChunkSize;
    } else if (contentLength_ >= 0) {
        remaining_ = static_cast<size_t>(contentLength_);
        step_ = remaining_ > 0 ? kFixedBody : kComplete;
    } else {
        step_ = kUntilClose;
        keepAlive_ = false;
    }
    return true;
}

bool HttpResponseContext::onChunkSize(const std::string& line) {
    std::string size = line.substr(0, line.find(';'));
    size = TrimOws(size);
    if (size.empty()) return fail("empty chunk size");
    char* end = nullptr;
    const unsigned long long n = std::strtoull(size.c_str(), &end, 16);
    if (*end != '\0' || size[0] == '-' || size[0] == '+') return fail("invalid chunk size");

    remaining_ = static_cast<size_t>(n);
    if (remaining_ == 0) {
        headBytes_ = 0;
        step_ = kTrailers;
    } else {
        step_ = kChunkData;
    }
    return true;
}

size_t HttpResponseContext::takeBody(const char* data, size_t len) {
    const size_t n = step_ == kUntilClose ? len : std::min(remaining_, len);
    if (step_ != kUntilClose) {
        remaining_ -= n;
        if (remaining_ == 0) {
            step_ = step_ == kChunkData ? kChunkEnd : kComplete;
        }
    }
    if (n > 0 && bodyCallback_) bodyCallback_(data, n);
    return n;
}

void HttpResponseContext::onEof() {
    if (step_ == kUntilClose) {
        step_ = kComplete;
    } else if (step_ == kStatusLine || step_ == kHeaderLines) {
        fail("connection closed before a complete response head");
    } else if (step_ != kComplete && step_ != kFailed) {
        fail("connection closed before the response body ended");
    }
}

} // namespace protocol
} // namespace haven
