#include "haven/protocol/HttpContext.h"
#include "haven/common/Logger.h"

#include <algorithm>
#include <cstdlib>

namespace haven {
namespace protocol {

using haven::network::Buffer;

namespace {

// Strict unsigned parse of the whole string in the given base.
bool ParseSize(const std::string& text, int base, size_t* out) {
    if (text.empty() || text[0] == '-' || text[0] == '+') return false;
    char* endp = nullptr;
    const unsigned long long v = std::strtoull(text.c_str(), &endp, base);
    if (endp != text.c_str() + text.size()) return false;
    *out = static_cast<size_t>(v);
    return true;
}

size_t LineLength(const Buffer* buf, const char* crlf) {
    return static_cast<size_t>(crlf - buf->Peek()) + 2;
}

} // namespace

void HttpContext::reset() {
    state_ = kExpectRequestLine;
    HttpRequest empty;
    request_.swap(empty);
    receiveTime_ = std::chrono::system_clock::time_point();
    bodyStep_ = kFixed;
    remaining_ = 0;
    headerBytes_ = 0;
}

bool HttpContext::parseRequest(Buffer* buf, std::chrono::system_clock::time_point receiveTime) {
    if (receiveTime_ == std::chrono::system_clock::time_point()) {
        receiveTime_ = receiveTime;
    }
    bool progress = true;
    while (progress && state_ != kGotAll) {
        progress = false;
        bool ok = true;
        switch (state_) {
            case kExpectRequestLine:
                ok = parseRequestLine(buf, &progress);
                break;
            case kExpectHeaders:
                ok = parseHeaderLine(buf, &progress);
                break;
            case kExpectBody:
                switch (bodyStep_) {
                    case kFixed: ok = parseFixedBody(buf, &progress); break;
                    case kChunkSize: ok = parseChunkSize(buf, &progress); break;
                    case kChunkData: ok = parseChunkData(buf, &progress); break;
                    case kTrailers: ok = parseTrailers(buf, &progress); break;
                }
                break;
            case kGotAll:
                break;
        }
        if (!ok) return false;
    }
    return true;
}

bool HttpContext::parseRequestLine(Buffer* buf, bool* progress) {
    const char* crlf = buf->FindCRLF();
    if (!crlf) {
        return buf->ReadableBytes() <= kMaxHeaderBytes;
    }
    if (!applyRequestLine(buf->Peek(), crlf)) {
        LOG_DEBUG << "malformed request line";
        return false;
    }
    headerBytes_ = LineLength(buf, crlf);
    buf->RetrieveUntil(crlf + 2);
    state_ = kExpectHeaders;
    *progress = true;
    return true;
}

// METHOD SP request-target SP HTTP/1.x
bool HttpContext::applyRequestLine(const char* begin, const char* end) {
    const char* sp1 = std::find(begin, end, ' ');
    if (sp1 == end || !request_.setMethod(begin, sp1)) return false;

    const char* target = sp1 + 1;
    const char* sp2 = std::find(target, end, ' ');
    if (sp2 == end || sp2 == target) return false;
    const char* question = std::find(target, sp2, '?');
    request_.setPath(target, question);
    if (question != sp2) request_.setQuery(question, sp2);

    const std::string version(sp2 + 1, end);
    if (version == "HTTP/1.1") {
        request_.setVersion(HttpRequest::kHttp11);
    } else if (version == "HTTP/1.0") {
        request_.setVersion(HttpRequest::kHttp10);
    } else {
        return false;
    }
    return true;
}

bool HttpContext::parseHeaderLine(Buffer* buf, bool* progress) {
    const char* crlf = buf->FindCRLF();
    if (!crlf) {
        return headerBytes_ + buf->ReadableBytes() <= kMaxHeaderBytes;
    }
    headerBytes_ += LineLength(buf, crlf);
    if (headerBytes_ > kMaxHeaderBytes) return false;

    if (crlf == buf->Peek()) {
        buf->Retrieve(2);
        *progress = true;
        return selectBodyFraming();
    }
    const char* colon = std::find(buf->Peek(), crlf, ':');
    if (colon == crlf || colon == buf->Peek()) {
        LOG_DEBUG << "malformed header line";
        return false;
    }
    request_.addHeader(buf->Peek(), colon, crlf);
    buf->RetrieveUntil(crlf + 2);
    *progress = true;
    return true;
}

bool HttpContext::selectBodyFraming() {
    remaining_ = 0;
    const std::string te = request_.getHeader("Transfer-Encoding");
    if (!te.empty()) {
        // Anything but a chunked final coding leaves the body length unknowable.
        if (!HeaderHasToken(te, "chunked")) return false;
        bodyStep_ = kChunkSize;
        state_ = kExpectBody;
        return true;
    }

    const std::string cl = request_.getHeader("Content-Length");
    if (!cl.empty() && (!ParseSize(cl, 10, &remaining_) || remaining_ > kMaxBodyBytes)) {
        return false;
    }
    bodyStep_ = kFixed;
    state_ = remaining_ > 0 ? kExpectBody : kGotAll;
    return true;
}

bool HttpContext::parseFixedBody(Buffer* buf, bool* progress) {
    const size_t n = std::min(remaining_, buf->ReadableBytes());
    request_.appendBody(buf->Peek(), n);
    buf->Retrieve(n);
    remaining_ -= n;
    if (remaining_ == 0) {
        state_ = kGotAll;
        *progress = true;
    }
    return true;
}

bool HttpContext::parseChunkSize(Buffer* buf, bool* progress) {
    const char* crlf = buf->FindCRLF();
    if (!crlf) {
        // A size line never needs more than a few dozen bytes.
        return buf->ReadableBytes() <= 1024;
    }
    std::string line(buf->Peek(), crlf);
    buf->RetrieveUntil(crlf + 2);

    const size_t semi = line.find(';');
    if (semi != std::string::npos) line.resize(semi);
    size_t size = 0;
    if (!ParseSize(TrimOws(line), 16, &size)) return false;
    if (size > kMaxBodyBytes || request_.body().size() + size > kMaxBodyBytes) return false;

    remaining_ = size;
    bodyStep_ = size == 0 ? kTrailers : kChunkData;
    headerBytes_ = 0;
    *progress = true;
    return true;
}

bool HttpContext::parseChunkData(Buffer* buf, bool* progress) {
    if (buf->ReadableBytes() < remaining_ + 2) return true;
    request_.appendBody(buf->Peek(), remaining_);
    buf->Retrieve(remaining_);
    if (!buf->StartsWith("\r\n", 2)) return false;
    buf->Retrieve(2);
    remaining_ = 0;
    bodyStep_ = kChunkSize;
    *progress = true;
    return true;
}

// Trailer fields are read and dropped line by line up to the empty line.
bool HttpContext::parseTrailers(Buffer* buf, bool* progress) {
    const char* crlf = buf->FindCRLF();
    if (!crlf) {
        return headerBytes_ + buf->ReadableBytes() <= kMaxHeaderBytes;
    }
    const bool last = crlf == buf->Peek();
    headerBytes_ += LineLength(buf, crlf);
    if (headerBytes_ > kMaxHeaderBytes) return false;
    buf->RetrieveUntil(crlf + 2);
    if (last) state_ = kGotAll;
    *progress = true;
    return true;
}

} // namespace protocol
} // namespace haven
