#pragma once

#include "haven/protocol/HttpHeaders.h"

#include <cstddef>
#include <functional>
#include <string>

namespace haven {
namespace protocol {

// Push parser for an HTTP/1.x response read from an upstream.
//
// Body framing follows the head: chunked, Content-Length, or (with neither)
// everything until the peer closes. Decoded body bytes go straight to the
// body callback and are never stored. Interim 1xx heads other than
// 101 Switching Protocols are skipped.
class HttpResponseContext {
public:
    using BodyCallback = std::function<void(const char* data, size_t len)>;

    static const size_t kMaxHeaderBytes = 64 * 1024;

    HttpResponseContext() { reset(); }

    void setBodyCallback(const BodyCallback& cb) { bodyCallback_ = cb; }
    // For HEAD: the response ends with its head whatever the headers say.
    void setExpectNoBody(bool on) { expectNoBody_ = on; }

    // Returns true once the response is complete. *consumed, when given, is
    // how many of the bytes belong to this response.
    bool feed(const char* data, size_t len, size_t* consumed = nullptr);
    // The peer closed. Only a read-until-close body ends cleanly here.
    void onEof();
    void reset();

    bool headersComplete() const { return step_ > kHeaderLines && step_ != kFailed; }
    bool gotAll() const { return step_ == kComplete; }
    bool hasError() const { return step_ == kFailed; }
    const std::string& errorMessage() const { return error_; }

    int statusCode() const { return statusCode_; }
    const std::string& reason() const { return reason_; }
    const HeaderList& headers() const { return headers_; }
    bool keepAlive() const { return keepAlive_; }
    bool chunked() const { return chunked_; }
    bool needsCloseToFinish() const { return step_ == kUntilClose; }
    // -1 when no Content-Length applies.
    long long contentLength() const { return contentLength_; }

private:
    enum Step {
        kStatusLine,
        kHeaderLines,
        kFixedBody,
        kUntilClose,
        kChunkSize,
        kChunkData,
        kChunkEnd,   // the CRLF closing a chunk
        kTrailers,
        kComplete,
        kFailed,
    };

    bool lineStep() const;
    // Collects bytes up to LF into line_; true once a full line is there.
    bool takeLine(const char* data, size_t len, size_t* off);
    bool onLine(const std::string& line);
    bool onStatusLine(const std::string& line);
    bool onHeadComplete();
    bool onChunkSize(const std::string& line);
    size_t takeBody(const char* data, size_t len);
    bool fail(const std::string& why);

    Step step_;
    std::string line_;
    size_t headBytes_;
    std::string error_;
    BodyCallback bodyCallback_;
    bool expectNoBody_ = false;

    int minorVersion_;
    int statusCode_;
    std::string reason_;
    HeaderList headers_;
    bool keepAlive_;
    bool chunked_;
    long long contentLength_;
    size_t remaining_;
};

} // namespace protocol
} // namespace haven
