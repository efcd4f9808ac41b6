#pragma once

#include "haven/protocol/HttpRequest.h"
#include "haven/network/Buffer.h"

#include <chrono>

namespace haven {
namespace protocol {

// Incremental HTTP/1.x request parser. Bytes are consumed from the buffer as
// they are parsed, so a pipelined request stays in the buffer untouched.
//
// Request bodies are framed by Transfer-Encoding (chunked must be the final
// coding) or Content-Length, and are otherwise empty.
class HttpContext {
public:
    enum HttpRequestParseState {
        kExpectRequestLine,
        kExpectHeaders,
        kExpectBody,
        kGotAll,
    };

    // Request line plus header fields, and separately the decoded body.
    static const size_t kMaxHeaderBytes = 64 * 1024;
    static const size_t kMaxBodyBytes = 64 * 1024 * 1024;

    HttpContext() { reset(); }

    // Consumes what it can. False once the input cannot be a valid request;
    // the context is then unusable until reset().
    bool parseRequest(haven::network::Buffer* buf, std::chrono::system_clock::time_point receiveTime);

    bool gotAll() const { return state_ == kGotAll; }
    HttpRequestParseState state() const { return state_; }
    std::chrono::system_clock::time_point receiveTime() const { return receiveTime_; }

    void reset();

    const HttpRequest& request() const { return request_; }
    HttpRequest& request() { return request_; }

private:
    // Each step returns false on a protocol error and sets *progress when it
    // consumed input and the state machine should run again.
    bool parseRequestLine(haven::network::Buffer* buf, bool* progress);
    bool parseHeaderLine(haven::network::Buffer* buf, bool* progress);
    bool parseFixedBody(haven::network::Buffer* buf, bool* progress);
    bool parseChunkSize(haven::network::Buffer* buf, bool* progress);
    bool parseChunkData(haven::network::Buffer* buf, bool* progress);
    bool parseTrailers(haven::network::Buffer* buf, bool* progress);

    bool applyRequestLine(const char* begin, const char* end);
    bool selectBodyFraming();

    enum BodyStep { kFixed, kChunkSize, kChunkData, kTrailers };

    HttpRequestParseState state_;
    HttpRequest request_;
    std::chrono::system_clock::time_point receiveTime_;

    BodyStep bodyStep_;
    size_t remaining_;
    size_t headerBytes_;
};

} // namespace protocol
} // namespace haven
