#pragma once

#include <string>

#include "haven/network/Buffer.h"
#include "haven/protocol/HttpHeaders.h"

namespace haven {
namespace protocol {

class HttpResponse {
public:
    enum HttpStatusCode {
        kUnknown,
        k101SwitchingProtocols = 101,
        k200Ok = 200,
        k204NoContent = 204,
        k301MovedPermanently = 301,
        k304NotModified = 304,
        k400BadRequest = 400,
        k404NotFound = 404,
        k405MethodNotAllowed = 405,
        k431RequestHeaderFieldsTooLarge = 431,
        k500InternalServerError = 500,
    };

    // How the body that follows the header block is delimited.
    enum BodyFraming {
        kFixedLength,
        kChunked,
        kUntilClose,
        kNoBody,
    };

    explicit HttpResponse(bool close)
        : statusCode_(kUnknown), closeConnection_(close), headOnly_(false) {}

    void setStatusCode(int code) { statusCode_ = code; }
    int statusCode() const { return statusCode_; }
    void setStatusMessage(const std::string& message) { statusMessage_ = message; }
    const std::string& statusMessage() const { return statusMessage_; }
    void setCloseConnection(bool on) { closeConnection_ = on; }
    bool closeConnection() const { return closeConnection_; }
    void setContentType(const std::string& contentType) { setHeader("Content-Type", contentType); }

    // Appends, so repeated fields such as Set-Cookie survive.
    void addHeader(const std::string& key, const std::string& value) {
        headers_.emplace_back(key, value);
    }
    void setHeader(const std::string& key, const std::string& value) { SetHeader(&headers_, key, value); }
    void removeHeader(const std::string& key) { RemoveHeader(&headers_, key); }
    std::string getHeader(const std::string& key) const {
        const std::string* v = FindHeader(headers_, key);
        return v ? *v : std::string();
    }
    const HeaderList& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    const std::string& body() const { return body_; }

    // Answer to HEAD: Content-Length describes the body, which is not sent.
    void setHeadOnly(bool on) { headOnly_ = on; }
    bool headOnly() const { return headOnly_; }

    // Whole message with Content-Length framing.
    void appendToBuffer(haven::network::Buffer* output) const;

    // Status line and header block only. contentLength is used with kFixedLength.
    void appendHeadToBuffer(haven::network::Buffer* output, BodyFraming framing, long long contentLength) const;

    // 1xx, 204 and 304 never carry a body.
    static bool StatusHasBody(int code) {
        return !(code < 200 || code == 204 || code == 304);
    }
    static const char* ReasonPhrase(int code);

private:
    int statusCode_;
    std::string statusMessage_;
    bool closeConnection_;
    bool headOnly_;
    HeaderList headers_;
    std::string body_;
};

} // namespace protocol
} // namespace haven
