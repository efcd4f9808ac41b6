#include "haven/protocol/HttpResponse.h"

#include <cstdio>
#include <cstring>

namespace haven {
namespace protocol {

const char* HttpResponse::ReasonPhrase(int code) {
    switch (code) {
        case 100: return "Continue";
        case 101: return "Switching Protocols";
        case 200: return "OK";
        case 201: return "Created";
        case 202: return "Accepted";
        case 204: return "No Content";
        case 206: return "Partial Content";
        case 301: return "Moved Permanently";
        case 302: return "Found";
        case 303: return "See Other";
        case 304: return "Not Modified";
        case 307: return "Temporary Redirect";
        case 308: return "Permanent Redirect";
        case 400: return "Bad Request";
        case 401: return "Unauthorized";
        case 403: return "Forbidden";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Content Too Large";
        case 426: return "Upgrade Required";
        case 429: return "Too Many Requests";
        case 431: return "Request Header Fields Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 502: return "Bad Gateway";
        case 503: return "Service Unavailable";
        case 504: return "Gateway Timeout";
        default: return "";
    }
}

void HttpResponse::appendHeadToBuffer(haven::network::Buffer* output, BodyFraming framing, long long contentLength) const {
    char buf[64];
    snprintf(buf, sizeof buf, "HTTP/1.1 %d ", statusCode_);
    output->Append(buf, strlen(buf));
    output->Append(statusMessage_.empty() ? std::string(ReasonPhrase(statusCode_)) : statusMessage_);
    output->Append("\r\n");

    for (const auto& header : headers_) {
        // Framing is ours to decide.
        if (IEquals(header.first, "Content-Length") ||
            IEquals(header.first, "Transfer-Encoding")) {
            continue;
        }
        if (statusCode_ != k101SwitchingProtocols && IEquals(header.first, "Connection")) {
            continue;
        }
        output->Append(header.first);
        output->Append(": ");
        output->Append(header.second);
        output->Append("\r\n");
    }

    if (framing == kFixedLength) {
        snprintf(buf, sizeof buf, "Content-Length: %lld\r\n", contentLength);
        output->Append(buf, strlen(buf));
    } else if (framing == kChunked) {
        output->Append("Transfer-Encoding: chunked\r\n");
    }

    if (statusCode_ != k101SwitchingProtocols) {
        if (closeConnection_ || framing == kUntilClose) {
            output->Append("Connection: close\r\n");
        } else {
            output->Append("Connection: keep-alive\r\n");
        }
    }
    output->Append("\r\n");
}

void HttpResponse::appendToBuffer(haven::network::Buffer* output) const {
    if (!StatusHasBody(statusCode_)) {
        appendHeadToBuffer(output, kNoBody, 0);
        return;
    }
    appendHeadToBuffer(output, kFixedLength, static_cast<long long>(body_.size()));
    if (!headOnly_) {
        output->Append(body_);
    }
}

} // namespace protocol
} // namespace haven
