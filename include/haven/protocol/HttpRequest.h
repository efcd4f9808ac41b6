#pragma once

#include "haven/protocol/HttpHeaders.h"

#include <string>
#include <map>
#include <utility>
#include <cctype>
#include <cstddef>

namespace haven {
namespace protocol {

class HttpRequest {
public:
    enum Method {
        kInvalid, kGet, kPost, kHead, kPut, kDelete, kPatch, kOptions, kOther
    };

    enum Version {
        kUnknown, kHttp10, kHttp11
    };

    using HeaderMap = std::map<std::string, std::string, CaseInsensitiveLess>;

    HttpRequest() : method_(kInvalid), version_(kUnknown) {}

    void setVersion(Version v) { version_ = v; }
    Version getVersion() const { return version_; }

    // Any RFC 9110 token is accepted; unknown methods map to kOther and keep
    // their text so they can be forwarded as is.
    bool setMethod(const char* start, const char* end) {
        std::string m(start, end);
        if (m.empty()) {
            method_ = kInvalid;
            return false;
        }
        for (unsigned char c : m) {
            if (!std::isalnum(c) && std::string("!#$%&'*+-.^_`|~").find(static_cast<char>(c)) == std::string::npos) {
                method_ = kInvalid;
                return false;
            }
        }
        if (m == "GET") method_ = kGet;
        else if (m == "POST") method_ = kPost;
        else if (m == "HEAD") method_ = kHead;
        else if (m == "PUT") method_ = kPut;
        else if (m == "DELETE") method_ = kDelete;
        else if (m == "PATCH") method_ = kPatch;
        else if (m == "OPTIONS") method_ = kOptions;
        else method_ = kOther;
        methodText_ = std::move(m);
        return true;
    }

    Method getMethod() const { return method_; }
    const std::string& methodString() const { return methodText_; }

    void setPath(const char* start, const char* end) {
        path_.assign(start, end);
    }
    const std::string& path() const { return path_; }

    // Includes the leading '?', empty when the target has no query.
    void setQuery(const char* start, const char* end) {
        query_.assign(start, end);
    }
    const std::string& query() const { return query_; }

    // Repeated fields are folded into one comma separated value.
    void addHeader(const char* start, const char* colon, const char* end) {
        std::string field(start, colon);
        ++colon;
        while (colon < end && isspace(static_cast<unsigned char>(*colon))) {
            ++colon;
        }
        std::string value(colon, end);
        while (!value.empty() && isspace(static_cast<unsigned char>(value[value.size()-1]))) {
            value.resize(value.size()-1);
        }
        auto it = headers_.find(field);
        if (it == headers_.end()) {
            headers_.emplace(std::move(field), std::move(value));
        } else if (IEquals(field, "Cookie")) {
            it->second += "; " + value;
        } else {
            it->second += ", " + value;
        }
    }

    // Field names compare without case.
    std::string getHeader(const std::string& field) const {
        std::string result;
        auto it = headers_.find(field);
        if (it != headers_.end()) {
            result = it->second;
        }
        return result;
    }

    bool hasHeader(const std::string& field) const {
        return headers_.find(field) != headers_.end();
    }

    void setHeader(const std::string& field, const std::string& value) {
        headers_.erase(field);
        headers_[field] = value;
    }

    void removeHeader(const std::string& field) {
        headers_.erase(field);
    }

    const HeaderMap& headers() const { return headers_; }

    void setBody(const std::string& body) { body_ = body; }
    void appendBody(const char* data, size_t len) { body_.append(data, len); }
    const std::string& body() const { return body_; }

    void swap(HttpRequest& that) {
        std::swap(method_, that.method_);
        std::swap(version_, that.version_);
        methodText_.swap(that.methodText_);
        path_.swap(that.path_);
        query_.swap(that.query_);
        headers_.swap(that.headers_);
        body_.swap(that.body_);
    }

private:
    Method method_;
    Version version_;
    std::string methodText_;
    std::string path_;
    std::string query_;
    HeaderMap headers_;
    std::string body_;
};

} // namespace protocol
} // namespace haven
