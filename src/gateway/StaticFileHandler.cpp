#include "haven/gateway/StaticFileHandler.h"
#include "haven/protocol/HttpRequest.h"
#include "haven/protocol/MimeTypes.h"
#include "haven/protocol/Url.h"
#include "haven/common/Logger.h"

#include <dirent.h>
#include <sys/stat.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <vector>

namespace haven {
namespace gateway {

using protocol::HttpRequest;
using protocol::HttpResponse;

namespace {

std::string HtmlEscape(const std::string& s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        switch (c) {
            case '&': out += "&amp;"; break;
            case '<': out += "&lt;"; break;
            case '>': out += "&gt;"; break;
            case '"': out += "&quot;"; break;
            case '\'': out += "&#39;"; break;
            default: out += c; break;
        }
    }
    return out;
}

std::string EncodePathSegment(const std::string& s) {
    static const char kHex[] = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : s) {
        if (isalnum(c) || c == '-' || c == '.' || c == '_' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += kHex[c >> 4];
            out += kHex[c & 0x0F];
        }
    }
    return out;
}

bool IsDirectory(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISDIR(st.st_mode);
}

bool IsRegularFile(const std::string& path) {
    struct stat st;
    return ::stat(path.c_str(), &st) == 0 && S_ISREG(st.st_mode);
}

} // namespace

StaticFileHandler::StaticFileHandler(const std::string& root, bool showDirListing, bool showIndex)
    : root_(root.size() > 1 && root.back() == '/' ? root.substr(0, root.size() - 1) : root),
      showDirListing_(showDirListing),
      showIndex_(showIndex) {
}

bool StaticFileHandler::NormalizePath(const std::string& rawPath, std::string* out) {
    const std::string decoded = protocol::PercentDecode(rawPath, false);
    if (decoded.find('\0') != std::string::npos) return false;

    std::vector<std::string> segments;
    size_t pos = 0;
    while (pos <= decoded.size()) {
        size_t slash = decoded.find('/', pos);
        if (slash == std::string::npos) slash = decoded.size();
        const std::string seg = decoded.substr(pos, slash - pos);
        if (seg == "..") {
            if (segments.empty()) return false;
            segments.pop_back();
        } else if (!seg.empty() && seg != ".") {
            segments.push_back(seg);
        }
        pos = slash + 1;
    }

    std::string result;
    for (const auto& seg : segments) {
        result += "/" + seg;
    }
    const bool trailingSlash = !decoded.empty() && decoded.back() == '/';
    if (result.empty() || trailingSlash) result += "/";
    *out = result;
    return true;
}

HttpResponse StaticFileHandler::NotFound() {
    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k404NotFound);
    resp.setContentType("text/plain; charset=utf-8");
    resp.setBody("Not Found");
    return resp;
}

HttpResponse StaticFileHandler::Serve(const HttpRequest& req) const {
    if (req.getMethod() != HttpRequest::kGet && req.getMethod() != HttpRequest::kHead) {
        HttpResponse resp(false);
        resp.setStatusCode(HttpResponse::k405MethodNotAllowed);
        resp.setHeader("Allow", "GET, HEAD");
        resp.setContentType("text/plain; charset=utf-8");
        resp.setBody("Method Not Allowed");
        return resp;
    }

    std::string urlPath;
    if (!NormalizePath(req.path(), &urlPath)) {
        LOG_DEBUG << "Refusing path outside " << root_ << ": " << req.path();
        return NotFound();
    }
    const std::string fsPath = root_ + urlPath;

    if (IsDirectory(fsPath)) {
        if (urlPath.back() != '/') {
            HttpResponse resp(false);
            resp.setStatusCode(HttpResponse::k301MovedPermanently);
            resp.setHeader("Location", req.path() + "/" + req.query());
            return resp;
        }
        const std::string index = fsPath + "index.html";
        if (showIndex_ && IsRegularFile(index)) {
            return serveFile(index);
        }
        if (showDirListing_) {
            return listDirectory(fsPath, urlPath);
        }
        return NotFound();
    }
    if (urlPath.back() == '/' || !IsRegularFile(fsPath)) {
        return NotFound();
    }
    return serveFile(fsPath);
}

HttpResponse StaticFileHandler::serveFile(const std::string& fsPath) const {
    std::ifstream f(fsPath, std::ios::in | std::ios::binary);
    if (!f.is_open()) {
        LOG_WARN << "Cannot open " << fsPath;
        return NotFound();
    }
    std::string body((std::istreambuf_iterator<char>(f)), std::istreambuf_iterator<char>());

    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType(protocol::MimeTypeForPath(fsPath));
    resp.setBody(body);
    return resp;
}

HttpResponse StaticFileHandler::listDirectory(const std::string& fsPath, const std::string& urlPath) const {
    DIR* d = ::opendir(fsPath.c_str());
    if (!d) {
        LOG_WARN << "Cannot list " << fsPath;
        return NotFound();
    }
    std::vector<std::string> entries;
    while (dirent* e = ::readdir(d)) {
        const std::string name = e->d_name;
        if (name == "." || name == "..") continue;
        entries.push_back(IsDirectory(fsPath + name) ? name + "/" : name);
    }
    ::closedir(d);
    std::sort(entries.begin(), entries.end());

    const std::string title = "Index of " + HtmlEscape(urlPath);
    std::string html = "<!DOCTYPE html>\n<html>\n<head>\n<meta charset=\"utf-8\">\n<title>" + title +
                       "</title>\n</head>\n<body>\n<h1>" + title + "</h1>\n<ul>\n";
    if (urlPath != "/") {
        html += "<li><a href=\"../\">../</a></li>\n";
    }
    for (const auto& entry : entries) {
        const bool dir = entry.back() == '/';
        const std::string name = dir ? entry.substr(0, entry.size() - 1) : entry;
        html += "<li><a href=\"" + EncodePathSegment(name) + (dir ? "/" : "") + "\">" +
                HtmlEscape(entry) + "</a></li>\n";
    }
    html += "</ul>\n</body>\n</html>\n";

    HttpResponse resp(false);
    resp.setStatusCode(HttpResponse::k200Ok);
    resp.setContentType("text/html; charset=utf-8");
    resp.setBody(html);
    return resp;
}

} // namespace gateway
} // namespace haven
