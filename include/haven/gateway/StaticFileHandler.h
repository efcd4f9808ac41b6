#pragma once

#include "haven/protocol/HttpResponse.h"

#include <string>

namespace haven {
namespace protocol {
class HttpRequest;
}
namespace gateway {

// Serves files below a root directory.
class StaticFileHandler {
public:
    StaticFileHandler(const std::string& root, bool showDirListing, bool showIndex);

    protocol::HttpResponse Serve(const protocol::HttpRequest& req) const;

    // Percent-decodes a request path and folds "." and ".." segments.
    // Returns false when the path would leave the root.
    static bool NormalizePath(const std::string& rawPath, std::string* out);

    const std::string& root() const { return root_; }

private:
    protocol::HttpResponse serveFile(const std::string& fsPath) const;
    protocol::HttpResponse listDirectory(const std::string& fsPath, const std::string& urlPath) const;
    static protocol::HttpResponse NotFound();

    const std::string root_;
    const bool showDirListing_;
    const bool showIndex_;
};

} // namespace gateway
} // namespace haven
