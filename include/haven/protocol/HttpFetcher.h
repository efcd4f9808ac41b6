#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/protocol/HttpHeaders.h"
#include "haven/protocol/HttpResponseContext.h"
#include "haven/protocol/Url.h"

#include <functional>
#include <memory>
#include <string>

namespace haven {
namespace network {
class EventLoop;
class InetAddress;
class Resolver;
class TcpClient;
class TlsContext;
}
namespace protocol {

struct FetchRequest {
    std::string method = "GET";
    Url url;
    HeaderList headers;
    std::string body;
};

struct FetchResponseHead {
    int status = 0;
    std::string reason;
    HeaderList headers;
    // -1 when the upstream did not declare a length.
    long long contentLength = -1;
    // Where the response came from, after redirects.
    Url url;
};

// One outbound HTTP/1.1 request on a fresh connection (Connection: close).
//
// Redirects are followed up to kMaxRedirects hops. The response head is
// reported once, then the body in pieces as it arrives, then completion.
// Any failure before completion goes to the error callback instead, even
// after the head has been reported. The fetcher keeps itself alive until
// it finishes, fails or is cancelled. Loop thread only.
class HttpFetcher : haven::common::noncopyable,
                    public std::enable_shared_from_this<HttpFetcher> {
public:
    static const int kMaxRedirects = 20;

    using ResponseCallback = std::function<void(const FetchResponseHead&)>;
    // Return false to stop reading; the fetch is then cancelled.
    using BodyCallback = std::function<bool(const char* data, size_t len)>;
    using CompleteCallback = std::function<void()>;
    using ErrorCallback = std::function<void(const std::string& message)>;

    // tls may be null; https targets then fail. Host names are looked up
    // through resolver, which must outlive the fetch.
    HttpFetcher(haven::network::EventLoop* loop,
                const haven::network::TlsContext* tls,
                haven::network::Resolver* resolver);
    ~HttpFetcher();

    void setResponseCallback(const ResponseCallback& cb) { responseCallback_ = cb; }
    void setBodyCallback(const BodyCallback& cb) { bodyCallback_ = cb; }
    void setCompleteCallback(const CompleteCallback& cb) { completeCallback_ = cb; }
    void setErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    void Fetch(const FetchRequest& request);
    // Tears the upstream connection down. No callback fires afterwards.
    void Cancel();

    // Stops and restarts reading the upstream response, for a body consumer
    // that cannot keep up.
    void PauseReading();
    void ResumeReading();

    bool finished() const { return state_ == kDone; }

    // Request bytes as sent on the wire for request.
    static std::string SerializeRequest(const FetchRequest& request);

private:
    enum State { kIdle, kConnecting, kWaitingHead, kReadingBody, kDone };

    void startHop();
    void onResolved(bool ok, const haven::network::InetAddress& addr, const std::string& err);
    void onConnection(const haven::network::TcpConnectionPtr& conn);
    void onMessage(const haven::network::TcpConnectionPtr& conn, haven::network::Buffer* buf);
    void onBody(const char* data, size_t len);
    void handleHead();
    bool prepareRedirect(std::string* err);
    void complete();
    void fail(const std::string& message);
    void finish();

    haven::network::EventLoop* loop_;
    const haven::network::TlsContext* tls_;
    haven::network::Resolver* resolver_;
    State state_;
    FetchRequest request_;
    int redirects_;
    bool headHandled_;
    bool redirecting_;
    bool paused_;
    HttpResponseContext response_;
    std::unique_ptr<haven::network::TcpClient> client_;
    std::shared_ptr<HttpFetcher> self_;

    ResponseCallback responseCallback_;
    BodyCallback bodyCallback_;
    CompleteCallback completeCallback_;
    ErrorCallback errorCallback_;
};

using HttpFetcherPtr = std::shared_ptr<HttpFetcher>;

} // namespace protocol
} // namespace haven
