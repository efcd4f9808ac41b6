#include "haven/protocol/HttpFetcher.h"
#include "haven/network/EventLoop.h"
#include "haven/network/InetAddress.h"
#include "haven/network/Resolver.h"
#include "haven/network/TcpClient.h"
#include "haven/network/TcpConnection.h"
#include "haven/network/TlsContext.h"
#include "haven/common/Logger.h"

namespace haven {
namespace protocol {

using haven::network::Buffer;
using haven::network::InetAddress;
using haven::network::TcpClient;
using haven::network::TcpConnectionPtr;

namespace {

bool IsRedirectStatus(int status) {
    return status == 301 || status == 302 || status == 303 || status == 307 || status == 308;
}

// Fields whose values the fetcher derives itself.
bool IsManagedRequestHeader(const std::string& name) {
    return IEquals(name, "Host") || IEquals(name, "Content-Length") ||
           IEquals(name, "Connection") || IEquals(name, "Transfer-Encoding") ||
           IEquals(name, "Keep-Alive") || IEquals(name, "Upgrade") || IEquals(name, "TE");
}

bool SameOrigin(const Url& a, const Url& b) {
    return a.scheme == b.scheme && a.host == b.host && a.port == b.port;
}

} // namespace

HttpFetcher::HttpFetcher(haven::network::EventLoop* loop,
                         const haven::network::TlsContext* tls,
                         haven::network::Resolver* resolver)
    : loop_(loop),
      tls_(tls),
      resolver_(resolver),
      state_(kIdle),
      redirects_(0),
      headHandled_(false),
      redirecting_(false),
      paused_(false) {
}

HttpFetcher::~HttpFetcher() {
    LOG_DEBUG << "HttpFetcher::dtor " << request_.url.toString();
}

std::string HttpFetcher::SerializeRequest(const FetchRequest& request) {
    std::string out = request.method + " " + request.url.target() + " HTTP/1.1\r\n";
    out += "Host: " + request.url.hostHeader() + "\r\n";
    bool hasAccept = false;
    for (const auto& kv : request.headers) {
        if (IsManagedRequestHeader(kv.first)) continue;
        if (IEquals(kv.first, "Accept")) hasAccept = true;
        out += kv.first + ": " + kv.second + "\r\n";
    }
    if (!hasAccept) {
        out += "Accept: */*\r\n";
    }
    if (!request.body.empty() || request.method == "POST" || request.method == "PUT" || request.method == "PATCH") {
        out += "Content-Length: " + std::to_string(request.body.size()) + "\r\n";
    }
    out += "Connection: close\r\n\r\n";
    out += request.body;
    return out;
}

void HttpFetcher::Fetch(const FetchRequest& request) {
    loop_->AssertInLoopThread();
    if (state_ != kIdle) {
        LOG_WARN << "HttpFetcher::Fetch called twice";
        return;
    }
    self_ = shared_from_this();
    request_ = request;
    redirects_ = 0;
    startHop();
}

void HttpFetcher::startHop() {
    state_ = kConnecting;
    headHandled_ = false;
    redirecting_ = false;
    paused_ = false;
    response_.reset();
    response_.setExpectNoBody(request_.method == "HEAD");
    response_.setBodyCallback([this](const char* data, size_t len) { onBody(data, len); });

    const Url& url = request_.url;
    if (url.scheme != "http" && url.scheme != "https") {
        fail("Unsupported URL scheme for fetch: " + url.scheme);
        return;
    }
    if (url.secure() && (!tls_ || !tls_->ok())) {
        fail("TLS is not available for " + url.toString());
        return;
    }

    std::weak_ptr<HttpFetcher> weakSelf(shared_from_this());
    resolver_->Resolve(loop_, url.host, url.port,
                       [weakSelf](bool ok, const InetAddress& addr, const std::string& err) {
        if (auto self = weakSelf.lock()) self->onResolved(ok, addr, err);
    });
}

void HttpFetcher::onResolved(bool ok, const InetAddress& addr, const std::string& err) {
    // Cancelled, or already past this hop.
    if (state_ != kConnecting || client_) return;
    if (!ok) {
        fail(err);
        return;
    }

    const Url& url = request_.url;
    client_.reset(new TcpClient(loop_, addr, "Fetch"));
    if (url.secure()) {
        client_->EnableTls(tls_, url.host);
    }
    std::weak_ptr<HttpFetcher> weakSelf(shared_from_this());
    client_->SetConnectionCallback([weakSelf](const TcpConnectionPtr& conn) {
        if (auto self = weakSelf.lock()) self->onConnection(conn);
    });
    client_->SetMessageCallback([weakSelf](const TcpConnectionPtr& conn, Buffer* buf, haven::network::Timestamp) {
        if (auto self = weakSelf.lock()) {
            self->onMessage(conn, buf);
        } else {
            buf->RetrieveAll();
        }
    });
    client_->SetConnectFailedCallback([weakSelf](int, const std::string& reason) {
        if (auto self = weakSelf.lock()) self->fail(reason);
    });
    client_->Connect();
}

void HttpFetcher::onConnection(const TcpConnectionPtr& conn) {
    std::shared_ptr<HttpFetcher> guard(shared_from_this());
    if (conn->connected()) {
        if (state_ != kConnecting) return;
        state_ = kWaitingHead;
        conn->Send(SerializeRequest(request_));
        return;
    }

    if (state_ == kDone) return;
    if (state_ == kConnecting) {
        fail(conn->errorMessage().empty() ? "connection to " + request_.url.hostHeader() + " closed" : conn->errorMessage());
        return;
    }
    response_.onEof();
    if (response_.gotAll()) {
        if (!headHandled_) handleHead();
        if (state_ == kDone) return;
        if (redirecting_) {
            std::string err;
            if (!prepareRedirect(&err)) {
                fail(err);
            } else {
                startHop();
            }
            return;
        }
        complete();
        return;
    }
    std::string why = conn->errorMessage();
    if (why.empty()) why = response_.errorMessage();
    if (why.empty()) why = request_.url.hostHeader() + " closed the connection before the response was complete";
    fail(why);
}

void HttpFetcher::onMessage(const TcpConnectionPtr&, Buffer* buf) {
    std::shared_ptr<HttpFetcher> guard(shared_from_this());
    if (state_ != kWaitingHead && state_ != kReadingBody) {
        buf->RetrieveAll();
        return;
    }
    response_.feed(buf->Peek(), buf->ReadableBytes());
    // Connections are never reused, so anything past the response is dropped.
    buf->RetrieveAll();
    if (state_ == kDone) return;

    if (response_.hasError()) {
        fail("Invalid response from " + request_.url.hostHeader() + ": " + response_.errorMessage());
        return;
    }
    if (!headHandled_ && response_.headersComplete()) {
        handleHead();
        if (state_ == kDone) return;
    }
    if (redirecting_) {
        std::string err;
        if (!prepareRedirect(&err)) {
            fail(err);
        } else {
            startHop();
        }
        return;
    }
    if (response_.gotAll()) {
        complete();
    }
}

void HttpFetcher::onBody(const char* data, size_t len) {
    if (!headHandled_) handleHead();
    if (state_ == kDone || redirecting_) return;
    if (bodyCallback_ && !bodyCallback_(data, len)) {
        LOG_DEBUG << "HttpFetcher body consumer went away, dropping " << request_.url.toString();
        Cancel();
    }
}

void HttpFetcher::handleHead() {
    headHandled_ = true;
    const int status = response_.statusCode();
    if (IsRedirectStatus(status) && FindHeader(response_.headers(), "Location")) {
        redirecting_ = true;
        return;
    }

    state_ = kReadingBody;
    FetchResponseHead head;
    head.status = status;
    head.reason = response_.reason();
    head.headers = response_.headers();
    head.contentLength = response_.contentLength();
    head.url = request_.url;
    if (responseCallback_) {
        responseCallback_(head);
    }
}

bool HttpFetcher::prepareRedirect(std::string* err) {
    if (++redirects_ > kMaxRedirects) {
        *err = "Too many redirects";
        return false;
    }
    const std::string location = *FindHeader(response_.headers(), "Location");
    const int status = response_.statusCode();
    Url next;
    if (!request_.url.Resolve(location, &next, err)) {
        return false;
    }
    LOG_DEBUG << "HttpFetcher redirect " << status << " " << request_.url.toString() << " -> " << next.toString();

    if ((status == 303 && request_.method != "HEAD") ||
        ((status == 301 || status == 302) && request_.method == "POST")) {
        request_.method = "GET";
        request_.body.clear();
        RemoveHeader(&request_.headers, "Content-Type");
        RemoveHeader(&request_.headers, "Content-Encoding");
        RemoveHeader(&request_.headers, "Content-Language");
        RemoveHeader(&request_.headers, "Content-Location");
    }
    if (!SameOrigin(request_.url, next)) {
        RemoveHeader(&request_.headers, "Authorization");
    }
    request_.url = next;

    std::shared_ptr<TcpClient> old(client_.release());
    loop_->QueueInLoop([old]() {});
    return true;
}

void HttpFetcher::complete() {
    CompleteCallback cb = completeCallback_;
    finish();
    if (cb) cb();
}

void HttpFetcher::fail(const std::string& message) {
    if (state_ == kDone) return;
    LOG_WARN << "Fetch " << request_.method << " " << request_.url.toString() << " failed: " << message;
    ErrorCallback cb = errorCallback_;
    finish();
    if (cb) cb(message);
}

void HttpFetcher::PauseReading() {
    if (state_ != kReadingBody || paused_ || !client_) return;
    TcpConnectionPtr conn = client_->connection();
    if (conn) {
        paused_ = true;
        conn->StopRead();
    }
}

void HttpFetcher::ResumeReading() {
    if (!paused_) return;
    paused_ = false;
    TcpConnectionPtr conn = client_ ? client_->connection() : TcpConnectionPtr();
    if (conn) conn->StartRead();
}

void HttpFetcher::Cancel() {
    if (state_ == kDone) return;
    finish();
}

void HttpFetcher::finish() {
    state_ = kDone;
    responseCallback_ = ResponseCallback();
    bodyCallback_ = BodyCallback();
    completeCallback_ = CompleteCallback();
    errorCallback_ = ErrorCallback();

    // Both may be running further up the stack; let the loop drop them.
    std::shared_ptr<TcpClient> client(client_.release());
    std::shared_ptr<HttpFetcher> self;
    self.swap(self_);
    loop_->QueueInLoop([client, self]() {});
}

} // namespace protocol
} // namespace haven
