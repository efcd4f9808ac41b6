#include "haven/protocol/WebSocketClient.h"
#include "haven/protocol/WebSocketCodec.h"
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

WebSocketClient::WebSocketClient(haven::network::EventLoop* loop,
                                 const Url& url,
                                 const std::string& subprotocol,
                                 const haven::network::TlsContext* tls,
                                 haven::network::Resolver* resolver)
    : loop_(loop),
      url_(url),
      subprotocol_(subprotocol),
      tls_(tls),
      resolver_(resolver),
      state_(kIdle) {
}

WebSocketClient::~WebSocketClient() {
    LOG_DEBUG << "WebSocketClient::dtor " << url_.toString();
}

void WebSocketClient::Connect() {
    loop_->AssertInLoopThread();
    if (state_ != kIdle) return;
    state_ = kConnecting;

    if (url_.scheme != "ws" && url_.scheme != "wss") {
        fail("Unsupported WebSocket URL scheme: " + url_.scheme);
        return;
    }
    if (url_.secure() && (!tls_ || !tls_->ok())) {
        fail("TLS is not available for " + url_.toString());
        return;
    }
    key_ = ws::GenerateKey();
    if (key_.empty()) {
        fail("cannot generate Sec-WebSocket-Key");
        return;
    }

    std::weak_ptr<WebSocketClient> weakSelf(shared_from_this());
    resolver_->Resolve(loop_, url_.host, url_.port,
                       [weakSelf](bool ok, const InetAddress& addr, const std::string& err) {
        if (auto self = weakSelf.lock()) self->onResolved(ok, addr, err);
    });
}

void WebSocketClient::onResolved(bool ok, const InetAddress& addr, const std::string& err) {
    if (state_ != kConnecting || client_) return;
    if (!ok) {
        fail(err);
        return;
    }
    client_.reset(new TcpClient(loop_, addr, "WsUpstream"));
    if (url_.secure()) {
        client_->EnableTls(tls_, url_.host);
    }
    std::weak_ptr<WebSocketClient> weakSelf(shared_from_this());
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
        if (auto self = weakSelf.lock()) self->onConnectFailed(reason);
    });
    client_->Connect();
}

void WebSocketClient::Cancel() {
    if (state_ == kConnecting || state_ == kHandshaking || state_ == kIdle) {
        state_ = kFailed;
        openCallback_ = OpenCallback();
        errorCallback_ = ErrorCallback();
        releaseClient();
    }
}

void WebSocketClient::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        if (state_ != kConnecting) return;
        state_ = kHandshaking;
        std::string req = "GET " + url_.target() + " HTTP/1.1\r\n";
        req += "Host: " + url_.hostHeader() + "\r\n";
        req += "Upgrade: websocket\r\n";
        req += "Connection: Upgrade\r\n";
        req += "Sec-WebSocket-Key: " + key_ + "\r\n";
        req += "Sec-WebSocket-Version: 13\r\n";
        if (!subprotocol_.empty()) {
            req += "Sec-WebSocket-Protocol: " + subprotocol_ + "\r\n";
        }
        req += "\r\n";
        conn->Send(req);
        return;
    }
    if (state_ == kConnecting || state_ == kHandshaking) {
        const std::string& why = conn->errorMessage();
        fail(why.empty() ? "connection closed during WebSocket handshake with " + url_.toString() : why);
    }
}

void WebSocketClient::onConnectFailed(const std::string& reason) {
    if (state_ == kConnecting) {
        fail(reason);
    }
}

void WebSocketClient::onMessage(const TcpConnectionPtr& conn, Buffer* buf) {
    // The open callback may drop the last outside reference.
    std::shared_ptr<WebSocketClient> guard(shared_from_this());
    if (state_ != kHandshaking) {
        buf->RetrieveAll();
        return;
    }
    size_t used = 0;
    const bool done = response_.feed(buf->Peek(), buf->ReadableBytes(), &used);
    buf->Retrieve(used);
    if (response_.hasError()) {
        fail("invalid WebSocket handshake response: " + response_.errorMessage());
        return;
    }
    if (!response_.headersComplete() || !done) {
        return;
    }

    std::string err;
    if (!verifyHandshake(&err)) {
        fail(err);
        return;
    }

    state_ = kOpen;
    ws_ = std::make_shared<WebSocketConnection>(conn, WebSocketConnection::kClientRole);
    LOG_DEBUG << "WebSocket upstream open " << url_.toString() << " protocol=" << protocol_;
    if (openCallback_) {
        OpenCallback cb;
        cb.swap(openCallback_);
        errorCallback_ = ErrorCallback();
        cb(ws_);
    }
    // Frames that followed the 101 are still in buf; Start() reads them.
    ws_->Start();
}

bool WebSocketClient::verifyHandshake(std::string* err) {
    if (response_.statusCode() != 101) {
        *err = "Unexpected server response: " + std::to_string(response_.statusCode());
        return false;
    }
    const HeaderList& headers = response_.headers();
    const std::string* upgrade = FindHeader(headers, "Upgrade");
    const std::string* connection = FindHeader(headers, "Connection");
    if (!upgrade || !IEquals(TrimOws(*upgrade), "websocket") ||
        !connection || !HeaderHasToken(*connection, "upgrade")) {
        *err = "Invalid WebSocket upgrade response from " + url_.toString();
        return false;
    }
    const std::string* accept = FindHeader(headers, "Sec-WebSocket-Accept");
    if (!accept || TrimOws(*accept) != ws::ComputeAcceptKey(key_)) {
        *err = "Invalid Sec-WebSocket-Accept header from " + url_.toString();
        return false;
    }
    const std::string* proto = FindHeader(headers, "Sec-WebSocket-Protocol");
    if (proto && !proto->empty()) {
        if (subprotocol_.empty() || !HeaderHasToken(subprotocol_, *proto)) {
            *err = "Server sent a subprotocol that was not requested: " + *proto;
            return false;
        }
        protocol_ = TrimOws(*proto);
    }
    return true;
}

void WebSocketClient::fail(const std::string& message) {
    if (state_ == kOpen || state_ == kFailed) return;
    state_ = kFailed;
    LOG_WARN << "WebSocket upstream " << url_.toString() << " failed: " << message;
    ErrorCallback cb;
    cb.swap(errorCallback_);
    openCallback_ = OpenCallback();
    releaseClient();
    if (cb) {
        // Report from a fresh stack so callers never see a callback inside Connect().
        loop_->QueueInLoop([cb, message]() { cb(message); });
    }
}

void WebSocketClient::releaseClient() {
    if (!client_) return;
    // Destroying the TcpClient from inside one of its own callbacks is not
    // safe, so let the loop drop it.
    std::shared_ptr<TcpClient> old(client_.release());
    loop_->QueueInLoop([old]() {});
}

} // namespace protocol
} // namespace haven
