#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/protocol/HttpResponseContext.h"
#include "haven/protocol/Url.h"
#include "haven/protocol/WebSocketConnection.h"

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

// Opens one outbound WebSocket: TCP (and TLS for wss) connect, the HTTP
// upgrade request, and the Sec-WebSocket-Accept check.
//
// Exactly one of the open and error callbacks fires, always from the loop.
// The caller owns the client and must keep it alive for as long as the
// WebSocketConnection it hands out is in use: it owns the TCP client.
class WebSocketClient : haven::common::noncopyable,
                        public std::enable_shared_from_this<WebSocketClient> {
public:
    using OpenCallback = std::function<void(const WebSocketConnectionPtr&)>;
    using ErrorCallback = std::function<void(const std::string& message)>;

    // url must use the ws or wss scheme. tls may be null when url is ws.
    // resolver must outlive the handshake.
    WebSocketClient(haven::network::EventLoop* loop,
                    const Url& url,
                    const std::string& subprotocol,
                    const haven::network::TlsContext* tls,
                    haven::network::Resolver* resolver);
    ~WebSocketClient();

    void setOpenCallback(const OpenCallback& cb) { openCallback_ = cb; }
    void setErrorCallback(const ErrorCallback& cb) { errorCallback_ = cb; }

    void Connect();
    // Stops a pending handshake. No callback fires afterwards.
    void Cancel();

    // Subprotocol the server selected, empty when none.
    const std::string& protocol() const { return protocol_; }
    const Url& url() const { return url_; }

private:
    enum State { kIdle, kConnecting, kHandshaking, kOpen, kFailed };

    void onResolved(bool ok, const haven::network::InetAddress& addr, const std::string& err);
    void onConnection(const haven::network::TcpConnectionPtr& conn);
    void onMessage(const haven::network::TcpConnectionPtr& conn, haven::network::Buffer* buf);
    void onConnectFailed(const std::string& reason);
    bool verifyHandshake(std::string* err);
    void fail(const std::string& message);
    void releaseClient();

    haven::network::EventLoop* loop_;
    const Url url_;
    const std::string subprotocol_;
    const haven::network::TlsContext* tls_;
    haven::network::Resolver* resolver_;
    State state_;
    std::string key_;
    std::string protocol_;
    HttpResponseContext response_;
    std::unique_ptr<haven::network::TcpClient> client_;
    WebSocketConnectionPtr ws_;

    OpenCallback openCallback_;
    ErrorCallback errorCallback_;
};

using WebSocketClientPtr = std::shared_ptr<WebSocketClient>;

} // namespace protocol
} // namespace haven
