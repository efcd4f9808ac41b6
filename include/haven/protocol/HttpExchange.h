#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/protocol/HttpRequest.h"
#include "haven/protocol/HttpResponse.h"

#include <functional>
#include <memory>

namespace haven {
namespace network {
class EventLoop;
}
namespace protocol {

// One request on a server connection, answered later and possibly in pieces.
//
// A handler either calls Respond() once, or BeginStream() followed by any
// number of WriteBody() calls and EndStream(), or Upgrade() to take the raw
// connection over. The server does not read the next pipelined request until
// the exchange is finished. All calls must be made on the connection's loop.
class HttpExchange : haven::common::noncopyable,
                     public std::enable_shared_from_this<HttpExchange> {
public:
    enum Outcome { kKeepAlive, kClose, kUpgraded };
    using DoneCallback = std::function<void(const haven::network::TcpConnectionPtr&, Outcome)>;

    enum Flow { kPause, kResume, kClientGone };
    using FlowCallback = std::function<void(Flow)>;

    HttpExchange(const haven::network::TcpConnectionPtr& conn,
                 HttpRequest&& request,
                 bool closeConnection,
                 const DoneCallback& done);

    const HttpRequest& request() const { return request_; }
    haven::network::EventLoop* loop() const { return loop_; }
    // Null once the client is gone.
    haven::network::TcpConnectionPtr connection() const { return conn_.lock(); }
    bool clientConnected() const;
    bool closeConnection() const { return close_; }
    bool finished() const { return state_ == kDone; }

    // Sends a complete response with Content-Length framing.
    void Respond(HttpResponse response);

    // contentLength < 0 means the length is not known up front.
    void BeginStream(const HttpResponse& head, long long contentLength);
    // False when the client can no longer be written to.
    bool WriteBody(const char* data, size_t len);
    void EndStream();

    // Drops the client connection without finishing the response.
    void Abort();

    // kPause once more than highWaterMark bytes wait to reach the client,
    // kResume when they have all been written, kClientGone if the client
    // disconnects first. Dropped when the exchange finishes.
    void SetFlowCallback(const FlowCallback& cb, size_t highWaterMark);
    // Called by the server when the client connection closes.
    void NotifyClientClosed();

    // Sends the 101 response and hands the connection to the caller, who must
    // install its own connection and message callbacks. Bytes that followed the
    // request are left in connection->inputBuffer().
    haven::network::TcpConnectionPtr Upgrade(const HttpResponse& switching);

private:
    enum State { kPending, kStreaming, kDone };

    void Finish(Outcome outcome);
    void DropFlowCallback();

    std::weak_ptr<haven::network::TcpConnection> conn_;
    haven::network::EventLoop* loop_;
    HttpRequest request_;
    bool close_;
    DoneCallback done_;
    FlowCallback flow_;
    State state_;
    HttpResponse::BodyFraming framing_;
    long long remaining_;
};

using HttpExchangePtr = std::shared_ptr<HttpExchange>;

} // namespace protocol
} // namespace haven
