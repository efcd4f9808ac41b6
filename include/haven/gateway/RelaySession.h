#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/protocol/WebSocketClient.h"
#include "haven/protocol/WebSocketConnection.h"

#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace haven {
namespace network {
class EventLoop;
class Resolver;
class TlsContext;
}
namespace gateway {

// Pairs an upgraded client connection with an outbound WebSocket and copies
// messages both ways. A close on either side is mirrored on the other.
//
//   Connecting -> Open      upstream handshake done
//   Connecting -> Closing   upstream failed (client gets 1011) or client left
//   Open       -> Closing   either side closed
//   Closing    -> Closed    both TCP connections are gone
//
// The session owns itself from Start() until it reaches Closed. When one
// side has more than highWaterMark bytes waiting to be written, reading from
// the other side pauses until they drain.
class RelaySession : haven::common::noncopyable,
                     public std::enable_shared_from_this<RelaySession> {
public:
    enum State { kConnecting, kOpen, kClosing, kClosed };

    RelaySession(const haven::network::TcpConnectionPtr& clientConn,
                 const std::string& target,
                 const std::string& subprotocol,
                 const haven::network::TlsContext* tls,
                 haven::network::Resolver* resolver,
                 size_t highWaterMark);
    ~RelaySession();

    // Applies to both WebSocket sides; call before Start().
    void setCloseTimeout(int ms) { closeTimeoutMs_ = ms; }
    void Start();

    State state() const { return state_; }

    // Sessions constructed and not yet destroyed, across all loops.
    static int LiveCount();

private:
    void onUpstreamOpen(const protocol::WebSocketConnectionPtr& upstream);
    void onUpstreamError(const std::string& message);
    void onClientMessage(protocol::ws::Opcode opcode, const std::string& payload);
    void onUpstreamMessage(protocol::ws::Opcode opcode, const std::string& payload);
    void onClientClose(uint16_t code, const std::string& reason);
    void onUpstreamClose(uint16_t code, const std::string& reason);
    void onClientDisconnect();
    void onUpstreamDisconnect();
    void maybeFinish();
    void linkFlowControl();
    void unlinkFlowControl();

    haven::network::EventLoop* loop_;
    State state_;
    const std::string target_;
    const std::string subprotocol_;
    const haven::network::TlsContext* tls_;
    haven::network::Resolver* resolver_;
    const size_t highWaterMark_;
    int closeTimeoutMs_;

    protocol::WebSocketConnectionPtr client_;
    protocol::WebSocketClientPtr connector_;
    protocol::WebSocketConnectionPtr upstream_;
    // Client messages received before the upstream opened.
    std::vector<std::pair<protocol::ws::Opcode, std::string>> pending_;
    size_t pendingBytes_;
    bool clientGone_;
    bool upstreamGone_;

    std::shared_ptr<RelaySession> self_;
};

} // namespace gateway
} // namespace haven
