#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Callbacks.h"
#include "haven/network/OneShotTimer.h"
#include "haven/protocol/WebSocketCodec.h"

#include <functional>
#include <memory>
#include <string>

namespace haven {
namespace protocol {

class WebSocketConnection;
using WebSocketConnectionPtr = std::shared_ptr<WebSocketConnection>;

// Message layer over an upgraded TCP connection, after the handshake.
//
// Fragmented messages are reassembled, pings are answered with pongs, and the
// closing handshake is carried out. The close callback fires once, when the
// peer starts closing, the TCP connection drops, or the peer breaks the
// protocol; it does not fire for a close started locally with Close(). The
// disconnect callback fires once the TCP connection is gone.
//
// Once closing, the TCP connection is dropped if the peer has not finished
// the handshake and disconnected within the close timeout.
//
// The owner keeps this object alive; TCP callbacks only hold weak references.
// Loop thread only.
class WebSocketConnection : haven::common::noncopyable,
                            public std::enable_shared_from_this<WebSocketConnection> {
public:
    enum Role { kServerRole, kClientRole };
    enum State { kOpen, kClosing, kClosed };

    static const int kDefaultCloseTimeoutMs = 5000;

    using MessageCallback = std::function<void(const WebSocketConnectionPtr&, ws::Opcode, const std::string&)>;
    using CloseCallback = std::function<void(const WebSocketConnectionPtr&, uint16_t code, const std::string& reason)>;
    using DisconnectCallback = std::function<void(const WebSocketConnectionPtr&)>;

    WebSocketConnection(const haven::network::TcpConnectionPtr& conn, Role role);
    ~WebSocketConnection();

    // Takes over the TCP callbacks and processes bytes already buffered.
    void Start();

    bool SendText(const std::string& message) { return Send(ws::kText, message); }
    bool SendBinary(const std::string& message) { return Send(ws::kBinary, message); }
    // Text or binary. False when the connection is no longer open.
    bool Send(ws::Opcode opcode, const std::string& payload);

    // Starts the closing handshake. code 0 or 1005 sends a Close frame with no
    // status.
    void Close(uint16_t code, const std::string& reason);
    // Drops the TCP connection without a closing handshake.
    void Abort();

    State state() const { return state_; }
    Role role() const { return role_; }
    const haven::network::TcpConnectionPtr& connection() const { return conn_; }
    const std::string& name() const;

    void setMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void setCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }
    void setDisconnectCallback(const DisconnectCallback& cb) { disconnectCallback_ = cb; }
    void setCloseTimeout(int ms) { closeTimeoutMs_ = ms; }

private:
    void onTcpConnection(const haven::network::TcpConnectionPtr& conn);
    void onTcpMessage(const haven::network::TcpConnectionPtr& conn, haven::network::Buffer* buf);
    // Returns false when no further frames should be read.
    bool handleFrame(ws::Frame& frame);
    bool handleClose(const std::string& payload);
    void failConnection(uint16_t code, const std::string& why);
    void sendFrame(uint8_t opcode, const std::string& payload);
    void notifyClose(uint16_t code, const std::string& reason);
    void handleDisconnect();
    void armCloseTimer();

    haven::network::TcpConnectionPtr conn_;
    const Role role_;
    State state_;
    bool started_;
    bool closeNotified_;
    bool disconnected_;
    int closeTimeoutMs_;
    haven::network::OneShotTimerPtr closeTimer_;

    // Message being reassembled from fragments.
    bool fragmented_;
    uint8_t fragmentOpcode_;
    std::string fragmentBuf_;

    MessageCallback messageCallback_;
    CloseCallback closeCallback_;
    DisconnectCallback disconnectCallback_;
};

} // namespace protocol
} // namespace haven
