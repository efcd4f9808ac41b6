#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/Buffer.h"
#include "haven/network/Callbacks.h"
#include "haven/network/InetAddress.h"

#include <sys/types.h>
#include <any>
#include <atomic>
#include <memory>
#include <string>

struct ssl_ctx_st;

namespace haven {
namespace network {

class Channel;
class EventLoop;
class Socket;
class TlsSession;

// An established TCP connection, optionally wrapped in TLS. Always held by
// a shared_ptr; I/O happens on the owning loop, and the public sending and
// closing calls may come from any thread.
//
// Server side: with a TLS context the first inbound byte decides between a
// TLS handshake and plaintext, so one port serves both.
// Client side: EnableClientTls() before ConnectEstablished() starts a
// handshake with SNI; data sent before it completes is queued.
class TcpConnection : haven::common::noncopyable,
                      public std::enable_shared_from_this<TcpConnection> {
public:
    TcpConnection(EventLoop* loop,
                  const std::string& name,
                  int sockfd,
                  const InetAddress& localAddr,
                  const InetAddress& peerAddr,
                  ssl_ctx_st* serverTlsCtx = nullptr);
    ~TcpConnection();

    EventLoop* getLoop() const { return loop_; }
    const std::string& name() const { return name_; }
    const InetAddress& localAddress() const { return localAddr_; }
    const InetAddress& peerAddress() const { return peerAddr_; }
    bool connected() const { return state_ == kConnected; }

    // Last socket or TLS error seen on this connection, empty if none.
    const std::string& errorMessage() const { return errorMessage_; }

    // Per-connection state owned by the protocol layer.
    void SetContext(const std::any& context) { context_ = context; }
    std::any* GetMutableContext() { return &context_; }

    // Bytes received but not yet consumed by the message callback. Loop thread only.
    Buffer* inputBuffer() { return &inputBuffer_; }

    void Send(const std::string& message);
    void Send(const void* data, size_t len);
    // Half-closes once queued output has drained.
    void Shutdown();
    // Closes now, discarding queued output.
    void ForceClose();

    // Pause and resume reading from the socket; used to push back on a
    // producer whose consumer is slower. Safe from any thread.
    void StartRead();
    void StopRead();
    bool isReading() const { return reading_; }

    void SetConnectionCallback(const ConnectionCallback& cb) { connectionCallback_ = cb; }
    void SetMessageCallback(const MessageCallback& cb) { messageCallback_ = cb; }
    void SetWriteCompleteCallback(const WriteCompleteCallback& cb) { writeCompleteCallback_ = cb; }
    void SetCloseCallback(const CloseCallback& cb) { closeCallback_ = cb; }
    // cb runs (queued) each time the output queue grows past highWaterMark.
    void SetHighWaterMarkCallback(const HighWaterMarkCallback& cb, size_t highWaterMark) {
        highWaterMarkCallback_ = cb;
        highWaterMark_ = highWaterMark;
    }

    void EnableClientTls(ssl_ctx_st* tlsCtx, const std::string& serverName, bool verifyHost);

    // Called once by the owning server or client after construction.
    void ConnectEstablished();
    // Called once after the owner has dropped the connection.
    void ConnectDestroyed();

private:
    enum State { kDisconnected, kConnecting, kConnected, kDisconnecting };
    enum TlsPhase {
        kTlsOff,       // plaintext
        kTlsSniff,     // server side, waiting for the first byte
        kTlsHandshake,
        kTlsReady,
    };

    void HandleRead(Timestamp receiveTime);
    void HandleWrite();
    void HandleClose();
    void HandleError();

    void ReadPlain(Timestamp receiveTime);
    void ReadTls(Timestamp receiveTime);
    // Bytes written (0 when the socket or TLS layer must wait), -1 on error.
    ssize_t WriteSome(const void* data, size_t len, int* savedErrno);
    void NotifyWriteComplete();

    void SendInLoop(const void* data, size_t len);
    void ShutdownInLoop();
    void StartReadInLoop();
    void StopReadInLoop();

    // Server side: peeks at the first byte and picks TLS or plaintext.
    void SniffTls();
    // False on a fatal handshake error.
    bool DriveHandshake();
    bool TlsBlocksWrites() const { return tlsPhase_ == kTlsSniff || tlsPhase_ == kTlsHandshake; }
    void ArmWriteForTls();

    EventLoop* loop_;
    const std::string name_;
    std::atomic<State> state_;

    std::unique_ptr<Socket> socket_;
    std::unique_ptr<Channel> channel_;

    const InetAddress localAddr_;
    const InetAddress peerAddr_;

    ConnectionCallback connectionCallback_;
    MessageCallback messageCallback_;
    WriteCompleteCallback writeCompleteCallback_;
    CloseCallback closeCallback_;
    HighWaterMarkCallback highWaterMarkCallback_;
    size_t highWaterMark_;
    bool reading_;

    Buffer inputBuffer_;
    Buffer outputBuffer_;

    std::any context_;
    std::string errorMessage_;

    ssl_ctx_st* tlsCtx_;
    TlsPhase tlsPhase_;
    std::unique_ptr<TlsSession> tls_;
    // The TLS layer asked for writability to make progress.
    bool tlsWantWrite_;
    bool tlsClient_;
    bool tlsVerifyHost_;
    std::string tlsServerName_;
};

} // namespace network
} // namespace haven
