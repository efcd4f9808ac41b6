#pragma once

#include "haven/common/noncopyable.h"

#include <sys/types.h>
#include <memory>
#include <string>

struct ssl_ctx_st;
struct ssl_st;

namespace haven {
namespace network {

// One TLS session bound to a non-blocking socket. Drives the handshake and
// translates OpenSSL's retry signals into a small result set.
class TlsSession : haven::common::noncopyable {
public:
    enum Result {
        kOk,
        kWantRead,
        kWantWrite,
        kClosed,   // close_notify or a clean EOF from the peer
        kFailed,
    };

    // Server side of a connection whose first byte announced a handshake.
    static std::unique_ptr<TlsSession> Accept(ssl_ctx_st* ctx, int fd, std::string* err);
    // Client side. serverName feeds SNI unless it is an IP literal; with
    // verifyHost set the certificate must also match it.
    static std::unique_ptr<TlsSession> Connect(ssl_ctx_st* ctx, int fd, const std::string& serverName,
                                               bool verifyHost, std::string* err);
    ~TlsSession();

    // kOk once established. On kFailed *err explains why.
    Result Handshake(std::string* err);

    // On kOk *n holds the byte count. On kFailed *savedErrno is set.
    Result Read(char* buf, size_t cap, size_t* n, int* savedErrno);
    Result Write(const void* data, size_t len, size_t* n, int* savedErrno);

    // Sends close_notify without waiting for the peer's.
    void Shutdown();

    const char* protocolVersion() const;

private:
    TlsSession(ssl_st* ssl, bool client);

    Result Classify(int ret, int* savedErrno);

    ssl_st* ssl_;
    const bool client_;
    bool established_;
};

// Whether the first byte of a stream starts a TLS handshake record.
inline bool LooksLikeTlsHandshake(unsigned char firstByte) { return firstByte == 0x16; }

} // namespace network
} // namespace haven
