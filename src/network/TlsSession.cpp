#include "haven/network/TlsSession.h"
#include "haven/network/TlsContext.h"

#include <openssl/err.h>
#include <openssl/ssl.h>
#include <openssl/x509v3.h>

#include <arpa/inet.h>
#include <cerrno>

namespace haven {
namespace network {

namespace {

SSL* NewSsl(ssl_ctx_st* ctx, int fd, std::string* err) {
    SSL* ssl = ctx ? SSL_new(ctx) : nullptr;
    if (!ssl) {
        *err = "TLS setup failed: " + TlsContext::LastErrorString();
        return nullptr;
    }
    if (SSL_set_fd(ssl, fd) != 1) {
        *err = "TLS setup failed: " + TlsContext::LastErrorString();
        SSL_free(ssl);
        return nullptr;
    }
    return ssl;
}

bool IsIpv4Literal(const std::string& host) {
    struct in_addr numeric;
    return ::inet_pton(AF_INET, host.c_str(), &numeric) == 1;
}

} // namespace

TlsSession::TlsSession(ssl_st* ssl, bool client)
    : ssl_(ssl), client_(client), established_(false) {}

TlsSession::~TlsSession() {
    SSL_free(ssl_);
}

std::unique_ptr<TlsSession> TlsSession::Accept(ssl_ctx_st* ctx, int fd, std::string* err) {
    SSL* ssl = NewSsl(ctx, fd, err);
    if (!ssl) return nullptr;
    SSL_set_accept_state(ssl);
    return std::unique_ptr<TlsSession>(new TlsSession(ssl, false));
}

std::unique_ptr<TlsSession> TlsSession::Connect(ssl_ctx_st* ctx, int fd, const std::string& serverName,
                                                bool verifyHost, std::string* err) {
    SSL* ssl = NewSsl(ctx, fd, err);
    if (!ssl) return nullptr;
    SSL_set_connect_state(ssl);

    if (!serverName.empty()) {
        const bool ipLiteral = IsIpv4Literal(serverName);
        // RFC 6066 forbids IP literals in SNI.
        if (!ipLiteral) {
            SSL_set_tlsext_host_name(ssl, serverName.c_str());
        }
        if (verifyHost) {
            if (ipLiteral) {
                X509_VERIFY_PARAM_set1_ip_asc(SSL_get0_param(ssl), serverName.c_str());
            } else {
                SSL_set1_host(ssl, serverName.c_str());
            }
        }
    }
    return std::unique_ptr<TlsSession>(new TlsSession(ssl, true));
}

TlsSession::Result TlsSession::Handshake(std::string* err) {
    if (established_) return kOk;
    ERR_clear_error();
    errno = 0;
    const int ret = SSL_do_handshake(ssl_);
    if (ret == 1) {
        established_ = true;
        return kOk;
    }
    int ignored = 0;
    const Result result = Classify(ret, &ignored);
    if (result == kWantRead || result == kWantWrite) return result;

    std::string detail = TlsContext::LastErrorString();
    const long verify = SSL_get_verify_result(ssl_);
    if (client_ && verify != X509_V_OK) {
        detail = X509_verify_cert_error_string(verify);
    }
    if (detail.empty()) {
        detail = "error " + std::to_string(SSL_get_error(ssl_, ret));
    }
    *err = detail;
    return kFailed;
}

TlsSession::Result TlsSession::Read(char* buf, size_t cap, size_t* n, int* savedErrno) {
    *n = 0;
    if (cap == 0) return kOk;
    ERR_clear_error();
    errno = 0;
    const int ret = SSL_read(ssl_, buf, static_cast<int>(cap));
    if (ret > 0) {
        *n = static_cast<size_t>(ret);
        return kOk;
    }
    return Classify(ret, savedErrno);
}

TlsSession::Result TlsSession::Write(const void* data, size_t len, size_t* n, int* savedErrno) {
    *n = 0;
    if (len == 0) return kOk;
    ERR_clear_error();
    errno = 0;
    const int ret = SSL_write(ssl_, data, static_cast<int>(len));
    if (ret > 0) {
        *n = static_cast<size_t>(ret);
        return kOk;
    }
    return Classify(ret, savedErrno);
}

void TlsSession::Shutdown() {
    if (established_) {
        SSL_shutdown(ssl_);
    }
}

const char* TlsSession::protocolVersion() const {
    return SSL_get_version(ssl_);
}

TlsSession::Result TlsSession::Classify(int ret, int* savedErrno) {
    const int sysErrno = errno;
    switch (SSL_get_error(ssl_, ret)) {
        case SSL_ERROR_WANT_READ:
            return kWantRead;
        case SSL_ERROR_WANT_WRITE:
            return kWantWrite;
        case SSL_ERROR_ZERO_RETURN:
            return kClosed;
        case SSL_ERROR_SYSCALL:
            // EOF without close_notify; treated like a plain TCP close.
            if (sysErrno == 0) return kClosed;
            *savedErrno = sysErrno;
            return kFailed;
        default:
            *savedErrno = EIO;
            return kFailed;
    }
}

} // namespace network
} // namespace haven
