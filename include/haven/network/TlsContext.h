#pragma once

#include "haven/common/noncopyable.h"

#include <string>

struct ssl_ctx_st;

namespace haven {
namespace network {

// Owns an SSL_CTX for either inbound termination or outbound origination.
class TlsContext : haven::common::noncopyable {
public:
    TlsContext();
    ~TlsContext();

    bool InitServer(const std::string& certPemPath, const std::string& keyPemPath);
    // caFile empty means the system default trust store.
    bool InitClient(bool verifyPeer, const std::string& caFile = "");

    ssl_ctx_st* ctx() const { return ctx_; }
    bool ok() const { return ctx_ != nullptr; }
    bool verifyPeer() const { return verifyPeer_; }

    // Drains the OpenSSL error queue into one line.
    static std::string LastErrorString();

private:
    void Reset();

    ssl_ctx_st* ctx_{nullptr};
    bool verifyPeer_{false};
};

} // namespace network
} // namespace haven
