#pragma once

#include "haven/common/noncopyable.h"
#include "haven/network/TcpServer.h"
#include "haven/protocol/HttpExchange.h"

#include <functional>
#include <string>

namespace haven {
namespace protocol {

class HttpRequest;
class HttpResponse;

// HTTP/1.1 server on top of TcpServer with keep-alive and pipelining.
//
// Two handler styles are supported. An HttpCallback fills in a response
// synchronously. An ExchangeCallback receives an HttpExchange and may answer
// later, stream the body, or upgrade the connection. When both are set the
// exchange callback wins.
class HttpServer : haven::common::noncopyable {
public:
    using HttpCallback = std::function<void(const HttpRequest&, HttpResponse*)>;
    using ExchangeCallback = std::function<void(const HttpExchangePtr&)>;

    HttpServer(haven::network::EventLoop* loop,
               const haven::network::InetAddress& listenAddr,
               const std::string& name,
               haven::network::TcpServer::Option option = haven::network::TcpServer::kNoReusePort);

    haven::network::EventLoop* getLoop() const { return server_.getLoop(); }
    const std::string& hostport() const { return server_.hostport(); }
    size_t connectionCount() const { return server_.ConnectionCount(); }

    void setHttpCallback(const HttpCallback& cb) { httpCallback_ = cb; }
    void setExchangeCallback(const ExchangeCallback& cb) { exchangeCallback_ = cb; }

    // Both must precede start().
    void setThreadNum(int numThreads) { server_.SetThreadNum(numThreads); }
    bool enableTls(const std::string& certPemPath, const std::string& keyPemPath) {
        return server_.EnableTls(certPemPath, keyPemPath);
    }

    void start();

private:
    void onConnection(const haven::network::TcpConnectionPtr& conn);
    void onMessage(const haven::network::TcpConnectionPtr& conn,
                   haven::network::Buffer* buf,
                   std::chrono::system_clock::time_point receiveTime);
    void onRequest(const haven::network::TcpConnectionPtr&, HttpRequest&& req);
    void onExchangeDone(const haven::network::TcpConnectionPtr& conn, HttpExchange::Outcome outcome);

    haven::network::TcpServer server_;
    HttpCallback httpCallback_;
    ExchangeCallback exchangeCallback_;
};

} // namespace protocol
} // namespace haven
