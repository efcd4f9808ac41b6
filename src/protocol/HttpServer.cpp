#include "haven/protocol/HttpServer.h"
#include "haven/protocol/HttpContext.h"
#include "haven/protocol/HttpRequest.h"
#include "haven/protocol/HttpResponse.h"
#include "haven/network/EventLoop.h"
#include "haven/network/TcpConnection.h"
#include "haven/common/Logger.h"

namespace haven {
namespace protocol {

using haven::network::Buffer;
using haven::network::TcpConnectionPtr;

namespace {

// Per-connection state kept in the TcpConnection context.
struct HttpSession {
    HttpContext parser;
    HttpExchangePtr pending;
    bool dispatching = false;
    bool upgraded = false;
};

} // namespace

HttpServer::HttpServer(haven::network::EventLoop* loop,
                       const haven::network::InetAddress& listenAddr,
                       const std::string& name,
                       haven::network::TcpServer::Option option)
    : server_(loop, listenAddr, name, option) {
    server_.SetConnectionCallback(
        std::bind(&HttpServer::onConnection, this, std::placeholders::_1));
    server_.SetMessageCallback(
        std::bind(&HttpServer::onMessage, this, std::placeholders::_1, std::placeholders::_2, std::placeholders::_3));
}

void HttpServer::start() {
    LOG_INFO << "HttpServer[" << server_.name() << "] starts listening on " << server_.hostport();
    server_.Start();
}

void HttpServer::onConnection(const TcpConnectionPtr& conn) {
    if (conn->connected()) {
        conn->SetContext(HttpSession());
    } else {
        // Breaks the exchange's hold on the session; the handler may still
        // own the exchange and will see the client gone.
        HttpSession* session = std::any_cast<HttpSession>(conn->GetMutableContext());
        if (session && session->pending) {
            HttpExchangePtr pending;
            pending.swap(session->pending);
            pending->NotifyClientClosed();
        }
    }
}

void HttpServer::onMessage(const TcpConnectionPtr& conn,
                           Buffer* buf,
                           std::chrono::system_clock::time_point receiveTime) {
    HttpSession* session = std::any_cast<HttpSession>(conn->GetMutableContext());
    if (!session || session->upgraded) {
        return;
    }

    // Support keep-alive / pipelining: drain complete requests one at a time;
    // an unfinished exchange holds the rest in the buffer.
    while (!session->pending && conn->connected()) {
        if (!session->parser.parseRequest(buf, receiveTime)) {
            HttpResponse response(true);
            response.setStatusCode(HttpResponse::k400BadRequest);
            Buffer out;
            response.appendToBuffer(&out);
            conn->Send(out.Peek(), out.ReadableBytes());
            conn->Shutdown();
            buf->RetrieveAll();
            return;
        }
        if (!session->parser.gotAll()) {
            return;
        }
        HttpRequest req;
        req.swap(session->parser.request());
        session->parser.reset();

        session->dispatching = true;
        onRequest(conn, std::move(req));
        session->dispatching = false;

        if (session->upgraded || buf->ReadableBytes() == 0) {
            return;
        }
    }
}

void HttpServer::onRequest(const TcpConnectionPtr& conn, HttpRequest&& req) {
    const std::string connection = req.getHeader("Connection");
    const bool close = HeaderHasToken(connection, "close") ||
                       (req.getVersion() == HttpRequest::kHttp10 && !HeaderHasToken(connection, "keep-alive"));

    HttpSession* session = std::any_cast<HttpSession>(conn->GetMutableContext());
    auto exchange = std::make_shared<HttpExchange>(
        conn, std::move(req), close,
        std::bind(&HttpServer::onExchangeDone, this, std::placeholders::_1, std::placeholders::_2));
    session->pending = exchange;

    if (exchangeCallback_) {
        exchangeCallback_(exchange);
        return;
    }

    HttpResponse response(close);
    if (httpCallback_) {
        httpCallback_(exchange->request(), &response);
    } else {
        response.setStatusCode(HttpResponse::k404NotFound);
        response.setStatusMessage("Not Found");
    }
    exchange->Respond(std::move(response));
}

void HttpServer::onExchangeDone(const TcpConnectionPtr& conn, HttpExchange::Outcome outcome) {
    HttpSession* session = std::any_cast<HttpSession>(conn->GetMutableContext());
    if (!session) {
        return;
    }
    session->pending.reset();

    if (outcome == HttpExchange::kUpgraded) {
        session->upgraded = true;
        return;
    }
    if (outcome == HttpExchange::kClose) {
        conn->Shutdown();
        return;
    }
    // An exchange finished outside onMessage: resume pipelined input.
    if (!session->dispatching && conn->inputBuffer()->ReadableBytes() > 0) {
        conn->getLoop()->QueueInLoop([this, conn]() {
            onMessage(conn, conn->inputBuffer(), std::chrono::system_clock::now());
        });
    }
}

} // namespace protocol
} // namespace haven
