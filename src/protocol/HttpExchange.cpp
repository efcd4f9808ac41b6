#include "haven/protocol/HttpExchange.h"
#include "haven/network/TcpConnection.h"
#include "haven/common/Logger.h"

#include <cstdio>

namespace haven {
namespace protocol {

using haven::network::Buffer;
using haven::network::TcpConnectionPtr;

HttpExchange::HttpExchange(const TcpConnectionPtr& conn,
                           HttpRequest&& request,
                           bool closeConnection,
                           const DoneCallback& done)
    : conn_(conn),
      loop_(conn->getLoop()),
      close_(closeConnection),
      done_(done),
      state_(kPending),
      framing_(HttpResponse::kNoBody),
      remaining_(0) {
    request_.swap(request);
}

bool HttpExchange::clientConnected() const {
    TcpConnectionPtr conn = conn_.lock();
    return conn && conn->connected();
}

void HttpExchange::Respond(HttpResponse response) {
    if (state_ != kPending) {
        LOG_WARN << "HttpExchange::Respond called twice for " << request_.path();
        return;
    }
    TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) {
        state_ = kDone;
        return;
    }
    if (response.closeConnection()) close_ = true;
    response.setCloseConnection(close_);
    response.setHeadOnly(request_.getMethod() == HttpRequest::kHead);

    Buffer buf;
    response.appendToBuffer(&buf);
    conn->Send(buf.Peek(), buf.ReadableBytes());
    Finish(close_ ? kClose : kKeepAlive);
}

void HttpExchange::BeginStream(const HttpResponse& head, long long contentLength) {
    if (state_ != kPending) {
        LOG_WARN << "HttpExchange::BeginStream after the response started for " << request_.path();
        return;
    }
    TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) {
        state_ = kDone;
        return;
    }
    if (head.closeConnection()) close_ = true;

    const bool headRequest = request_.getMethod() == HttpRequest::kHead;
    HttpResponse::BodyFraming announced;
    if (!HttpResponse::StatusHasBody(head.statusCode())) {
        announced = HttpResponse::kNoBody;
        framing_ = HttpResponse::kNoBody;
    } else if (contentLength >= 0) {
        announced = HttpResponse::kFixedLength;
        framing_ = headRequest ? HttpResponse::kNoBody : HttpResponse::kFixedLength;
    } else if (headRequest) {
        announced = HttpResponse::kNoBody;
        framing_ = HttpResponse::kNoBody;
    } else if (request_.getVersion() == HttpRequest::kHttp11) {
        announced = HttpResponse::kChunked;
        framing_ = HttpResponse::kChunked;
    } else {
        announced = HttpResponse::kUntilClose;
        framing_ = HttpResponse::kUntilClose;
        close_ = true;
    }
    remaining_ = contentLength;

    HttpResponse copy(head);
    copy.setCloseConnection(close_);
    Buffer buf;
    copy.appendHeadToBuffer(&buf, announced, contentLength);
    conn->Send(buf.Peek(), buf.ReadableBytes());
    state_ = kStreaming;
}

bool HttpExchange::WriteBody(const char* data, size_t len) {
    if (state_ != kStreaming) return false;
    TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) return false;
    if (len == 0 || framing_ == HttpResponse::kNoBody) return true;

    if (framing_ == HttpResponse::kChunked) {
        char sizeLine[32];
        const int n = snprintf(sizeLine, sizeof sizeLine, "%zx\r\n", len);
        Buffer buf;
        buf.Append(sizeLine, static_cast<size_t>(n));
        buf.Append(data, len);
        buf.Append("\r\n");
        conn->Send(buf.Peek(), buf.ReadableBytes());
        return true;
    }
    if (framing_ == HttpResponse::kFixedLength) {
        if (static_cast<long long>(len) > remaining_) {
            LOG_WARN << "HttpExchange body overruns Content-Length for " << request_.path();
            len = static_cast<size_t>(remaining_);
        }
        remaining_ -= static_cast<long long>(len);
    }
    conn->Send(data, len);
    return true;
}

void HttpExchange::EndStream() {
    if (state_ != kStreaming) return;
    TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) {
        state_ = kDone;
        return;
    }
    if (framing_ == HttpResponse::kChunked) {
        conn->Send("0\r\n\r\n");
    } else if (framing_ == HttpResponse::kFixedLength && remaining_ > 0) {
        // The client would wait forever for the missing bytes.
        LOG_WARN << "HttpExchange body ended " << remaining_ << " bytes short for " << request_.path();
        close_ = true;
    }
    Finish(close_ ? kClose : kKeepAlive);
}

void HttpExchange::Abort() {
    if (state_ == kDone) return;
    state_ = kDone;
    DropFlowCallback();
    TcpConnectionPtr conn = conn_.lock();
    if (conn) {
        conn->ForceClose();
    }
}

void HttpExchange::SetFlowCallback(const FlowCallback& cb, size_t highWaterMark) {
    TcpConnectionPtr conn = conn_.lock();
    if (state_ == kDone || !conn) return;
    flow_ = cb;
    std::weak_ptr<HttpExchange> weakSelf(shared_from_this());
    conn->SetHighWaterMarkCallback([weakSelf](const TcpConnectionPtr&, size_t queued) {
        auto self = weakSelf.lock();
        if (self && self->flow_) {
            LOG_DEBUG << "HttpExchange pausing " << self->request_.path() << " at " << queued << " queued bytes";
            self->flow_(kPause);
        }
    }, highWaterMark);
    conn->SetWriteCompleteCallback([weakSelf](const TcpConnectionPtr&) {
        auto self = weakSelf.lock();
        if (self && self->flow_) self->flow_(kResume);
    });
}

void HttpExchange::NotifyClientClosed() {
    if (!flow_) return;
    FlowCallback cb = flow_;
    DropFlowCallback();
    cb(kClientGone);
}

void HttpExchange::DropFlowCallback() {
    if (!flow_) return;
    flow_ = FlowCallback();
    TcpConnectionPtr conn = conn_.lock();
    if (conn) {
        conn->SetHighWaterMarkCallback(haven::network::HighWaterMarkCallback(), 0);
        conn->SetWriteCompleteCallback(haven::network::WriteCompleteCallback());
    }
}

TcpConnectionPtr HttpExchange::Upgrade(const HttpResponse& switching) {
    if (state_ != kPending) return TcpConnectionPtr();
    TcpConnectionPtr conn = conn_.lock();
    if (!conn || !conn->connected()) {
        state_ = kDone;
        return TcpConnectionPtr();
    }
    Buffer buf;
    switching.appendHeadToBuffer(&buf, HttpResponse::kNoBody, 0);
    conn->Send(buf.Peek(), buf.ReadableBytes());
    Finish(kUpgraded);
    return conn;
}

void HttpExchange::Finish(Outcome outcome) {
    state_ = kDone;
    DropFlowCallback();
    TcpConnectionPtr conn = conn_.lock();
    if (conn && done_) {
        DoneCallback done;
        done.swap(done_);
        done(conn, outcome);
    }
}

} // namespace protocol
} // namespace haven
