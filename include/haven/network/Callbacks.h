#pragma once

#include <memory>
#include <functional>
#include <chrono>
#include <string>

namespace haven {
namespace network {

class TcpConnection;
class Buffer;

using Timestamp = std::chrono::system_clock::time_point;

using TcpConnectionPtr = std::shared_ptr<TcpConnection>;
using ConnectionCallback = std::function<void(const TcpConnectionPtr&)>;
using CloseCallback = std::function<void(const TcpConnectionPtr&)>;
using WriteCompleteCallback = std::function<void(const TcpConnectionPtr&)>;
// Output queued on the connection, in bytes, when it crossed the mark.
using HighWaterMarkCallback = std::function<void(const TcpConnectionPtr&, size_t)>;
using MessageCallback = std::function<void(const TcpConnectionPtr&, Buffer*, Timestamp)>;

// errno of a failed outbound connect, or 0 when the failure has no errno.
using ConnectFailedCallback = std::function<void(int savedErrno, const std::string& reason)>;

} // namespace network
} // namespace haven
