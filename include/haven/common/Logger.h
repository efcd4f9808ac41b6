#pragma once

#include <atomic>
#include <mutex>
#include <sstream>
#include <string>

namespace haven {
namespace common {

enum class LogLevel {
    DEBUG,
    INFO,
    WARN,
    ERROR,
    FATAL
};

// Process-wide line logger writing to stdout.
// Line format: [time] [LEVEL] [thread] [file:line] message
class Logger {
public:
    static Logger& Instance();

    void SetLevel(LogLevel level) { level_.store(level, std::memory_order_relaxed); }
    LogLevel GetLevel() const { return level_.load(std::memory_order_relaxed); }
    bool Enabled(LogLevel level) const { return level >= GetLevel(); }

    // Case is ignored. Unknown names map to INFO.
    static LogLevel ParseLevel(const std::string& levelStr);
    static const char* LevelName(LogLevel level);

    // ANSI colors are on by default only when stdout is a terminal.

    void Log(LogLevel level, const char* file, int line, const std::string& msg);

private:
    Logger();
    ~Logger() = default;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    std::atomic<LogLevel> level_;
    std::atomic<bool> color_;
    std::mutex mutex_;
};

// Collects one line; it is written when the stream goes out of scope.
// With a saved errno the system error text is appended. A FATAL stream
// aborts the process once the line is written.
class LogStream {
public:
    LogStream(LogLevel level, const char* file, int line, int savedErrno = 0)
        : level_(level), file_(file), line_(line), savedErrno_(savedErrno) {}

    ~LogStream();

    template <typename T>
    LogStream& operator<<(const T& val) {
        ss_ << val;
        return *this;
    }

private:
    LogLevel level_;
    const char* file_;
    int line_;
    int savedErrno_;
    std::ostringstream ss_;
};

} // namespace common
} // namespace haven

// The empty branch keeps "if (x) LOG_INFO << ...; else ..." binding to the caller's if.
#define HAVEN_LOG_IF(level, savedErrno) \
    if (!haven::common::Logger::Instance().Enabled(level)) {} \
    else haven::common::LogStream(level, __FILE__, __LINE__, savedErrno)

#define LOG_DEBUG HAVEN_LOG_IF(haven::common::LogLevel::DEBUG, 0)
#define LOG_INFO HAVEN_LOG_IF(haven::common::LogLevel::INFO, 0)
#define LOG_WARN HAVEN_LOG_IF(haven::common::LogLevel::WARN, 0)
#define LOG_ERROR HAVEN_LOG_IF(haven::common::LogLevel::ERROR, 0)
#define LOG_FATAL haven::common::LogStream(haven::common::LogLevel::FATAL, __FILE__, __LINE__)

// Same as LOG_ERROR / LOG_FATAL with strerror(errno) appended.
#define LOG_SYSERR HAVEN_LOG_IF(haven::common::LogLevel::ERROR, errno)
#define LOG_SYSFATAL haven::common::LogStream(haven::common::LogLevel::FATAL, __FILE__, __LINE__, errno)
