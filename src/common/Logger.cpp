#include "haven/common/Logger.h"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <thread>

namespace haven {
namespace common {

namespace {

void FormatTimestamp(std::ostream& os) {
    auto now = std::chrono::system_clock::now();
    std::time_t secs = std::chrono::system_clock::to_time_t(now);
    long millis = static_cast<long>(
        std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000);

    std::tm local;
    localtime_r(&secs, &local);
    os << std::put_time(&local, "%Y-%m-%d %H:%M:%S")
       << '.' << std::setfill('0') << std::setw(3) << millis << std::setfill(' ');
}

const char* ColorOf(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "\033[36m";
        case LogLevel::INFO:  return "\033[32m";
        case LogLevel::WARN:  return "\033[33m";
        case LogLevel::ERROR: return "\033[31m";
        case LogLevel::FATAL: return "\033[35m";
    }
    return "";
}

const char* StripDirectory(const char* path) {
    const char* slash = std::strrchr(path, '/');
    return slash ? slash + 1 : path;
}

// strerror_r has two signatures; this overload pair accepts either.
const char* ErrorText(int result, const char* buf) { return result == 0 ? buf : "unknown error"; }
const char* ErrorText(const char* result, const char*) { return result; }

} // namespace

Logger::Logger()
    : level_(LogLevel::INFO), color_(::isatty(STDOUT_FILENO) == 1) {}

Logger& Logger::Instance() {
    static Logger instance;
    return instance;
}

LogLevel Logger::ParseLevel(const std::string& levelStr) {
    std::string upper(levelStr);
    std::transform(upper.begin(), upper.end(), upper.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (upper == "DEBUG") return LogLevel::DEBUG;
    if (upper == "WARN" || upper == "WARNING") return LogLevel::WARN;
    if (upper == "ERROR") return LogLevel::ERROR;
    if (upper == "FATAL") return LogLevel::FATAL;
    return LogLevel::INFO;
}

const char* Logger::LevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO ";
        case LogLevel::WARN:  return "WARN ";
        case LogLevel::ERROR: return "ERROR";
        case LogLevel::FATAL: return "FATAL";
    }
    return "?????";
}

void Logger::Log(LogLevel level, const char* file, int line, const std::string& msg) {
    std::ostringstream out;
    bool color = color_.load(std::memory_order_relaxed);
    if (color) out << ColorOf(level);
    out << '[';
    FormatTimestamp(out);
    out << "] [" << LevelName(level) << "] [" << std::this_thread::get_id() << "] ["
        << StripDirectory(file) << ':' << line << "] " << msg;
    if (color) out << "\033[0m";
    out << '\n';

    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << out.str();
    if (level >= LogLevel::WARN) std::cout.flush();
}

LogStream::~LogStream() {
    if (savedErrno_ != 0) {
        char buf[128];
        ss_ << ": " << ErrorText(::strerror_r(savedErrno_, buf, sizeof buf), buf)
            << " (errno=" << savedErrno_ << ")";
    }
    Logger::Instance().Log(level_, file_, line_, ss_.str());
    if (level_ == LogLevel::FATAL) {
        std::cout.flush();
        std::abort();
    }
}

} // namespace common
} // namespace haven
