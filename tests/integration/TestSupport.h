#pragma once

// Blocking socket helpers shared by the integration tests.

#include <arpa/inet.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <cassert>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <cstring>
#include <strings.h>
#include <string>

namespace testsupport {

inline uint16_t pickFreePort() {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    int one = 1;
    ::setsockopt(fd, SOL_SOCKET, SO_REUSEADDR, &one, sizeof(one));

    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
    addr.sin_port = htons(0);
    assert(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)) == 0);

    socklen_t len = sizeof(addr);
    assert(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len) == 0);
    uint16_t port = ntohs(addr.sin_port);
    ::close(fd);
    assert(port != 0);
    return port;
}

inline int connectTo(uint16_t port) {
    int fd = ::socket(AF_INET, SOCK_STREAM, 0);
    assert(fd >= 0);
    sockaddr_in addr;
    std::memset(&addr, 0, sizeof(addr));
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port);
    assert(::inet_pton(AF_INET, "127.0.0.1", &addr.sin_addr) == 1);
    int ret = ::connect(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr));
    assert(ret == 0);
    return fd;
}

inline bool pollReadable(int fd, int timeoutMs) {
    pollfd pfd;
    pfd.fd = fd;
    pfd.events = POLLIN | POLLHUP | POLLERR;
    return ::poll(&pfd, 1, timeoutMs) == 1;
}

inline void sendAll(int fd, const std::string& s) {
    size_t off = 0;
    while (off < s.size()) {
        ssize_t n = ::send(fd, s.data() + off, s.size() - off, MSG_NOSIGNAL);
        assert(n > 0);
        off += static_cast<size_t>(n);
    }
}

// Empty on timeout or when the peer closed.
inline std::string recvSome(int fd, int timeoutMs = 2000) {
    if (!pollReadable(fd, timeoutMs)) return std::string();
    char buf[4096];
    ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
    if (n <= 0) return std::string();
    return std::string(buf, buf + n);
}

// Reads until the peer closes or timeoutMs passes.
inline std::string recvUntilClose(int fd, int timeoutMs = 3000) {
    std::string out;
    const auto start = std::chrono::steady_clock::now();
    while (std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start).count() < timeoutMs) {
        if (!pollReadable(fd, 50)) continue;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, buf + n);
    }
    return out;
}

inline std::string recvUntil(int fd, const std::string& marker, int timeoutMs = 3000) {
    std::string out;
    const auto start = std::chrono::steady_clock::now();
    while (out.find(marker) == std::string::npos) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > timeoutMs) break;
        if (!pollReadable(fd, 50)) continue;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) break;
        out.append(buf, buf + n);
    }
    return out;
}

// True once the peer has closed the connection (EOF or reset) within timeoutMs.
inline bool waitForClose(int fd, int timeoutMs = 3000) {
    const auto start = std::chrono::steady_clock::now();
    while (std::chrono::duration_cast<std::chrono::milliseconds>(
               std::chrono::steady_clock::now() - start).count() < timeoutMs) {
        if (!pollReadable(fd, 50)) continue;
        char buf[4096];
        ssize_t n = ::recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) return true;
    }
    return false;
}

// One request on a fresh connection, whole response back.
inline std::string httpRoundTrip(uint16_t port, const std::string& request, int timeoutMs = 3000) {
    int fd = connectTo(port);
    sendAll(fd, request);
    std::string resp = recvUntilClose(fd, timeoutMs);
    ::close(fd);
    return resp;
}

inline int statusOf(const std::string& response) {
    if (response.compare(0, 5, "HTTP/") != 0) return -1;
    const size_t sp = response.find(' ');
    if (sp == std::string::npos) return -1;
    return std::atoi(response.c_str() + sp + 1);
}

inline std::string bodyOf(const std::string& response) {
    const size_t end = response.find("\r\n\r\n");
    return end == std::string::npos ? std::string() : response.substr(end + 4);
}

inline std::string headBlockOf(const std::string& response) {
    const size_t end = response.find("\r\n\r\n");
    return end == std::string::npos ? response : response.substr(0, end + 2);
}

// Header lookup on a raw head block, ignoring case. Empty when absent.
inline std::string headerOf(const std::string& response, const std::string& name) {
    const std::string head = headBlockOf(response);
    size_t pos = head.find("\r\n");
    while (pos != std::string::npos && pos + 2 < head.size()) {
        const size_t lineStart = pos + 2;
        const size_t lineEnd = head.find("\r\n", lineStart);
        if (lineEnd == std::string::npos) break;
        const std::string line = head.substr(lineStart, lineEnd - lineStart);
        const size_t colon = line.find(':');
        if (colon == name.size() && strncasecmp(line.c_str(), name.c_str(), name.size()) == 0) {
            size_t v = colon + 1;
            while (v < line.size() && (line[v] == ' ' || line[v] == '\t')) ++v;
            return line.substr(v);
        }
        pos = lineEnd;
    }
    return std::string();
}

inline bool hasHeader(const std::string& response, const std::string& name) {
    const std::string head = headBlockOf(response);
    const std::string needle = "\r\n" + name + ":";
    for (size_t i = 0; i + needle.size() <= head.size(); ++i) {
        if (strncasecmp(head.c_str() + i, needle.c_str(), needle.size()) == 0) return true;
    }
    return false;
}

// Decodes a chunked body; returns the input unchanged when it is not chunked.
inline std::string dechunk(const std::string& body) {
    std::string out;
    size_t pos = 0;
    while (pos < body.size()) {
        const size_t lineEnd = body.find("\r\n", pos);
        if (lineEnd == std::string::npos) return body;
        const size_t size = std::strtoul(body.substr(pos, lineEnd - pos).c_str(), nullptr, 16);
        if (size == 0) return out;
        out += body.substr(lineEnd + 2, size);
        pos = lineEnd + 2 + size + 2;
    }
    return out;
}

// Masked client frame (FIN set).
inline std::string makeClientFrame(uint8_t opcode, const std::string& payload) {
    const uint8_t mask[4] = {0x12, 0x34, 0x56, 0x78};
    std::string out;
    out.push_back(static_cast<char>(0x80 | opcode));
    if (payload.size() <= 125) {
        out.push_back(static_cast<char>(0x80 | payload.size()));
    } else {
        assert(payload.size() <= 0xFFFF);
        out.push_back(static_cast<char>(0x80 | 126));
        out.push_back(static_cast<char>((payload.size() >> 8) & 0xFF));
        out.push_back(static_cast<char>(payload.size() & 0xFF));
    }
    for (uint8_t b : mask) out.push_back(static_cast<char>(b));
    for (size_t i = 0; i < payload.size(); ++i) {
        out.push_back(static_cast<char>(static_cast<uint8_t>(payload[i]) ^ mask[i % 4]));
    }
    return out;
}

inline std::string makeClientClose(uint16_t code, const std::string& reason) {
    std::string payload;
    payload.push_back(static_cast<char>(code >> 8));
    payload.push_back(static_cast<char>(code & 0xFF));
    payload += reason;
    return makeClientFrame(0x8, payload);
}

// Pulls one unmasked server frame off the front of data.
inline bool takeServerFrame(std::string* data, uint8_t* opcode, std::string* payload) {
    if (data->size() < 2) return false;
    const uint8_t b0 = static_cast<uint8_t>((*data)[0]);
    const uint8_t b1 = static_cast<uint8_t>((*data)[1]);
    assert((b1 & 0x80) == 0);
    size_t len = b1 & 0x7F;
    size_t off = 2;
    if (len == 126) {
        if (data->size() < 4) return false;
        len = (static_cast<uint8_t>((*data)[2]) << 8) | static_cast<uint8_t>((*data)[3]);
        off = 4;
    } else if (len == 127) {
        return false;
    }
    if (data->size() < off + len) return false;
    *opcode = b0 & 0x0F;
    payload->assign(*data, off, len);
    data->erase(0, off + len);
    return true;
}

// Waits for the next server frame, keeping leftovers in *pending.
inline bool readServerFrame(int fd, std::string* pending, uint8_t* opcode, std::string* payload, int timeoutMs = 3000) {
    const auto start = std::chrono::steady_clock::now();
    while (!takeServerFrame(pending, opcode, payload)) {
        auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - start).count();
        if (elapsed > timeoutMs) return false;
        std::string chunk = recvSome(fd, 100);
        if (chunk.empty() && !pollReadable(fd, 0)) continue;
        if (chunk.empty()) return false;
        *pending += chunk;
    }
    return true;
}

inline uint16_t closeCodeOf(const std::string& payload) {
    if (payload.size() < 2) return 1005;
    return static_cast<uint16_t>((static_cast<uint8_t>(payload[0]) << 8) | static_cast<uint8_t>(payload[1]));
}

} // namespace testsupport
