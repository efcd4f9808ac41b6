#include "haven/network/Buffer.h"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <sys/uio.h>
#include <unistd.h>

namespace haven {
namespace network {

const char* Buffer::Find(const char* needle, size_t len) const {
    const char* hit = std::search(Peek(), BeginWrite(), needle, needle + len);
    return hit == BeginWrite() ? nullptr : hit;
}

bool Buffer::StartsWith(const char* prefix, size_t len) const {
    return ReadableBytes() >= len && std::memcmp(Peek(), prefix, len) == 0;
}

void Buffer::Retrieve(size_t len) {
    if (len < ReadableBytes()) {
        readerIndex_ += len;
    } else {
        RetrieveAll();
    }
}

std::string Buffer::RetrieveAsString(size_t len) {
    len = std::min(len, ReadableBytes());
    std::string out(Peek(), len);
    Retrieve(len);
    return out;
}

void Buffer::Append(const char* data, size_t len) {
    EnsureWritableBytes(len);
    std::memcpy(BeginWrite(), data, len);
    HasWritten(len);
}

void Buffer::AppendUint16(uint16_t v) {
    const char bytes[2] = {static_cast<char>(v >> 8), static_cast<char>(v)};
    Append(bytes, sizeof bytes);
}

void Buffer::AppendUint64(uint64_t v) {
    char bytes[8];
    for (int i = 7; i >= 0; --i) {
        bytes[i] = static_cast<char>(v & 0xFF);
        v >>= 8;
    }
    Append(bytes, sizeof bytes);
}

uint16_t Buffer::PeekUint16(size_t offset) const {
    return static_cast<uint16_t>((PeekUint8(offset) << 8) | PeekUint8(offset + 1));
}

uint64_t Buffer::PeekUint64(size_t offset) const {
    uint64_t v = 0;
    for (size_t i = 0; i < 8; ++i) {
        v = (v << 8) | PeekUint8(offset + i);
    }
    return v;
}

void Buffer::MakeSpace(size_t len) {
    const size_t readable = ReadableBytes();
    if (WritableBytes() + PrependableBytes() < len + kCheapPrepend) {
        storage_.resize(writerIndex_ + len);
        return;
    }
    std::memmove(Begin() + kCheapPrepend, Peek(), readable);
    readerIndex_ = kCheapPrepend;
    writerIndex_ = kCheapPrepend + readable;
}

ssize_t Buffer::ReadFd(int fd, int* savedErrno) {
    char spill[65536];
    const size_t writable = WritableBytes();

    struct iovec vec[2];
    vec[0].iov_base = BeginWrite();
    vec[0].iov_len = writable;
    vec[1].iov_base = spill;
    vec[1].iov_len = sizeof spill;
    // A tail already larger than the spill area is read on its own.
    const int iovcnt = writable < sizeof spill ? 2 : 1;

    const ssize_t n = ::readv(fd, vec, iovcnt);
    if (n < 0) {
        *savedErrno = errno;
        return n;
    }
    const size_t got = static_cast<size_t>(n);
    if (got <= writable) {
        writerIndex_ += got;
    } else {
        writerIndex_ = storage_.size();
        Append(spill, got - writable);
    }
    return n;
}

} // namespace network
} // namespace haven
