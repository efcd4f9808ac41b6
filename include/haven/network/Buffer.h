#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include <sys/types.h>

namespace haven {
namespace network {

// Byte queue used for socket input and output.
//
//   [ prependable | readable | writable ]
//   0        readerIndex  writerIndex   size
//
// Consumed bytes are reclaimed lazily: the readable region is slid back to
// the front only when appending would otherwise grow the storage.
// Integer helpers use network byte order.
class Buffer {
public:
    static const size_t kCheapPrepend = 8;
    static const size_t kInitialSize = 1024;

    explicit Buffer(size_t initialSize = kInitialSize)
        : storage_(kCheapPrepend + initialSize),
          readerIndex_(kCheapPrepend),
          writerIndex_(kCheapPrepend) {}

    Buffer(const Buffer&) = delete;
    Buffer& operator=(const Buffer&) = delete;
    Buffer(Buffer&&) noexcept = default;
    Buffer& operator=(Buffer&&) noexcept = default;

    size_t ReadableBytes() const { return writerIndex_ - readerIndex_; }
    size_t WritableBytes() const { return storage_.size() - writerIndex_; }
    size_t PrependableBytes() const { return readerIndex_; }

    const char* Peek() const { return Begin() + readerIndex_; }

    // Start of the first match in the readable bytes, or nullptr.
    const char* Find(const char* needle, size_t len) const;
    const char* FindCRLF() const { return Find("\r\n", 2); }
    bool StartsWith(const char* prefix, size_t len) const;

    void Retrieve(size_t len);
    void RetrieveUntil(const char* end) { Retrieve(static_cast<size_t>(end - Peek())); }
    void RetrieveAll() { readerIndex_ = writerIndex_ = kCheapPrepend; }
    std::string RetrieveAsString(size_t len);
    std::string RetrieveAllAsString() { return RetrieveAsString(ReadableBytes()); }

    void Append(const char* data, size_t len);
    void Append(const std::string& str) { Append(str.data(), str.size()); }
    void AppendUint8(uint8_t v) { Append(reinterpret_cast<const char*>(&v), 1); }
    void AppendUint16(uint16_t v);
    void AppendUint64(uint64_t v);

    // Callers check ReadableBytes() first.
    uint8_t PeekUint8(size_t offset = 0) const { return static_cast<uint8_t>(Peek()[offset]); }
    uint16_t PeekUint16(size_t offset = 0) const;
    uint64_t PeekUint64(size_t offset = 0) const;

    char* BeginWrite() { return Begin() + writerIndex_; }
    const char* BeginWrite() const { return Begin() + writerIndex_; }
    void HasWritten(size_t len) { writerIndex_ += len; }
    void EnsureWritableBytes(size_t len) {
        if (WritableBytes() < len) MakeSpace(len);
    }

    // One readv() into the writable tail plus a stack spill area.
    ssize_t ReadFd(int fd, int* savedErrno);

private:
    char* Begin() { return storage_.data(); }
    const char* Begin() const { return storage_.data(); }
    void MakeSpace(size_t len);

    std::vector<char> storage_;
    size_t readerIndex_;
    size_t writerIndex_;
};

} // namespace network
} // namespace haven
