#pragma once

#include "haven/network/Buffer.h"

#include <cstdint>
#include <string>

namespace haven {
namespace protocol {
namespace ws {

enum Opcode : uint8_t {
    kContinuation = 0x0,
    kText = 0x1,
    kBinary = 0x2,
    kClose = 0x8,
    kPing = 0x9,
    kPong = 0xA,
};

enum CloseCode : uint16_t {
    kNormalClosure = 1000,
    kGoingAway = 1001,
    kProtocolError = 1002,
    kUnsupportedData = 1003,
    kNoStatusReceived = 1005,
    kAbnormalClosure = 1006,
    kInvalidPayload = 1007,
    kPolicyViolation = 1008,
    kMessageTooBig = 1009,
    kInternalError = 1011,
};

const size_t kMaxMessageBytes = 64 * 1024 * 1024;

struct Frame {
    bool fin = true;
    uint8_t opcode = kText;
    bool masked = false;
    std::string payload; // unmasked
};

enum DecodeResult { kIncomplete, kFrameReady, kBadFrame, kFrameTooBig };

// Decodes the frame at the front of buf. On kFrameReady the frame's bytes are
// consumed; on any other result buf is untouched. No extensions are
// negotiated, so RSV bits must be zero.
DecodeResult DecodeFrame(haven::network::Buffer* buf, Frame* frame, std::string* err);

// Appends one frame. With mask set a fresh random masking key is used
// (client to server direction). Returns false if no random key could be drawn.
bool EncodeFrame(haven::network::Buffer* out, uint8_t opcode, const char* data, size_t len, bool fin, bool mask);

// base64(SHA-1(key + GUID)), RFC 6455 section 4.2.2.
std::string ComputeAcceptKey(const std::string& secWebSocketKey);
// base64 of 16 random bytes, for Sec-WebSocket-Key.
std::string GenerateKey();

// Codes that may appear in a Close frame on the wire.
bool IsSendableCloseCode(uint16_t code);
// An empty payload when code is 0 or 1005.
std::string EncodeClosePayload(uint16_t code, const std::string& reason);
// Empty payload decodes as 1005. Returns false for a malformed payload.
bool DecodeClosePayload(const std::string& payload, uint16_t* code, std::string* reason);

} // namespace ws
} // namespace protocol
} // namespace haven
