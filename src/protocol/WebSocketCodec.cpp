#include "haven/protocol/WebSocketCodec.h"
#include "haven/common/Logger.h"

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

#include <algorithm>

namespace haven {
namespace protocol {
namespace ws {

namespace {

const char kGuid[] = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";

std::string Base64(const unsigned char* data, size_t len) {
    std::string out(4 * ((len + 2) / 3) + 1, '\0');
    const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
    out.resize(n > 0 ? static_cast<size_t>(n) : 0);
    return out;
}

// Masking is an XOR with the 4-byte key, so it also unmasks.
void ApplyMask(std::string* payload, const unsigned char key[4]) {
    for (size_t i = 0; i < payload->size(); ++i) {
        (*payload)[i] = static_cast<char>((*payload)[i] ^ key[i % 4]);
    }
}

bool IsKnownOpcode(uint8_t op) {
    return op == kContinuation || op == kText || op == kBinary ||
           op == kClose || op == kPing || op == kPong;
}

} // namespace

DecodeResult DecodeFrame(haven::network::Buffer* buf, Frame* frame, std::string* err) {
    const size_t avail = buf->ReadableBytes();
    if (avail < 2) return kIncomplete;

    const uint8_t b0 = buf->PeekUint8(0);
    const uint8_t b1 = buf->PeekUint8(1);
    const bool fin = (b0 & 0x80) != 0;
    const uint8_t opcode = b0 & 0x0F;
    const bool masked = (b1 & 0x80) != 0;

    if ((b0 & 0x70) != 0) {
        *err = "reserved bits set";
        return kBadFrame;
    }
    if (!IsKnownOpcode(opcode)) {
        *err = "unknown opcode " + std::to_string(opcode);
        return kBadFrame;
    }
    uint64_t len = b1 & 0x7F;
    if ((opcode & 0x08) != 0 && (!fin || len > 125)) {
        *err = "fragmented or oversized control frame";
        return kBadFrame;
    }

    size_t headerSize = 2;
    if (len == 126) {
        if (avail < 4) return kIncomplete;
        len = buf->PeekUint16(2);
        headerSize = 4;
    } else if (len == 127) {
        if (avail < 10) return kIncomplete;
        len = buf->PeekUint64(2);
        headerSize = 10;
        if (len >> 63) {
            *err = "invalid payload length";
            return kBadFrame;
        }
    }
    if (len > kMaxMessageBytes) {
        *err = "frame too big";
        return kFrameTooBig;
    }

    unsigned char maskKey[4] = {0, 0, 0, 0};
    if (masked) {
        if (avail < headerSize + 4) return kIncomplete;
        for (size_t i = 0; i < 4; ++i) maskKey[i] = buf->PeekUint8(headerSize + i);
        headerSize += 4;
    }
    if (avail < headerSize + len) return kIncomplete;

    frame->fin = fin;
    frame->opcode = opcode;
    frame->masked = masked;
    buf->Retrieve(headerSize);
    frame->payload = buf->RetrieveAsString(static_cast<size_t>(len));
    if (masked) {
        ApplyMask(&frame->payload, maskKey);
    }
    return kFrameReady;
}

bool EncodeFrame(haven::network::Buffer* out, uint8_t opcode, const char* data, size_t len, bool fin, bool mask) {
    unsigned char key[4];
    if (mask && RAND_bytes(key, sizeof key) != 1) {
        LOG_ERROR << "RAND_bytes failed while masking a WebSocket frame";
        return false;
    }

    out->AppendUint8(static_cast<uint8_t>((fin ? 0x80 : 0x00) | (opcode & 0x0F)));
    const uint8_t maskBit = mask ? 0x80 : 0x00;
    if (len < 126) {
        out->AppendUint8(static_cast<uint8_t>(maskBit | len));
    } else if (len <= 0xFFFF) {
        out->AppendUint8(static_cast<uint8_t>(maskBit | 126));
        out->AppendUint16(static_cast<uint16_t>(len));
    } else {
        out->AppendUint8(static_cast<uint8_t>(maskBit | 127));
        out->AppendUint64(static_cast<uint64_t>(len));
    }

    if (!mask) {
        out->Append(data, len);
        return true;
    }
    out->Append(reinterpret_cast<const char*>(key), sizeof key);
    std::string payload(data, len);
    ApplyMask(&payload, key);
    out->Append(payload);
    return true;
}

std::string ComputeAcceptKey(const std::string& secWebSocketKey) {
    const std::string material = secWebSocketKey + kGuid;
    unsigned char digest[SHA_DIGEST_LENGTH];
    SHA1(reinterpret_cast<const unsigned char*>(material.data()), material.size(), digest);
    return Base64(digest, sizeof digest);
}

std::string GenerateKey() {
    unsigned char nonce[16];
    if (RAND_bytes(nonce, sizeof nonce) != 1) {
        LOG_ERROR << "RAND_bytes failed while generating a WebSocket key";
        return std::string();
    }
    return Base64(nonce, sizeof nonce);
}

bool IsSendableCloseCode(uint16_t code) {
    if (code < 1000 || code > 4999) return false;
    if (code == kNoStatusReceived || code == kAbnormalClosure || code == 1015) return false;
    // 1016-2999 are reserved for future protocol use.
    if (code >= 1016 && code < 3000) return false;
    return code != 1004;
}

std::string EncodeClosePayload(uint16_t code, const std::string& reason) {
    if (code == 0 || code == kNoStatusReceived) return std::string();
    haven::network::Buffer out(2 + reason.size());
    out.AppendUint16(code);
    // Control frame payloads are limited to 125 bytes.
    out.Append(reason.data(), std::min<size_t>(reason.size(), 123));
    return out.RetrieveAllAsString();
}

bool DecodeClosePayload(const std::string& payload, uint16_t* code, std::string* reason) {
    reason->clear();
    if (payload.empty()) {
        *code = kNoStatusReceived;
        return true;
    }
    if (payload.size() < 2) return false;
    *code = static_cast<uint16_t>((static_cast<unsigned char>(payload[0]) << 8) |
                                  static_cast<unsigned char>(payload[1]));
    if (!IsSendableCloseCode(*code)) return false;
    reason->assign(payload, 2, std::string::npos);
    return true;
}

} // namespace ws
} // namespace protocol
} // namespace haven
