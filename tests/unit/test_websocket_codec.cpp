#include "haven/protocol/WebSocketCodec.h"
#include "haven/network/Buffer.h"
#include "haven/common/Logger.h"

#include <cassert>
#include <string>

using namespace haven::protocol;
using haven::network::Buffer;
using haven::common::Logger;
using haven::common::LogLevel;

void testAcceptKey() {
    // RFC 6455 section 1.3.
    assert(ws::ComputeAcceptKey("dGhlIHNhbXBsZSBub25jZQ==") == "s3pPLMBiTxaQ9kYGzzhZRbK+xOo=");
    const std::string key = ws::GenerateKey();
    assert(key.size() == 24);
    assert(key != ws::GenerateKey());
    LOG_INFO << "Accept Key PASS";
}

void testMaskedFrameFromClient() {
    Buffer buf;
    const std::string payload(300, 'x');
    assert(ws::EncodeFrame(&buf, ws::kBinary, payload.data(), payload.size(), true, true));
    // 2 header bytes, 2 length bytes, 4 mask bytes.
    assert(buf.ReadableBytes() == 8 + payload.size());
    assert((static_cast<unsigned char>(buf.Peek()[1]) & 0x80) != 0);

    // Byte by byte arrival is incomplete until the last byte.
    Buffer partial;
    const std::string wire(buf.Peek(), buf.ReadableBytes());
    ws::Frame frame;
    std::string err;
    for (size_t i = 0; i + 1 < wire.size(); ++i) {
        partial.Append(&wire[i], 1);
        assert(ws::DecodeFrame(&partial, &frame, &err) == ws::kIncomplete);
    }
    partial.Append(&wire[wire.size() - 1], 1);
    assert(ws::DecodeFrame(&partial, &frame, &err) == ws::kFrameReady);
    assert(frame.fin && frame.masked);
    assert(frame.opcode == ws::kBinary);
    assert(frame.payload == payload);
    assert(partial.ReadableBytes() == 0);
    LOG_INFO << "Masked Frame From Client PASS";
}

void testUnmaskedFramesQueued() {
    Buffer buf;
    assert(ws::EncodeFrame(&buf, ws::kText, "hel", 3, false, false));
    assert(ws::EncodeFrame(&buf, ws::kContinuation, "lo", 2, true, false));
    const std::string big(70000, 'b');
    assert(ws::EncodeFrame(&buf, ws::kBinary, big.data(), big.size(), true, false));

    ws::Frame frame;
    std::string err;
    assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kFrameReady);
    assert(!frame.fin && !frame.masked && frame.opcode == ws::kText && frame.payload == "hel");
    assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kFrameReady);
    assert(frame.fin && frame.opcode == ws::kContinuation && frame.payload == "lo");
    assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kFrameReady);
    assert(frame.payload.size() == big.size());
    assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kIncomplete);
    LOG_INFO << "Unmasked Frames Queued PASS";
}

void testBadFrames() {
    ws::Frame frame;
    std::string err;
    {
        Buffer buf;
        const char rsv[] = {static_cast<char>(0xC1), 0x00};
        buf.Append(rsv, 2);
        assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kBadFrame);
        assert(buf.ReadableBytes() == 2);
    }
    {
        Buffer buf;
        const char op[] = {static_cast<char>(0x83), 0x00};
        buf.Append(op, 2);
        assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kBadFrame);
    }
    {
        Buffer buf;
        const char ping[] = {0x09, 0x00};
        buf.Append(ping, 2);
        assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kBadFrame);
    }
    {
        Buffer buf;
        const char huge[] = {static_cast<char>(0x82), 127, 0, 0, 0, 0, 0x10, 0, 0, 0};
        buf.Append(huge, sizeof huge);
        assert(ws::DecodeFrame(&buf, &frame, &err) == ws::kFrameTooBig);
    }
    LOG_INFO << "Bad Frames PASS";
}

void testClosePayload() {
    assert(ws::IsSendableCloseCode(1000));
    assert(ws::IsSendableCloseCode(1011));
    assert(ws::IsSendableCloseCode(4000));
    assert(!ws::IsSendableCloseCode(1005));
    assert(!ws::IsSendableCloseCode(1006));
    assert(!ws::IsSendableCloseCode(1015));
    assert(!ws::IsSendableCloseCode(2000));
    assert(!ws::IsSendableCloseCode(999));
    assert(!ws::IsSendableCloseCode(5000));

    assert(ws::EncodeClosePayload(ws::kNoStatusReceived, "x").empty());
    assert(ws::EncodeClosePayload(0, "").empty());
    const std::string payload = ws::EncodeClosePayload(4000, "upstream done");
    assert(payload.size() == 2 + 13);
    assert(ws::EncodeClosePayload(1000, std::string(200, 'r')).size() == 125);

    uint16_t code = 0;
    std::string reason;
    assert(ws::DecodeClosePayload(payload, &code, &reason));
    assert(code == 4000 && reason == "upstream done");
    assert(ws::DecodeClosePayload("", &code, &reason));
    assert(code == ws::kNoStatusReceived && reason.empty());
    assert(!ws::DecodeClosePayload("x", &code, &reason));
    assert(!ws::DecodeClosePayload(std::string("\x03\xed", 2), &code, &reason)); // 1005
    LOG_INFO << "Close Payload PASS";
}

int main() {
    Logger::Instance().SetLevel(LogLevel::INFO);
    testAcceptKey();
    testMaskedFrameFromClient();
    testUnmaskedFramesQueued();
    testBadFrames();
    testClosePayload();
    return 0;
}
