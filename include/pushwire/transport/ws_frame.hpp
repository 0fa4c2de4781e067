/**
 * @file ws_frame.hpp
 * @brief RFC 6455 frame encoder (client side, masked) and a byte-fed decoder.
 *
 * @details
 * PURPOSE
 * -------
 * The relay's push channel is a WebSocket. This header is the framing layer
 * only: it turns payloads into wire frames and wire bytes back into frames.
 * Sockets, TLS and the opening handshake live in transport_websocket.cpp.
 *
 * WIRE FORMAT (what we implement)
 * -------------------------------
 *   byte 0   FIN(1) RSV(3) OPCODE(4)
 *   byte 1   MASK(1) LEN(7)          LEN 126 -> 16-bit length follows,
 *                                    LEN 127 -> 64-bit length follows
 *   [mask]   4 bytes when MASK=1
 *   payload  XOR-ed with mask[i % 4] when MASK=1
 *
 * - Client-to-server frames are always masked (RFC 6455 §5.3).
 * - Server frames are normally unmasked; the decoder unmasks anyway if a mask
 *   is present.
 * - Fragmentation is reported frame by frame (FIN + opcode). Reassembly is the
 *   connection's job.
 *
 * LIMITS
 * ------
 * Frames announcing more than `MAX_PAYLOAD` bytes are a protocol error. The
 * relay only sends single-byte control frames, so the limit is generous.
 *
 * @code
 *   std::vector<uint8_t> wire;
 *   pushwire::ws::encode(pushwire::ws::Opcode::Text, data, n, mask, wire);
 *
 *   pushwire::ws::decoder dec;
 *   pushwire::ws::Frame f;
 *   for (uint8_t b : incoming)
 *     if (dec.feed(b, f) == pushwire::ws::FeedResult::Frame) handle(f);
 * @endcode
 */
#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

namespace pushwire {
namespace ws {

enum class Opcode : uint8_t {
  Continuation = 0x0,
  Text         = 0x1,
  Binary       = 0x2,
  Close        = 0x8,
  Ping         = 0x9,
  Pong         = 0xA
};

static constexpr size_t MAX_PAYLOAD = 1u << 20;

inline bool is_control(Opcode op) { return (static_cast<uint8_t>(op) & 0x8) != 0; }

struct Frame {
  bool                 fin{true};
  Opcode               opcode{Opcode::Binary};
  std::vector<uint8_t> payload;
};

/**
 * @brief Encode one masked client frame (FIN set).
 *
 * @param op    Frame opcode.
 * @param in    Payload bytes (may be null when n == 0).
 * @param n     Payload length.
 * @param mask  Masking key; callers draw it from a CSPRNG per frame.
 * @param out   Receives the complete frame; cleared first.
 */
inline void encode(Opcode op, const uint8_t* in, size_t n,
                   const std::array<uint8_t, 4>& mask, std::vector<uint8_t>& out) {
  out.clear();
  out.reserve(n + 14);

  out.push_back(static_cast<uint8_t>(0x80 | static_cast<uint8_t>(op)));   // FIN + opcode

  if (n < 126) {
    out.push_back(static_cast<uint8_t>(0x80 | n));
  } else if (n <= 0xFFFF) {
    out.push_back(0x80 | 126);
    out.push_back(static_cast<uint8_t>((n >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(n & 0xFF));
  } else {
    out.push_back(0x80 | 127);
    for (int shift = 56; shift >= 0; shift -= 8)
      out.push_back(static_cast<uint8_t>((static_cast<uint64_t>(n) >> shift) & 0xFF));
  }

  out.insert(out.end(), mask.begin(), mask.end());
  for (size_t i = 0; i < n; ++i) out.push_back(in[i] ^ mask[i % 4]);
}

enum class FeedResult : uint8_t { NeedMore = 0, Frame = 1, Error = 2 };

/**
 * @brief Stateful frame decoder for byte-at-a-time feeds.
 *
 * Mirrors the wire layout as a small state machine: header, extended length,
 * mask, payload. On a protocol error it resets and reports Error; the caller
 * is expected to close the connection since WebSocket has no resync point.
 */
struct decoder {
  enum class Stage : uint8_t { Head0, Head1, ExtLen, Mask, Payload };

  Stage    stage = Stage::Head0;
  Frame    cur;
  bool     masked = false;
  uint8_t  ext_left = 0;          ///< Extended-length bytes still to read (2 or 8).
  uint64_t len = 0;
  std::array<uint8_t, 4> mask{};
  uint8_t  mask_have = 0;

  void reset() {
    stage = Stage::Head0;
    cur = Frame{};
    masked = false;
    ext_left = 0;
    len = 0;
    mask_have = 0;
  }

  FeedResult feed(uint8_t b, Frame& out) {
    switch (stage) {
      case Stage::Head0:
        cur = Frame{};
        if (b & 0x70) { reset(); return FeedResult::Error; }      // RSV bits without extension
        cur.fin    = (b & 0x80) != 0;
        cur.opcode = static_cast<Opcode>(b & 0x0F);
        stage = Stage::Head1;
        return FeedResult::NeedMore;

      case Stage::Head1: {
        masked = (b & 0x80) != 0;
        const uint8_t l7 = b & 0x7F;
        if (is_control(cur.opcode) && (l7 > 125 || !cur.fin)) { reset(); return FeedResult::Error; }
        len = 0;
        if (l7 == 126)      { ext_left = 2; stage = Stage::ExtLen; return FeedResult::NeedMore; }
        if (l7 == 127)      { ext_left = 8; stage = Stage::ExtLen; return FeedResult::NeedMore; }
        len = l7;
        return after_length(out);
      }

      case Stage::ExtLen:
        len = (len << 8) | b;
        if (--ext_left > 0) return FeedResult::NeedMore;
        return after_length(out);

      case Stage::Mask:
        mask[mask_have++] = b;
        if (mask_have < 4) return FeedResult::NeedMore;
        if (len == 0) return complete(out);
        stage = Stage::Payload;
        return FeedResult::NeedMore;

      case Stage::Payload: {
        const size_t i = cur.payload.size();
        cur.payload.push_back(masked ? static_cast<uint8_t>(b ^ mask[i % 4]) : b);
        if (cur.payload.size() < len) return FeedResult::NeedMore;
        return complete(out);
      }
    }
    reset();
    return FeedResult::Error;
  }

private:
  FeedResult after_length(Frame& out) {
    if (len > MAX_PAYLOAD) { reset(); return FeedResult::Error; }
    cur.payload.reserve(static_cast<size_t>(len));
    if (masked) { mask_have = 0; stage = Stage::Mask; return FeedResult::NeedMore; }
    if (len == 0) return complete(out);
    stage = Stage::Payload;
    return FeedResult::NeedMore;
  }

  FeedResult complete(Frame& out) {
    out = std::move(cur);
    reset();
    return FeedResult::Frame;
  }
};

} // namespace ws
} // namespace pushwire
