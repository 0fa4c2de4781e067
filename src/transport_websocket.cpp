// ============================================================================
// transport_websocket.cpp - implementation for transport/transport_websocket.hpp
// Framing lives in ws_frame.hpp; this file does the upgrade handshake and the
// control-frame chores (ping/pong, close) so the session only sees data.
// ============================================================================

#include "pushwire/transport/transport_websocket.hpp"
#include "pushwire/log.hpp"

#include <array>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <utility>

#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>

namespace pushwire::transport {

namespace {

constexpr const char* WS_GUID = "258EAFA5-E914-47DA-95CA-C5AB0DC85B11";
constexpr size_t      MAX_HANDSHAKE = 16 * 1024;

std::string base64(const unsigned char* data, size_t len) {
  std::string out(4 * ((len + 2) / 3), '\0');
  const int n = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&out[0]), data, static_cast<int>(len));
  out.resize(n > 0 ? static_cast<size_t>(n) : 0);
  return out;
}

std::string lower(std::string s) {
  for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return s;
}

std::string trim(const std::string& s) {
  size_t b = 0, e = s.size();
  while (b < e && std::isspace(static_cast<unsigned char>(s[b]))) ++b;
  while (e > b && std::isspace(static_cast<unsigned char>(s[e - 1]))) --e;
  return s.substr(b, e - b);
}

uint64_t mono_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

} // namespace

std::string websocket_accept_key(const std::string& client_key) {
  const std::string in = client_key + WS_GUID;
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char*>(in.data()), in.size(), digest);
  return base64(digest, sizeof(digest));
}

WebSocketConnection::WebSocketConnection() : stream_(std::make_unique<TlsStream>()) {}

WebSocketConnection::WebSocketConnection(std::unique_ptr<IByteStream> stream) : stream_(std::move(stream)) {}

bool WebSocketConnection::open(const std::string& url, uint32_t timeout_ms, Error& err) {
  close();
  Url u;
  if (!parse_url(url, u, err)) return false;
  io_timeout_ms_ = timeout_ms;
  if (!stream_->connect(u, timeout_ms, err)) return false;
  if (!handshake(u, timeout_ms, err)) { stream_->close(); return false; }
  return true;
}

// ---------------------------------------------------------------------------
// handshake()
// -----------
// Send the Upgrade request, read until the blank line, check status and
// Sec-WebSocket-Accept. Any bytes past the header already belong to the frame
// stream and go through the decoder.
// ---------------------------------------------------------------------------
bool WebSocketConnection::handshake(const Url& url, uint32_t timeout_ms, Error& err) {
  unsigned char nonce[16];
  if (RAND_bytes(nonce, sizeof(nonce)) != 1) {
    err.set(ErrorCode::NetworkError, "rand_bytes_failed");
    return false;
  }
  const std::string key = base64(nonce, sizeof(nonce));

  std::string req;
  req += "GET " + url.path + " HTTP/1.1\r\n";
  req += "Host: " + url.host + "\r\n";
  req += "Upgrade: websocket\r\n";
  req += "Connection: Upgrade\r\n";
  req += "Sec-WebSocket-Key: " + key + "\r\n";
  req += "Sec-WebSocket-Version: 13\r\n";
  req += "User-Agent: pushwire\r\n\r\n";
  if (!stream_->write_all(reinterpret_cast<const uint8_t*>(req.data()), req.size(), timeout_ms, err)) return false;

  const uint64_t deadline = mono_ms() + timeout_ms;
  std::string head;
  size_t end = std::string::npos;
  uint8_t buf[1024];
  while (end == std::string::npos) {
    if (head.size() > MAX_HANDSHAKE) { err.set(ErrorCode::ProtocolError, "ws_handshake_too_large"); return false; }
    const uint64_t now = mono_ms();
    if (now >= deadline) { err.set(ErrorCode::NetworkError, "timeout"); return false; }
    size_t n = 0;
    const RxResult r = stream_->read_some(buf, sizeof(buf), n, static_cast<uint32_t>(deadline - now), err);
    if (r == RxResult::Error) return false;
    if (r == RxResult::Closed) { err.set(ErrorCode::NetworkError, "ws_handshake_eof"); return false; }
    if (r == RxResult::None) continue;
    head.append(reinterpret_cast<const char*>(buf), n);
    end = head.find("\r\n\r\n");
  }

  // Status line: HTTP/1.1 101 Switching Protocols
  const auto eol = head.find("\r\n");
  const std::string status_line = head.substr(0, eol);
  const auto sp = status_line.find(' ');
  const int status = (sp == std::string::npos) ? 0 : std::atoi(status_line.c_str() + sp + 1);
  if (status == 401 || status == 403) {
    err.set(ErrorCode::AuthError, "ws_handshake_status=" + std::to_string(status));
    return false;
  }
  if (status != 101) {
    err.set(ErrorCode::NetworkError, "ws_handshake_status=" + std::to_string(status));
    return false;
  }

  std::string accept;
  size_t pos = eol + 2;
  while (pos < end) {
    const auto next = head.find("\r\n", pos);
    const std::string line = head.substr(pos, next - pos);
    const auto colon = line.find(':');
    if (colon != std::string::npos && lower(trim(line.substr(0, colon))) == "sec-websocket-accept")
      accept = trim(line.substr(colon + 1));
    pos = next + 2;
  }
  if (accept != websocket_accept_key(key)) {
    err.set(ErrorCode::ProtocolError, "ws_bad_accept_key");
    return false;
  }

  dec_.reset();
  assembling_.clear();
  in_message_ = false;
  ready_.clear();

  const size_t body_at = end + 4;
  if (body_at < head.size()) {
    const RxResult r = absorb(reinterpret_cast<const uint8_t*>(head.data()) + body_at, head.size() - body_at, err);
    if (r == RxResult::Error || r == RxResult::Closed) return false;
  }
  return true;
}

bool WebSocketConnection::send_frame(ws::Opcode op, const uint8_t* data, size_t len, Error& err) {
  std::array<uint8_t, 4> mask{};
  if (RAND_bytes(mask.data(), static_cast<int>(mask.size())) != 1) {
    err.set(ErrorCode::NetworkError, "rand_bytes_failed");
    return false;
  }
  std::vector<uint8_t> wire;
  ws::encode(op, data, len, mask, wire);
  return stream_->write_all(wire.data(), wire.size(), io_timeout_ms_, err);
}

bool WebSocketConnection::send_text(const std::string& text, Error& err) {
  return send_frame(ws::Opcode::Text, reinterpret_cast<const uint8_t*>(text.data()), text.size(), err);
}

// ---------------------------------------------------------------------------
// absorb()
// --------
// Decode bytes, answer control frames, reassemble fragmented data messages
// into ready_. Returns Ok when at least one message is ready, None when more
// bytes are needed, Closed on a close frame, Error on protocol violations.
// ---------------------------------------------------------------------------
RxResult WebSocketConnection::absorb(const uint8_t* data, size_t len, Error& err) {
  ws::Frame f;
  for (size_t i = 0; i < len; ++i) {
    const ws::FeedResult fr = dec_.feed(data[i], f);
    if (fr == ws::FeedResult::NeedMore) continue;
    if (fr == ws::FeedResult::Error) {
      err.set(ErrorCode::ProtocolError, "ws_bad_frame");
      return RxResult::Error;
    }

    switch (f.opcode) {
      case ws::Opcode::Ping:
        if (!send_frame(ws::Opcode::Pong, f.payload.data(), f.payload.size(), err)) return RxResult::Error;
        break;
      case ws::Opcode::Pong:
        break;
      case ws::Opcode::Close: {
        Error ignored;
        if (!send_frame(ws::Opcode::Close, f.payload.data(), f.payload.size(), ignored))
          log::debug("ws_close_echo_failed", {{"reason", ignored.reason}});
        return RxResult::Closed;
      }
      case ws::Opcode::Text:
      case ws::Opcode::Binary:
        if (in_message_) { err.set(ErrorCode::ProtocolError, "ws_unfinished_fragment"); return RxResult::Error; }
        assembling_ = std::move(f.payload);
        in_message_ = !f.fin;
        break;
      case ws::Opcode::Continuation:
        if (!in_message_) { err.set(ErrorCode::ProtocolError, "ws_orphan_continuation"); return RxResult::Error; }
        if (assembling_.size() + f.payload.size() > ws::MAX_PAYLOAD) {
          err.set(ErrorCode::ProtocolError, "ws_message_too_large");
          return RxResult::Error;
        }
        assembling_.insert(assembling_.end(), f.payload.begin(), f.payload.end());
        in_message_ = !f.fin;
        break;
      default:
        err.set(ErrorCode::ProtocolError, "ws_bad_opcode");
        return RxResult::Error;
    }

    const bool data_frame = f.opcode == ws::Opcode::Text || f.opcode == ws::Opcode::Binary ||
                            f.opcode == ws::Opcode::Continuation;
    if (data_frame && !in_message_) {
      if (ready_.full()) { err.set(ErrorCode::ProtocolError, "ws_ready_queue_full"); return RxResult::Error; }
      ready_.push_back(std::move(assembling_));
      assembling_.clear();
    }
  }
  return ready_.empty() ? RxResult::None : RxResult::Ok;
}

RxResult WebSocketConnection::recv(std::vector<uint8_t>& payload, uint32_t timeout_ms, Error& err) {
  payload.clear();
  if (!ready_.empty()) {
    payload = std::move(ready_.front());
    ready_.pop_front();
    return RxResult::Ok;
  }
  if (!stream_->is_open()) { err.set(ErrorCode::NetworkError, "not_connected"); return RxResult::Error; }

  const uint64_t deadline = mono_ms() + timeout_ms;
  uint8_t buf[512];
  for (;;) {
    const uint64_t now = mono_ms();
    const uint32_t left = now >= deadline ? 0 : static_cast<uint32_t>(deadline - now);
    size_t n = 0;
    const RxResult r = stream_->read_some(buf, sizeof(buf), n, left, err);
    if (r == RxResult::None) return RxResult::None;
    if (r == RxResult::Closed || r == RxResult::Error) { stream_->close(); return r; }

    const RxResult a = absorb(buf, n, err);
    if (a == RxResult::Closed || a == RxResult::Error) { stream_->close(); return a; }
    if (a == RxResult::Ok) {
      payload = std::move(ready_.front());
      ready_.pop_front();
      return RxResult::Ok;
    }
    if (left == 0) return RxResult::None;
  }
}

void WebSocketConnection::close() {
  if (stream_->is_open()) {
    Error ignored;
    const uint8_t normal[2] = {0x03, 0xE8};   // 1000 normal closure
    if (!send_frame(ws::Opcode::Close, normal, sizeof(normal), ignored))
      log::debug("ws_close_send_failed", {{"reason", ignored.reason}});
  }
  stream_->close();
  dec_.reset();
  assembling_.clear();
  in_message_ = false;
  ready_.clear();
}

} // namespace pushwire::transport
