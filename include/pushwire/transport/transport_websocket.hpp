#pragma once
/**
 * @file transport_websocket.hpp
 * @brief IConnection over a WebSocket (RFC 6455) on top of TlsStream.
 *
 * Handshake: HTTP/1.1 Upgrade with a random Sec-WebSocket-Key; the reply must
 * be 101 with the matching Sec-WebSocket-Accept. 401/403 is AuthError.
 *
 * After the handshake recv() returns one reassembled data message per call.
 * Pings are answered with pongs, a close frame is echoed and reported as
 * RxResult::Closed. Messages decoded beyond the one being returned wait in a
 * small fixed-capacity queue.
 */

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <etl/deque.h>

#include "pushwire/transport/transport_base.hpp"
#include "pushwire/transport/tls_stream.hpp"
#include "pushwire/transport/ws_frame.hpp"

namespace pushwire::transport {

/// base64(SHA1(key + RFC 6455 GUID)), the value the server must echo.
std::string websocket_accept_key(const std::string& client_key);

class WebSocketConnection : public IConnection {
public:
  static constexpr size_t READY_CAPACITY = 32;

  WebSocketConnection();
  explicit WebSocketConnection(std::unique_ptr<IByteStream> stream);

  bool        open(const std::string& url, uint32_t timeout_ms, Error& err) override;
  bool        send_text(const std::string& text, Error& err) override;
  RxResult    recv(std::vector<uint8_t>& payload, uint32_t timeout_ms, Error& err) override;
  void        close() override;
  bool        is_open() const override { return stream_->is_open(); }
  const char* name() const override { return "websocket"; }

private:
  bool send_frame(ws::Opcode op, const uint8_t* data, size_t len, Error& err);
  bool handshake(const Url& url, uint32_t timeout_ms, Error& err);

  /// Feed raw bytes through the decoder; returns false on protocol error or close.
  RxResult absorb(const uint8_t* data, size_t len, Error& err);

  std::unique_ptr<IByteStream> stream_;
  ws::decoder          dec_;
  std::vector<uint8_t> assembling_;
  bool                 in_message_{false};
  uint32_t             io_timeout_ms_{15000};
  etl::deque<std::vector<uint8_t>, READY_CAPACITY> ready_;
};

} // namespace pushwire::transport
