#pragma once
/**
 * @file tls_stream.hpp
 * @brief Byte stream over TCP, optionally wrapped in TLS (OpenSSL), with
 *        per-call timeouts.
 *
 * @details
 * Shared by the WebSocket connection and the HTTPS request channel. `wss://`
 * and `https://` URLs get TLS with peer verification against the system trust
 * store and hostname checking; `ws://` and `http://` stay plain TCP (local
 * relays, tests).
 *
 * Every blocking step (resolve excluded) is bounded by the timeout passed in.
 * A timeout is reported as NetworkError with reason "timeout".
 *
 * Not thread-safe: one owner at a time.
 */

#include <cstddef>
#include <cstdint>
#include <string>

#include "pushwire/errors.hpp"
#include "pushwire/transport/transport_base.hpp"

typedef struct ssl_st     SSL;
typedef struct ssl_ctx_st SSL_CTX;

namespace pushwire::transport {

struct Url {
  bool        tls{true};
  std::string host;
  uint16_t    port{443};
  std::string path{"/"};     ///< Path plus query, always starts with '/'.
};

/// Accepts http, https, ws and wss. Default ports 80/443.
bool parse_url(const std::string& text, Url& out, Error& err);

/**
 * @brief Ordered byte stream the WebSocket layer frames on.
 *
 * TlsStream is the production implementation; tests script one in memory.
 * read_some() returns Ok with n > 0, None on timeout, Closed on orderly EOF,
 * Error otherwise.
 */
class IByteStream {
public:
  virtual ~IByteStream() = default;
  virtual bool     connect(const Url& url, uint32_t timeout_ms, Error& err) = 0;
  virtual bool     write_all(const uint8_t* data, size_t len, uint32_t timeout_ms, Error& err) = 0;
  virtual RxResult read_some(uint8_t* out, size_t cap, size_t& n, uint32_t timeout_ms, Error& err) = 0;
  virtual void     close() = 0;
  virtual bool     is_open() const = 0;
};

class TlsStream : public IByteStream {
public:
  TlsStream() = default;
  ~TlsStream() override;

  TlsStream(const TlsStream&) = delete;
  TlsStream& operator=(const TlsStream&) = delete;

  bool connect(const Url& url, uint32_t timeout_ms, Error& err) override;

  /// Write all bytes or fail.
  bool write_all(const uint8_t* data, size_t len, uint32_t timeout_ms, Error& err) override;

  /**
   * @brief Read whatever is available, waiting up to timeout_ms.
   * @return Ok with n > 0, None on timeout, Closed on orderly EOF, Error otherwise.
   */
  RxResult read_some(uint8_t* out, size_t cap, size_t& n, uint32_t timeout_ms, Error& err) override;

  void close() override;
  bool is_open() const override { return fd_ >= 0; }

private:
  bool wait_fd(bool for_write, uint32_t timeout_ms, Error& err);

  int      fd_{-1};
  SSL_CTX* ctx_{nullptr};
  SSL*     ssl_{nullptr};
};

} // namespace pushwire::transport
