#pragma once
/**
 * @file transport_base.hpp
 * @brief Connection interface the session drives; the relay socket hides behind it.
 *
 * The session never touches sockets. It opens one IConnection, sends the
 * identification frame, then polls recv() from its own thread. Tests swap in a
 * scripted fake.
 */

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "pushwire/errors.hpp"

namespace pushwire::transport {

enum class RxResult : uint8_t { None = 0, Ok = 1, Closed = 2, Error = 3 };

/**
 * @brief One persistent, message-oriented connection.
 *
 * Contract:
 *  - open(url, timeout_ms, err) connects and completes any handshake. A relay
 *    that refuses the handshake with 401/403 reports AuthError; everything
 *    else is NetworkError.
 *  - send_text() sends one complete message.
 *  - recv(payload, timeout_ms, err) waits at most timeout_ms for one complete
 *    message. None means the wait timed out with nothing to report.
 *  - close() is idempotent; is_open() is false afterwards.
 *  - name() is a short identifier for logs.
 */
class IConnection {
public:
  virtual ~IConnection() = default;
  virtual bool        open(const std::string& url, uint32_t timeout_ms, Error& err) = 0;
  virtual bool        send_text(const std::string& text, Error& err) = 0;
  virtual RxResult    recv(std::vector<uint8_t>& payload, uint32_t timeout_ms, Error& err) = 0;
  virtual void        close() = 0;
  virtual bool        is_open() const = 0;
  virtual const char* name() const = 0;
};

} // namespace pushwire::transport
