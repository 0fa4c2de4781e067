/**
 * @file message.hpp
 * @brief The Message record handed from the fetcher to the ledger, the
 *        emergency loop and the notification sink.
 *
 * @details
 * A Message is built once, from the relay's JSON (see parser.hpp), and never
 * mutated afterwards. It travels as `MessagePtr` (shared, const) so the
 * fetcher, the emergency loop and the sink all look at the same object.
 * Acknowledgment progress is tracked next to it in `AckState`, never inside it.
 *
 * Timestamps are milliseconds since the Unix epoch. The relay speaks seconds;
 * the parser converts.
 */
#ifndef PUSHWIRE_MESSAGE_HPP
#define PUSHWIRE_MESSAGE_HPP

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace pushwire {

/**
 * @brief Relay priority classes.
 *
 * Wire values are -2..2. Only `Emergency` enters the acknowledgment loop.
 */
enum class Priority : int8_t {
  Lowest    = -2,
  Low       = -1,
  Normal    =  0,
  High      =  1,
  Emergency =  2
};

/// Map a wire integer to a Priority; values outside -2..2 are clamped.
Priority priority_from_wire(int64_t v);

/// "lowest", "low", "normal", "high", "emergency".
const char* to_string(Priority p);

struct Message {
  int64_t     id{0};                    ///< Server-assigned, monotonic per device.
  Priority    priority{Priority::Normal};
  std::string title;                    ///< Falls back to the app name when the relay omits it.
  std::string body;
  std::string app;
  uint64_t    received_at_ms{0};        ///< Relay "date" field.

  std::optional<uint64_t>    expires_at_ms;      ///< Emergency only, when the relay declares it.
  std::optional<std::string> receipt_id;         ///< Emergency only.
  std::optional<uint32_t>    retry_interval_ms;  ///< Emergency only, server-declared re-alert interval.

  bool acked{false};                    ///< Relay already saw an acknowledgment for this receipt.

  std::optional<std::string> url;
  std::optional<std::string> url_title;
  std::optional<std::string> sound;
  bool html{false};

  /// True when this message must be re-alerted until acknowledged or expired.
  bool needs_ack_loop() const {
    return priority == Priority::Emergency && receipt_id.has_value() && !receipt_id->empty() && !acked;
  }
};

using MessagePtr = std::shared_ptr<const Message>;

} // namespace pushwire

#endif // PUSHWIRE_MESSAGE_HPP
