/**
 * @file relay_frame.hpp
 * @brief Control signals on the relay's push channel.
 *
 * @details
 * The relay never pushes message content over the persistent connection. It
 * pushes one-byte signals and the client reacts:
 *
 * | byte | RelayFrame          | session reaction                                |
 * |------|---------------------|-------------------------------------------------|
 * | `#`  | KeepAlive           | reset inactivity timer                          |
 * | `!`  | NewMessage          | schedule a fetch                                |
 * | `R`  | Reload              | reconnect now (no backoff growth), then re-sync |
 * | `E`  | ReloadCredentials   | drop token, CredentialsRevoked, no reconnect    |
 * | `A`  | SessionSuperseded   | SessionSuperseded, no reconnect                 |
 *
 * Several signals may share one WebSocket message; each byte is one frame.
 *
 * Client to relay there is exactly one frame, sent right after the socket
 * opens: `login:<device_id>:<secret>\n`.
 */
#ifndef PUSHWIRE_RELAY_FRAME_HPP
#define PUSHWIRE_RELAY_FRAME_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "pushwire/credentials.hpp"

namespace pushwire {

enum class RelayFrame : uint8_t {
  KeepAlive = 0,
  NewMessage,
  Reload,
  ReloadCredentials,
  SessionSuperseded,
  Unknown
};

RelayFrame classify_frame(uint8_t byte);

/// Classify every byte of one push-channel message, in order.
std::vector<RelayFrame> classify_payload(const std::vector<uint8_t>& payload);

const char* to_string(RelayFrame f);

std::string identification_frame(const Token& token);

} // namespace pushwire

#endif // PUSHWIRE_RELAY_FRAME_HPP
