/**
 * @file events.hpp
 * @brief Terminal conditions surfaced to the outer layer (CLI, tray, UI).
 *
 * These are not errors: nothing is retried after them. Each one asks the
 * outer layer for a user-facing reaction (re-login prompt, log entry).
 */
#ifndef PUSHWIRE_EVENTS_HPP
#define PUSHWIRE_EVENTS_HPP

#include <cstdint>
#include <functional>
#include <string>

namespace pushwire {

enum class EventKind : uint8_t {
  AuthRejected = 0,     ///< Relay refused the token at connect. Re-login needed.
  CredentialsRevoked,   ///< Relay asked for new credentials; token cleared.
  SessionSuperseded,    ///< Another client logged in with this device. No reconnect.
  EmergencyExpired      ///< An emergency alert ran out without acknowledgment.
};

struct Event {
  EventKind   kind{EventKind::AuthRejected};
  std::string detail;   ///< Receipt id for EmergencyExpired, reason text otherwise.
};

using EventCallback = std::function<void(const Event&)>;

inline const char* to_string(EventKind k) {
  switch (k) {
    case EventKind::AuthRejected:       return "auth_rejected";
    case EventKind::CredentialsRevoked: return "credentials_revoked";
    case EventKind::SessionSuperseded:  return "session_superseded";
    case EventKind::EmergencyExpired:   return "emergency_expired";
  }
  return "unknown";
}

} // namespace pushwire

#endif // PUSHWIRE_EVENTS_HPP
