/**
 * @file errors.hpp
 * @brief Error codes and the Error record filled by every fallible pushwire call.
 *
 * @details
 * pushwire does not throw across module boundaries. A fallible function returns
 * `bool` (or `std::optional`) and fills an `Error&` out-parameter on failure,
 * the same way the command builders report `reason=` strings.
 *
 * Transient vs terminal:
 * - `NetworkError`, `FetchError`, `AckError` are transient. Callers retry them
 *   (session backoff, emergency schedule).
 * - `AuthError` is not retried automatically. It means the user has to log in
 *   again.
 * - `ProtocolError` and `StorageError` report malformed relay data or a state
 *   file that could not be read/written.
 *
 * Terminal session conditions (credentials revoked, session superseded) and
 * emergency expiry are *events*, not errors. See session.hpp and
 * emergency_loop.hpp.
 */
#ifndef PUSHWIRE_ERRORS_HPP
#define PUSHWIRE_ERRORS_HPP

#include <cstdint>
#include <string>
#include <utility>

namespace pushwire {

enum class ErrorCode : uint8_t {
  Ok = 0,
  AuthError,
  NetworkError,
  FetchError,
  AckError,
  ProtocolError,
  StorageError
};

struct Error {
  ErrorCode   code{ErrorCode::Ok};
  std::string reason;

  bool ok() const { return code == ErrorCode::Ok; }

  void set(ErrorCode c, std::string r) {
    code = c;
    reason = std::move(r);
  }

  void clear() {
    code = ErrorCode::Ok;
    reason.clear();
  }
};

/// Short lowercase name used in log lines ("auth_error", "network_error", ...).
const char* to_string(ErrorCode code);

/// True for codes the caller is expected to retry on its own schedule.
inline bool is_transient(ErrorCode code) {
  return code == ErrorCode::NetworkError || code == ErrorCode::FetchError ||
         code == ErrorCode::AckError;
}

} // namespace pushwire

#endif // PUSHWIRE_ERRORS_HPP
