#pragma once
/**
 * @file credentials.hpp
 * @brief Credential Store contract and the state-file backed implementation.
 *
 * The core never looks inside a Token; it only hands it to the relay API and
 * to the identification frame. Secure storage (keychain, secret service) is a
 * platform concern: implement ICredentialStore and pass it to Client.
 */

#include <optional>
#include <string>
#include <utility>

#include "pushwire/errors.hpp"

namespace pushwire {

/// Device/session token issued by the relay at login + device registration.
struct Token {
  std::string device_id;
  std::string secret;

  bool empty() const { return device_id.empty() || secret.empty(); }
  bool operator==(const Token& o) const { return device_id == o.device_id && secret == o.secret; }
  bool operator!=(const Token& o) const { return !(*this == o); }
};

class ICredentialStore {
public:
  virtual ~ICredentialStore() = default;
  virtual std::optional<Token> get_token() const = 0;
  virtual bool set_token(const Token& token, Error& err) = 0;
  virtual bool clear_token(Error& err) = 0;
};

class StateStore;

/// Keeps the token in state.json next to the ledger position.
class StateCredentialStore : public ICredentialStore {
public:
  explicit StateCredentialStore(StateStore& store) : store_(store) {}

  std::optional<Token> get_token() const override;
  bool set_token(const Token& token, Error& err) override;
  bool clear_token(Error& err) override;

  /// Optional user key kept alongside the token (informational only).
  void set_user_key(std::string key) { user_key_ = std::move(key); }

private:
  StateStore& store_;
  std::string user_key_;
};

} // namespace pushwire
