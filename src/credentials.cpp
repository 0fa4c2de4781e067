#include "pushwire/credentials.hpp"
#include "pushwire/state_store.hpp"

namespace pushwire {

std::optional<Token> StateCredentialStore::get_token() const {
  auto st = store_.snapshot();
  Token t{st.device_id, st.secret};
  if (t.empty()) return std::nullopt;
  return t;
}

bool StateCredentialStore::set_token(const Token& token, Error& err) {
  std::string key = user_key_;
  if (key.empty()) key = store_.snapshot().user_key;   // keep what login stored
  return store_.set_credentials(token.device_id, token.secret, key, err);
}

bool StateCredentialStore::clear_token(Error& err) {
  return store_.clear_credentials(err);
}

} // namespace pushwire
