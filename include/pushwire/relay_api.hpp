/**
 * @file relay_api.hpp
 * @brief Authenticated request channel to the relay's REST endpoint.
 *
 * @details
 * | call                     | relay endpoint                                      |
 * |--------------------------|-----------------------------------------------------|
 * | fetch_messages           | GET  /messages.json?secret=..&device_id=..          |
 * | update_highest_message   | POST /devices/<id>/update_highest_message.json      |
 * | acknowledge              | POST /receipts/<receipt>/acknowledge.json           |
 * | login                    | POST /users/login.json                              |
 * | register_device          | POST /devices.json                                  |
 *
 * HTTP status mapping (all calls):
 * - 2xx: body checked for `"status": 1`.
 * - 401, 403 and other 4xx: AuthError, except 408/429 which are transient.
 * - 412 on login: AuthError with reason "twofa_required".
 * - 5xx, 408, 429, timeouts, socket errors: NetworkError.
 *
 * The session, fetcher and emergency loop only see IRelayApi so tests can
 * script the relay.
 */
#ifndef PUSHWIRE_RELAY_API_HPP
#define PUSHWIRE_RELAY_API_HPP

#include <cstdint>
#include <string>
#include <vector>

#include "pushwire/credentials.hpp"
#include "pushwire/errors.hpp"
#include "pushwire/message.hpp"

namespace pushwire {

struct LoginResult {
  std::string user_key;
  std::string secret;
};

class IRelayApi {
public:
  virtual ~IRelayApi() = default;

  /// All messages the relay still queues for this device, in relay order.
  virtual bool fetch_messages(const Token& token, std::vector<MessagePtr>& out, Error& err) = 0;

  /// Delivery receipt: everything up to and including @p message_id was received.
  virtual bool update_highest_message(const Token& token, int64_t message_id, Error& err) = 0;

  /// Emergency acknowledgment for one receipt.
  virtual bool acknowledge(const Token& token, const std::string& receipt_id, Error& err) = 0;

  virtual bool login(const std::string& email, const std::string& password,
                     const std::string& twofa, LoginResult& out, Error& err) = 0;

  virtual bool register_device(const std::string& secret, const std::string& name,
                               std::string& device_id, Error& err) = 0;
};

/// Error code for a non-2xx status, ErrorCode::Ok for 2xx.
ErrorCode classify_http_status(int status);

class HttpRelayApi : public IRelayApi {
public:
  HttpRelayApi(std::string base_url, uint32_t timeout_ms);

  bool fetch_messages(const Token& token, std::vector<MessagePtr>& out, Error& err) override;
  bool update_highest_message(const Token& token, int64_t message_id, Error& err) override;
  bool acknowledge(const Token& token, const std::string& receipt_id, Error& err) override;
  bool login(const std::string& email, const std::string& password,
             const std::string& twofa, LoginResult& out, Error& err) override;
  bool register_device(const std::string& secret, const std::string& name,
                       std::string& device_id, Error& err) override;

private:
  std::string base_url_;
  uint32_t    timeout_ms_;
};

} // namespace pushwire

#endif // PUSHWIRE_RELAY_API_HPP
