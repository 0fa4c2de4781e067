#pragma once
/**
 * @file parser.hpp
 * @brief JSON codec for relay responses and for Messages persisted in state.json.
 *
 * All functions catch `nlohmann::json::exception` at the parse site and report
 * `ErrorCode::ProtocolError` instead of throwing.
 */

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "pushwire/errors.hpp"
#include "pushwire/message.hpp"

namespace pushwire {
namespace parser {

/**
 * @brief Decode the relay's `messages.json` body.
 *
 * Checks `"status": 1`, then converts every entry of `"messages"`. Entries
 * without a numeric `id` are skipped (logged), the rest keep relay order.
 */
bool parse_messages_response(const std::string& body, std::vector<MessagePtr>& out, Error& err);

/**
 * @brief Check a generic `{ "status": 1, ... }` reply.
 *
 * On `status != 1` the first entry of `"errors"` (if any) becomes the reason.
 * @p code is the ErrorCode reported on failure.
 */
bool check_status(const std::string& body, ErrorCode code, Error& err);

/// `users/login.json` → user key and secret.
bool parse_login_response(const std::string& body, std::string& user_key, std::string& secret, Error& err);

/// `devices.json` → device id.
bool parse_device_response(const std::string& body, std::string& device_id, Error& err);

/// Convert one relay message object. Returns false when `id` is missing.
bool message_from_relay(const nlohmann::json& j, Message& out);

/// State-file form of a Message. Round-trips exactly with message_from_state().
nlohmann::json message_to_state(const Message& m);
bool message_from_state(const nlohmann::json& j, Message& out);

} // namespace parser
} // namespace pushwire
