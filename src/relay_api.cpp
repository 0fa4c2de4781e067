// ============================================================================
// relay_api.cpp - HttpRelayApi, the production IRelayApi
// Endpoint table and status mapping: include/pushwire/relay_api.hpp
// ============================================================================

#include "pushwire/relay_api.hpp"
#include "pushwire/http.hpp"
#include "pushwire/parser.hpp"

#include <utility>

namespace pushwire {

namespace {

// Map transport/status failures onto the code the caller reports. A non-2xx
// reply with a JSON body still carries the relay's own reason.
bool check_reply(const http::Response& resp, ErrorCode body_code, Error& err) {
  const ErrorCode c = classify_http_status(resp.status);
  if (c != ErrorCode::Ok) {
    Error detail;
    std::string reason = "http_status=" + std::to_string(resp.status);
    if (!parser::check_status(resp.body, c, detail) && detail.code == c && !detail.reason.empty())
      reason += " " + detail.reason;
    err.set(c, reason);
    return false;
  }
  return parser::check_status(resp.body, body_code, err);
}

http::Request form_post(const std::string& url, const std::vector<std::pair<std::string, std::string>>& fields) {
  http::Request req;
  req.method = "POST";
  req.url = url;
  req.headers.emplace_back("Content-Type", "application/x-www-form-urlencoded");
  req.body = http::form_encode(fields);
  return req;
}

} // namespace

ErrorCode classify_http_status(int status) {
  if (status >= 200 && status < 300) return ErrorCode::Ok;
  if (status == 408 || status == 429) return ErrorCode::NetworkError;
  if (status >= 400 && status < 500) return ErrorCode::AuthError;
  return ErrorCode::NetworkError;
}

HttpRelayApi::HttpRelayApi(std::string base_url, uint32_t timeout_ms)
: base_url_(std::move(base_url)), timeout_ms_(timeout_ms) {
  while (!base_url_.empty() && base_url_.back() == '/') base_url_.pop_back();
}

bool HttpRelayApi::fetch_messages(const Token& token, std::vector<MessagePtr>& out, Error& err) {
  http::Request req;
  req.url = base_url_ + "/messages.json?secret=" + http::url_encode(token.secret) +
            "&device_id=" + http::url_encode(token.device_id);

  http::Response resp;
  if (!http::perform(req, timeout_ms_, resp, err)) return false;

  const ErrorCode c = classify_http_status(resp.status);
  if (c != ErrorCode::Ok) return check_reply(resp, ErrorCode::FetchError, err);
  return parser::parse_messages_response(resp.body, out, err);
}

bool HttpRelayApi::update_highest_message(const Token& token, int64_t message_id, Error& err) {
  const auto req = form_post(base_url_ + "/devices/" + http::url_encode(token.device_id) +
                             "/update_highest_message.json",
                             {{"secret", token.secret}, {"message", std::to_string(message_id)}});
  http::Response resp;
  if (!http::perform(req, timeout_ms_, resp, err)) return false;
  return check_reply(resp, ErrorCode::FetchError, err);
}

bool HttpRelayApi::acknowledge(const Token& token, const std::string& receipt_id, Error& err) {
  const auto req = form_post(base_url_ + "/receipts/" + http::url_encode(receipt_id) + "/acknowledge.json",
                             {{"secret", token.secret}});
  http::Response resp;
  if (!http::perform(req, timeout_ms_, resp, err)) return false;
  return check_reply(resp, ErrorCode::AckError, err);
}

bool HttpRelayApi::login(const std::string& email, const std::string& password,
                         const std::string& twofa, LoginResult& out, Error& err) {
  std::vector<std::pair<std::string, std::string>> fields{{"email", email}, {"password", password}};
  if (!twofa.empty()) fields.emplace_back("twofa", twofa);

  http::Response resp;
  if (!http::perform(form_post(base_url_ + "/users/login.json", fields), timeout_ms_, resp, err)) return false;
  if (resp.status == 412) {
    err.set(ErrorCode::AuthError, "twofa_required");
    return false;
  }
  if (classify_http_status(resp.status) != ErrorCode::Ok) return check_reply(resp, ErrorCode::AuthError, err);
  return parser::parse_login_response(resp.body, out.user_key, out.secret, err);
}

bool HttpRelayApi::register_device(const std::string& secret, const std::string& name,
                                   std::string& device_id, Error& err) {
  const auto req = form_post(base_url_ + "/devices.json", {{"secret", secret}, {"name", name}, {"os", "O"}});
  http::Response resp;
  if (!http::perform(req, timeout_ms_, resp, err)) return false;
  if (classify_http_status(resp.status) != ErrorCode::Ok) return check_reply(resp, ErrorCode::AuthError, err);
  return parser::parse_device_response(resp.body, device_id, err);
}

} // namespace pushwire
