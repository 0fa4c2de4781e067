/**
 * @file parser.cpp
 * @brief Implementation of the relay/state JSON codec (parser.hpp).
 *
 * @details
 * Relay shape (one entry of "messages"):
 * @code
 *   { "id": 41, "id_str": "41", "message": "disk full", "app": "nagios",
 *     "aid": 7, "icon": "nagios", "date": 1718000000, "priority": 2,
 *     "acked": 0, "umid": 99, "title": "host1", "receipt": "r4nd0m",
 *     "url": null, "sound": "siren", "html": 0 }
 * @endcode
 * Optional emergency hints are honored when present: "expires_at" (absolute,
 * seconds), "expire" (seconds after "date") and "retry" (seconds).
 *
 * The relay sends seconds; Message keeps milliseconds.
 */
#include "pushwire/parser.hpp"
#include "pushwire/log.hpp"

#include <cstdlib>

using nlohmann::json;

namespace pushwire {

Priority priority_from_wire(int64_t v) {
  if (v <= -2) return Priority::Lowest;
  if (v == -1) return Priority::Low;
  if (v == 0)  return Priority::Normal;
  if (v == 1)  return Priority::High;
  return Priority::Emergency;
}

const char* to_string(Priority p) {
  switch (p) {
    case Priority::Lowest:    return "lowest";
    case Priority::Low:       return "low";
    case Priority::Normal:    return "normal";
    case Priority::High:      return "high";
    case Priority::Emergency: return "emergency";
  }
  return "normal";
}

namespace parser {

// ---------- local helpers ----------

// Relay fields are frequently null instead of absent.
static std::optional<std::string> opt_string(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::nullopt;
  auto s = it->get<std::string>();
  if (s.empty()) return std::nullopt;
  return s;
}

static std::optional<int64_t> opt_int(const json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end()) return std::nullopt;
  if (it->is_number_integer()) return it->get<int64_t>();
  // id_str-style numbers delivered as strings
  if (it->is_string()) {
    const auto& s = it->get_ref<const std::string&>();
    if (s.empty()) return std::nullopt;
    char* e = nullptr;
    long long v = std::strtoll(s.c_str(), &e, 10);
    if (!e || *e) return std::nullopt;
    return static_cast<int64_t>(v);
  }
  return std::nullopt;
}

static std::string first_error(const json& j) {
  auto it = j.find("errors");
  if (it != j.end() && it->is_array() && !it->empty() && (*it)[0].is_string())
    return (*it)[0].get<std::string>();
  return "status_not_ok";
}

static bool parse_object(const std::string& body, json& out, Error& err) {
  try {
    out = json::parse(body);
  } catch (const json::exception& e) {
    err.set(ErrorCode::ProtocolError, std::string("bad_json: ") + e.what());
    return false;
  }
  if (!out.is_object()) {
    err.set(ErrorCode::ProtocolError, "bad_json: not an object");
    return false;
  }
  return true;
}

// ---------- relay responses ----------

bool message_from_relay(const json& j, Message& out) {
  if (!j.is_object()) return false;
  auto id = opt_int(j, "id");
  if (!id) return false;

  Message m;
  m.id       = *id;
  m.priority = priority_from_wire(opt_int(j, "priority").value_or(0));
  m.body     = opt_string(j, "message").value_or("");
  m.app      = opt_string(j, "app").value_or("");
  m.title    = opt_string(j, "title").value_or(m.app);

  const int64_t date_s = opt_int(j, "date").value_or(0);
  m.received_at_ms = date_s > 0 ? static_cast<uint64_t>(date_s) * 1000u : 0u;

  m.receipt_id = opt_string(j, "receipt");
  m.acked      = opt_int(j, "acked").value_or(0) != 0;
  m.url        = opt_string(j, "url");
  m.url_title  = opt_string(j, "url_title");
  m.sound      = opt_string(j, "sound");
  m.html       = opt_int(j, "html").value_or(0) != 0;

  // Emergency hints. Absolute wins over relative.
  if (auto abs_s = opt_int(j, "expires_at"); abs_s && *abs_s > 0) {
    m.expires_at_ms = static_cast<uint64_t>(*abs_s) * 1000u;
  } else if (auto rel_s = opt_int(j, "expire"); rel_s && *rel_s > 0 && date_s > 0) {
    m.expires_at_ms = static_cast<uint64_t>(date_s + *rel_s) * 1000u;
  }
  if (auto retry_s = opt_int(j, "retry"); retry_s && *retry_s > 0) {
    m.retry_interval_ms = static_cast<uint32_t>(*retry_s * 1000);
  }

  out = std::move(m);
  return true;
}

bool parse_messages_response(const std::string& body, std::vector<MessagePtr>& out, Error& err) {
  out.clear();
  json j;
  if (!parse_object(body, j, err)) return false;

  if (opt_int(j, "status").value_or(0) != 1) {
    err.set(ErrorCode::FetchError, first_error(j));
    return false;
  }

  auto it = j.find("messages");
  if (it == j.end() || it->is_null()) return true;   // nothing queued
  if (!it->is_array()) {
    err.set(ErrorCode::ProtocolError, "messages_not_array");
    return false;
  }

  for (const auto& entry : *it) {
    Message m;
    if (!message_from_relay(entry, m)) {
      log::warn("message_skipped", {{"reason", "missing_id"}});
      continue;
    }
    out.push_back(std::make_shared<const Message>(std::move(m)));
  }
  return true;
}

bool check_status(const std::string& body, ErrorCode code, Error& err) {
  json j;
  if (!parse_object(body, j, err)) return false;
  if (opt_int(j, "status").value_or(0) != 1) {
    err.set(code, first_error(j));
    return false;
  }
  return true;
}

bool parse_login_response(const std::string& body, std::string& user_key, std::string& secret, Error& err) {
  json j;
  if (!parse_object(body, j, err)) return false;
  if (opt_int(j, "status").value_or(0) != 1) {
    err.set(ErrorCode::AuthError, first_error(j));
    return false;
  }
  auto s = opt_string(j, "secret");
  if (!s) {
    err.set(ErrorCode::ProtocolError, "login_missing_secret");
    return false;
  }
  secret   = *s;
  user_key = opt_string(j, "id").value_or("");
  return true;
}

bool parse_device_response(const std::string& body, std::string& device_id, Error& err) {
  json j;
  if (!parse_object(body, j, err)) return false;
  if (opt_int(j, "status").value_or(0) != 1) {
    err.set(ErrorCode::AuthError, first_error(j));
    return false;
  }
  auto id = opt_string(j, "id");
  if (!id) {
    err.set(ErrorCode::ProtocolError, "device_missing_id");
    return false;
  }
  device_id = *id;
  return true;
}

// ---------- state form ----------

json message_to_state(const Message& m) {
  json j;
  j["id"]             = m.id;
  j["priority"]       = static_cast<int>(m.priority);
  j["title"]          = m.title;
  j["body"]           = m.body;
  j["app"]            = m.app;
  j["received_at_ms"] = m.received_at_ms;
  j["acked"]          = m.acked;
  j["html"]           = m.html;
  if (m.expires_at_ms)     j["expires_at_ms"]     = *m.expires_at_ms;
  if (m.receipt_id)        j["receipt"]           = *m.receipt_id;
  if (m.retry_interval_ms) j["retry_interval_ms"] = *m.retry_interval_ms;
  if (m.url)               j["url"]               = *m.url;
  if (m.url_title)         j["url_title"]         = *m.url_title;
  if (m.sound)             j["sound"]             = *m.sound;
  return j;
}

bool message_from_state(const json& j, Message& out) {
  if (!j.is_object()) return false;
  try {
    Message m;
    m.id             = j.at("id").get<int64_t>();
    m.priority       = priority_from_wire(j.value("priority", 0));
    m.title          = j.value("title", std::string());
    m.body           = j.value("body", std::string());
    m.app            = j.value("app", std::string());
    m.received_at_ms = j.value("received_at_ms", uint64_t{0});
    m.acked          = j.value("acked", false);
    m.html           = j.value("html", false);
    if (j.contains("expires_at_ms"))     m.expires_at_ms     = j.at("expires_at_ms").get<uint64_t>();
    if (j.contains("receipt"))           m.receipt_id        = j.at("receipt").get<std::string>();
    if (j.contains("retry_interval_ms")) m.retry_interval_ms = j.at("retry_interval_ms").get<uint32_t>();
    if (j.contains("url"))               m.url               = j.at("url").get<std::string>();
    if (j.contains("url_title"))         m.url_title         = j.at("url_title").get<std::string>();
    if (j.contains("sound"))             m.sound             = j.at("sound").get<std::string>();
    out = std::move(m);
    return true;
  } catch (const json::exception& e) {
    log::warn("state_message_invalid", {{"reason", e.what()}});
    return false;
  }
}

} // namespace parser
} // namespace pushwire
