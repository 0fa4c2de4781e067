#include "pushwire/config.hpp"

#include <fstream>
#include <limits>
#include <system_error>

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using nlohmann::json;

namespace pushwire {

namespace {

// Milliseconds handed to poll() must fit an int.
constexpr int64_t MAX_TIMEOUT_MS = std::numeric_limits<int>::max();
// Seconds that are later scaled to uint32 milliseconds.
constexpr int64_t MAX_RETRY_S = std::numeric_limits<uint32_t>::max() / 1000;

bool read_u32(const json& j, const char* key, uint32_t& out, Error& err,
              int64_t max = std::numeric_limits<uint32_t>::max()) {
  if (!j.contains(key)) return true;
  const json& v = j.at(key);
  if (!v.is_number_integer() || v.get<int64_t>() < 0 || v.get<int64_t>() > max) {
    err.set(ErrorCode::StorageError, std::string("bad_config_value: ") + key);
    return false;
  }
  out = static_cast<uint32_t>(v.get<int64_t>());
  return true;
}

bool read_string(const json& j, const char* key, std::string& out, Error& err) {
  if (!j.contains(key)) return true;
  if (!j.at(key).is_string()) {
    err.set(ErrorCode::StorageError, std::string("bad_config_value: ") + key);
    return false;
  }
  out = j.at(key).get<std::string>();
  return true;
}

} // namespace

bool load_config(const fs::path& file, Config& cfg, Error& err) {
  std::error_code ec;
  if (!fs::exists(file, ec)) return true;

  std::ifstream in(file);
  if (!in) {
    err.set(ErrorCode::StorageError, "open_failed: " + file.string());
    return false;
  }

  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    err.set(ErrorCode::StorageError, std::string("bad_config_json: ") + e.what());
    return false;
  }
  if (!j.is_object()) {
    err.set(ErrorCode::StorageError, "bad_config_json: not an object");
    return false;
  }

  Config c = cfg;
  if (!read_string(j, "api_url", c.api_url, err)) return false;
  if (!read_string(j, "push_url", c.push_url, err)) return false;
  if (!read_u32(j, "keepalive_interval_ms", c.keepalive_interval_ms, err, MAX_TIMEOUT_MS)) return false;
  if (!read_u32(j, "backoff_min_ms", c.backoff_min_ms, err)) return false;
  if (!read_u32(j, "backoff_max_ms", c.backoff_max_ms, err)) return false;
  if (!read_u32(j, "network_timeout_ms", c.network_timeout_ms, err, MAX_TIMEOUT_MS)) return false;
  if (!read_u32(j, "emergency_retry_s", c.emergency_retry_s, err, MAX_RETRY_S)) return false;
  if (!read_u32(j, "emergency_expire_s", c.emergency_expire_s, err)) return false;
  if (!read_string(j, "device_name", c.device_name, err)) return false;

  if (j.contains("backoff_jitter")) {
    const json& v = j.at("backoff_jitter");
    if (!v.is_number() || v.get<double>() < 0.0 || v.get<double>() >= 1.0) {
      err.set(ErrorCode::StorageError, "bad_config_value: backoff_jitter");
      return false;
    }
    c.backoff_jitter = v.get<double>();
  }

  if (j.contains("log_level")) {
    std::string lvl;
    if (!read_string(j, "log_level", lvl, err)) return false;
    if (!log::parse_level(lvl, c.log_level)) {
      err.set(ErrorCode::StorageError, "bad_config_value: log_level");
      return false;
    }
  }

  if (c.keepalive_interval_ms == 0 || c.network_timeout_ms == 0 || c.backoff_min_ms > c.backoff_max_ms) {
    err.set(ErrorCode::StorageError, "bad_config_value: timing");
    return false;
  }

  cfg = c;
  return true;
}

} // namespace pushwire
