// ============================================================================
// state_store.cpp - implementation for state_store.hpp
// For the file format see the matching .hpp. Round-trip cases live in
// tests/test_state_store.cpp.
// ============================================================================

#include "pushwire/state_store.hpp"
#include "pushwire/parser.hpp"
#include "pushwire/log.hpp"

#include <fcntl.h>
#include <sys/file.h>         // flock
#include <unistd.h>

#include <cerrno>
#include <cstdlib>            // getenv for XDG/HOME lookups
#include <cstring>
#include <fstream>            // std::ifstream / std::ofstream
#include <system_error>       // std::error_code for non-throwing filesystem ops

#include <nlohmann/json.hpp>

namespace fs = std::filesystem;
using nlohmann::json;

namespace pushwire {

fs::path default_state_dir() {
  const char* xdg = std::getenv("XDG_CONFIG_HOME");
  if (xdg && *xdg) return fs::path(xdg) / "pushwire";
  const char* home = std::getenv("HOME");
  return fs::path(home ? home : ".") / ".config" / "pushwire";
}

StateStore::StateStore(fs::path file)
: file_(std::move(file)) {}

// ---------------------------------------------------------------------------
// load()
// ------
// Missing file -> empty state, success. Anything unreadable -> StorageError.
// Pending acks whose message cannot be decoded are dropped with a warning so
// one corrupt entry does not take the rest down.
// ---------------------------------------------------------------------------
bool StateStore::load(Error& err) {
  std::lock_guard<std::mutex> lock(mu_);
  state_ = PersistedState{};

  std::error_code ec;
  if (!fs::exists(file_, ec)) return true;

  std::ifstream in(file_);
  if (!in) {
    err.set(ErrorCode::StorageError, "open_failed: " + file_.string());
    return false;
  }

  json j;
  try {
    in >> j;
  } catch (const json::exception& e) {
    err.set(ErrorCode::StorageError, std::string("bad_state_json: ") + e.what());
    return false;
  }
  if (!j.is_object()) {
    err.set(ErrorCode::StorageError, "bad_state_json: not an object");
    return false;
  }

  try {
    state_.device_id       = j.value("device_id", std::string());
    state_.secret          = j.value("secret", std::string());
    state_.user_key        = j.value("user_key", std::string());
    state_.last_message_id = j.value("last_message_id", int64_t{0});

    auto it = j.find("pending_acks");
    if (it != j.end() && it->is_array()) {
      for (const auto& e : *it) {
        PersistedAck a;
        if (!e.is_object() || !parser::message_from_state(e.value("message", json::object()), a.message)) {
          log::warn("pending_ack_dropped", {{"reason", "bad_message"}});
          continue;
        }
        a.next_retry_at_ms  = e.value("next_retry_at_ms", uint64_t{0});
        a.expires_at_ms     = e.value("expires_at_ms", uint64_t{0});
        a.retry_interval_ms = e.value("retry_interval_ms", uint32_t{0});
        state_.pending_acks.push_back(std::move(a));
      }
    }
  } catch (const json::exception& e) {
    state_ = PersistedState{};
    err.set(ErrorCode::StorageError, std::string("bad_state_field: ") + e.what());
    return false;
  }
  return true;
}

PersistedState StateStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

bool StateStore::set_credentials(const std::string& device_id, const std::string& secret,
                                 const std::string& user_key, Error& err) {
  std::lock_guard<std::mutex> lock(mu_);
  state_.device_id = device_id;
  state_.secret    = secret;
  state_.user_key  = user_key;
  return flush_locked(err);
}

bool StateStore::clear_credentials(Error& err) {
  std::lock_guard<std::mutex> lock(mu_);
  state_.device_id.clear();
  state_.secret.clear();
  state_.user_key.clear();
  return flush_locked(err);
}

bool StateStore::set_last_message_id(int64_t id, Error& err) {
  std::lock_guard<std::mutex> lock(mu_);
  state_.last_message_id = id;
  return flush_locked(err);
}

bool StateStore::set_pending_acks(const std::vector<PersistedAck>& acks, Error& err) {
  std::lock_guard<std::mutex> lock(mu_);
  state_.pending_acks = acks;
  return flush_locked(err);
}

bool StateStore::reset(Error& err) {
  std::lock_guard<std::mutex> lock(mu_);
  state_ = PersistedState{};
  return flush_locked(err);
}

// ---------------------------------------------------------------------------
// flush_locked()
// --------------
// PRE:  mu_ held.
// Writes <file>.tmp then renames over <file>. Directories are created on
// demand so a fresh install needs no setup step.
// ---------------------------------------------------------------------------
bool StateStore::flush_locked(Error& err) {
  json j;
  j["device_id"]       = state_.device_id;
  j["secret"]          = state_.secret;
  j["user_key"]        = state_.user_key;
  j["last_message_id"] = state_.last_message_id;

  json acks = json::array();
  for (const auto& a : state_.pending_acks) {
    json e;
    e["message"]           = parser::message_to_state(a.message);
    e["next_retry_at_ms"]  = a.next_retry_at_ms;
    e["expires_at_ms"]     = a.expires_at_ms;
    e["retry_interval_ms"] = a.retry_interval_ms;
    acks.push_back(std::move(e));
  }
  j["pending_acks"] = std::move(acks);

  std::error_code ec;
  if (file_.has_parent_path()) {
    fs::create_directories(file_.parent_path(), ec);
    if (ec) {
      err.set(ErrorCode::StorageError, "state_dir: " + ec.message());
      return false;
    }
  }

  auto tmp = file_;
  tmp += ".tmp";
  {
    std::ofstream out(tmp, std::ios::trunc);
    if (!out) {
      err.set(ErrorCode::StorageError, "open_failed: " + tmp.string());
      return false;
    }
    out << j.dump(2);
    out.flush();
    if (!out) {
      err.set(ErrorCode::StorageError, "write_failed: " + tmp.string());
      return false;
    }
  }

  fs::rename(tmp, file_, ec);
  if (ec) {
    err.set(ErrorCode::StorageError, "rename_failed: " + ec.message());
    return false;
  }
  return true;
}

StateLock::StateLock(fs::path file)
: file_(std::move(file)) {}

StateLock::~StateLock() { release(); }

bool StateLock::acquire(Error& err) {
  if (fd_ >= 0) return true;

  std::error_code ec;
  if (file_.has_parent_path()) {
    fs::create_directories(file_.parent_path(), ec);
    if (ec) {
      err.set(ErrorCode::StorageError, "state_dir: " + ec.message());
      return false;
    }
  }

  const int fd = ::open(file_.c_str(), O_RDWR | O_CREAT | O_CLOEXEC, 0600);
  if (fd < 0) {
    err.set(ErrorCode::StorageError, "open_failed: " + file_.string() + ": " + std::strerror(errno));
    return false;
  }
  if (::flock(fd, LOCK_EX | LOCK_NB) != 0) {
    const int e = errno;
    ::close(fd);
    if (e == EWOULDBLOCK) err.set(ErrorCode::StorageError, "state_locked");
    else err.set(ErrorCode::StorageError, std::string("lock_failed: ") + std::strerror(e));
    return false;
  }
  fd_ = fd;
  return true;
}

void StateLock::release() {
  if (fd_ < 0) return;
  ::close(fd_);               // closing the last descriptor drops the flock
  fd_ = -1;
}

} // namespace pushwire
