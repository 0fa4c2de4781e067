// -----------------------------------------------------------------------------
// session.cpp - Transport Session state machine
//
// State diagram, frame table, failure model: include/pushwire/session.hpp
// Scenarios:                                 tests/test_session.cpp
// -----------------------------------------------------------------------------
#include "pushwire/session.hpp"
#include "pushwire/log.hpp"

#include <algorithm>
#include <chrono>
#include <random>
#include <utility>

namespace pushwire {

namespace {

constexpr uint32_t FETCH_RETRY_MAX_MS = 60000;

uint32_t seed_or_random(uint32_t seed) { return seed ? seed : std::random_device{}(); }

uint64_t mono_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(steady_clock::now().time_since_epoch()).count());
}

bool is_connected(SessionState s) { return s != SessionState::Disconnected; }

} // namespace

const char* to_string(SessionState s) {
  switch (s) {
    case SessionState::Disconnected:  return "disconnected";
    case SessionState::Connecting:    return "connecting";
    case SessionState::Authenticated: return "authenticated";
    case SessionState::Signaled:      return "signaled";
    case SessionState::Idle:          return "idle";
  }
  return "unknown";
}

Session::Session(transport::IConnection& conn, ICredentialStore& credentials, MessageFetcher& fetcher,
                 IExecutor& executor, SessionConfig cfg)
: conn_(conn), credentials_(credentials), fetcher_(fetcher), executor_(executor), cfg_(std::move(cfg)),
  backoff_(cfg_.backoff_min_ms, cfg_.backoff_max_ms, cfg_.backoff_jitter, seed_or_random(cfg_.backoff_seed)),
  fetch_backoff_(cfg_.backoff_min_ms, std::min(cfg_.backoff_max_ms, FETCH_RETRY_MAX_MS), cfg_.backoff_jitter,
                 seed_or_random(cfg_.backoff_seed ? cfg_.backoff_seed + 1 : 0)) {}

Session::~Session() {
  stop();
  conn_.close();
}

void Session::set_state(SessionState s, const char* why) {
  const SessionState prev = state_.exchange(s);
  if (prev != s) log::info("session_state", {{"from", to_string(prev)}, {"to", to_string(s)}, {"why", why}});
}

// ---------------------------------------------------------------------------
// connect()
// ---------
// open() -> identification frame -> Connecting. Failures leave the state at
// Disconnected; NetworkError schedules the next attempt, AuthError halts.
// ---------------------------------------------------------------------------
bool Session::connect(const Token& token, uint64_t now_ms, Error& err) {
  teardown();

  if (!conn_.open(cfg_.push_url, cfg_.network_timeout_ms, err)) {
    if (err.code == ErrorCode::AuthError) {
      Error cerr;
      if (!credentials_.clear_token(cerr))
        log::error("token_clear_failed", {{"reason", cerr.reason}});
      halt(EventKind::AuthRejected, err.reason);
    } else {
      schedule_reconnect(now_ms, err);
    }
    return false;
  }

  if (!conn_.send_text(identification_frame(token), err)) {
    conn_.close();
    schedule_reconnect(now_ms, err);
    return false;
  }

  connected_at_ms_  = now_ms;
  last_frame_at_ms_ = now_ms;
  set_state(SessionState::Connecting, "identified");
  return true;
}

void Session::connect_from_store(uint64_t now_ms) {
  const auto token = credentials_.get_token();
  if (!token) {
    halt(EventKind::AuthRejected, "no_credentials");
    return;
  }
  Error err;
  if (!connect(*token, now_ms, err)) {
    log::warn("connect_failed", {{"code", to_string(err.code)}, {"reason", err.reason}});
  }
}

// ---------------------------------------------------------------------------
// tick()
// ------
// Order matters:
//   1. requests from other threads (logout, resume)
//   2. fetch outcomes, so a retry is planned before timers are checked
//   3. Disconnected: reconnect when due
//      connected:    one recv, frames in order, then grace/keep-alive timers
//   4. due fetch retry
// ---------------------------------------------------------------------------
void Session::tick(uint64_t now_ms) {
  if (logout_requested_.exchange(false)) {
    teardown();
    Error err;
    if (!credentials_.clear_token(err)) log::error("token_clear_failed", {{"reason", err.reason}});
    halted_ = true;
    fetch_retry_at_ms_ = 0;
    refetch_pending_ = false;
    set_state(SessionState::Disconnected, "logout");
  }
  if (resume_requested_.exchange(false)) {
    halted_ = false;
    backoff_.reset();
    retry_count_ = 0;
    reconnect_at_ms_ = now_ms;
    log::info("session_resume");
  }

  collect_fetch(now_ms);

  if (state_ == SessionState::Disconnected) {
    if (!halted_ && now_ms >= reconnect_at_ms_) connect_from_store(now_ms);
  }

  if (is_connected(state_)) {
    Error err;
    const transport::RxResult r = conn_.recv(rx_, cfg_.recv_wait_ms, err);
    if (r == transport::RxResult::Ok) {
      for (RelayFrame f : classify_payload(rx_)) {
        handle_frame(f, now_ms);
        if (!is_connected(state_)) break;   // a frame ended the link; drop the rest
      }
    } else if (r == transport::RxResult::Closed) {
      err.set(ErrorCode::NetworkError, "remote_closed");
      schedule_reconnect(now_ms, err);
    } else if (r == transport::RxResult::Error) {
      schedule_reconnect(now_ms, err);
    }
  }

  if (state_ == SessionState::Connecting && now_ms - connected_at_ms_ >= cfg_.auth_grace_ms) {
    become_authenticated(now_ms);
  }

  if (is_connected(state_) && now_ms - last_frame_at_ms_ >= 2ull * cfg_.keepalive_interval_ms) {
    log::warn("keepalive_timeout", {{"silent_ms", std::to_string(now_ms - last_frame_at_ms_)}});
    Error err;
    err.set(ErrorCode::NetworkError, "keepalive_timeout");
    schedule_reconnect(now_ms, err);
  }

  if (fetch_retry_at_ms_ != 0 && now_ms >= fetch_retry_at_ms_ && !halted_) {
    fetch_retry_at_ms_ = 0;
    request_fetch(now_ms);
  }

  collect_fetch(now_ms);
}

void Session::handle_frame(RelayFrame f, uint64_t now_ms) {
  last_frame_at_ms_ = now_ms;
  log::debug("relay_frame", {{"frame", to_string(f)}, {"state", to_string(state_)}});

  switch (f) {
    case RelayFrame::KeepAlive:
      if (state_ == SessionState::Connecting) become_authenticated(now_ms);
      else if (state_ == SessionState::Authenticated && !fetch_in_flight_) set_state(SessionState::Idle, "keepalive");
      break;

    case RelayFrame::NewMessage: {
      const bool first = state_ == SessionState::Connecting;
      if (first) become_authenticated(now_ms);   // its initial sync covers this signal
      set_state(SessionState::Signaled, "new_message");
      if (!first) request_fetch(now_ms);
      break;
    }

    case RelayFrame::Reload:
      teardown();
      reconnect_at_ms_ = now_ms;   // immediate; backoff is neither advanced nor reset
      set_state(SessionState::Disconnected, "reload");
      break;

    case RelayFrame::ReloadCredentials: {
      const bool rejected_at_login = state_ == SessionState::Connecting;
      teardown();
      Error err;
      if (!credentials_.clear_token(err)) log::error("token_clear_failed", {{"reason", err.reason}});
      halt(rejected_at_login ? EventKind::AuthRejected : EventKind::CredentialsRevoked, "relay_reload_credentials");
      break;
    }

    case RelayFrame::SessionSuperseded:
      teardown();
      halt(EventKind::SessionSuperseded, "another_session_active");
      break;

    case RelayFrame::Unknown:
      log::warn("relay_frame_unknown");
      if (state_ == SessionState::Connecting) become_authenticated(now_ms);
      break;
  }
}

void Session::become_authenticated(uint64_t now_ms) {
  backoff_.reset();
  retry_count_ = 0;
  set_state(SessionState::Authenticated, "relay_accepted");
  request_fetch(now_ms);   // initial sync
}

void Session::teardown() {
  if (conn_.is_open()) conn_.close();
  rx_.clear();
}

void Session::schedule_reconnect(uint64_t now_ms, const Error& cause) {
  teardown();
  const uint32_t delay = backoff_.next_delay_ms();
  retry_count_ = backoff_.attempts();
  reconnect_at_ms_ = now_ms + delay;
  set_state(SessionState::Disconnected, "link_lost");
  log::warn("reconnect_scheduled", {{"code", to_string(cause.code)}, {"reason", cause.reason},
                                    {"in_ms", std::to_string(delay)}, {"attempt", std::to_string(retry_count_.load())}});
}

void Session::halt(EventKind kind, const std::string& detail) {
  set_state(SessionState::Disconnected, to_string(kind));
  fetch_retry_at_ms_ = 0;
  refetch_pending_ = false;
  if (halted_.exchange(true)) return;   // already terminal; surface once
  log::error("session_halted", {{"event", to_string(kind)}, {"detail", detail}});
  if (on_event_) on_event_(Event{kind, detail});
}

// ---------------------------------------------------------------------------
// request_fetch()
// ---------------
// At most one fetch in flight. A `!` that arrives meanwhile sets
// refetch_pending_ so the relay is asked once more after the current fetch
// finishes; any number of signals collapse into that one extra fetch.
// ---------------------------------------------------------------------------
void Session::request_fetch(uint64_t now_ms) {
  if (fetch_in_flight_) { refetch_pending_ = true; return; }
  fetch_in_flight_ = true;
  refetch_pending_ = false;

  const bool posted = executor_.post([this] {
    std::vector<MessagePtr> batch;
    Error err;
    const bool ok = fetcher_.fetch_pending(batch, err);
    if (ok && !batch.empty() && on_messages_) on_messages_(batch);

    std::lock_guard<std::mutex> lock(fetch_mu_);
    fetch_done_ = true;
    fetch_ok_   = ok;
    fetch_err_  = err;
  });

  if (!posted) {
    fetch_in_flight_ = false;
    const uint32_t delay = fetch_backoff_.next_delay_ms();
    fetch_retry_at_ms_ = now_ms + delay;
    log::warn("fetch_not_queued", {{"retry_in_ms", std::to_string(delay)}});
  }
}

void Session::collect_fetch(uint64_t now_ms) {
  bool ok = false;
  Error err;
  {
    std::lock_guard<std::mutex> lock(fetch_mu_);
    if (!fetch_done_) return;
    fetch_done_ = false;
    ok  = fetch_ok_;
    err = fetch_err_;
  }
  fetch_in_flight_ = false;

  if (!ok) {
    const uint32_t delay = fetch_backoff_.next_delay_ms();
    fetch_retry_at_ms_ = halted_ ? 0 : now_ms + delay;
    refetch_pending_ = false;   // the retry covers it
    log::warn("fetch_failed", {{"code", to_string(err.code)}, {"reason", err.reason},
                               {"retry_in_ms", std::to_string(delay)}});
    return;
  }

  fetch_backoff_.reset();
  if (refetch_pending_ && !halted_) {
    request_fetch(now_ms);
    return;
  }
  if (state_ == SessionState::Signaled || state_ == SessionState::Authenticated) {
    set_state(SessionState::Idle, "fetch_done");
  }
}

void Session::request_logout() {
  logout_requested_ = true;
  run_cv_.notify_all();
}

void Session::resume() {
  resume_requested_ = true;
  run_cv_.notify_all();
}

void Session::start() {
  if (thread_.joinable()) return;
  stopping_ = false;
  thread_ = std::thread(&Session::run, this);
}

void Session::stop() {
  stopping_ = true;
  run_cv_.notify_all();
  if (thread_.joinable()) thread_.join();
}

void Session::run() {
  while (!stopping_) {
    tick(mono_ms());
    if (state_ == SessionState::Disconnected) {
      // recv() paces the loop while connected; here nothing blocks, so wait.
      std::unique_lock<std::mutex> lock(run_mu_);
      run_cv_.wait_for(lock, std::chrono::milliseconds(cfg_.recv_wait_ms), [this] {
        return stopping_.load() || logout_requested_.load() || resume_requested_.load();
      });
    }
  }
  teardown();
  set_state(SessionState::Disconnected, "stopped");
}

} // namespace pushwire
