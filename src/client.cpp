// ============================================================================
// client.cpp - implementation for client.hpp
// Construction order follows the data flow; stop() runs it backwards so no
// worker job outlives the session it reports to.
// ============================================================================

#include "pushwire/client.hpp"
#include "pushwire/log.hpp"
#include "pushwire/transport/transport_websocket.hpp"

#include <algorithm>
#include <chrono>
#include <future>
#include <limits>
#include <memory>
#include <utility>

namespace fs = std::filesystem;

namespace pushwire {

namespace {

uint64_t wall_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

SessionConfig session_config(const Config& c) {
  SessionConfig s;
  s.push_url              = c.push_url;
  s.keepalive_interval_ms = c.keepalive_interval_ms;
  s.network_timeout_ms    = c.network_timeout_ms;
  s.backoff_min_ms        = c.backoff_min_ms;
  s.backoff_max_ms        = c.backoff_max_ms;
  s.backoff_jitter        = c.backoff_jitter;
  return s;
}

EmergencyConfig emergency_config(const Config& c) {
  EmergencyConfig e;
  const uint64_t retry_ms = static_cast<uint64_t>(c.emergency_retry_s) * 1000u;
  e.default_retry_ms  = static_cast<uint32_t>(std::min<uint64_t>(retry_ms, std::numeric_limits<uint32_t>::max()));
  e.default_expire_ms = static_cast<uint64_t>(c.emergency_expire_s) * 1000u;
  return e;
}

} // namespace

Client::Client(Config cfg, const fs::path& state_dir, INotificationSink& sink)
: Client(cfg, state_dir, sink,
         std::make_unique<HttpRelayApi>(cfg.api_url, cfg.network_timeout_ms),
         std::make_unique<transport::WebSocketConnection>()) {}

Client::Client(Config cfg, const fs::path& state_dir, INotificationSink& sink,
               std::unique_ptr<IRelayApi> api, std::unique_ptr<transport::IConnection> conn)
: cfg_(std::move(cfg)),
  lock_(state_dir / "run.lock"),
  store_(state_dir / "state.json"),
  credentials_(store_),
  api_(std::move(api)),
  conn_(std::move(conn)),
  sink_(sink) {}

Client::~Client() { stop(); }

bool Client::open(Error& err) {
  if (!lock_.acquire(err)) return false;
  if (!store_.load(err)) return false;
  const PersistedState st = store_.snapshot();

  ledger_  = std::make_unique<Ledger>(st.last_message_id, &store_);
  fetcher_ = std::make_unique<MessageFetcher>(*api_, credentials_, *ledger_);
  loop_    = std::make_unique<EmergencyLoop>(sink_, *api_, credentials_, &store_, emergency_config(cfg_));
  loop_->set_event_callback([this](const Event& e) { on_event(e); });
  loop_->restore(st.pending_acks, wall_ms());

  session_ = std::make_unique<Session>(*conn_, credentials_, *fetcher_, worker_, session_config(cfg_));
  session_->set_message_handler([this](const std::vector<MessagePtr>& batch) { deliver(batch); });
  session_->set_event_callback([this](const Event& e) { on_event(e); });

  log::info("client_open", {{"state", store_.path().string()},
                            {"logged_in", st.device_id.empty() ? "no" : "yes"},
                            {"last_id", std::to_string(st.last_message_id)},
                            {"pending_acks", std::to_string(st.pending_acks.size())}});
  return true;
}

bool Client::start(Error& err) {
  if (!session_) {
    err.set(ErrorCode::StorageError, "client_not_open");
    return false;
  }
  if (running_) return true;
  worker_.start();
  loop_->start();
  session_->start();
  running_ = true;
  return true;
}

void Client::stop() {
  if (!running_) return;
  session_->stop();
  worker_.stop();
  loop_->stop();
  running_ = false;
}

// ---------------------------------------------------------------------------
// deliver()
// ---------
// Worker thread. The batch is already ascending and deduplicated. Unresolved
// emergencies go to the loop (which displays the first alert itself);
// everything else, including emergencies the relay reports as acknowledged,
// is displayed once.
// ---------------------------------------------------------------------------
void Client::deliver(const std::vector<MessagePtr>& batch) {
  const uint64_t now = wall_ms();
  for (const auto& m : batch) {
    if (m->needs_ack_loop()) {
      if (!loop_->track(m, now)) log::debug("emergency_not_tracked", {{"id", std::to_string(m->id)}});
    } else {
      sink_.display(*m);
    }
  }
}

void Client::on_event(const Event& e) {
  EventCallback cb;
  {
    std::lock_guard<std::mutex> lock(event_mu_);
    cb = on_event_;
  }
  if (cb) cb(e);
}

void Client::set_event_callback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(event_mu_);
  on_event_ = std::move(cb);
}

bool Client::login(const std::string& email, const std::string& password, const std::string& twofa, Error& err) {
  LoginResult lr;
  if (!api_->login(email, password, twofa, lr, err)) return false;

  std::string device_id;
  if (!api_->register_device(lr.secret, cfg_.device_name, device_id, err)) return false;

  credentials_.set_user_key(lr.user_key);
  if (!credentials_.set_token(Token{device_id, lr.secret}, err)) return false;

  log::info("login_ok", {{"device_id", device_id}, {"device_name", cfg_.device_name}});
  if (session_) session_->resume();
  return true;
}

// ---------------------------------------------------------------------------
// logout()
// --------
// While running, the wipe is queued behind whatever the worker is doing. A
// fetch already in flight finishes (and delivers) first; any fetch after the
// wipe finds no token. Without the worker the wipe runs here.
// ---------------------------------------------------------------------------
bool Client::logout(Error& err) {
  if (session_) session_->request_logout();

  auto wipe = [this] {
    Error e;
    if (loop_) loop_->clear();
    if (ledger_) ledger_->reset();
    if (!store_.reset(e) && e.ok()) e.set(ErrorCode::StorageError, "state_reset_failed");
    return e;
  };

  if (running_) {
    auto done = std::make_shared<std::promise<Error>>();
    std::future<Error> result = done->get_future();
    if (!worker_.post([wipe, done] { done->set_value(wipe()); })) {
      err.set(ErrorCode::StorageError, "worker_busy");
      return false;
    }
    try {
      err = result.get();
    } catch (const std::future_error&) {
      // Job dropped by a concurrent stop(); the worker is gone.
      err = wipe();
    }
  } else {
    err = wipe();
  }
  if (!err.ok()) return false;
  log::info("logout_ok");
  return true;
}

bool Client::acknowledge(const std::string& receipt_id, Error& err) {
  if (!loop_) {
    err.set(ErrorCode::AckError, "client_not_open");
    return false;
  }
  return loop_->acknowledge(receipt_id, err);
}

bool Client::acknowledge_async(const std::string& receipt_id) {
  if (!loop_) return false;
  return worker_.post([this, receipt_id] {
    Error err;
    if (!loop_->acknowledge(receipt_id, err)) {
      log::error("ack_failed", {{"receipt", receipt_id}, {"code", to_string(err.code)}, {"reason", err.reason}});
    }
  });
}

ClientStatus Client::status() const {
  ClientStatus s;
  const PersistedState st = store_.snapshot();
  s.logged_in       = !st.device_id.empty() && !st.secret.empty();
  s.device_id       = st.device_id;
  s.last_message_id = ledger_ ? ledger_->last_message_id() : st.last_message_id;
  s.pending_acks    = loop_ ? loop_->pending() : st.pending_acks.size();
  if (session_) {
    s.state       = session_->state();
    s.retry_count = session_->retry_count();
  }
  return s;
}

} // namespace pushwire
