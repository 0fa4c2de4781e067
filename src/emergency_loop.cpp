// -----------------------------------------------------------------------------
// emergency_loop.cpp - re-alert scheduling, acknowledgment, expiry
//
// Model & cancellation argument: include/pushwire/emergency_loop.hpp
// Schedules and races:           tests/test_emergency_loop.cpp
// -----------------------------------------------------------------------------
#include "pushwire/emergency_loop.hpp"
#include "pushwire/log.hpp"

#include <algorithm>
#include <chrono>
#include <utility>

namespace pushwire {

namespace {

uint64_t wall_ms() {
  using namespace std::chrono;
  return static_cast<uint64_t>(duration_cast<milliseconds>(system_clock::now().time_since_epoch()).count());
}

} // namespace

EmergencyLoop::EmergencyLoop(INotificationSink& sink, IRelayApi& api, ICredentialStore& credentials,
                             StateStore* store, EmergencyConfig cfg)
: sink_(sink), api_(api), credentials_(credentials), store_(store), cfg_(cfg) {}

EmergencyLoop::~EmergencyLoop() { stop(); }

void EmergencyLoop::set_event_callback(EventCallback cb) {
  std::lock_guard<std::mutex> lock(mu_);
  on_event_ = std::move(cb);
}

// -----------------------------------------------------------------------------
// track()
// POLICY:
//   - interval: relay "retry", else default; never below min_retry_ms.
//   - expiry:   relay "expires_at", else received_at + default_expire_ms.
//   - An alert that is already past its expiry is shown once and reported
//     expired; it never gets an AckState.
// -----------------------------------------------------------------------------
bool EmergencyLoop::track(const MessagePtr& msg, uint64_t now_ms) {
  if (!msg || !msg->needs_ack_loop()) return false;
  const std::string& receipt = *msg->receipt_id;

  EventCallback cb;
  bool expired_now = false;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (states_.count(receipt)) return false;

    AckState st;
    st.receipt_id        = receipt;
    st.message           = msg;
    st.retry_interval_ms = std::max(msg->retry_interval_ms.value_or(cfg_.default_retry_ms), cfg_.min_retry_ms);
    const uint64_t base  = msg->received_at_ms ? msg->received_at_ms : now_ms;
    st.expires_at_ms     = msg->expires_at_ms.value_or(base + cfg_.default_expire_ms);
    st.next_retry_at_ms  = now_ms + st.retry_interval_ms;

    sink_.display(*msg);

    if (now_ms >= st.expires_at_ms) {
      log::info("emergency_expired", {{"receipt", receipt}, {"id", std::to_string(msg->id)}, {"on", "track"}});
      expired_now = true;
      cb = on_event_;
    } else {
      log::info("emergency_tracked", {{"receipt", receipt}, {"id", std::to_string(msg->id)},
                                      {"retry_ms", std::to_string(st.retry_interval_ms)},
                                      {"expires_at_ms", std::to_string(st.expires_at_ms)}});
      states_.emplace(receipt, std::move(st));
      persist_locked();
    }
  }
  cv_.notify_all();

  if (expired_now) {
    if (cb) cb(Event{EventKind::EmergencyExpired, receipt});
    return false;
  }
  return true;
}

void EmergencyLoop::tick(uint64_t now_ms) {
  std::vector<std::string> expired;
  EventCallback cb;
  {
    std::lock_guard<std::mutex> lock(mu_);
    bool changed = false;

    for (auto it = states_.begin(); it != states_.end();) {
      AckState& st = it->second;
      if (st.acknowledged) { ++it; continue; }

      if (now_ms >= st.expires_at_ms) {
        log::info("emergency_expired", {{"receipt", st.receipt_id}, {"id", std::to_string(st.message->id)}});
        expired.push_back(st.receipt_id);
        it = states_.erase(it);
        changed = true;
        continue;
      }

      if (now_ms >= st.next_retry_at_ms) {
        sink_.display(*st.message);
        log::debug("emergency_realert", {{"receipt", st.receipt_id}});
        while (st.next_retry_at_ms <= now_ms) st.next_retry_at_ms += st.retry_interval_ms;
        changed = true;
      }
      ++it;
    }

    if (changed) persist_locked();
    cb = on_event_;
  }

  if (cb) {
    for (const auto& r : expired) cb(Event{EventKind::EmergencyExpired, r});
  }
}

bool EmergencyLoop::acknowledge(const std::string& receipt_id, Error& err) {
  const auto token = credentials_.get_token();
  if (!token) {
    err.set(ErrorCode::AckError, "auth_error: no token");
    return false;
  }

  Error api_err;
  if (!api_.acknowledge(*token, receipt_id, api_err)) {
    err.set(ErrorCode::AckError, std::string(to_string(api_err.code)) + ": " + api_err.reason);
    log::warn("emergency_ack_failed", {{"receipt", receipt_id}, {"reason", err.reason}});
    return false;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    auto it = states_.find(receipt_id);
    if (it != states_.end()) {
      it->second.acknowledged = true;
      states_.erase(it);
      persist_locked();
    }
  }
  cv_.notify_all();
  log::info("emergency_acknowledged", {{"receipt", receipt_id}});
  return true;
}

void EmergencyLoop::restore(const std::vector<PersistedAck>& acks, uint64_t now_ms) {
  std::lock_guard<std::mutex> lock(mu_);
  for (const auto& p : acks) {
    if (!p.message.receipt_id || p.message.receipt_id->empty()) continue;
    if (now_ms >= p.expires_at_ms) {
      log::info("emergency_restore_expired", {{"receipt", *p.message.receipt_id}});
      continue;
    }
    AckState st;
    st.receipt_id        = *p.message.receipt_id;
    st.message           = std::make_shared<const Message>(p.message);
    st.expires_at_ms     = p.expires_at_ms;
    st.retry_interval_ms = std::max(p.retry_interval_ms, cfg_.min_retry_ms);
    st.next_retry_at_ms  = p.next_retry_at_ms;
    states_.emplace(st.receipt_id, std::move(st));
  }
  persist_locked();
  log::info("emergency_restored", {{"pending", std::to_string(states_.size())}});
}

void EmergencyLoop::clear() {
  std::lock_guard<std::mutex> lock(mu_);
  states_.clear();
  persist_locked();
}

size_t EmergencyLoop::pending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return states_.size();
}

bool EmergencyLoop::is_tracked(const std::string& receipt_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return states_.count(receipt_id) != 0;
}

std::vector<AckState> EmergencyLoop::snapshot() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<AckState> out;
  out.reserve(states_.size());
  for (const auto& kv : states_) out.push_back(kv.second);
  return out;
}

void EmergencyLoop::persist_locked() {
  if (!store_) return;
  std::vector<PersistedAck> acks;
  acks.reserve(states_.size());
  for (const auto& kv : states_) {
    PersistedAck p;
    p.message           = *kv.second.message;
    p.next_retry_at_ms  = kv.second.next_retry_at_ms;
    p.expires_at_ms     = kv.second.expires_at_ms;
    p.retry_interval_ms = kv.second.retry_interval_ms;
    acks.push_back(std::move(p));
  }
  Error err;
  if (!store_->set_pending_acks(acks, err)) {
    log::error("emergency_persist_failed", {{"code", to_string(err.code)}, {"reason", err.reason}});
  }
}

void EmergencyLoop::start() {
  std::lock_guard<std::mutex> lock(mu_);
  if (alert_thread_.joinable()) return;
  stopping_ = false;
  alert_thread_ = std::thread(&EmergencyLoop::run, this);
}

void EmergencyLoop::stop() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    stopping_ = true;
  }
  cv_.notify_all();
  if (alert_thread_.joinable()) alert_thread_.join();
}

void EmergencyLoop::run() {
  for (;;) {
    {
      std::unique_lock<std::mutex> lock(mu_);
      if (stopping_) return;

      const uint64_t now = wall_ms();
      uint64_t wait_ms = 1000;
      for (const auto& kv : states_) {
        const uint64_t due = std::min(kv.second.next_retry_at_ms, kv.second.expires_at_ms);
        wait_ms = std::min<uint64_t>(wait_ms, due > now ? due - now : 0);
      }
      if (wait_ms > 0) cv_.wait_for(lock, std::chrono::milliseconds(wait_ms));
      if (stopping_) return;
    }
    tick(wall_ms());
  }
}

} // namespace pushwire
