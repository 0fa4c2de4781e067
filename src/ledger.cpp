// -----------------------------------------------------------------------------
// ledger.cpp - Implementation of the dedup & ordering ledger
//
// API & guarantees: include/pushwire/ledger.hpp
// Property tests:   tests/test_ledger.cpp
// -----------------------------------------------------------------------------
#include "pushwire/ledger.hpp"
#include "pushwire/state_store.hpp"
#include "pushwire/log.hpp"

#include <string>

namespace pushwire {

Ledger::Ledger(int64_t last_message_id, StateStore* store)
: last_id_(last_message_id < 0 ? 0 : last_message_id), store_(store) {}

// -----------------------------------------------------------------------------
// accept() - admit strictly newer ids only.
// POLICY:
//   - Equality is a duplicate, lower is out-of-order; both are dropped.
//   - The persisted mark is written while still holding mu_, so two concurrent
//     accepts can never write an older value after a newer one.
// -----------------------------------------------------------------------------
bool Ledger::accept(const Message& msg) {
  std::lock_guard<std::mutex> lock(mu_);
  if (msg.id <= last_id_) {
    log::debug("ledger_drop", {{"id", std::to_string(msg.id)}, {"last", std::to_string(last_id_)}});
    return false;
  }
  last_id_ = msg.id;
  persist_locked(last_id_);
  return true;
}

int64_t Ledger::last_message_id() const {
  std::lock_guard<std::mutex> lock(mu_);
  return last_id_;
}

void Ledger::reset() {
  std::lock_guard<std::mutex> lock(mu_);
  last_id_ = 0;
  persist_locked(0);
}

void Ledger::persist_locked(int64_t id) {
  if (!store_) return;
  Error err;
  if (!store_->set_last_message_id(id, err)) {
    // The in-memory mark still holds for this process; a relaunch may re-show.
    log::error("ledger_persist_failed", {{"code", to_string(err.code)}, {"reason", err.reason}});
  }
}

} // namespace pushwire
