/**
 * @file emergency_loop.hpp
 * @brief Emergency Acknowledgment Loop: re-alert until acknowledged or expired.
 *
 * @details
 * ## Model
 * Every emergency Message with a receipt id gets one AckState, keyed by that
 * receipt id. The state is a small timer record:
 *
 * ```
 *   track(msg, now)       display now; next_retry_at = now + interval
 *   tick(now)
 *     now >= expires_at   erase, EmergencyExpired (no display)
 *     now >= next_retry   display; next_retry += interval (skips missed slots)
 *   acknowledge(receipt)  upstream call, then erase
 * ```
 *
 * With `expires_at = t0 + 300s` and a 60s interval the sink sees the message
 * at t0, +60, +120, +180, +240 and never again.
 *
 * ## Cancellation
 * `tick()` displays while holding the loop mutex, and `acknowledge()` erases
 * the state under the same mutex after the relay confirmed. Whichever gets the
 * mutex second sees the other's result, so a re-alert can never land after
 * the acknowledgment was recorded. The upstream call itself runs without the
 * mutex so a slow relay does not stall other alerts.
 *
 * If the upstream call fails the state is left alone and re-alerts continue:
 * the relay decides when the emergency is over.
 *
 * ## Threads
 * `start()` runs an alert thread that sleeps until the earliest due time (at
 * most one second, to follow wall-clock jumps) and calls `tick()` with the
 * wall clock. Tests skip the thread and call `tick()` with their own clock.
 *
 * ## Persistence
 * Every change rewrites `pending_acks` in the StateStore; `restore()` loads
 * them after a restart without re-displaying immediately.
 */
#ifndef PUSHWIRE_EMERGENCY_LOOP_HPP
#define PUSHWIRE_EMERGENCY_LOOP_HPP

#include <condition_variable>
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pushwire/credentials.hpp"
#include "pushwire/errors.hpp"
#include "pushwire/events.hpp"
#include "pushwire/message.hpp"
#include "pushwire/notification_sink.hpp"
#include "pushwire/relay_api.hpp"
#include "pushwire/state_store.hpp"

namespace pushwire {

struct EmergencyConfig {
  uint32_t default_retry_ms{60000};        ///< When the relay does not declare "retry".
  uint64_t default_expire_ms{10800000};    ///< Counted from received_at when no expiry is declared.
  uint32_t min_retry_ms{1000};
};

struct AckState {
  std::string receipt_id;
  MessagePtr  message;
  bool        acknowledged{false};
  uint64_t    next_retry_at_ms{0};
  uint64_t    expires_at_ms{0};
  uint32_t    retry_interval_ms{0};
};

class EmergencyLoop {
public:
  EmergencyLoop(INotificationSink& sink, IRelayApi& api, ICredentialStore& credentials,
                StateStore* store = nullptr, EmergencyConfig cfg = {});
  ~EmergencyLoop();

  EmergencyLoop(const EmergencyLoop&) = delete;
  EmergencyLoop& operator=(const EmergencyLoop&) = delete;

  void set_event_callback(EventCallback cb);

  /**
   * @brief Start re-alerting @p msg. Displays it once right away.
   * @retval false not an emergency needing the loop, or the receipt is already tracked.
   */
  bool track(const MessagePtr& msg, uint64_t now_ms);

  /// Fire due re-alerts and expire what ran out.
  void tick(uint64_t now_ms);

  /**
   * @brief Send the acknowledgment upstream, then cancel re-alerts.
   *
   * Works for receipts this loop does not track (acknowledging from the CLI).
   * AckError when the relay call fails; the AckState is then untouched.
   */
  bool acknowledge(const std::string& receipt_id, Error& err);

  /// Re-create AckStates from persisted state. Entries already expired are dropped.
  void restore(const std::vector<PersistedAck>& acks, uint64_t now_ms);

  /// Forget every AckState (logout). Persisted.
  void clear();

  size_t pending() const;
  bool   is_tracked(const std::string& receipt_id) const;
  std::vector<AckState> snapshot() const;

  void start();
  void stop();

private:
  void persist_locked();
  void run();

  INotificationSink& sink_;
  IRelayApi&         api_;
  ICredentialStore&  credentials_;
  StateStore*        store_;
  EmergencyConfig    cfg_;

  mutable std::mutex              mu_;
  std::map<std::string, AckState> states_;
  EventCallback                   on_event_;

  std::condition_variable cv_;
  bool                    stopping_{false};
  std::thread             alert_thread_;
};

} // namespace pushwire

#endif // PUSHWIRE_EMERGENCY_LOOP_HPP
