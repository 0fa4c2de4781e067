/**
 * @file ledger.hpp
 * @brief Dedup & ordering ledger - the only gate between relay input and the
 *        notification sink.
 *
 * @details
 * The ledger remembers one number: the highest message id already handed to
 * the user. A message gets through `accept()` exactly when its id is strictly
 * greater, and passing it moves the mark. That single comparison gives both
 * guarantees the client needs:
 * - **no duplicate alerts**, even when the relay redelivers a batch after a
 *   reconnect or a failed delivery receipt;
 * - **temporal order**, because an id lower than one already shown is dropped
 *   instead of popping up late.
 *
 * The mark is written to the StateStore on every advance, so a relaunch picks
 * up where the previous process stopped.
 *
 * @par Threading
 * Fetch jobs run on the worker thread and may be retried while the CLI reads
 * status. Every read and write of the mark goes through one mutex, which is
 * what keeps it non-decreasing.
 *
 * @code
 *   Ledger ledger(store.snapshot().last_message_id, &store);
 *   for (const auto& m : batch)
 *     if (ledger.accept(*m)) sink.display(*m);
 * @endcode
 */
#ifndef PUSHWIRE_LEDGER_HPP
#define PUSHWIRE_LEDGER_HPP

#include <cstdint>
#include <mutex>

#include "pushwire/message.hpp"

namespace pushwire {

class StateStore;

class Ledger {
public:
  /**
   * @param last_message_id  Starting mark (0 for a fresh device).
   * @param store            Where advances are persisted; nullptr keeps the
   *                         ledger in memory only.
   */
  explicit Ledger(int64_t last_message_id = 0, StateStore* store = nullptr);

  /**
   * @brief Admit a message if it is newer than everything seen so far.
   * @retval true  id > last_message_id; the mark now equals id.
   * @retval false duplicate or out-of-order; dropped silently.
   */
  bool accept(const Message& msg);

  int64_t last_message_id() const;

  /// Back to zero (logout). Persisted.
  void reset();

private:
  void persist_locked(int64_t id);

  mutable std::mutex mu_;
  int64_t            last_id_{0};
  StateStore*        store_{nullptr};
};

} // namespace pushwire

#endif // PUSHWIRE_LEDGER_HPP
