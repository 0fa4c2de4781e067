/**
 * @page pw-state-store pushwire persisted state
 * @file state_store.hpp
 * @brief One JSON file that survives restarts: credentials, ledger position,
 *        unresolved emergency acknowledgments.
 *
 * @details
 * FILE FORMAT
 * -----------
 * `<state_dir>/state.json`:
 * @code
 *   {
 *     "device_id": "abc123", "secret": "s3cr3t", "user_key": "uQiRzpo4...",
 *     "last_message_id": 41,
 *     "pending_acks": [
 *       { "message": { ...message_to_state()... },
 *         "next_retry_at_ms": 1718000060000, "expires_at_ms": 1718010800000,
 *         "retry_interval_ms": 60000 }
 *     ]
 *   }
 * @endcode
 *
 * WRITES
 * ------
 * Every mutation rewrites the whole file through `<file>.tmp` + rename, so a
 * crash leaves either the old or the new document, never half of one.
 *
 * THREADING
 * ---------
 * The ledger (worker thread), the emergency loop (alert thread) and the CLI
 * all write here. Each setter takes the store mutex, updates the cached
 * document and flushes it.
 *
 * ONE WRITER PER FILE
 * -------------------
 * The cache is read once at load() and every flush rewrites the whole file,
 * so two processes writing the same state.json would undo each other. A
 * process takes StateLock on `<state_dir>/run.lock` before it opens the store
 * for writing; while `pushwire run` holds it, one-shot commands are refused.
 */
#ifndef PUSHWIRE_STATE_STORE_HPP
#define PUSHWIRE_STATE_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "pushwire/errors.hpp"
#include "pushwire/message.hpp"

namespace pushwire {

/// Serializable snapshot of one unresolved emergency alert.
struct PersistedAck {
  Message  message;
  uint64_t next_retry_at_ms{0};
  uint64_t expires_at_ms{0};
  uint32_t retry_interval_ms{0};
};

struct PersistedState {
  std::string device_id;
  std::string secret;
  std::string user_key;
  int64_t     last_message_id{0};
  std::vector<PersistedAck> pending_acks;
};

class StateStore {
public:
  explicit StateStore(std::filesystem::path file);

  /**
   * @brief Read the file into the cache.
   *
   * A missing file is not an error: the cache starts empty. A file that is not
   * valid JSON reports StorageError and leaves the cache empty.
   */
  bool load(Error& err);

  PersistedState snapshot() const;

  bool set_credentials(const std::string& device_id, const std::string& secret,
                       const std::string& user_key, Error& err);
  bool clear_credentials(Error& err);
  bool set_last_message_id(int64_t id, Error& err);
  bool set_pending_acks(const std::vector<PersistedAck>& acks, Error& err);

  /// Forget everything (logout).
  bool reset(Error& err);

  const std::filesystem::path& path() const { return file_; }

private:
  bool flush_locked(Error& err);

  std::filesystem::path file_;
  mutable std::mutex    mu_;
  PersistedState        state_;
};

/**
 * @brief Advisory single-writer lock on a state directory.
 *
 * flock(2) on a descriptor this object owns. Held until release() or
 * destruction; the kernel drops it if the process dies. Any other holder,
 * including another StateLock in the same process, makes acquire() fail
 * with StorageError "state_locked".
 */
class StateLock {
public:
  explicit StateLock(std::filesystem::path file);
  ~StateLock();

  StateLock(const StateLock&) = delete;
  StateLock& operator=(const StateLock&) = delete;

  bool acquire(Error& err);
  void release();
  bool held() const { return fd_ >= 0; }

  const std::filesystem::path& path() const { return file_; }

private:
  std::filesystem::path file_;
  int                   fd_{-1};
};

/// `$XDG_CONFIG_HOME/pushwire`, falling back to `$HOME/.config/pushwire`.
std::filesystem::path default_state_dir();

} // namespace pushwire

#endif // PUSHWIRE_STATE_STORE_HPP
