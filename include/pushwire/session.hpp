/**
 * @file session.hpp
 * @brief Transport Session: the persistent relay connection as an explicit
 *        state machine with one owning thread.
 *
 * @details
 * ## Field Brief
 * The relay keeps one connection per device open and pokes it with one-byte
 * signals. Session owns that connection. It connects, identifies, watches
 * for silence, reacts to signals and reconnects with backoff when the link
 * breaks. Message content never travels here: a `!` only tells the session
 * to schedule a fetch on the worker.
 *
 * ---
 *
 * @par States
 * ```
 *   Disconnected ──connect()──► Connecting ──first frame / grace──► Authenticated
 *        ▲                           │                                   │
 *        │                           │ 'A' 'E' / open failed        '#'  │  '!'
 *        │                           ▼                                   ▼
 *        └──── link lost, 'R', keep-alive timeout ◄──── Idle ◄──fetch done── Signaled
 * ```
 * - **Connecting**: socket open, identification frame sent. The relay does not
 *   confirm a login; it either starts talking or rejects. The session counts
 *   as authenticated at the first frame that is not a rejection, or after
 *   `auth_grace_ms` of quiet on an open socket.
 * - **Authenticated**: backoff is reset and the initial sync fetch is posted.
 * - **Signaled**: a fetch is in flight or queued because of `!`.
 * - **Idle**: connected, nothing pending.
 *
 * ---
 *
 * @par Frame handling
 * | frame | reaction                                                           |
 * |-------|--------------------------------------------------------------------|
 * | `#`   | refresh inactivity timer                                           |
 * | `!`   | Signaled, post fetch (coalesced while one is in flight)            |
 * | `R`   | drop link, reconnect on the next tick, backoff untouched           |
 * | `E`   | clear token, Disconnected, CredentialsRevoked (AuthRejected while Connecting) |
 * | `A`   | Disconnected, SessionSuperseded, no reconnect                      |
 *
 * Any frame counts as liveness. No frame for `2 * keepalive_interval_ms`
 * forces a reconnect.
 *
 * ---
 *
 * @par Failure Model
 * - **Network failure** (open, send, recv, remote close, timeout): Disconnected,
 *   reconnect after `Backoff::next_delay_ms()`. Unlimited retries.
 * - **AuthError on open** (handshake 401/403) or `E` while Connecting:
 *   token cleared, AuthRejected surfaced, no retry until `resume()`.
 * - **Terminal frames** (`E`, `A`): surfaced exactly once through the event
 *   callback, then the session stays Disconnected until `resume()`.
 * - **FetchError**: retried on a separate fetch backoff while the link stays up.
 *
 * ---
 *
 * @par Ownership & threads
 * Exactly one thread calls `tick()` (the session thread from `start()`, or
 * the test). It alone touches the connection, so two reconnects can never
 * overlap. Other threads only:
 * - read `state()` / `retry_count()` (atomics);
 * - call `request_logout()` / `resume()` (atomic flags, acted on next tick);
 * - complete fetch jobs (posted to the IExecutor), which hand their outcome
 *   back under a small mutex.
 *
 * The executor must be stopped before the Session is destroyed.
 *
 * @code
 *   Session s(conn, creds, fetcher, worker, cfg);
 *   s.set_message_handler([&](const std::vector<MessagePtr>& batch) { ... });
 *   s.set_event_callback([&](const Event& e) { ... });
 *   s.start();            // or: for (;;) s.tick(now_ms());
 * @endcode
 */
#ifndef PUSHWIRE_SESSION_HPP
#define PUSHWIRE_SESSION_HPP

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "pushwire/backoff.hpp"
#include "pushwire/credentials.hpp"
#include "pushwire/errors.hpp"
#include "pushwire/events.hpp"
#include "pushwire/fetcher.hpp"
#include "pushwire/relay_frame.hpp"
#include "pushwire/transport/transport_base.hpp"
#include "pushwire/work_queue.hpp"

namespace pushwire {

enum class SessionState : uint8_t {
  Disconnected = 0,
  Connecting,
  Authenticated,
  Signaled,
  Idle
};

const char* to_string(SessionState s);

struct SessionConfig {
  std::string push_url{"wss://client.pushover.net/push"};
  uint32_t keepalive_interval_ms{30000};
  uint32_t auth_grace_ms{3000};
  uint32_t network_timeout_ms{15000};
  uint32_t recv_wait_ms{250};          ///< Longest a single tick blocks in recv().
  uint32_t backoff_min_ms{Backoff::MIN_MS_DEFAULT};
  uint32_t backoff_max_ms{Backoff::MAX_MS_DEFAULT};
  double   backoff_jitter{Backoff::JITTER_DEFAULT};
  uint32_t backoff_seed{0};            ///< 0 = random_device.
};

using MessageHandler = std::function<void(const std::vector<MessagePtr>&)>;

class Session {
public:
  Session(transport::IConnection& conn, ICredentialStore& credentials, MessageFetcher& fetcher,
          IExecutor& executor, SessionConfig cfg = {});
  ~Session();

  Session(const Session&) = delete;
  Session& operator=(const Session&) = delete;

  /// Receives each fetched batch (ascending, already deduplicated). Worker thread.
  void set_message_handler(MessageHandler h) { on_messages_ = std::move(h); }

  /// Terminal conditions. Session thread.
  void set_event_callback(EventCallback cb) { on_event_ = std::move(cb); }

  /**
   * @brief Open the link and identify with @p token. Session thread only.
   *
   * On success the state is Connecting. AuthError when the relay refuses the
   * handshake, NetworkError for everything else (a reconnect is scheduled).
   */
  bool connect(const Token& token, uint64_t now_ms, Error& err);

  /// Advance the state machine: read frames, check timers, reconnect when due.
  void tick(uint64_t now_ms);

  SessionState state() const { return state_.load(); }
  uint32_t     retry_count() const { return retry_count_.load(); }
  bool         halted() const { return halted_.load(); }

  /// Ask the session thread to drop the link, clear the token and stay down.
  void request_logout();

  /// Leave a terminal state (new credentials were stored). Reconnects promptly.
  void resume();

  void start();
  void stop();

private:
  void connect_from_store(uint64_t now_ms);
  void handle_frame(RelayFrame f, uint64_t now_ms);
  void become_authenticated(uint64_t now_ms);
  void set_state(SessionState s, const char* why);
  void teardown();
  void schedule_reconnect(uint64_t now_ms, const Error& cause);
  void halt(EventKind kind, const std::string& detail);
  void request_fetch(uint64_t now_ms);
  void collect_fetch(uint64_t now_ms);
  void run();

  transport::IConnection& conn_;
  ICredentialStore&       credentials_;
  MessageFetcher&         fetcher_;
  IExecutor&              executor_;
  SessionConfig           cfg_;

  MessageHandler on_messages_;
  EventCallback  on_event_;

  std::atomic<SessionState> state_{SessionState::Disconnected};
  std::atomic<uint32_t>     retry_count_{0};
  std::atomic<bool>         halted_{false};
  std::atomic<bool>         logout_requested_{false};
  std::atomic<bool>         resume_requested_{false};

  // Session-thread only.
  Backoff  backoff_;
  Backoff  fetch_backoff_;
  uint64_t reconnect_at_ms_{0};
  uint64_t connected_at_ms_{0};
  uint64_t last_frame_at_ms_{0};
  uint64_t fetch_retry_at_ms_{0};
  bool     fetch_in_flight_{false};
  bool     refetch_pending_{false};
  std::vector<uint8_t> rx_;

  // Fetch outcome, written by the worker.
  std::mutex fetch_mu_;
  bool       fetch_done_{false};
  bool       fetch_ok_{false};
  Error      fetch_err_;

  // Session thread.
  std::mutex              run_mu_;
  std::condition_variable run_cv_;
  std::atomic<bool>       stopping_{false};
  std::thread             thread_;
};

} // namespace pushwire

#endif // PUSHWIRE_SESSION_HPP
