/**
 * @file client.hpp
 * @brief Wires the delivery engine together for one device.
 *
 * @details
 * ```
 *   WebSocketConnection ─► Session ──post──► WorkQueue ─► MessageFetcher ─► Ledger
 *                                                              │
 *                                   emergency, unacked ◄───────┴───► everything else
 *                                          │                               │
 *                                   EmergencyLoop ──► INotificationSink ◄──┘
 * ```
 * Client owns every piece except the sink. Entry points (CLI, tray) only
 * start/stop it and relay user actions: login, logout, acknowledge.
 *
 * Threads while running: session thread, worker thread, alert thread.
 */
#ifndef PUSHWIRE_CLIENT_HPP
#define PUSHWIRE_CLIENT_HPP

#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include "pushwire/config.hpp"
#include "pushwire/credentials.hpp"
#include "pushwire/emergency_loop.hpp"
#include "pushwire/errors.hpp"
#include "pushwire/events.hpp"
#include "pushwire/fetcher.hpp"
#include "pushwire/ledger.hpp"
#include "pushwire/notification_sink.hpp"
#include "pushwire/relay_api.hpp"
#include "pushwire/session.hpp"
#include "pushwire/state_store.hpp"
#include "pushwire/transport/transport_base.hpp"
#include "pushwire/work_queue.hpp"

namespace pushwire {

struct ClientStatus {
  bool         logged_in{false};
  std::string  device_id;
  int64_t      last_message_id{0};
  size_t       pending_acks{0};
  SessionState state{SessionState::Disconnected};
  uint32_t     retry_count{0};
};

class Client {
public:
  /// Production wiring: HttpRelayApi + WebSocketConnection.
  Client(Config cfg, const std::filesystem::path& state_dir, INotificationSink& sink);

  /// Injected relay API and connection (tests, alternative transports).
  Client(Config cfg, const std::filesystem::path& state_dir, INotificationSink& sink,
         std::unique_ptr<IRelayApi> api, std::unique_ptr<transport::IConnection> conn);

  ~Client();

  Client(const Client&) = delete;
  Client& operator=(const Client&) = delete;

  /// Lock the state directory, load state.json, rebuild the ledger mark and
  /// pending emergency alerts. StorageError "state_locked" when another
  /// client (usually `pushwire run`) owns the directory.
  bool open(Error& err);

  /// Start worker, alert and session threads. Requires open().
  bool start(Error& err);
  void stop();

  /// Login, register this device, store the token, wake a halted session.
  bool login(const std::string& email, const std::string& password, const std::string& twofa, Error& err);

  /// Drop credentials, ledger mark and pending alerts; the session stays down.
  bool logout(Error& err);

  /// Blocking acknowledgment (CLI one-shot).
  bool acknowledge(const std::string& receipt_id, Error& err);

  /// Acknowledgment on the worker; the result is logged.
  bool acknowledge_async(const std::string& receipt_id);

  ClientStatus status() const;

  void set_event_callback(EventCallback cb);

private:
  void deliver(const std::vector<MessagePtr>& batch);
  void on_event(const Event& e);

  Config                                  cfg_;
  StateLock                               lock_;
  StateStore                              store_;
  StateCredentialStore                    credentials_;
  std::unique_ptr<IRelayApi>              api_;
  std::unique_ptr<transport::IConnection> conn_;
  INotificationSink&                      sink_;
  std::unique_ptr<Ledger>                 ledger_;
  std::unique_ptr<MessageFetcher>         fetcher_;
  std::unique_ptr<EmergencyLoop>          loop_;
  WorkQueue                               worker_;
  std::unique_ptr<Session>                session_;
  bool                                    running_{false};

  mutable std::mutex event_mu_;
  EventCallback      on_event_;
};

} // namespace pushwire

#endif // PUSHWIRE_CLIENT_HPP
