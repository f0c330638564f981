// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_STATE_MACHINE_HPP
#define PBAPCLIENT_CLIENT_STATE_MACHINE_HPP

#include "client/account_store.hpp"
#include "client/config.hpp"
#include "client/connection_state.hpp"
#include "client/connection_worker.hpp"
#include "client/event.hpp"
#include "client/notifications.hpp"
#include "client/peer_device.hpp"
#include "client/service_discovery.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace pbapclient {
namespace client {

/**
 * PbapClientStateMachine - connection lifecycle of one phonebook server
 *
 *                  (DISCONNECTED)
 *                      |    ^
 *              CONNECT |    | WORKER_CLOSED
 *                      V    |
 *           (CONNECTING)  (DISCONNECTING)
 *                      |    ^
 *     WORKER_SUCCEEDED |    | DISCONNECT
 *                      V    |
 *                   (CONNECTED)
 *
 *   CONNECTING + WORKER_FAILED / CONNECT_TIMEOUT / DISCONNECT -> DISCONNECTING
 *   DISCONNECTING + DISCONNECT_TIMEOUT -> force abort, still DISCONNECTING
 *   DISCONNECTING + CONNECT / DISCONNECT -> deferred until DISCONNECTED
 *
 * All events, whether from callers, discovery, the worker or timers, go
 * through one io_context and are processed one at a time on the loop
 * thread. The public request methods only post and never block. State
 * queries take a mutex and may be called from any thread.
 *
 * With an external io_context the caller runs the loop; no thread is
 * started and the io_context must not be run after this object is
 * destroyed.
 */
class PbapClientStateMachine {
public:
  // Returns false while user storage is locked and downloads must wait
  using StorageUnlockedFn = std::function<bool()>;

  PbapClientStateMachine(const ClientConfig &config,
                         std::shared_ptr<ServiceDiscovery> discovery,
                         WorkerFactory worker_factory,
                         ConnectionNotifications &notifications = ConnectionEvents(),
                         std::shared_ptr<AccountStore> accounts = nullptr,
                         StorageUnlockedFn storage_unlocked = nullptr,
                         boost::asio::io_context *external_io_context = nullptr);
  ~PbapClientStateMachine();

  PbapClientStateMachine(const PbapClientStateMachine &) = delete;
  PbapClientStateMachine &operator=(const PbapClientStateMachine &) = delete;

  // Requests (any thread, never block)
  void Connect(const PeerDevice &device);
  // Throws std::invalid_argument for a malformed address
  void Connect(const std::string &address);
  void Disconnect(const PeerDevice &device);
  void ResumeDownload();

  // Cancel timers, stop the worker and the loop. Idempotent.
  void Shutdown();

  // Queries (any thread)
  ConnectionState GetConnectionState() const;
  ConnectionState GetConnectionState(const PeerDevice &device) const;
  std::vector<PeerDevice>
  GetDevicesMatchingConnectionStates(const std::vector<ConnectionState> &states) const;
  // Current peer; nullopt while DISCONNECTED
  std::optional<PeerDevice> GetDevice() const;
  size_t DeferredCount() const {
    return deferred_count_.load(std::memory_order_relaxed);
  }
  std::string Dump() const;

private:
  // Queue an event from any thread
  void Post(Event event);

  // Loop thread only from here on
  void ProcessEvent(const Event &event);
  bool IsStale(const Event &event) const;

  // Per-state handlers; return the state to move to, if any
  std::optional<ConnectionState> HandleDisconnected(const Event &event);
  std::optional<ConnectionState> HandleConnecting(const Event &event);
  std::optional<ConnectionState> HandleConnected(const Event &event);
  std::optional<ConnectionState> HandleDisconnecting(const Event &event);

  void TransitionTo(ConnectionState next);
  void EnterState(ConnectionState state);
  void ExitState(ConnectionState state);
  void Defer(const Event &event);
  void DrainDeferred();

  void NotifyStateChanged(const std::optional<PeerDevice> &device,
                          ConnectionState prev_state, ConnectionState new_state);

  void ArmTimer(boost::asio::steady_timer &timer, uint64_t &generation,
                std::chrono::milliseconds delay, Event event);
  void CancelTimer(boost::asio::steady_timer &timer, uint64_t &generation);
  void CancelAllTimers();

  void RetireWorker();
  void ReapRetiredWorkers();
  bool StorageUnlocked() const;
  void RemoveUncleanAccounts();
  void ShutdownOnLoop();

  ClientConfig config_;
  std::shared_ptr<ServiceDiscovery> discovery_;
  WorkerFactory worker_factory_;
  ConnectionNotifications &notifications_;
  std::shared_ptr<AccountStore> accounts_;
  StorageUnlockedFn storage_unlocked_;

  // Event loop (may be external or owned locally)
  std::unique_ptr<boost::asio::io_context> owned_io_context_;
  boost::asio::io_context &io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread loop_thread_;

  boost::asio::steady_timer connect_timer_;
  boost::asio::steady_timer disconnect_timer_;
  boost::asio::steady_timer abort_grace_timer_;
  // Bumped on every arm/cancel; an expiry only counts if it still matches
  uint64_t connect_timer_gen_{0};
  uint64_t disconnect_timer_gen_{0};
  uint64_t abort_grace_timer_gen_{0};

  // Guarded by state_mutex_, written on the loop thread only
  mutable std::mutex state_mutex_;
  ConnectionState state_{ConnectionState::DISCONNECTED};
  std::optional<PeerDevice> current_device_; // Only changes in DISCONNECTED

  // Previous state, reported as "from" in notifications
  ConnectionState most_recent_state_{ConnectionState::DISCONNECTED};

  std::unique_ptr<ConnectionWorker> worker_;
  std::vector<std::unique_ptr<ConnectionWorker>> retired_workers_;
  uint64_t next_attempt_{1};
  uint64_t attempt_{0}; // Attempt owning worker_, 0 while DISCONNECTED
  bool connect_issued_{false};
  bool abort_issued_{false};

  std::deque<Event> deferred_;
  std::atomic<size_t> deferred_count_{0};

  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> shut_down_{false};
};

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_STATE_MACHINE_HPP
