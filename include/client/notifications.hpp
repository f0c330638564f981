// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_NOTIFICATIONS_HPP
#define PBAPCLIENT_CLIENT_NOTIFICATIONS_HPP

#include "client/connection_state.hpp"
#include "client/peer_device.hpp"
#include <cstddef>
#include <functional>
#include <mutex>
#include <vector>

namespace pbapclient {
namespace client {

/**
 * ConnectionNotifications - publishes connection state changes
 *
 * Subscribers register callbacks and keep the returned Subscription
 * alive for as long as they want events. Callbacks run synchronously on
 * the publishing thread (the state machine event loop) and must not
 * subscribe or unsubscribe from inside the callback.
 */
class ConnectionNotifications {
public:
  using ConnectionStateChangedCallback =
      std::function<void(const PeerDevice &device, ConnectionState prev_state,
                         ConnectionState new_state)>;

  // RAII handle, unsubscribes on destruction
  class Subscription {
  public:
    Subscription() = default;
    Subscription(ConnectionNotifications *owner, size_t id);
    ~Subscription();

    Subscription(const Subscription &) = delete;
    Subscription &operator=(const Subscription &) = delete;
    Subscription(Subscription &&other) noexcept;
    Subscription &operator=(Subscription &&other) noexcept;

    void Unsubscribe();

  private:
    ConnectionNotifications *owner_{nullptr};
    size_t id_{0};
    bool active_{false};
  };

  [[nodiscard]] Subscription
  SubscribeConnectionStateChanged(ConnectionStateChangedCallback callback);

  void NotifyConnectionStateChanged(const PeerDevice &device,
                                    ConnectionState prev_state,
                                    ConnectionState new_state);

  size_t SubscriberCount() const;

  static ConnectionNotifications &Get();

private:
  void Unsubscribe(size_t id);

  struct CallbackEntry {
    size_t id;
    ConnectionStateChangedCallback state_changed;
  };

  mutable std::mutex mutex_;
  std::vector<CallbackEntry> callbacks_;
  size_t next_id_{1};
};

// Process-wide instance
inline ConnectionNotifications &ConnectionEvents() {
  return ConnectionNotifications::Get();
}

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_NOTIFICATIONS_HPP
