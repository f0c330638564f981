// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/notifications.hpp"
#include <algorithm>

namespace pbapclient {
namespace client {

// ============================================================================
// ConnectionNotifications::Subscription
// ============================================================================

ConnectionNotifications::Subscription::Subscription(
    ConnectionNotifications *owner, size_t id)
    : owner_(owner), id_(id), active_(true) {}

ConnectionNotifications::Subscription::~Subscription() { Unsubscribe(); }

ConnectionNotifications::Subscription::Subscription(
    Subscription &&other) noexcept
    : owner_(other.owner_), id_(other.id_), active_(other.active_) {
  other.owner_ = nullptr;
  other.active_ = false;
}

ConnectionNotifications::Subscription &
ConnectionNotifications::Subscription::operator=(
    Subscription &&other) noexcept {
  if (this != &other) {
    Unsubscribe();
    owner_ = other.owner_;
    id_ = other.id_;
    active_ = other.active_;
    other.owner_ = nullptr;
    other.active_ = false;
  }
  return *this;
}

void ConnectionNotifications::Subscription::Unsubscribe() {
  if (active_ && owner_) {
    owner_->Unsubscribe(id_);
    active_ = false;
  }
}

// ============================================================================
// ConnectionNotifications
// ============================================================================

ConnectionNotifications::Subscription
ConnectionNotifications::SubscribeConnectionStateChanged(
    ConnectionStateChangedCallback callback) {
  std::lock_guard<std::mutex> lock(mutex_);
  size_t id = next_id_++;

  CallbackEntry entry;
  entry.id = id;
  entry.state_changed = std::move(callback);
  callbacks_.push_back(std::move(entry));

  return Subscription(this, id);
}

void ConnectionNotifications::NotifyConnectionStateChanged(
    const PeerDevice &device, ConnectionState prev_state,
    ConnectionState new_state) {
  std::lock_guard<std::mutex> lock(mutex_);

  for (const auto &entry : callbacks_) {
    if (entry.state_changed) {
      entry.state_changed(device, prev_state, new_state);
    }
  }
}

size_t ConnectionNotifications::SubscriberCount() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return callbacks_.size();
}

void ConnectionNotifications::Unsubscribe(size_t id) {
  std::lock_guard<std::mutex> lock(mutex_);

  auto it =
      std::find_if(callbacks_.begin(), callbacks_.end(),
                   [id](const CallbackEntry &entry) { return entry.id == id; });

  if (it != callbacks_.end()) {
    callbacks_.erase(it);
  }
}

ConnectionNotifications &ConnectionNotifications::Get() {
  static ConnectionNotifications instance;
  return instance;
}

} // namespace client
} // namespace pbapclient
