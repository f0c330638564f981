// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/state_machine.hpp"
#include "util/logging.hpp"
#include <algorithm>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/asio/post.hpp>
#include <sstream>
#include <stdexcept>

namespace pbapclient {
namespace client {

PbapClientStateMachine::PbapClientStateMachine(
    const ClientConfig &config, std::shared_ptr<ServiceDiscovery> discovery,
    WorkerFactory worker_factory, ConnectionNotifications &notifications,
    std::shared_ptr<AccountStore> accounts, StorageUnlockedFn storage_unlocked,
    boost::asio::io_context *external_io_context)
    : config_(config), discovery_(std::move(discovery)),
      worker_factory_(std::move(worker_factory)), notifications_(notifications),
      accounts_(std::move(accounts)),
      storage_unlocked_(std::move(storage_unlocked)),
      owned_io_context_(external_io_context
                            ? nullptr
                            : std::make_unique<boost::asio::io_context>()),
      io_context_(external_io_context ? *external_io_context
                                      : *owned_io_context_),
      connect_timer_(io_context_), disconnect_timer_(io_context_),
      abort_grace_timer_(io_context_) {
  RemoveUncleanAccounts();

  if (!discovery_) {
    LOG_CLIENT_WARN("No service discovery provided; connections cannot complete");
  }

  if (!config_.use_internal_thread && owned_io_context_) {
    LOG_CLIENT_WARN("use_internal_thread is off but no io_context was given, "
                    "starting an internal loop thread");
  } else if (config_.use_internal_thread && !owned_io_context_) {
    LOG_CLIENT_DEBUG("Using the caller's io_context");
  }

  if (owned_io_context_) {
    work_guard_ = std::make_unique<
        boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
        boost::asio::make_work_guard(io_context_));
    loop_thread_ = std::thread([this]() { io_context_.run(); });
  }

  LOG_CLIENT_DEBUG("PbapClientStateMachine initialized (connect timeout {}ms, "
                   "disconnect timeout {}ms, external_io_context: {})",
                   config_.connect_timeout.count(),
                   config_.disconnect_timeout.count(),
                   external_io_context ? "yes" : "no");
}

PbapClientStateMachine::~PbapClientStateMachine() {
  Shutdown();
  if (loop_thread_.joinable()) {
    if (loop_thread_.get_id() == std::this_thread::get_id()) {
      LOG_CLIENT_ERROR("State machine destroyed from its own loop thread");
      loop_thread_.detach();
    } else {
      loop_thread_.join();
    }
  }
  // Joins every handler thread; a worker stuck in I/O is aborted first
  worker_.reset();
  retired_workers_.clear();
}

// ============================================================================
// Requests
// ============================================================================

void PbapClientStateMachine::Connect(const PeerDevice &device) {
  LOG_CLIENT_DEBUG("Connect request {}", device.ToLogString());
  Post(Event::Connect(device));
}

void PbapClientStateMachine::Connect(const std::string &address) {
  auto device = PeerDevice::FromString(address);
  if (!device) {
    LOG_CLIENT_WARN("Received CONNECT without valid device ('{}')", address);
    throw std::invalid_argument("invalid device address: " + address);
  }
  Connect(*device);
}

void PbapClientStateMachine::Disconnect(const PeerDevice &device) {
  LOG_CLIENT_DEBUG("Disconnect request {}", device.ToLogString());
  Post(Event::Disconnect(device));
}

void PbapClientStateMachine::ResumeDownload() {
  RemoveUncleanAccounts();
  Post(Event{EventType::RESUME_DOWNLOAD});
}

void PbapClientStateMachine::Shutdown() {
  if (shutdown_requested_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  LOG_CLIENT_INFO("Shutting down connection state machine");
  RemoveUncleanAccounts();

  if (!owned_io_context_) {
    // External loop: the caller drives it, so clean up right here
    ShutdownOnLoop();
    return;
  }

  if (loop_thread_.get_id() == std::this_thread::get_id()) {
    ShutdownOnLoop();
    io_context_.stop();
    return;
  }

  boost::asio::post(io_context_, [this]() {
    ShutdownOnLoop();
    io_context_.stop();
  });
  if (loop_thread_.joinable()) {
    loop_thread_.join();
  }
}

void PbapClientStateMachine::ShutdownOnLoop() {
  shut_down_.store(true, std::memory_order_release);
  CancelAllTimers();

  std::optional<PeerDevice> device;
  ConnectionState state;
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    device = current_device_;
    state = state_;
  }
  if (state == ConnectionState::CONNECTING && discovery_ && device) {
    discovery_->CancelSearch(*device);
  }
  RetireWorker();

  if (!deferred_.empty()) {
    LOG_CLIENT_DEBUG("Dropping {} deferred events on shutdown",
                     deferred_.size());
    deferred_.clear();
    deferred_count_.store(0, std::memory_order_relaxed);
  }
  work_guard_.reset();
}

// ============================================================================
// Queries
// ============================================================================

ConnectionState PbapClientStateMachine::GetConnectionState() const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  return state_;
}

ConnectionState
PbapClientStateMachine::GetConnectionState(const PeerDevice &device) const {
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ != ConnectionState::DISCONNECTED && current_device_ &&
      *current_device_ == device) {
    return state_;
  }
  return ConnectionState::DISCONNECTED;
}

std::vector<PeerDevice> PbapClientStateMachine::GetDevicesMatchingConnectionStates(
    const std::vector<ConnectionState> &states) const {
  std::vector<PeerDevice> devices;
  std::lock_guard<std::mutex> lock(state_mutex_);
  // DISCONNECTED never has a device, so it can never match
  if (state_ == ConnectionState::DISCONNECTED || !current_device_) {
    return devices;
  }
  if (std::find(states.begin(), states.end(), state_) != states.end()) {
    devices.push_back(*current_device_);
  }
  return devices;
}

std::optional<PeerDevice> PbapClientStateMachine::GetDevice() const {
  // The device is assigned just before leaving DISCONNECTED and cleared
  // just after entering it; hide it for that whole state
  std::lock_guard<std::mutex> lock(state_mutex_);
  if (state_ == ConnectionState::DISCONNECTED) {
    return std::nullopt;
  }
  return current_device_;
}

std::string PbapClientStateMachine::Dump() const {
  std::ostringstream ss;
  auto device = GetDevice();
  ss << "current device: "
     << (device ? device->ToLogString() : std::string("none")) << "\n";
  ss << "state: " << ConnectionStateAsString(GetConnectionState()) << "\n";
  ss << "deferred events: " << DeferredCount() << "\n";
  return ss.str();
}

// ============================================================================
// Event processing
// ============================================================================

void PbapClientStateMachine::Post(Event event) {
  if (shutdown_requested_.load(std::memory_order_acquire)) {
    LOG_CLIENT_DEBUG("Dropping {} after shutdown",
                     EventTypeAsString(event.type));
    return;
  }
  boost::asio::post(io_context_, [this, event = std::move(event)]() {
    ProcessEvent(event);
  });
}

bool PbapClientStateMachine::IsStale(const Event &event) const {
  switch (event.type) {
  case EventType::SDP_COMPLETE:
  case EventType::WORKER_SUCCEEDED:
  case EventType::WORKER_FAILED:
  case EventType::WORKER_CLOSED:
    return event.attempt != attempt_;
  default:
    return false;
  }
}

void PbapClientStateMachine::ProcessEvent(const Event &event) {
  if (shut_down_.load(std::memory_order_acquire)) {
    return;
  }
  if (IsStale(event)) {
    LOG_CLIENT_DEBUG("Dropping {} from finished attempt {} (current {})",
                     EventTypeAsString(event.type), event.attempt, attempt_);
    return;
  }

  LOG_CLIENT_DEBUG("Processing {} in {}", EventTypeAsString(event.type),
                   ConnectionStateAsString(state_));

  std::optional<ConnectionState> next;
  switch (state_) {
  case ConnectionState::DISCONNECTED:
    next = HandleDisconnected(event);
    break;
  case ConnectionState::CONNECTING:
    next = HandleConnecting(event);
    break;
  case ConnectionState::CONNECTED:
    next = HandleConnected(event);
    break;
  case ConnectionState::DISCONNECTING:
    next = HandleDisconnecting(event);
    break;
  }

  if (next) {
    TransitionTo(*next);
  }
}

std::optional<ConnectionState>
PbapClientStateMachine::HandleDisconnected(const Event &event) {
  switch (event.type) {
  case EventType::CONNECT:
    if (!event.peer) {
      // Connect() validates the address, so this is a queueing bug
      LOG_CLIENT_ERROR("Received CONNECT without valid device");
      return std::nullopt;
    }
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      current_device_ = event.peer;
    }
    return ConnectionState::CONNECTING;

  case EventType::DISCONNECT:
    LOG_CLIENT_WARN("Received unexpected disconnect while disconnected");
    // Someone may still believe we are connected; remind them
    if (event.peer) {
      NotifyStateChanged(event.peer, ConnectionState::DISCONNECTED,
                         ConnectionState::DISCONNECTED);
    }
    return std::nullopt;

  default:
    LOG_CLIENT_WARN("Received unexpected {} while disconnected",
                    EventTypeAsString(event.type));
    return std::nullopt;
  }
}

std::optional<ConnectionState>
PbapClientStateMachine::HandleConnecting(const Event &event) {
  switch (event.type) {
  case EventType::DISCONNECT:
    if (event.peer && event.peer == current_device_) {
      return ConnectionState::DISCONNECTING;
    }
    LOG_CLIENT_DEBUG("Ignoring DISCONNECT for a device we are not connecting to");
    return std::nullopt;

  case EventType::WORKER_SUCCEEDED:
    return ConnectionState::CONNECTED;

  case EventType::WORKER_FAILED:
  case EventType::CONNECT_TIMEOUT:
    if (event.type == EventType::CONNECT_TIMEOUT) {
      LOG_CLIENT_WARN("Connect to {} timed out after {}ms",
                      current_device_->ToLogString(),
                      config_.connect_timeout.count());
    }
    return ConnectionState::DISCONNECTING;

  case EventType::CONNECT:
    LOG_CLIENT_WARN("Connecting already in progress");
    return std::nullopt;

  case EventType::SDP_COMPLETE: {
    if (!event.discovery) {
      LOG_DISC_WARN("SDP_COMPLETE without a record");
      return std::nullopt;
    }
    const DiscoveryResult &result = *event.discovery;
    if (result.device != *current_device_) {
      LOG_DISC_WARN("SDP record fetched for different device - ignore");
      return std::nullopt;
    }
    if (!boost::algorithm::iequals(result.uuid, PBAP_PSE_UUID)) {
      LOG_DISC_DEBUG("Ignoring SDP record for {} (expected {})", result.uuid,
                     PBAP_PSE_UUID);
      return std::nullopt;
    }
    if (connect_issued_) {
      LOG_DISC_DEBUG("Duplicate SDP record for {} - connect already issued",
                     current_device_->ToLogString());
      return std::nullopt;
    }
    if (!worker_) {
      LOG_CLIENT_ERROR("SDP record arrived without a worker");
      return std::nullopt;
    }
    connect_issued_ = true;
    worker_->Connect(result.record);
    return std::nullopt;
  }

  default:
    LOG_CLIENT_WARN("Received unexpected {} while connecting",
                    EventTypeAsString(event.type));
    return std::nullopt;
  }
}

std::optional<ConnectionState>
PbapClientStateMachine::HandleConnected(const Event &event) {
  switch (event.type) {
  case EventType::CONNECT:
    NotifyStateChanged(current_device_, ConnectionState::CONNECTED,
                       ConnectionState::CONNECTED);
    LOG_CLIENT_WARN("Received CONNECT while connected, ignoring");
    return std::nullopt;

  case EventType::DISCONNECT:
    if (event.peer && event.peer == current_device_) {
      return ConnectionState::DISCONNECTING;
    }
    LOG_CLIENT_DEBUG("Ignoring DISCONNECT for a device we are not connected to");
    return std::nullopt;

  case EventType::RESUME_DOWNLOAD:
    if (!StorageUnlocked()) {
      LOG_CLIENT_DEBUG("Storage still locked, not resuming download");
    } else if (worker_) {
      worker_->StartDownload();
    }
    return std::nullopt;

  default:
    LOG_CLIENT_WARN("Received unexpected {} while connected",
                    EventTypeAsString(event.type));
    return std::nullopt;
  }
}

std::optional<ConnectionState>
PbapClientStateMachine::HandleDisconnecting(const Event &event) {
  switch (event.type) {
  case EventType::WORKER_CLOSED:
    if (event.synthesized) {
      LOG_CLIENT_WARN("Worker for {} never closed after abort, releasing it",
                      current_device_->ToLogString());
    }
    CancelTimer(disconnect_timer_, disconnect_timer_gen_);
    return ConnectionState::DISCONNECTED;

  case EventType::CONNECT:
  case EventType::DISCONNECT:
    Defer(event);
    return std::nullopt;

  case EventType::DISCONNECT_TIMEOUT:
    if (abort_issued_) {
      LOG_CLIENT_DEBUG("Abort already issued for {}",
                       current_device_->ToLogString());
      return std::nullopt;
    }
    LOG_CLIENT_WARN("Disconnect Timeout, Forcing");
    abort_issued_ = true;
    if (worker_) {
      worker_->ForceAbort();
    }
    {
      // If even the abort does not come back, close on the worker's behalf
      Event closed = Event::FromWorker(EventType::WORKER_CLOSED, attempt_);
      closed.synthesized = true;
      ArmTimer(abort_grace_timer_, abort_grace_timer_gen_, config_.abort_grace,
               closed);
    }
    return std::nullopt;

  case EventType::RESUME_DOWNLOAD:
    // Do nothing.
    return std::nullopt;

  default:
    LOG_CLIENT_WARN("Received unexpected {} while disconnecting",
                    EventTypeAsString(event.type));
    return std::nullopt;
  }
}

// ============================================================================
// Transitions
// ============================================================================

void PbapClientStateMachine::TransitionTo(ConnectionState next) {
  const ConnectionState from = state_;
  LOG_CLIENT_TRACE("Transition {} -> {}", ConnectionStateAsString(from),
                   ConnectionStateAsString(next));

  ExitState(from);
  {
    std::lock_guard<std::mutex> lock(state_mutex_);
    state_ = next;
  }
  EnterState(next);
  ReapRetiredWorkers();

  if (from == ConnectionState::DISCONNECTING &&
      next != ConnectionState::DISCONNECTING) {
    DrainDeferred();
  }
}

void PbapClientStateMachine::EnterState(ConnectionState state) {
  switch (state) {
  case ConnectionState::DISCONNECTED: {
    NotifyStateChanged(current_device_, most_recent_state_,
                       ConnectionState::DISCONNECTED);
    most_recent_state_ = ConnectionState::DISCONNECTED;
    {
      std::lock_guard<std::mutex> lock(state_mutex_);
      current_device_.reset();
    }
    RetireWorker();
    attempt_ = 0;
    connect_issued_ = false;
    abort_issued_ = false;
    break;
  }

  case ConnectionState::CONNECTING: {
    NotifyStateChanged(current_device_, most_recent_state_,
                       ConnectionState::CONNECTING);
    const PeerDevice device = *current_device_;
    attempt_ = next_attempt_++;
    const uint64_t attempt = attempt_;

    if (discovery_) {
      discovery_->StartSearch(
          device, PBAP_PSE_UUID,
          [this, attempt](const DiscoveryResult &result) {
            Event ev = Event::SdpComplete(result);
            ev.attempt = attempt;
            Post(std::move(ev));
          });
    }
    most_recent_state_ = ConnectionState::CONNECTING;

    // Slow connect/download/teardown steps run on the worker's own thread
    if (worker_factory_) {
      worker_ = worker_factory_(device, [this, attempt](WorkerResult result) {
        switch (result) {
        case WorkerResult::SUCCEEDED:
          Post(Event::FromWorker(EventType::WORKER_SUCCEEDED, attempt));
          break;
        case WorkerResult::FAILED:
          Post(Event::FromWorker(EventType::WORKER_FAILED, attempt));
          break;
        case WorkerResult::CLOSED:
          Post(Event::FromWorker(EventType::WORKER_CLOSED, attempt));
          break;
        }
      });
    }
    if (!worker_) {
      LOG_CLIENT_ERROR("Could not create a connection worker for {}",
                       device.ToLogString());
      Post(Event::FromWorker(EventType::WORKER_FAILED, attempt));
    }

    ArmTimer(connect_timer_, connect_timer_gen_, config_.connect_timeout,
             Event{EventType::CONNECT_TIMEOUT});
    break;
  }

  case ConnectionState::CONNECTED:
    NotifyStateChanged(current_device_, most_recent_state_,
                       ConnectionState::CONNECTED);
    most_recent_state_ = ConnectionState::CONNECTED;
    if (!StorageUnlocked()) {
      LOG_CLIENT_INFO("Storage locked, download waits for ResumeDownload");
    } else if (worker_) {
      worker_->StartDownload();
    }
    break;

  case ConnectionState::DISCONNECTING:
    NotifyStateChanged(current_device_, most_recent_state_,
                       ConnectionState::DISCONNECTING);
    most_recent_state_ = ConnectionState::DISCONNECTING;
    if (worker_) {
      worker_->Teardown();
    } else {
      // Nothing to tear down
      Post(Event::FromWorker(EventType::WORKER_CLOSED, attempt_));
    }
    ArmTimer(disconnect_timer_, disconnect_timer_gen_,
             config_.disconnect_timeout, Event{EventType::DISCONNECT_TIMEOUT});
    break;
  }
}

void PbapClientStateMachine::ExitState(ConnectionState state) {
  switch (state) {
  case ConnectionState::CONNECTING:
    if (discovery_ && current_device_) {
      discovery_->CancelSearch(*current_device_);
    }
    CancelTimer(connect_timer_, connect_timer_gen_);
    break;
  case ConnectionState::DISCONNECTING:
    CancelTimer(disconnect_timer_, disconnect_timer_gen_);
    CancelTimer(abort_grace_timer_, abort_grace_timer_gen_);
    break;
  default:
    break;
  }
}

void PbapClientStateMachine::Defer(const Event &event) {
  LOG_CLIENT_DEBUG("Deferring {} until disconnected",
                   EventTypeAsString(event.type));
  deferred_.push_back(event);
  deferred_count_.store(deferred_.size(), std::memory_order_relaxed);
}

void PbapClientStateMachine::DrainDeferred() {
  if (deferred_.empty()) {
    return;
  }

  // Anything deferred again while replaying lands in a fresh deferred_
  std::deque<Event> pending;
  pending.swap(deferred_);
  deferred_count_.store(0, std::memory_order_relaxed);
  LOG_CLIENT_DEBUG("Replaying {} deferred events", pending.size());

  while (!pending.empty()) {
    Event event = std::move(pending.front());
    pending.pop_front();
    ProcessEvent(event);
  }
}

void PbapClientStateMachine::NotifyStateChanged(
    const std::optional<PeerDevice> &device, ConnectionState prev_state,
    ConnectionState new_state) {
  if (!device) {
    LOG_CLIENT_WARN("Connection state change with invalid device");
    return;
  }
  LOG_CLIENT_INFO("Connection state {}: {} -> {}", device->ToLogString(),
                  ConnectionStateAsString(prev_state),
                  ConnectionStateAsString(new_state));
  notifications_.NotifyConnectionStateChanged(*device, prev_state, new_state);
}

// ============================================================================
// Timers
// ============================================================================

void PbapClientStateMachine::ArmTimer(boost::asio::steady_timer &timer,
                                      uint64_t &generation,
                                      std::chrono::milliseconds delay,
                                      Event event) {
  const uint64_t armed = ++generation;
  timer.expires_after(delay);
  timer.async_wait([this, &generation, armed, event = std::move(event)](
                       const boost::system::error_code &ec) {
    if (ec == boost::asio::error::operation_aborted || armed != generation) {
      return;
    }
    if (ec) {
      LOG_CLIENT_ERROR("Timer for {} failed: {}",
                       EventTypeAsString(event.type), ec.message());
      return;
    }
    ProcessEvent(event);
  });
}

void PbapClientStateMachine::CancelTimer(boost::asio::steady_timer &timer,
                                         uint64_t &generation) {
  ++generation;
  timer.cancel();
}

void PbapClientStateMachine::CancelAllTimers() {
  CancelTimer(connect_timer_, connect_timer_gen_);
  CancelTimer(disconnect_timer_, disconnect_timer_gen_);
  CancelTimer(abort_grace_timer_, abort_grace_timer_gen_);
}

// ============================================================================
// Collaborators
// ============================================================================

void PbapClientStateMachine::RetireWorker() {
  if (!worker_) {
    return;
  }
  // Never join on the loop thread; the handler may still be stuck in I/O
  worker_->Quit();
  retired_workers_.push_back(std::move(worker_));
}

void PbapClientStateMachine::ReapRetiredWorkers() {
  retired_workers_.erase(
      std::remove_if(retired_workers_.begin(), retired_workers_.end(),
                     [](const std::unique_ptr<ConnectionWorker> &worker) {
                       return worker->IsStopped();
                     }),
      retired_workers_.end());
}

bool PbapClientStateMachine::StorageUnlocked() const {
  return !storage_unlocked_ || storage_unlocked_();
}

void PbapClientStateMachine::RemoveUncleanAccounts() {
  if (!accounts_) {
    return;
  }
  const size_t removed = accounts_->RemoveAllAccounts();
  if (removed > 0) {
    LOG_CLIENT_WARN("Removed {} unclean accounts", removed);
  }
}

} // namespace client
} // namespace pbapclient
