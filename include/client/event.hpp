// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_EVENT_HPP
#define PBAPCLIENT_CLIENT_EVENT_HPP

#include "client/peer_device.hpp"
#include "client/sdp_record.hpp"
#include <cstdint>
#include <optional>
#include <string>

namespace pbapclient {
namespace client {

enum class EventType {
  CONNECT,            // payload: peer
  DISCONNECT,         // payload: peer
  SDP_COMPLETE,       // payload: discovery result
  WORKER_SUCCEEDED,
  WORKER_FAILED,
  WORKER_CLOSED,
  CONNECT_TIMEOUT,
  DISCONNECT_TIMEOUT,
  RESUME_DOWNLOAD
};

std::string EventTypeAsString(EventType type);

// One message on the state machine queue
struct Event {
  EventType type;
  std::optional<PeerDevice> peer;
  std::optional<DiscoveryResult> discovery;
  uint64_t attempt = 0;     // Connection attempt a worker result belongs to
  bool synthesized = false; // WORKER_CLOSED produced by the abort fallback

  static Event Connect(std::optional<PeerDevice> peer) {
    Event ev{EventType::CONNECT};
    ev.peer = std::move(peer);
    return ev;
  }
  static Event Disconnect(std::optional<PeerDevice> peer) {
    Event ev{EventType::DISCONNECT};
    ev.peer = std::move(peer);
    return ev;
  }
  static Event SdpComplete(DiscoveryResult result) {
    Event ev{EventType::SDP_COMPLETE};
    ev.discovery = std::move(result);
    return ev;
  }
  static Event FromWorker(EventType type, uint64_t attempt) {
    Event ev{type};
    ev.attempt = attempt;
    return ev;
  }
};

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_EVENT_HPP
