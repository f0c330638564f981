// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/event.hpp"

namespace pbapclient {
namespace client {

std::string EventTypeAsString(EventType type) {
  switch (type) {
  case EventType::CONNECT:
    return "CONNECT";
  case EventType::DISCONNECT:
    return "DISCONNECT";
  case EventType::SDP_COMPLETE:
    return "SDP_COMPLETE";
  case EventType::WORKER_SUCCEEDED:
    return "WORKER_SUCCEEDED";
  case EventType::WORKER_FAILED:
    return "WORKER_FAILED";
  case EventType::WORKER_CLOSED:
    return "WORKER_CLOSED";
  case EventType::CONNECT_TIMEOUT:
    return "CONNECT_TIMEOUT";
  case EventType::DISCONNECT_TIMEOUT:
    return "DISCONNECT_TIMEOUT";
  case EventType::RESUME_DOWNLOAD:
    return "RESUME_DOWNLOAD";
  default:
    return "UNKNOWN";
  }
}

} // namespace client
} // namespace pbapclient
