// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/connection_state.hpp"

namespace pbapclient {
namespace client {

std::string ConnectionStateAsString(ConnectionState state) {
  switch (state) {
  case ConnectionState::DISCONNECTED:
    return "disconnected";
  case ConnectionState::CONNECTING:
    return "connecting";
  case ConnectionState::CONNECTED:
    return "connected";
  case ConnectionState::DISCONNECTING:
    return "disconnecting";
  default:
    return "unknown";
  }
}

} // namespace client
} // namespace pbapclient
