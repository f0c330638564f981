// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_CONNECTION_STATE_HPP
#define PBAPCLIENT_CLIENT_CONNECTION_STATE_HPP

#include <string>

namespace pbapclient {
namespace client {

// Profile connection states, in the order a session walks through them
enum class ConnectionState {
  DISCONNECTED,  // No peer; the only state in which the peer may change
  CONNECTING,    // Discovery and handshake in progress
  CONNECTED,     // Session established, downloads may run
  DISCONNECTING  // Teardown in progress
};

std::string ConnectionStateAsString(ConnectionState state);

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_CONNECTION_STATE_HPP
