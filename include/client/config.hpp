// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_CONFIG_HPP
#define PBAPCLIENT_CLIENT_CONFIG_HPP

#include <chrono>
#include <optional>
#include <string>

namespace pbapclient {
namespace client {

struct ClientConfig {
  std::chrono::milliseconds connect_timeout;    // CONNECTING -> DISCONNECTING
  std::chrono::milliseconds disconnect_timeout; // Teardown before force abort
  std::chrono::milliseconds abort_grace;        // Force abort before giving up on the worker
  std::string datadir;   // Account store location ("" = memory only)
  std::string log_level;

  // When false the caller runs the io_context handed to the state machine
  bool use_internal_thread;

  ClientConfig()
      : connect_timeout(std::chrono::seconds(10)),
        disconnect_timeout(std::chrono::seconds(3)),
        abort_grace(std::chrono::seconds(1)), datadir(""), log_level("info"),
        use_internal_thread(true) {}
};

/**
 * Load a JSON config file
 *
 * Recognized keys: connect_timeout_ms, disconnect_timeout_ms,
 * abort_grace_ms, datadir, log_level. Missing keys keep their defaults.
 * Returns nullopt (and logs) if the file cannot be read or parsed, or a
 * timeout is not positive.
 */
std::optional<ClientConfig> LoadClientConfig(const std::string &path);

bool SaveClientConfig(const std::string &path, const ClientConfig &config);

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_CONFIG_HPP
