// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_SERVICE_DISCOVERY_HPP
#define PBAPCLIENT_CLIENT_SERVICE_DISCOVERY_HPP

#include "client/peer_device.hpp"
#include "client/sdp_record.hpp"
#include <functional>
#include <string>

namespace pbapclient {
namespace client {

using DiscoveryCallback = std::function<void(const DiscoveryResult &result)>;

/**
 * ServiceDiscovery - resolves a peer's profile endpoint
 *
 * Abstract interface so the state machine can run against the platform
 * SDP stack or an in-memory fake. Results may be delivered on any thread
 * and may concern other devices or other service classes; the caller
 * filters them.
 */
class ServiceDiscovery {
public:
  virtual ~ServiceDiscovery() = default;

  /**
   * Start looking up `uuid` on `device`
   * The callback stays registered until CancelSearch() for that device.
   */
  virtual void StartSearch(const PeerDevice &device, const std::string &uuid,
                           DiscoveryCallback callback) = 0;

  /**
   * Drop the callback registered for `device`
   * Must not invoke the callback after returning.
   */
  virtual void CancelSearch(const PeerDevice &device) = 0;
};

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_SERVICE_DISCOVERY_HPP
