// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_PROFILE_SESSION_HPP
#define PBAPCLIENT_CLIENT_PROFILE_SESSION_HPP

#include "client/peer_device.hpp"
#include "client/sdp_record.hpp"
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <string>

namespace pbapclient {
namespace client {

/**
 * ProfileSession - the blocking I/O of one phonebook session
 *
 * Owned by a ConnectionHandler and only called from its handler thread,
 * except Abort(), which may be called from any thread to interrupt a
 * blocking call in progress.
 */
class ProfileSession {
public:
  virtual ~ProfileSession() = default;

  /**
   * Open the transport channel from the record and run the session
   * handshake. Returns true once the session is usable.
   */
  virtual bool Connect(const SdpPseRecord &record) = 0;

  /**
   * Pull one repository ("telecom/pb.vcf", ...)
   * Returns the number of entries fetched, nullopt on failure.
   */
  virtual std::optional<size_t> Download(const std::string &path) = 0;

  // Close the session and the channel; safe to call when not connected
  virtual void Disconnect() = 0;

  // Unblock any call in progress; later calls fail fast
  virtual void Abort() = 0;
};

using SessionFactory =
    std::function<std::unique_ptr<ProfileSession>(const PeerDevice &device)>;

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_PROFILE_SESSION_HPP
