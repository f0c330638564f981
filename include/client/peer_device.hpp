// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_PEER_DEVICE_HPP
#define PBAPCLIENT_CLIENT_PEER_DEVICE_HPP

#include <optional>
#include <string>

namespace pbapclient {
namespace client {

/**
 * PeerDevice - identity of a remote device
 *
 * Identified by its Bluetooth address ("AA:BB:CC:DD:EE:FF"), stored in
 * upper case. The display name is informational and ignored by
 * comparisons.
 */
class PeerDevice {
public:
  // Returns nullopt if the address is malformed
  static std::optional<PeerDevice> FromString(const std::string &address,
                                              const std::string &name = "");

  static bool IsValidAddress(const std::string &address);

  const std::string &address() const { return address_; }
  const std::string &name() const { return name_; }

  // Address with the middle octets masked, for logs
  std::string ToLogString() const;

  bool operator==(const PeerDevice &other) const {
    return address_ == other.address_;
  }
  bool operator!=(const PeerDevice &other) const { return !(*this == other); }

private:
  PeerDevice(std::string address, std::string name)
      : address_(std::move(address)), name_(std::move(name)) {}

  std::string address_;
  std::string name_;
};

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_PEER_DEVICE_HPP
