// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/peer_device.hpp"
#include <algorithm>
#include <cctype>

namespace pbapclient {
namespace client {

namespace {
constexpr size_t ADDRESS_LENGTH = 17; // six octets and five separators
} // namespace

bool PeerDevice::IsValidAddress(const std::string &address) {
  if (address.size() != ADDRESS_LENGTH) {
    return false;
  }
  for (size_t i = 0; i < address.size(); ++i) {
    const unsigned char c = static_cast<unsigned char>(address[i]);
    if (i % 3 == 2) {
      if (c != ':') {
        return false;
      }
    } else if (!std::isxdigit(c)) {
      return false;
    }
  }
  return true;
}

std::optional<PeerDevice> PeerDevice::FromString(const std::string &address,
                                                 const std::string &name) {
  if (!IsValidAddress(address)) {
    return std::nullopt;
  }
  std::string normalized = address;
  std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return PeerDevice(std::move(normalized), name);
}

std::string PeerDevice::ToLogString() const {
  // Keep the first and last octet: AA:XX:XX:XX:XX:FF
  if (address_.size() != ADDRESS_LENGTH) {
    return address_;
  }
  return address_.substr(0, 3) + "XX:XX:XX:XX" + address_.substr(14);
}

} // namespace client
} // namespace pbapclient
