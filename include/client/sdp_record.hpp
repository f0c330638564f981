// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_SDP_RECORD_HPP
#define PBAPCLIENT_CLIENT_SDP_RECORD_HPP

#include "client/peer_device.hpp"
#include <cstdint>
#include <string>
#include <vector>

namespace pbapclient {
namespace client {

// Service class UUID of the phonebook server (PSE) role
constexpr const char *PBAP_PSE_UUID = "0000112f-0000-1000-8000-00805f9b34fb";

// Supported repositories bitmask advertised by the server
namespace repository {
constexpr uint8_t LOCAL_PHONEBOOK = 1 << 0;
constexpr uint8_t SIM_CARD = 1 << 1;
constexpr uint8_t SPEED_DIAL = 1 << 2;
constexpr uint8_t FAVORITES = 1 << 3;
} // namespace repository

// Resolved endpoint of the phonebook server on the peer
struct SdpPseRecord {
  int l2cap_psm = -1;      // -1 if the server has no L2CAP channel
  int rfcomm_channel = -1; // -1 if the server has no RFCOMM channel
  uint16_t profile_version = 0;
  uint32_t supported_features = 0;
  uint8_t supported_repositories = 0;
  std::string service_name;
};

// What a discovery search reports back for one device
struct DiscoveryResult {
  PeerDevice device;
  std::string uuid;
  SdpPseRecord record;
};

/**
 * Paths to download for a record, in download order.
 *
 * Call history is fetched along with the local phonebook. A record that
 * advertises no repositories is treated as local phonebook only.
 */
std::vector<std::string> RepositoryPaths(const SdpPseRecord &record);

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_SDP_RECORD_HPP
