// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/sdp_record.hpp"

namespace pbapclient {
namespace client {

std::vector<std::string> RepositoryPaths(const SdpPseRecord &record) {
  uint8_t repos = record.supported_repositories;
  if (repos == 0) {
    repos = repository::LOCAL_PHONEBOOK;
  }

  std::vector<std::string> paths;
  if (repos & repository::LOCAL_PHONEBOOK) {
    paths.emplace_back("telecom/pb.vcf");
  }
  if (repos & repository::SIM_CARD) {
    paths.emplace_back("SIM1/telecom/pb.vcf");
  }
  if (repos & repository::FAVORITES) {
    paths.emplace_back("telecom/fav.vcf");
  }
  if (repos & repository::SPEED_DIAL) {
    paths.emplace_back("telecom/spd.vcf");
  }
  if (repos & repository::LOCAL_PHONEBOOK) {
    paths.emplace_back("telecom/ich.vcf");
    paths.emplace_back("telecom/och.vcf");
    paths.emplace_back("telecom/mch.vcf");
  }
  return paths;
}

} // namespace client
} // namespace pbapclient
