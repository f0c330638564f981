// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/config.hpp"
#include "util/logging.hpp"
#include <fstream>
#include <nlohmann/json.hpp>

using json = nlohmann::json;

namespace pbapclient {
namespace client {

namespace {

// Reads a positive millisecond value, leaving `out` untouched if absent
bool ReadTimeout(const json &j, const char *key,
                 std::chrono::milliseconds &out) {
  if (!j.contains(key)) {
    return true;
  }
  const int64_t ms = j.at(key).get<int64_t>();
  if (ms <= 0) {
    LOG_ERROR("Config: {} must be positive (got {})", key, ms);
    return false;
  }
  out = std::chrono::milliseconds(ms);
  return true;
}

} // namespace

std::optional<ClientConfig> LoadClientConfig(const std::string &path) {
  std::ifstream file(path);
  if (!file.is_open()) {
    LOG_ERROR("Config: cannot open {}", path);
    return std::nullopt;
  }

  try {
    json j;
    file >> j;
    if (!j.is_object()) {
      LOG_ERROR("Config: {} does not contain a JSON object", path);
      return std::nullopt;
    }

    ClientConfig config;
    if (!ReadTimeout(j, "connect_timeout_ms", config.connect_timeout) ||
        !ReadTimeout(j, "disconnect_timeout_ms", config.disconnect_timeout) ||
        !ReadTimeout(j, "abort_grace_ms", config.abort_grace)) {
      return std::nullopt;
    }
    config.datadir = j.value("datadir", config.datadir);
    config.log_level = j.value("log_level", config.log_level);

    LOG_DEBUG("Config: loaded {} (connect={}ms, disconnect={}ms)", path,
              config.connect_timeout.count(),
              config.disconnect_timeout.count());
    return config;
  } catch (const std::exception &e) {
    LOG_ERROR("Config: failed to parse {}: {}", path, e.what());
    return std::nullopt;
  }
}

bool SaveClientConfig(const std::string &path, const ClientConfig &config) {
  try {
    json j;
    j["connect_timeout_ms"] = config.connect_timeout.count();
    j["disconnect_timeout_ms"] = config.disconnect_timeout.count();
    j["abort_grace_ms"] = config.abort_grace.count();
    j["datadir"] = config.datadir;
    j["log_level"] = config.log_level;

    std::ofstream file(path, std::ios::trunc);
    if (!file.is_open()) {
      LOG_ERROR("Config: cannot open {} for writing", path);
      return false;
    }
    file << j.dump(2);
    return static_cast<bool>(file);
  } catch (const std::exception &e) {
    LOG_ERROR("Config: failed to save {}: {}", path, e.what());
    return false;
  }
}

} // namespace client
} // namespace pbapclient
