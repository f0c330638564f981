// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/account_store.hpp"
#include "util/logging.hpp"
#include <chrono>
#include <fcntl.h>
#include <filesystem>
#include <fstream>
#include <nlohmann/json.hpp>
#include <unistd.h>

using json = nlohmann::json;

namespace pbapclient {
namespace client {

namespace {
constexpr int ACCOUNTS_FILE_VERSION = 1;

int64_t NowSeconds() {
  return std::chrono::duration_cast<std::chrono::seconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}
} // namespace

AccountStore::AccountStore(const std::string &datadir) {
  if (!datadir.empty()) {
    accounts_path_ = (std::filesystem::path(datadir) / "accounts.json").string();
    if (!Load()) {
      LOG_STORE_WARN("AccountStore: starting with an empty account list");
    }
  }
}

bool AccountStore::Load() {
  std::lock_guard<std::mutex> lock(mutex_);

  std::ifstream file(accounts_path_);
  if (!file.is_open()) {
    LOG_STORE_DEBUG("AccountStore: no existing accounts file at {}",
                    accounts_path_);
    return true; // Not an error - first run
  }

  try {
    json j;
    file >> j;

    const int version = j.value("version", 0);
    if (version != ACCOUNTS_FILE_VERSION) {
      LOG_STORE_WARN("AccountStore: unsupported accounts file version {} in {}",
                     version, accounts_path_);
      return false;
    }

    size_t loaded = 0;
    for (const auto &entry_json : j.at("accounts")) {
      AccountEntry entry;
      entry.address = entry_json.at("address").get<std::string>();
      entry.created = entry_json.value("created", int64_t(0));
      if (!PeerDevice::IsValidAddress(entry.address)) {
        LOG_STORE_WARN("AccountStore: skipping malformed account '{}'",
                       entry.address);
        continue;
      }
      accounts_[entry.address] = entry;
      loaded++;
    }

    LOG_STORE_DEBUG("AccountStore: loaded {} accounts from {}", loaded,
                    accounts_path_);
    return true;
  } catch (const std::exception &e) {
    LOG_STORE_ERROR("AccountStore: failed to parse {}: {}", accounts_path_,
                    e.what());
    accounts_.clear();
    return false;
  }
}

bool AccountStore::SaveInternal() {
  if (accounts_path_.empty()) {
    return true;
  }

  try {
    json j;
    j["version"] = ACCOUNTS_FILE_VERSION;
    j["accounts"] = json::array();
    for (const auto &[address, entry] : accounts_) {
      j["accounts"].push_back({{"address", entry.address},
                               {"created", entry.created}});
    }

    // Write to a temp file, fsync, then rename over the destination
    std::filesystem::path dest(accounts_path_);
    std::filesystem::path tmp = dest;
    tmp += ".tmp";
    std::string data = j.dump(2);

    int fd = ::open(tmp.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600);
    if (fd < 0) {
      LOG_STORE_ERROR("AccountStore: failed to open {} for writing",
                      tmp.string());
      return false;
    }
    size_t total = 0;
    while (total < data.size()) {
      ssize_t n = ::write(fd, data.data() + total, data.size() - total);
      if (n <= 0) {
        LOG_STORE_ERROR("AccountStore: write error to {}", tmp.string());
        ::close(fd);
        std::error_code ec_remove;
        std::filesystem::remove(tmp, ec_remove);
        return false;
      }
      total += static_cast<size_t>(n);
    }
    if (::fsync(fd) != 0) {
      LOG_STORE_ERROR("AccountStore: fsync failed for {}", tmp.string());
      ::close(fd);
      std::error_code ec_remove;
      std::filesystem::remove(tmp, ec_remove);
      return false;
    }
    ::close(fd);

    std::error_code ec;
    std::filesystem::rename(tmp, dest, ec);
    if (ec) {
      LOG_STORE_ERROR("AccountStore: failed to replace {}: {}", dest.string(),
                      ec.message());
      std::error_code ec_remove;
      std::filesystem::remove(tmp, ec_remove);
      return false;
    }
    return true;
  } catch (const std::exception &e) {
    LOG_STORE_ERROR("AccountStore: failed to save {}: {}", accounts_path_,
                    e.what());
    return false;
  }
}

bool AccountStore::AddAccount(const PeerDevice &device) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (accounts_.count(device.address()) != 0) {
    LOG_STORE_DEBUG("AccountStore: account for {} already present",
                    device.ToLogString());
    return true;
  }

  AccountEntry entry;
  entry.address = device.address();
  entry.created = NowSeconds();
  accounts_[entry.address] = entry;
  LOG_STORE_INFO("AccountStore: added account for {}", device.ToLogString());
  return SaveInternal();
}

bool AccountStore::RemoveAccount(const PeerDevice &device) {
  std::lock_guard<std::mutex> lock(mutex_);

  if (accounts_.erase(device.address()) == 0) {
    return false;
  }
  LOG_STORE_INFO("AccountStore: removed account for {}", device.ToLogString());
  return SaveInternal();
}

size_t AccountStore::RemoveAllAccounts() {
  std::lock_guard<std::mutex> lock(mutex_);

  const size_t count = accounts_.size();
  LOG_STORE_WARN("AccountStore: found {} unclean accounts", count);
  if (count == 0) {
    return 0;
  }
  for (const auto &[address, entry] : accounts_) {
    LOG_STORE_WARN("AccountStore: deleting account {}", address);
  }
  accounts_.clear();
  if (!SaveInternal()) {
    LOG_STORE_ERROR("AccountStore: purged accounts could not be persisted");
  }
  return count;
}

bool AccountStore::HasAccount(const PeerDevice &device) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return accounts_.count(device.address()) != 0;
}

std::vector<AccountEntry> AccountStore::ListAccounts() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<AccountEntry> result;
  result.reserve(accounts_.size());
  for (const auto &[address, entry] : accounts_) {
    result.push_back(entry);
  }
  return result;
}

} // namespace client
} // namespace pbapclient
