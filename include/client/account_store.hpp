// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_ACCOUNT_STORE_HPP
#define PBAPCLIENT_CLIENT_ACCOUNT_STORE_HPP

#include "client/peer_device.hpp"
#include <cstdint>
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace pbapclient {
namespace client {

struct AccountEntry {
  std::string address; // Account name is the device address
  int64_t created = 0; // Unix seconds
};

/**
 * AccountStore - local accounts created for downloaded phonebooks
 *
 * An account exists while a peer's contacts are cached locally. Accounts
 * left behind by an unclean shutdown are purged with RemoveAllAccounts().
 *
 * Persisted to <datadir>/accounts.json; with an empty datadir accounts
 * live in memory only. Errors are logged and reported through return
 * values, never thrown. Thread-safe.
 */
class AccountStore {
public:
  explicit AccountStore(const std::string &datadir = "");

  bool AddAccount(const PeerDevice &device);
  bool RemoveAccount(const PeerDevice &device);

  // Returns the number of accounts removed
  size_t RemoveAllAccounts();

  bool HasAccount(const PeerDevice &device) const;
  std::vector<AccountEntry> ListAccounts() const;

  std::string GetAccountsPath() const { return accounts_path_; }

private:
  bool Load();
  bool SaveInternal(); // Caller must hold mutex_

  std::string accounts_path_;
  mutable std::mutex mutex_;
  std::map<std::string, AccountEntry> accounts_;
};

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_ACCOUNT_STORE_HPP
