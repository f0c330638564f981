// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_CONNECTION_HANDLER_HPP
#define PBAPCLIENT_CLIENT_CONNECTION_HANDLER_HPP

#include "client/account_store.hpp"
#include "client/connection_worker.hpp"
#include "client/peer_device.hpp"
#include "client/profile_session.hpp"
#include "client/sdp_record.hpp"
#include <atomic>
#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <memory>
#include <optional>
#include <thread>

namespace pbapclient {
namespace client {

/**
 * ConnectionHandler - default ConnectionWorker
 *
 * Runs every command on a dedicated handler thread with its own
 * io_context, so the blocking ProfileSession calls never touch the state
 * machine loop. Commands are processed in the order they were issued.
 *
 * Lifecycle: the thread starts in the constructor. Quit() lets queued
 * commands drain and then stops the thread; the destructor aborts the
 * session if a command is still running and joins the thread.
 */
class ConnectionHandler : public ConnectionWorker {
public:
  ConnectionHandler(const PeerDevice &device,
                    std::unique_ptr<ProfileSession> session,
                    std::shared_ptr<AccountStore> accounts,
                    WorkerResultCallback callback);
  ~ConnectionHandler() override;

  ConnectionHandler(const ConnectionHandler &) = delete;
  ConnectionHandler &operator=(const ConnectionHandler &) = delete;

  // Factory producing a handler plus a fresh session per attempt
  static WorkerFactory MakeFactory(SessionFactory session_factory,
                                   std::shared_ptr<AccountStore> accounts);

  void Connect(const SdpPseRecord &record) override;
  void StartDownload() override;
  void Teardown() override;
  void ForceAbort() override;
  void Quit() override;
  bool IsStopped() const override {
    return stopped_.load(std::memory_order_acquire);
  }

  const PeerDevice &device() const { return device_; }

private:
  template <typename Handler> void Post(const char *command, Handler handler);

  // Handler thread only
  void HandleConnect(const SdpPseRecord &record);
  void HandleDownload();
  void HandleTeardown();
  void Report(WorkerResult result);

  PeerDevice device_;
  std::unique_ptr<ProfileSession> session_;
  std::shared_ptr<AccountStore> accounts_;
  WorkerResultCallback callback_;

  boost::asio::io_context io_context_;
  std::unique_ptr<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>
      work_guard_;
  std::thread thread_;

  std::atomic<bool> quitting_{false};
  std::atomic<bool> stopped_{false};
  std::atomic<bool> aborted_{false};
  std::atomic<bool> download_pending_{false};
  std::atomic<bool> busy_{false}; // A command is running on the handler thread

  // Handler thread state
  std::optional<SdpPseRecord> record_;
  bool connected_{false};
  bool closed_reported_{false};
};

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_CONNECTION_HANDLER_HPP
