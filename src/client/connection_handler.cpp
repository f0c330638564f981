// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#include "client/connection_handler.hpp"
#include "util/logging.hpp"
#include <boost/asio/post.hpp>

namespace pbapclient {
namespace client {

ConnectionHandler::ConnectionHandler(const PeerDevice &device,
                                     std::unique_ptr<ProfileSession> session,
                                     std::shared_ptr<AccountStore> accounts,
                                     WorkerResultCallback callback)
    : device_(device), session_(std::move(session)),
      accounts_(std::move(accounts)), callback_(std::move(callback)) {
  work_guard_ = std::make_unique<
      boost::asio::executor_work_guard<boost::asio::io_context::executor_type>>(
      boost::asio::make_work_guard(io_context_));

  thread_ = std::thread([this]() {
    io_context_.run();
    stopped_.store(true, std::memory_order_release);
    LOG_WORKER_DEBUG("Handler thread for {} exited", device_.ToLogString());
  });

  LOG_WORKER_DEBUG("ConnectionHandler created for {}", device_.ToLogString());
}

ConnectionHandler::~ConnectionHandler() {
  Quit();
  if (busy_.load(std::memory_order_acquire) && session_) {
    // Still busy: unblock the session so the join below returns
    LOG_WORKER_WARN("ConnectionHandler for {} destroyed while busy, aborting",
                    device_.ToLogString());
    aborted_.store(true, std::memory_order_release);
    session_->Abort();
  }
  if (thread_.joinable()) {
    thread_.join();
  }
}

WorkerFactory
ConnectionHandler::MakeFactory(SessionFactory session_factory,
                               std::shared_ptr<AccountStore> accounts) {
  return [session_factory = std::move(session_factory),
          accounts = std::move(accounts)](
             const PeerDevice &device,
             WorkerResultCallback callback) -> std::unique_ptr<ConnectionWorker> {
    std::unique_ptr<ProfileSession> session;
    if (session_factory) {
      session = session_factory(device);
    }
    if (!session) {
      LOG_WORKER_ERROR("No profile session available for {}",
                       device.ToLogString());
    }
    return std::make_unique<ConnectionHandler>(device, std::move(session),
                                               accounts, std::move(callback));
  };
}

template <typename Handler>
void ConnectionHandler::Post(const char *command, Handler handler) {
  if (quitting_.load(std::memory_order_acquire)) {
    LOG_WORKER_WARN("Dropping {} for {}: handler is quitting", command,
                    device_.ToLogString());
    return;
  }
  LOG_WORKER_TRACE("Queue {} for {}", command, device_.ToLogString());
  boost::asio::post(io_context_, [this, handler = std::move(handler)]() {
    busy_.store(true, std::memory_order_release);
    handler();
    busy_.store(false, std::memory_order_release);
  });
}

void ConnectionHandler::Connect(const SdpPseRecord &record) {
  Post("connect", [this, record]() { HandleConnect(record); });
}

void ConnectionHandler::StartDownload() {
  if (download_pending_.exchange(true, std::memory_order_acq_rel)) {
    LOG_WORKER_DEBUG("Download already queued for {}", device_.ToLogString());
    return;
  }
  Post("download", [this]() { HandleDownload(); });
}

void ConnectionHandler::Teardown() {
  Post("teardown", [this]() { HandleTeardown(); });
}

void ConnectionHandler::ForceAbort() {
  LOG_WORKER_WARN("Force abort for {}", device_.ToLogString());
  aborted_.store(true, std::memory_order_release);
  if (session_) {
    session_->Abort();
  }
  // The abort still has to end in a CLOSED report
  Post("teardown", [this]() { HandleTeardown(); });
}

void ConnectionHandler::Quit() {
  if (quitting_.exchange(true, std::memory_order_acq_rel)) {
    return;
  }
  LOG_WORKER_DEBUG("Quit handler for {}", device_.ToLogString());
  // Let already queued commands finish, then run() returns
  boost::asio::post(io_context_, [this]() { work_guard_.reset(); });
}

void ConnectionHandler::HandleConnect(const SdpPseRecord &record) {
  if (connected_ || closed_reported_) {
    LOG_WORKER_WARN("Ignoring connect for {}: already {}",
                    device_.ToLogString(),
                    connected_ ? "connected" : "closed");
    return;
  }

  record_ = record;
  bool ok = false;
  if (!session_) {
    LOG_WORKER_ERROR("Connect for {} without a session", device_.ToLogString());
  } else if (aborted_.load(std::memory_order_acquire)) {
    LOG_WORKER_DEBUG("Connect for {} skipped after abort",
                     device_.ToLogString());
  } else {
    try {
      LOG_WORKER_DEBUG("Connecting to {} (psm={}, channel={}, version={:#06x})",
                       device_.ToLogString(), record.l2cap_psm,
                       record.rfcomm_channel, record.profile_version);
      ok = session_->Connect(record);
    } catch (const std::exception &e) {
      LOG_WORKER_ERROR("Session connect to {} threw: {}",
                       device_.ToLogString(), e.what());
      ok = false;
    }
  }

  connected_ = ok;
  LOG_WORKER_INFO("Connection to {} {}", device_.ToLogString(),
                  ok ? "established" : "failed");
  Report(ok ? WorkerResult::SUCCEEDED : WorkerResult::FAILED);
}

void ConnectionHandler::HandleDownload() {
  download_pending_.store(false, std::memory_order_release);

  if (!connected_ || !record_) {
    LOG_WORKER_WARN("Download requested for {} without a session",
                    device_.ToLogString());
    return;
  }

  if (accounts_ && !accounts_->AddAccount(device_)) {
    LOG_WORKER_WARN("Could not record account for {}, downloading anyway",
                    device_.ToLogString());
  }

  size_t total = 0;
  for (const auto &path : RepositoryPaths(*record_)) {
    if (aborted_.load(std::memory_order_acquire)) {
      LOG_WORKER_DEBUG("Download from {} interrupted by abort",
                       device_.ToLogString());
      return;
    }
    try {
      auto fetched = session_->Download(path);
      if (!fetched) {
        LOG_WORKER_WARN("Download of {} from {} failed", path,
                        device_.ToLogString());
        continue;
      }
      LOG_WORKER_DEBUG("Fetched {} entries from {} ({})", *fetched,
                       device_.ToLogString(), path);
      total += *fetched;
    } catch (const std::exception &e) {
      LOG_WORKER_ERROR("Download of {} from {} threw: {}", path,
                       device_.ToLogString(), e.what());
    }
  }
  LOG_WORKER_INFO("Download from {} complete ({} entries)",
                  device_.ToLogString(), total);
}

void ConnectionHandler::HandleTeardown() {
  if (closed_reported_) {
    LOG_WORKER_TRACE("Teardown for {} already reported",
                     device_.ToLogString());
    return;
  }

  if (session_) {
    try {
      session_->Disconnect();
    } catch (const std::exception &e) {
      LOG_WORKER_ERROR("Session disconnect from {} threw: {}",
                       device_.ToLogString(), e.what());
    }
  }
  connected_ = false;

  if (accounts_ && !accounts_->RemoveAccount(device_)) {
    LOG_WORKER_DEBUG("No account to remove for {}", device_.ToLogString());
  }

  closed_reported_ = true;
  LOG_WORKER_INFO("Connection to {} closed", device_.ToLogString());
  Report(WorkerResult::CLOSED);
}

void ConnectionHandler::Report(WorkerResult result) {
  if (callback_) {
    callback_(result);
  }
}

} // namespace client
} // namespace pbapclient
