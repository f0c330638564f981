// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#ifndef PBAPCLIENT_CLIENT_CONNECTION_WORKER_HPP
#define PBAPCLIENT_CLIENT_CONNECTION_WORKER_HPP

#include "client/peer_device.hpp"
#include "client/sdp_record.hpp"
#include <functional>
#include <memory>

namespace pbapclient {
namespace client {

enum class WorkerResult {
  SUCCEEDED, // Connect command finished, session usable
  FAILED,    // Connect command failed
  CLOSED     // Teardown (or forced abort) finished
};

// Invoked from the worker's own thread
using WorkerResultCallback = std::function<void(WorkerResult result)>;

/**
 * ConnectionWorker - executes the slow connect/download/teardown steps
 *
 * One instance per connection attempt, created by the state machine when
 * it enters CONNECTING. Commands are one-way posts and never block the
 * caller. Connect() resolves to exactly one SUCCEEDED or FAILED report,
 * Teardown() and ForceAbort() to a CLOSED report.
 */
class ConnectionWorker {
public:
  virtual ~ConnectionWorker() = default;

  virtual void Connect(const SdpPseRecord &record) = 0;
  virtual void StartDownload() = 0;
  virtual void Teardown() = 0;

  // May be issued at any time, even with a command in progress
  virtual void ForceAbort() = 0;

  // Finish queued work, then stop the execution context. Does not block.
  virtual void Quit() = 0;

  // True once the execution context has fully stopped
  virtual bool IsStopped() const = 0;
};

using WorkerFactory = std::function<std::unique_ptr<ConnectionWorker>(
    const PeerDevice &device, WorkerResultCallback callback)>;

} // namespace client
} // namespace pbapclient

#endif // PBAPCLIENT_CLIENT_CONNECTION_WORKER_HPP
