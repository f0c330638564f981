// Copyright (c) 2024 The pbapclient developers
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace pbapclient {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and easy access
 * to loggers throughout the client.
 *
 * Thread-safety: All methods are thread-safe. Initialization and
 * logger access are protected by a single mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Thread-safe: Multiple calls are safe; only the first call after
   * startup (or after Shutdown) performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "pbapclient.log");

  /**
   * Shutdown logging system (flushes buffers)
   *
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "client", "worker", "store")
   *
   * Auto-initializes if not initialized. Unknown components get the
   * default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  /**
   * Set log level at runtime (all components)
   */
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (client, worker, discovery, store, default)
   * @param level Log level (trace, debug, info, warn, error, critical)
   */
  static void SetComponentLevel(const std::string &component,
                                const std::string &level);
};

} // namespace util
} // namespace pbapclient

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  pbapclient::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  pbapclient::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  pbapclient::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  pbapclient::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  pbapclient::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  pbapclient::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_CLIENT_TRACE(...)                                                  \
  pbapclient::util::LogManager::GetLogger("client")->trace(__VA_ARGS__)
#define LOG_CLIENT_DEBUG(...)                                                  \
  pbapclient::util::LogManager::GetLogger("client")->debug(__VA_ARGS__)
#define LOG_CLIENT_INFO(...)                                                   \
  pbapclient::util::LogManager::GetLogger("client")->info(__VA_ARGS__)
#define LOG_CLIENT_WARN(...)                                                   \
  pbapclient::util::LogManager::GetLogger("client")->warn(__VA_ARGS__)
#define LOG_CLIENT_ERROR(...)                                                  \
  pbapclient::util::LogManager::GetLogger("client")->error(__VA_ARGS__)

#define LOG_WORKER_TRACE(...)                                                  \
  pbapclient::util::LogManager::GetLogger("worker")->trace(__VA_ARGS__)
#define LOG_WORKER_DEBUG(...)                                                  \
  pbapclient::util::LogManager::GetLogger("worker")->debug(__VA_ARGS__)
#define LOG_WORKER_INFO(...)                                                   \
  pbapclient::util::LogManager::GetLogger("worker")->info(__VA_ARGS__)
#define LOG_WORKER_WARN(...)                                                   \
  pbapclient::util::LogManager::GetLogger("worker")->warn(__VA_ARGS__)
#define LOG_WORKER_ERROR(...)                                                  \
  pbapclient::util::LogManager::GetLogger("worker")->error(__VA_ARGS__)

#define LOG_DISC_TRACE(...)                                                    \
  pbapclient::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...)                                                    \
  pbapclient::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_WARN(...)                                                     \
  pbapclient::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)

#define LOG_STORE_DEBUG(...)                                                   \
  pbapclient::util::LogManager::GetLogger("store")->debug(__VA_ARGS__)
#define LOG_STORE_INFO(...)                                                    \
  pbapclient::util::LogManager::GetLogger("store")->info(__VA_ARGS__)
#define LOG_STORE_WARN(...)                                                    \
  pbapclient::util::LogManager::GetLogger("store")->warn(__VA_ARGS__)
#define LOG_STORE_ERROR(...)                                                   \
  pbapclient::util::LogManager::GetLogger("store")->error(__VA_ARGS__)
