// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace mintnode {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Every subsystem logs through a named component logger so verbosity can be
 * tuned per component at runtime (--debug=network,rpc).
 *
 * Thread-safety: All methods are thread-safe. Logger registry access is
 * protected by a mutex.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  /**
   * Shutdown logging system (flushes buffers)
   * Subsequent logging calls after shutdown will auto-reinitialize.
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (e.g., "network", "rpc", "chain")
   *
   * Auto-initializes if not initialized. Unknown names map to "default".
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @param component Component name (network, rpc, chain, metrics, app, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  // Names of all component loggers
  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace mintnode

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  mintnode::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  mintnode::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  mintnode::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  mintnode::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  mintnode::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  mintnode::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_NET_TRACE(...)                                                     \
  mintnode::util::LogManager::GetLogger("network")->trace(__VA_ARGS__)
#define LOG_NET_DEBUG(...)                                                     \
  mintnode::util::LogManager::GetLogger("network")->debug(__VA_ARGS__)
#define LOG_NET_INFO(...)                                                      \
  mintnode::util::LogManager::GetLogger("network")->info(__VA_ARGS__)
#define LOG_NET_WARN(...)                                                      \
  mintnode::util::LogManager::GetLogger("network")->warn(__VA_ARGS__)
#define LOG_NET_ERROR(...)                                                     \
  mintnode::util::LogManager::GetLogger("network")->error(__VA_ARGS__)

#define LOG_RPC_TRACE(...)                                                     \
  mintnode::util::LogManager::GetLogger("rpc")->trace(__VA_ARGS__)
#define LOG_RPC_DEBUG(...)                                                     \
  mintnode::util::LogManager::GetLogger("rpc")->debug(__VA_ARGS__)
#define LOG_RPC_INFO(...)                                                      \
  mintnode::util::LogManager::GetLogger("rpc")->info(__VA_ARGS__)
#define LOG_RPC_WARN(...)                                                      \
  mintnode::util::LogManager::GetLogger("rpc")->warn(__VA_ARGS__)
#define LOG_RPC_ERROR(...)                                                     \
  mintnode::util::LogManager::GetLogger("rpc")->error(__VA_ARGS__)

#define LOG_CHAIN_TRACE(...)                                                   \
  mintnode::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  mintnode::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  mintnode::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  mintnode::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  mintnode::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_METRICS_DEBUG(...)                                                 \
  mintnode::util::LogManager::GetLogger("metrics")->debug(__VA_ARGS__)
#define LOG_METRICS_INFO(...)                                                  \
  mintnode::util::LogManager::GetLogger("metrics")->info(__VA_ARGS__)
#define LOG_METRICS_WARN(...)                                                  \
  mintnode::util::LogManager::GetLogger("metrics")->warn(__VA_ARGS__)
#define LOG_METRICS_ERROR(...)                                                 \
  mintnode::util::LogManager::GetLogger("metrics")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  mintnode::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  mintnode::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  mintnode::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  mintnode::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
