// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>
#include <vector>

namespace lunachain {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Every subsystem logs through a named component logger so that verbosity
 * can be raised per component (e.g. --debug=mempool).
 *
 * Thread-safety: All methods are thread-safe. Logger access is protected
 * by a mutex; GetLogger() auto-initializes with defaults.
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
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "debug.log");

  // Flush and drop all loggers. Later logging calls re-initialize.
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name (chain, mempool, mining, crypto, app)
   *
   * Unknown names resolve to the default logger.
   */
  static std::shared_ptr<spdlog::logger>
  GetLogger(const std::string &name = "default");

  // Set log level at runtime (all components)
  static void SetLogLevel(const std::string &level);

  /**
   * Set log level for a specific component
   * @return false if the component is unknown
   */
  static bool SetComponentLevel(const std::string &component,
                                const std::string &level);

  static const std::vector<std::string> &Components();
};

} // namespace util
} // namespace lunachain

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  lunachain::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  lunachain::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  lunachain::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  lunachain::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  lunachain::util::LogManager::GetLogger()->error(__VA_ARGS__)
#define LOG_CRITICAL(...)                                                      \
  lunachain::util::LogManager::GetLogger()->critical(__VA_ARGS__)

// Component-specific logging
#define LOG_CHAIN_TRACE(...)                                                   \
  lunachain::util::LogManager::GetLogger("chain")->trace(__VA_ARGS__)
#define LOG_CHAIN_DEBUG(...)                                                   \
  lunachain::util::LogManager::GetLogger("chain")->debug(__VA_ARGS__)
#define LOG_CHAIN_INFO(...)                                                    \
  lunachain::util::LogManager::GetLogger("chain")->info(__VA_ARGS__)
#define LOG_CHAIN_WARN(...)                                                    \
  lunachain::util::LogManager::GetLogger("chain")->warn(__VA_ARGS__)
#define LOG_CHAIN_ERROR(...)                                                   \
  lunachain::util::LogManager::GetLogger("chain")->error(__VA_ARGS__)

#define LOG_MEMPOOL_TRACE(...)                                                 \
  lunachain::util::LogManager::GetLogger("mempool")->trace(__VA_ARGS__)
#define LOG_MEMPOOL_DEBUG(...)                                                 \
  lunachain::util::LogManager::GetLogger("mempool")->debug(__VA_ARGS__)
#define LOG_MEMPOOL_INFO(...)                                                  \
  lunachain::util::LogManager::GetLogger("mempool")->info(__VA_ARGS__)
#define LOG_MEMPOOL_WARN(...)                                                  \
  lunachain::util::LogManager::GetLogger("mempool")->warn(__VA_ARGS__)
#define LOG_MEMPOOL_ERROR(...)                                                 \
  lunachain::util::LogManager::GetLogger("mempool")->error(__VA_ARGS__)

#define LOG_MINING_TRACE(...)                                                  \
  lunachain::util::LogManager::GetLogger("mining")->trace(__VA_ARGS__)
#define LOG_MINING_DEBUG(...)                                                  \
  lunachain::util::LogManager::GetLogger("mining")->debug(__VA_ARGS__)
#define LOG_MINING_INFO(...)                                                   \
  lunachain::util::LogManager::GetLogger("mining")->info(__VA_ARGS__)
#define LOG_MINING_WARN(...)                                                   \
  lunachain::util::LogManager::GetLogger("mining")->warn(__VA_ARGS__)
#define LOG_MINING_ERROR(...)                                                  \
  lunachain::util::LogManager::GetLogger("mining")->error(__VA_ARGS__)

#define LOG_CRYPTO_TRACE(...)                                                  \
  lunachain::util::LogManager::GetLogger("crypto")->trace(__VA_ARGS__)
#define LOG_CRYPTO_DEBUG(...)                                                  \
  lunachain::util::LogManager::GetLogger("crypto")->debug(__VA_ARGS__)
#define LOG_CRYPTO_INFO(...)                                                   \
  lunachain::util::LogManager::GetLogger("crypto")->info(__VA_ARGS__)
#define LOG_CRYPTO_WARN(...)                                                   \
  lunachain::util::LogManager::GetLogger("crypto")->warn(__VA_ARGS__)
#define LOG_CRYPTO_ERROR(...)                                                  \
  lunachain::util::LogManager::GetLogger("crypto")->error(__VA_ARGS__)

#define LOG_APP_DEBUG(...)                                                     \
  lunachain::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  lunachain::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  lunachain::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  lunachain::util::LogManager::GetLogger("app")->error(__VA_ARGS__)
