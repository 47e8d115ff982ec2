// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <spdlog/spdlog.h>
#include <string>

namespace bacstack {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * for the protocol stack ("app", "cache", "stack").
 *
 * Thread-safety: All methods are thread-safe. Initialization is
 * performed exactly once using std::call_once. Logger access is
 * protected by mutex for safe concurrent use.
 */
class LogManager {
public:
  /**
   * Initialize logging system
   * @param log_level Minimum log level (trace, debug, info, warn, error,
   * critical, off)
   * @param log_to_file If true, log to a rotating file instead of the console
   * @param log_file_path Path to log file (if log_to_file is true)
   *
   * Only the first call performs initialization.
   */
  static void Initialize(const std::string &log_level = "info",
                         bool log_to_file = false,
                         const std::string &log_file_path = "bacstack.log");

  /**
   * Shutdown logging system (flushes buffers)
   */
  static void Shutdown();

  /**
   * Get logger for specific component
   * @param name Component name ("app", "cache", "stack", "default")
   *
   * Auto-initializes if not initialized. Unknown components map to the
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
   * @param component Component name (app, cache, stack, default)
   * @param level Log level (trace, debug, info, warn, error, critical, off)
   */
  static void SetComponentLevel(const std::string &component, const std::string &level);
};

} // namespace util
} // namespace bacstack

// Convenience macros for logging
#define LOG_TRACE(...)                                                         \
  bacstack::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...)                                                         \
  bacstack::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...)                                                          \
  bacstack::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...)                                                          \
  bacstack::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...)                                                         \
  bacstack::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_APP_TRACE(...)                                                     \
  bacstack::util::LogManager::GetLogger("app")->trace(__VA_ARGS__)
#define LOG_APP_DEBUG(...)                                                     \
  bacstack::util::LogManager::GetLogger("app")->debug(__VA_ARGS__)
#define LOG_APP_INFO(...)                                                      \
  bacstack::util::LogManager::GetLogger("app")->info(__VA_ARGS__)
#define LOG_APP_WARN(...)                                                      \
  bacstack::util::LogManager::GetLogger("app")->warn(__VA_ARGS__)
#define LOG_APP_ERROR(...)                                                     \
  bacstack::util::LogManager::GetLogger("app")->error(__VA_ARGS__)

#define LOG_CACHE_TRACE(...)                                                   \
  bacstack::util::LogManager::GetLogger("cache")->trace(__VA_ARGS__)
#define LOG_CACHE_DEBUG(...)                                                   \
  bacstack::util::LogManager::GetLogger("cache")->debug(__VA_ARGS__)
#define LOG_CACHE_INFO(...)                                                    \
  bacstack::util::LogManager::GetLogger("cache")->info(__VA_ARGS__)
#define LOG_CACHE_WARN(...)                                                    \
  bacstack::util::LogManager::GetLogger("cache")->warn(__VA_ARGS__)
#define LOG_CACHE_ERROR(...)                                                   \
  bacstack::util::LogManager::GetLogger("cache")->error(__VA_ARGS__)

#define LOG_STACK_TRACE(...)                                                   \
  bacstack::util::LogManager::GetLogger("stack")->trace(__VA_ARGS__)
#define LOG_STACK_DEBUG(...)                                                   \
  bacstack::util::LogManager::GetLogger("stack")->debug(__VA_ARGS__)
#define LOG_STACK_INFO(...)                                                    \
  bacstack::util::LogManager::GetLogger("stack")->info(__VA_ARGS__)
#define LOG_STACK_WARN(...)                                                    \
  bacstack::util::LogManager::GetLogger("stack")->warn(__VA_ARGS__)
#define LOG_STACK_ERROR(...)                                                   \
  bacstack::util::LogManager::GetLogger("stack")->error(__VA_ARGS__)
