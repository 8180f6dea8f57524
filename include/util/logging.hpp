// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <memory>
#include <string>

#include <spdlog/spdlog.h>

namespace proximity {
namespace util {

/**
 * Logging utility wrapper around spdlog
 *
 * Provides centralized logging configuration and per-component loggers
 * ("discovery", "link", "advertise", "engine", "default").
 *
 * Thread-safety: All methods are thread-safe. Initialization and logger
 * access are serialized by one mutex, so platform callback threads may log
 * while the engine thread reconfigures levels.
 */
class LogManager {
public:
  // Initialize logging system with the specified minimum log level.
  // Only the first call after startup (or after Shutdown) has any effect.
  static void Initialize(const std::string& log_level = "off", bool log_to_file = false,
                         const std::string& log_file_path = "proximity.log");

  // Flush and drop all loggers.
  // Subsequent logging calls after shutdown will auto-reinitialize.
  static void Shutdown();

  // Get logger for a component. Unknown components map to "default".
  // Auto-initializes if not initialized.
  static std::shared_ptr<spdlog::logger> GetLogger(const std::string& name = "default");

  // Set log level at runtime (all components).
  static void SetLogLevel(const std::string& level);

  // Set log level for a specific component.
  static void SetComponentLevel(const std::string& component, const std::string& level);
};

}  // namespace util
}  // namespace proximity

// Convenience macros for logging
#define LOG_TRACE(...) proximity::util::LogManager::GetLogger()->trace(__VA_ARGS__)
#define LOG_DEBUG(...) proximity::util::LogManager::GetLogger()->debug(__VA_ARGS__)
#define LOG_INFO(...) proximity::util::LogManager::GetLogger()->info(__VA_ARGS__)
#define LOG_WARN(...) proximity::util::LogManager::GetLogger()->warn(__VA_ARGS__)
#define LOG_ERROR(...) proximity::util::LogManager::GetLogger()->error(__VA_ARGS__)

// Component-specific logging
#define LOG_DISC_TRACE(...) proximity::util::LogManager::GetLogger("discovery")->trace(__VA_ARGS__)
#define LOG_DISC_DEBUG(...) proximity::util::LogManager::GetLogger("discovery")->debug(__VA_ARGS__)
#define LOG_DISC_INFO(...) proximity::util::LogManager::GetLogger("discovery")->info(__VA_ARGS__)
#define LOG_DISC_WARN(...) proximity::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__)
#define LOG_DISC_ERROR(...) proximity::util::LogManager::GetLogger("discovery")->error(__VA_ARGS__)

#define LOG_LINK_TRACE(...) proximity::util::LogManager::GetLogger("link")->trace(__VA_ARGS__)
#define LOG_LINK_DEBUG(...) proximity::util::LogManager::GetLogger("link")->debug(__VA_ARGS__)
#define LOG_LINK_INFO(...) proximity::util::LogManager::GetLogger("link")->info(__VA_ARGS__)
#define LOG_LINK_WARN(...) proximity::util::LogManager::GetLogger("link")->warn(__VA_ARGS__)
#define LOG_LINK_ERROR(...) proximity::util::LogManager::GetLogger("link")->error(__VA_ARGS__)

#define LOG_ADV_DEBUG(...) proximity::util::LogManager::GetLogger("advertise")->debug(__VA_ARGS__)
#define LOG_ADV_INFO(...) proximity::util::LogManager::GetLogger("advertise")->info(__VA_ARGS__)
#define LOG_ADV_WARN(...) proximity::util::LogManager::GetLogger("advertise")->warn(__VA_ARGS__)
#define LOG_ADV_ERROR(...) proximity::util::LogManager::GetLogger("advertise")->error(__VA_ARGS__)

#define LOG_ENGINE_DEBUG(...) proximity::util::LogManager::GetLogger("engine")->debug(__VA_ARGS__)
#define LOG_ENGINE_INFO(...) proximity::util::LogManager::GetLogger("engine")->info(__VA_ARGS__)
#define LOG_ENGINE_WARN(...) proximity::util::LogManager::GetLogger("engine")->warn(__VA_ARGS__)
#define LOG_ENGINE_ERROR(...) proximity::util::LogManager::GetLogger("engine")->error(__VA_ARGS__)

// ============================================================================
// RATE-LIMITED LOGGING MACROS
// ============================================================================
// Limits log frequency per callsite for messages triggered by radio input
// (garbage advertisements, oversized frames, rejected inbound links).
// Anything in range can transmit, so a noisy or hostile neighbour must not be
// able to flood the log.
//
// Rate limit (token bucket): 200 messages per hour per callsite.

#include "util/rate_limiter.hpp"

// Callsite key from file:line
#define CALLSITE_KEY_ (std::string(__FILE__) + ":" + std::to_string(__LINE__))

#define LOG_WARN_RL(...)                                                                                               \
  do {                                                                                                                 \
    if (proximity::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                               \
      proximity::util::LogManager::GetLogger()->warn(__VA_ARGS__);                                                     \
    }                                                                                                                  \
  } while (0)

#define LOG_DISC_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (proximity::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                               \
      proximity::util::LogManager::GetLogger("discovery")->warn(__VA_ARGS__);                                          \
    }                                                                                                                  \
  } while (0)

#define LOG_LINK_WARN_RL(...)                                                                                          \
  do {                                                                                                                 \
    if (proximity::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                               \
      proximity::util::LogManager::GetLogger("link")->warn(__VA_ARGS__);                                               \
    }                                                                                                                  \
  } while (0)

#define LOG_LINK_ERROR_RL(...)                                                                                         \
  do {                                                                                                                 \
    if (proximity::util::RateLimiter::instance().should_log(CALLSITE_KEY_, 200, 3600)) {                               \
      proximity::util::LogManager::GetLogger("link")->error(__VA_ARGS__);                                              \
    }                                                                                                                  \
  } while (0)
