// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license
// Per-callsite rate limiter for log output driven by radio input

#pragma once

#include "util/time.hpp"

#include <chrono>
#include <cstddef>
#include <mutex>
#include <string>
#include <unordered_map>

namespace proximity {
namespace util {

/**
 * RateLimiter - Token bucket rate limiter for logging
 *
 * Each callsite gets N tokens that refill linearly over the period.
 * Used for warnings whose trigger is something a nearby device controls:
 * advertisements that fail to decode, oversized frames, inbound links
 * refused at the connection limit.
 *
 * With 200 tokens per 3600s a device advertising garbage at 10 Hz produces
 * a burst of 200 lines and then roughly one line every 18 seconds.
 */
class RateLimiter {
public:
  // Returns true if the message should be logged, false if rate-limited.
  // callsite_key identifies the log callsite (file:line).
  bool should_log(const std::string& callsite_key, int tokens_per_period, int period_seconds);

  // Drop all buckets (tests)
  void reset();

  size_t bucket_count() const;

  static RateLimiter& instance();

private:
  struct TokenBucket {
    double tokens;
    std::chrono::steady_clock::time_point last_refill;
    bool initialized;

    TokenBucket() : tokens(0.0), last_refill(GetSteadyTime()), initialized(false) {}
  };

  mutable std::mutex mutex_;
  std::unordered_map<std::string, TokenBucket> buckets_;
};

}  // namespace util
}  // namespace proximity
