// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <random>

namespace proximity {
namespace util {

// Exponential backoff parameters. max_attempts counts retries after the
// first failure; 0 disables retrying.
struct BackoffPolicy {
  std::chrono::milliseconds base{500};
  std::chrono::milliseconds cap{30000};
  double jitter{0.2};  // Fraction of the delay, applied symmetrically
  unsigned int max_attempts{5};
};

/**
 * ExponentialBackoff - delay sequence base * 2^n, capped, with jitter
 *
 * Not thread-safe; owned by whichever component runs on the io_context.
 */
class ExponentialBackoff {
public:
  // seed == 0 seeds from std::random_device
  explicit ExponentialBackoff(const BackoffPolicy& policy, uint64_t seed = 0);

  // Delay before the next retry, or nullopt when attempts are exhausted.
  // Each call consumes one attempt.
  std::optional<std::chrono::milliseconds> next();

  // Delay for a given zero-based attempt without consuming it (no jitter)
  [[nodiscard]] std::chrono::milliseconds nominal_delay(unsigned int attempt) const;

  void reset() { attempts_ = 0; }

  [[nodiscard]] unsigned int attempts() const { return attempts_; }
  [[nodiscard]] bool exhausted() const { return attempts_ >= policy_.max_attempts; }
  [[nodiscard]] const BackoffPolicy& policy() const { return policy_; }

private:
  BackoffPolicy policy_;
  unsigned int attempts_{0};
  std::mt19937_64 rng_;
};

}  // namespace util
}  // namespace proximity
