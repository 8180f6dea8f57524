// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/backoff.hpp"

#include <algorithm>

namespace proximity {
namespace util {

namespace {
uint64_t MakeSeed(uint64_t seed) {
  if (seed != 0) {
    return seed;
  }
  std::random_device rd;
  return (static_cast<uint64_t>(rd()) << 32) | rd();
}
}  // namespace

ExponentialBackoff::ExponentialBackoff(const BackoffPolicy& policy, uint64_t seed)
    : policy_(policy), rng_(MakeSeed(seed)) {
  policy_.jitter = std::clamp(policy_.jitter, 0.0, 1.0);
}

std::chrono::milliseconds ExponentialBackoff::nominal_delay(unsigned int attempt) const {
  const int64_t base = std::max<int64_t>(policy_.base.count(), 0);
  const int64_t cap = std::max<int64_t>(policy_.cap.count(), base);

  // Doubling stops at the cap
  int64_t delay = base;
  for (unsigned int i = 0; i < attempt && delay < cap; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, cap));
}

std::optional<std::chrono::milliseconds> ExponentialBackoff::next() {
  if (exhausted()) {
    return std::nullopt;
  }

  const auto nominal = nominal_delay(attempts_);
  ++attempts_;

  if (policy_.jitter <= 0.0 || nominal.count() == 0) {
    return nominal;
  }

  std::uniform_real_distribution<double> dist(-policy_.jitter, policy_.jitter);
  const double factor = 1.0 + dist(rng_);
  const auto jittered = static_cast<int64_t>(static_cast<double>(nominal.count()) * factor);
  return std::chrono::milliseconds(std::max<int64_t>(jittered, 0));
}

}  // namespace util
}  // namespace proximity
