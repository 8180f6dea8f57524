// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace proximity {
namespace util {

// Current unix time in seconds (mockable)
int64_t GetTime();

// Steady clock used for peer timestamps and rate limiting.
// When mock time is active the returned value advances with the mock time,
// so tests can age registry entries without sleeping.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in unix seconds. 0 disables mocking.
void SetMockTime(int64_t time);

int64_t GetMockTime();

// RAII helper for tests: enables mock time and restores the previous value.
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_(GetMockTime()) { SetMockTime(time); }
  ~MockTimeScope() { SetMockTime(previous_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  int64_t previous_;
};

}  // namespace util
}  // namespace proximity
