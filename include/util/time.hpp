// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace headerpipe {
namespace util {

/**
 * Mockable clock
 *
 * Production code calls GetSteadyTime() instead of std::chrono::steady_clock
 * so tests can pin or advance time without sleeping. Mock time is kept in
 * milliseconds; 0 means "use the real clocks".
 */

/**
 * Steady clock time point
 *
 * With mock time active the steady clock is simulated as a fixed real
 * reference point plus the mock offset, so it stays monotonic as long as the
 * mock value only moves forward.
 */
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in milliseconds since epoch (0 disables mocking)
void SetMockTimeMillis(int64_t millis);

// Current mock setting in milliseconds (0 when disabled)
int64_t GetMockTimeMillis();

// Move mock time forward; no-op while mocking is disabled
void AdvanceMockTime(std::chrono::milliseconds delta);

/**
 * RAII helper to set mock time and restore the previous setting on scope exit
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t millis) : previous_millis_(GetMockTimeMillis()) {
    SetMockTimeMillis(millis);
  }

  ~MockTimeScope() { SetMockTimeMillis(previous_millis_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const int64_t previous_millis_;
};

} // namespace util
} // namespace headerpipe
