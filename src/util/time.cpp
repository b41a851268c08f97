// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <mutex>

namespace headerpipe {
namespace util {

namespace {

std::atomic<int64_t> g_mock_millis{0};

// Steady clock simulation state, reset whenever mocking is switched on again
std::mutex g_steady_mutex;
std::chrono::steady_clock::time_point g_real_steady_reference;
int64_t g_mock_steady_reference{0};
bool g_steady_initialized{false};

} // namespace

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_millis.load(std::memory_order_relaxed);
  if (mock == 0) {
    return std::chrono::steady_clock::now();
  }

  std::lock_guard<std::mutex> lock(g_steady_mutex);
  if (!g_steady_initialized) {
    g_real_steady_reference = std::chrono::steady_clock::now();
    g_mock_steady_reference = mock;
    g_steady_initialized = true;
  }
  return g_real_steady_reference +
         std::chrono::milliseconds(mock - g_mock_steady_reference);
}

void SetMockTimeMillis(int64_t millis) {
  int64_t previous = g_mock_millis.exchange(millis, std::memory_order_relaxed);
  // Entering mock mode starts a fresh steady reference
  if (previous == 0 && millis != 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTimeMillis() { return g_mock_millis.load(std::memory_order_relaxed); }

void AdvanceMockTime(std::chrono::milliseconds delta) {
  int64_t current = g_mock_millis.load(std::memory_order_relaxed);
  while (current != 0 &&
         !g_mock_millis.compare_exchange_weak(current, current + delta.count(),
                                              std::memory_order_relaxed)) {
  }
}

} // namespace util
} // namespace headerpipe
