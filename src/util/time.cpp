// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>

namespace meshwalk {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<double> g_mock_time{0.0};

double GetTimeSeconds() {
  double mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0.0) {
    return mock;
  }

  return std::chrono::duration<double>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

void SetMockTime(double time) {
  g_mock_time.store(time, std::memory_order_relaxed);
}

double GetMockTime() { return g_mock_time.load(std::memory_order_relaxed); }

} // namespace util
} // namespace meshwalk
