// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace meshwalk {
namespace util {

/**
 * Mockable wall clock
 *
 * Candidate bookkeeping works in (fractional) seconds since the epoch, the
 * unit of the protocol's lifetimes (57.5s, 27.5s, ...). Tests pin the clock
 * with SetMockTime()/MockTimeScope instead of sleeping.
 */

/**
 * Current time as fractional seconds since epoch (mock time if set)
 */
double GetTimeSeconds();

/**
 * Set mock time in seconds since epoch (0 disables mocking)
 * Time does not advance while mocked; tests call SetMockTime() again.
 */
void SetMockTime(double time);

/**
 * Current mock time setting, 0 if disabled
 */
double GetMockTime();

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(double time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;
  MockTimeScope(MockTimeScope&&) = delete;
  MockTimeScope& operator=(MockTimeScope&&) = delete;

private:
  const double previous_time_;
};

} // namespace util
} // namespace meshwalk
