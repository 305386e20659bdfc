// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <cstdint>
#include <string>

namespace floodchain {
namespace util {

/**
 * Mockable wall clock
 *
 * Production code calls GetTime() instead of querying the system clock
 * directly; tests call SetMockTime() to pin the value (block timestamps
 * produced by the miner become reproducible).
 */

/**
 * Get current time as Unix timestamp (seconds since epoch)
 * Returns mock time if set, otherwise returns real system time
 */
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 * @return the previous mock time (0 if mocking was disabled)
 */
int64_t SetMockTime(int64_t time);

/**
 * Format a Unix timestamp as a human-readable UTC string
 *
 * Example: FormatTime(1634567890) -> "2021-10-18 14:38:10 UTC"
 */
std::string FormatTime(int64_t unix_time);

/**
 * RAII helper to set mock time and restore it when scope exits
 */
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(SetMockTime(time)) {}

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope&) = delete;
  MockTimeScope& operator=(const MockTimeScope&) = delete;

private:
  const int64_t previous_time_;
};

} // namespace util
} // namespace floodchain
