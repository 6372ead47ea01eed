// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#ifndef LUNACHAIN_UTIL_TIME_HPP
#define LUNACHAIN_UTIL_TIME_HPP

#include <cstdint>

namespace lunachain {
namespace util {

/**
 * Mockable time system for testing
 *
 * Production code calls GetTime() instead of reading the system clock.
 * Tests call SetMockTime() to control the current time; when mock time is
 * 0 (default) the real system time is returned.
 */

// Current time as Unix timestamp (seconds since epoch)
int64_t GetTime();

/**
 * Set mock time for testing
 *
 * @param time Unix timestamp in seconds (0 to disable mocking)
 *
 * Mock time does not advance automatically.
 */
void SetMockTime(int64_t time);

// Returns 0 if mock time is disabled
int64_t GetMockTime();

// RAII helper to set mock time and restore it when scope exits
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time) : previous_time_(GetMockTime()) {
    SetMockTime(time);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace lunachain

#endif // LUNACHAIN_UTIL_TIME_HPP
