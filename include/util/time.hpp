// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#ifndef MINTNODE_UTIL_TIME_HPP
#define MINTNODE_UTIL_TIME_HPP

#include <cstdint>
#include <string>

namespace mintnode {
namespace util {

/**
 * Mockable wall clock
 *
 * Ledger code (transaction expiry, block timestamps) reads the wall clock
 * through GetTimeMillis() so tests can pin it with SetMockTime(). Timers and
 * timeouts use asio's steady clock and are not affected.
 */

// Current Unix time in milliseconds (mock time if set)
int64_t GetTimeMillis();

// Current Unix time in seconds (mock time if set)
int64_t GetTime();

/**
 * Set mock time for testing
 * @param time_ms Unix timestamp in milliseconds (0 disables mocking)
 *
 * Mock time does not advance on its own.
 */
void SetMockTime(int64_t time_ms);

// Returns 0 if mock time is disabled
int64_t GetMockTime();

// "YYYY-MM-DD HH:MM:SS UTC" for log output
std::string FormatTime(int64_t unix_time_ms);

// RAII helper that restores the previous mock time on scope exit
class MockTimeScope {
public:
  explicit MockTimeScope(int64_t time_ms) : previous_time_(GetMockTime()) {
    SetMockTime(time_ms);
  }

  ~MockTimeScope() { SetMockTime(previous_time_); }

  MockTimeScope(const MockTimeScope &) = delete;
  MockTimeScope &operator=(const MockTimeScope &) = delete;

private:
  int64_t previous_time_;
};

} // namespace util
} // namespace mintnode

#endif // MINTNODE_UTIL_TIME_HPP
