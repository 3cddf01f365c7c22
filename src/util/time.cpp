// Copyright (c) 2024 Mintnode
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

namespace mintnode {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time_ms{0};

int64_t GetTimeMillis() {
  int64_t mock = g_mock_time_ms.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }

  return std::chrono::duration_cast<std::chrono::milliseconds>(
             std::chrono::system_clock::now().time_since_epoch())
      .count();
}

int64_t GetTime() { return GetTimeMillis() / 1000; }

void SetMockTime(int64_t time_ms) {
  g_mock_time_ms.store(time_ms, std::memory_order_relaxed);
}

int64_t GetMockTime() { return g_mock_time_ms.load(std::memory_order_relaxed); }

std::string FormatTime(int64_t unix_time_ms) {
  std::time_t t = static_cast<std::time_t>(unix_time_ms / 1000);
  std::tm tm_utc{};
  if (gmtime_r(&t, &tm_utc) == nullptr) {
    return "invalid";
  }

  std::ostringstream oss;
  oss << std::put_time(&tm_utc, "%Y-%m-%d %H:%M:%S UTC");
  return oss.str();
}

} // namespace util
} // namespace mintnode
