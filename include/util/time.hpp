// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#pragma once

#include <chrono>
#include <cstdint>

namespace quorumwire {
namespace util {

// Current unix time in seconds (mockable).
int64_t GetTime();

// Wall clock time point handed to the consensus engine (mockable, second precision when mocked).
std::chrono::system_clock::time_point GetSystemTime();

// Monotonic clock (mockable). When mock time is active the steady clock advances by
// the same amount the mock time advances.
std::chrono::steady_clock::time_point GetSteadyTime();

// Set mock time in unix seconds; 0 disables mocking.
void SetMockTime(int64_t time);
int64_t GetMockTime();

// RAII helper for tests: sets mock time and restores the previous value on exit.
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
}  // namespace quorumwire
