// Copyright (c) 2025 The Unicity Foundation
// Distributed under the MIT software license

#include "util/time.hpp"

#include <atomic>
#include <mutex>

namespace quorumwire {
namespace util {

// 0 means mock time is disabled (use real time)
static std::atomic<int64_t> g_mock_time{0};

// Steady clock reference captured when mock time is first observed
static std::mutex g_steady_mutex;
static std::chrono::steady_clock::time_point g_real_steady_reference;
static int64_t g_mock_steady_reference{0};
static bool g_steady_initialized{false};

int64_t GetTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return mock;
  }
  return std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now().time_since_epoch()).count();
}

std::chrono::system_clock::time_point GetSystemTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    return std::chrono::system_clock::time_point{std::chrono::seconds{mock}};
  }
  return std::chrono::system_clock::now();
}

std::chrono::steady_clock::time_point GetSteadyTime() {
  int64_t mock = g_mock_time.load(std::memory_order_relaxed);
  if (mock != 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);

    if (!g_steady_initialized) {
      g_real_steady_reference = std::chrono::steady_clock::now();
      g_mock_steady_reference = mock;
      g_steady_initialized = true;
    }

    int64_t seconds_offset = mock - g_mock_steady_reference;
    return g_real_steady_reference + std::chrono::seconds(seconds_offset);
  }

  return std::chrono::steady_clock::now();
}

void SetMockTime(int64_t time) {
  g_mock_time.store(time, std::memory_order_relaxed);

  // Only reset the steady reference when disabling mock time, so that
  // successive mock values advance the steady clock by their difference
  if (time == 0) {
    std::lock_guard<std::mutex> lock(g_steady_mutex);
    g_steady_initialized = false;
  }
}

int64_t GetMockTime() {
  return g_mock_time.load(std::memory_order_relaxed);
}

}  // namespace util
}  // namespace quorumwire
