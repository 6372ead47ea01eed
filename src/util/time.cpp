// Copyright (c) 2024 LunaChain
// Distributed under the MIT software license

#include "util/time.hpp"
#include <atomic>
#include <chrono>

namespace lunachain {
namespace util {

namespace {

// Seconds since the epoch to report instead of the clock; 0 = off
std::atomic<int64_t> g_mock_time{0};

int64_t SystemSeconds() {
  using namespace std::chrono;
  return duration_cast<seconds>(system_clock::now().time_since_epoch()).count();
}

} // namespace

int64_t GetTime() {
  const int64_t mock = GetMockTime();
  return mock != 0 ? mock : SystemSeconds();
}

void SetMockTime(int64_t time) { g_mock_time.store(time); }

int64_t GetMockTime() { return g_mock_time.load(); }

} // namespace util
} // namespace lunachain
