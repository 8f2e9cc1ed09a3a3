#pragma once

#include <cstdint>
#include <ctime>

namespace Common {

// Get nanoseconds using CLOCK_MONOTONIC (for measuring durations)
inline uint64_t getNanosSinceEpoch() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_MONOTONIC, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

// Get nanoseconds using CLOCK_REALTIME for wall clock
inline uint64_t getWallClockNanos() noexcept {
  struct timespec ts;
  clock_gettime(CLOCK_REALTIME, &ts);
  return static_cast<uint64_t>(ts.tv_sec) * 1'000'000'000ULL + static_cast<uint64_t>(ts.tv_nsec);
}

/// Elapsed-time helper for phase timing in the engine logs
class StopWatch {
public:
  StopWatch() noexcept : start_ns_(getNanosSinceEpoch()) {}

  [[nodiscard]] uint64_t elapsedNanos() const noexcept {
    return getNanosSinceEpoch() - start_ns_;
  }

private:
  uint64_t start_ns_;
};

} // namespace Common
