#pragma once

#include <chrono>
#include <concepts>

namespace cadence {
using SystemClock = std::chrono::system_clock;
using TimePoint = std::chrono::time_point<SystemClock>;

// Intervals and run elapsed time are measured on the monotonic clock so that
// wall clock adjustments never stretch or shrink a wait.
using SteadyClock = std::chrono::steady_clock;
using SteadyTimePoint = std::chrono::time_point<SteadyClock>;

template <typename T>
concept DurationC = requires(T t) {
  typename std::chrono::duration<typename T::rep, typename T::period>;
  { t.count() } -> std::convertible_to<typename T::rep>;
};

inline std::chrono::nanoseconds toNanos(DurationC auto duration) {
  return std::chrono::duration_cast<std::chrono::nanoseconds>(duration);
}

} // namespace cadence
