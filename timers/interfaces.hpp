#pragma once

#include "cadence/time.hpp"
#include "cadence/timers/TimerError.hpp"

#include <chrono>
#include <cstdint>
#include <format>
#include <memory>
#include <optional>
#include <string_view>

namespace cadence::timers {

enum class TimerState { Running, Paused, Stopped };

inline std::string_view toString(TimerState state) {
  switch (state) {
  case TimerState::Running:
    return "Running";
  case TimerState::Paused:
    return "Paused";
  case TimerState::Stopped:
    return "Stopped";
  }
  return "Unknown";
}

struct TimerStatistics {
  // Ticks performed in the current run, failed callbacks included
  std::uint64_t executionCount{0};
  // Time since the current run was started, refreshed after every tick
  std::chrono::nanoseconds elapsedTime{0};
};

// Unit of work invoked by a timer on every tick. A failed result is counted
// as a tick and reported, it never stops the timer.
class ITimerCallback {
public:
  virtual Expected execute() = 0;
  virtual ~ITimerCallback() = default;
};

using ITimerCallbackPtr = std::shared_ptr<ITimerCallback>;

using ExpirationCount = std::optional<std::uint64_t>;

class ITimer {
public:
  virtual Expected startOnce(std::chrono::nanoseconds delay,
                             ITimerCallbackPtr callback) = 0;
  virtual Expected startRecurring(std::chrono::nanoseconds interval,
                                  ITimerCallbackPtr callback,
                                  ExpirationCount expirationCount = {}) = 0;
  virtual Expected pause() = 0;
  virtual Expected resume() = 0;
  virtual Expected stop() = 0;
  virtual Expected adjustInterval(std::chrono::nanoseconds newInterval) = 0;
  virtual TimerState getState() const = 0;
  virtual TimerStatistics getStatistics() const = 0;
  virtual ~ITimer() = default;
};

using ITimerPtr = std::shared_ptr<ITimer>;

} // namespace cadence::timers

template <>
struct std::formatter<cadence::timers::TimerState>
    : std::formatter<std::string_view> {
  auto format(cadence::timers::TimerState state,
              std::format_context &ctx) const {
    return std::formatter<std::string_view>::format(
        cadence::timers::toString(state), ctx);
  }
};
