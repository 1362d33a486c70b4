#pragma once

#include "cadence/time.hpp"

#include <algorithm>
#include <array>
#include <chrono>
#include <cstdint>
#include <format>
#include <string_view>

namespace cadence::event_sink {

enum class TimerEventType {
  Started,
  Paused,
  Resumed,
  Stopped,
  Tick,
  Expired,
  CallbackFailed,
  IntervalAdjusted
};

inline std::string_view toString(TimerEventType type) {
  switch (type) {
  case TimerEventType::Started:
    return "Started";
  case TimerEventType::Paused:
    return "Paused";
  case TimerEventType::Resumed:
    return "Resumed";
  case TimerEventType::Stopped:
    return "Stopped";
  case TimerEventType::Tick:
    return "Tick";
  case TimerEventType::Expired:
    return "Expired";
  case TimerEventType::CallbackFailed:
    return "CallbackFailed";
  case TimerEventType::IntervalAdjusted:
    return "IntervalAdjusted";
  }
  return "Unknown";
}

// Fixed size POD so events can travel through lock-free buffers. Names and
// details longer than the storage are truncated.
struct TimerEvent {
  static constexpr std::size_t MaxNameLength = 95;
  static constexpr std::size_t MaxDetailLength = 159;

  TimerEventType type;
  TimePoint time;
  std::uint64_t executionCount;
  std::int64_t intervalNanos;
  std::array<char, MaxNameLength + 1> timerName;
  std::array<char, MaxDetailLength + 1> detail;

  std::string_view name() const { return timerName.data(); }
  std::string_view details() const { return detail.data(); }
  auto interval() const { return std::chrono::nanoseconds{intervalNanos}; }
};

namespace internal {
template <std::size_t N>
void copyTruncated(std::array<char, N> &target, std::string_view source) {
  auto length = std::min(source.size(), N - 1);
  std::copy_n(source.data(), length, target.data());
  target[length] = '\0';
}
} // namespace internal

inline TimerEvent makeTimerEvent(TimerEventType type, std::string_view name,
                                 std::uint64_t executionCount,
                                 std::chrono::nanoseconds interval,
                                 std::string_view details = {}) {
  TimerEvent event{};
  event.type = type;
  event.time = SystemClock::now();
  event.executionCount = executionCount;
  event.intervalNanos = interval.count();
  internal::copyTruncated(event.timerName, name);
  internal::copyTruncated(event.detail, details);
  return event;
}

} // namespace cadence::event_sink

template <>
struct std::formatter<cadence::event_sink::TimerEventType>
    : std::formatter<std::string_view> {
  auto format(cadence::event_sink::TimerEventType type,
              std::format_context &ctx) const {
    return std::formatter<std::string_view>::format(
        cadence::event_sink::toString(type), ctx);
  }
};

template <>
struct std::formatter<cadence::event_sink::TimerEvent>
    : std::formatter<std::string_view> {
  auto format(const cadence::event_sink::TimerEvent &event,
              std::format_context &ctx) const {
    auto out = std::format_to(
        ctx.out(), "{} timer={} event={} executions={} interval={}",
        event.time, event.name(), event.type, event.executionCount,
        event.interval());
    if (!event.details().empty()) {
      out = std::format_to(out, " detail=\"{}\"", event.details());
    }
    return out;
  }
};
