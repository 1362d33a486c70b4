#pragma once

#include <expected>
#include <format>
#include <string>
#include <string_view>

namespace cadence::timers {

enum class TimerErrorKind {
  InvalidParameter, // Bad duration or operation not allowed in current state
  TimerStopped,     // Operation requires an active timer
  CallbackFailed    // User callback reported failure during a tick
};

struct TimerError {
  TimerErrorKind kind;
  std::string message{};

  friend bool operator==(const TimerError &, const TimerError &) = default;
};

using Expected = std::expected<void, TimerError>;

inline std::unexpected<TimerError> invalidParameter(std::string message) {
  return std::unexpected(
      TimerError{TimerErrorKind::InvalidParameter, std::move(message)});
}

inline std::unexpected<TimerError> timerStopped() {
  return std::unexpected(TimerError{TimerErrorKind::TimerStopped, {}});
}

inline std::unexpected<TimerError> callbackFailed(std::string message) {
  return std::unexpected(
      TimerError{TimerErrorKind::CallbackFailed, std::move(message)});
}

inline std::string_view toString(TimerErrorKind kind) {
  switch (kind) {
  case TimerErrorKind::InvalidParameter:
    return "InvalidParameter";
  case TimerErrorKind::TimerStopped:
    return "TimerStopped";
  case TimerErrorKind::CallbackFailed:
    return "CallbackFailed";
  }
  return "Unknown";
}

} // namespace cadence::timers

template <>
struct std::formatter<cadence::timers::TimerError>
    : std::formatter<std::string_view> {
  auto format(const cadence::timers::TimerError &error,
              std::format_context &ctx) const {
    using cadence::timers::TimerErrorKind;
    switch (error.kind) {
    case TimerErrorKind::InvalidParameter:
      return std::format_to(ctx.out(), "Invalid parameter: {}", error.message);
    case TimerErrorKind::TimerStopped:
      return std::format_to(ctx.out(),
                            "Operation attempted on a stopped timer.");
    case TimerErrorKind::CallbackFailed:
      return std::format_to(ctx.out(), "Callback execution failed: {}",
                            error.message);
    }
    return std::format_to(ctx.out(), "Unknown timer error: {}", error.message);
  }
};
