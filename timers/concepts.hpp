#pragma once

#include "cadence/timers/interfaces.hpp"

#include <chrono>
#include <concepts>
#include <type_traits>

namespace cadence::timers {

template <typename T>
concept TimerActionC = requires(T t) {
  { t() } -> std::same_as<Expected>;
};

template <typename T>
concept TimerC = requires(T t) {
  { t.startOnce(std::chrono::nanoseconds{}, ITimerCallbackPtr{}) }
      -> std::same_as<Expected>;
  {
    t.startRecurring(std::chrono::nanoseconds{}, ITimerCallbackPtr{},
                     ExpirationCount{})
  } -> std::same_as<Expected>;
  { t.pause() } -> std::same_as<Expected>;
  { t.resume() } -> std::same_as<Expected>;
  { t.stop() } -> std::same_as<Expected>;
  { t.adjustInterval(std::chrono::nanoseconds{}) } -> std::same_as<Expected>;
  { t.getState() } -> std::same_as<TimerState>;
  { t.getStatistics() } -> std::same_as<TimerStatistics>;
};

} // namespace cadence::timers
