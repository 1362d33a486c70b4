#pragma once
#include "cadence/event_sink/interfaces.hpp"

#include <string>

namespace cadence::timers {

struct TimerLoggingConfig {
  bool lifecycle{true}; // Started, Paused, Resumed, Stopped, Expired, ...
  bool ticks{false};    // One event per executed tick
};

class TimerConfig {
  std::string _name{"timer"};
  TimerLoggingConfig _logging{};
  event_sink::ITimerEventSinkPtr _eventSink{};

public:
  TimerConfig() {}
  TimerConfig(const std::string &name,
              event_sink::ITimerEventSinkPtr eventSink = {},
              TimerLoggingConfig logging = {})
      : _name{name}, _logging{logging}, _eventSink{std::move(eventSink)} {}

  auto &name() const { return _name; }

  auto &logging() const { return _logging; }

  auto &eventSink() const { return _eventSink; }
};

} // namespace cadence::timers
