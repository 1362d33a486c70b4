#pragma once

#include "cadence/event_sink/interfaces.hpp"

#include <format>
#include <iostream>
#include <mutex>
#include <ostream>

namespace cadence::event_sink {

// Writes one line per event:
// <time> timer=<name> event=<type> executions=<n> interval=<ns> [detail="..."]
class StreamTimerEventSink : public ITimerEventSink {
public:
  explicit StreamTimerEventSink(std::ostream &stream = std::clog)
      : _stream{stream} {}

  void onEvent(const TimerEvent &event) override {
    std::lock_guard lock{_streamMutex};
    _stream << std::format("{}", event) << std::endl;
  }

private:
  std::mutex _streamMutex;
  std::ostream &_stream;
};

} // namespace cadence::event_sink
