#pragma once

#include "cadence/event_sink/TimerEvent.hpp"

#include <memory>

namespace cadence::event_sink {

// Receives timer lifecycle and tick events. Implementations are invoked from
// timer loop threads as well as from the threads calling timer operations and
// must be thread safe.
class ITimerEventSink {
public:
  virtual void onEvent(const TimerEvent &event) = 0;
  virtual ~ITimerEventSink() = default;
};

using ITimerEventSinkPtr = std::shared_ptr<ITimerEventSink>;

} // namespace cadence::event_sink
