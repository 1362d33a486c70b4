#pragma once

#include "cadence/event_sink/interfaces.hpp"

#include <atomic>
#include <boost/lockfree/queue.hpp>
#include <concepts>
#include <cstdint>

namespace cadence::event_sink {

template <typename T>
concept TimerEventHandlerC = requires(T t, const TimerEvent &event) {
  { t(event) };
};

// Collects events from any number of timer threads without blocking them.
// A consumer drains the buffer on its own thread. When the buffer is full the
// event is dropped and counted rather than stalling the timer loop.
template <std::uint32_t Capacity = 1024>
class BufferedTimerEventSink : public ITimerEventSink {
public:
  using QueueT =
      boost::lockfree::queue<TimerEvent, boost::lockfree::capacity<Capacity>>;

  void onEvent(const TimerEvent &event) override {
    if (!_queue.bounded_push(event)) {
      _droppedEvents.fetch_add(1, std::memory_order_relaxed);
    }
  }

  // Returns the number of events handed to the handler
  std::uint64_t drain(TimerEventHandlerC auto &&handler) {
    std::uint64_t drained = 0;
    TimerEvent event{};
    while (_queue.pop(event)) {
      handler(event);
      ++drained;
    }
    return drained;
  }

  bool empty() const { return _queue.empty(); }

  std::uint64_t droppedEvents() const {
    return _droppedEvents.load(std::memory_order_relaxed);
  }

private:
  QueueT _queue;
  std::atomic<std::uint64_t> _droppedEvents{0};
};

} // namespace cadence::event_sink
