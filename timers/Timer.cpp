#include "cadence/timers/Timer.hpp"

#include <exception>
#include <format>
#include <iostream>
#include <system_error>
#include <utility>

namespace cadence::timers {

using event_sink::TimerEventType;

namespace {

bool isReported(const TimerLoggingConfig &logging, TimerEventType type) {
  switch (type) {
  case TimerEventType::Tick:
    return logging.ticks;
  case TimerEventType::CallbackFailed:
    return true;
  default:
    return logging.lifecycle;
  }
}

Expected invokeCallback(ITimerCallback &callback) {
  try {
    return callback.execute();
  } catch (const std::exception &e) {
    return callbackFailed(e.what());
  }
}

} // namespace

Timer::Timer() : Timer{TimerConfig{}} {}

Timer::Timer(TimerConfig config)
    : _config{std::move(config)}, _shared{std::make_shared<SharedState>()} {}

Timer::~Timer() {
  std::jthread loop;
  {
    std::lock_guard loopLock{_loopMutex};
    {
      std::lock_guard stateLock{_shared->mutex};
      _shared->state = TimerState::Stopped;
    }
    loop = std::move(_loop);
  }
  _shared->wakeCondition.notify_all();
  haltLoop(std::move(loop));
}

Expected Timer::startOnce(std::chrono::nanoseconds delay,
                          ITimerCallbackPtr callback) {
  return startInternal(delay, std::move(callback), false, {});
}

Expected Timer::startRecurring(std::chrono::nanoseconds interval,
                               ITimerCallbackPtr callback,
                               ExpirationCount expirationCount) {
  return startInternal(interval, std::move(callback), true, expirationCount);
}

Expected Timer::pause() {
  {
    std::lock_guard stateLock{_shared->mutex};
    if (_shared->state != TimerState::Running) {
      return timerStopped();
    }
    _shared->state = TimerState::Paused;
  }
  // Cuts short an interval wait in progress so the loop parks right away
  _shared->wakeCondition.notify_all();
  report(TimerEventType::Paused);
  return {};
}

Expected Timer::resume() {
  {
    std::lock_guard stateLock{_shared->mutex};
    if (_shared->state != TimerState::Paused) {
      return invalidParameter("Timer is not paused.");
    }
    _shared->state = TimerState::Running;
  }
  _shared->wakeCondition.notify_all();
  report(TimerEventType::Resumed);
  return {};
}

Expected Timer::stop() {
  std::jthread loop;
  {
    // Same lock order as startInternal. The state flip and the handle move
    // are one step, a concurrent start either lands before it and is torn
    // down here, or after it with a loop of its own.
    std::lock_guard loopLock{_loopMutex};
    {
      std::lock_guard stateLock{_shared->mutex};
      if (_shared->state == TimerState::Stopped) {
        return timerStopped();
      }
      _shared->state = TimerState::Stopped;
    }
    loop = std::move(_loop);
  }
  _shared->wakeCondition.notify_all();
  haltLoop(std::move(loop));
  report(TimerEventType::Stopped);
  return {};
}

Expected Timer::adjustInterval(std::chrono::nanoseconds newInterval) {
  if (newInterval <= std::chrono::nanoseconds::zero()) {
    return invalidParameter("Interval must be greater than zero.");
  }
  {
    std::lock_guard stateLock{_shared->mutex};
    _shared->interval = newInterval;
  }
  report(TimerEventType::IntervalAdjusted);
  return {};
}

TimerState Timer::getState() const {
  std::lock_guard stateLock{_shared->mutex};
  return _shared->state;
}

TimerStatistics Timer::getStatistics() const {
  std::lock_guard stateLock{_shared->mutex};
  return _shared->statistics;
}

std::chrono::nanoseconds Timer::getInterval() const {
  std::lock_guard stateLock{_shared->mutex};
  return _shared->interval;
}

ExpirationCount Timer::getExpirationCount() const {
  std::lock_guard loopLock{_loopMutex};
  return _expirationCount;
}

Expected Timer::startInternal(std::chrono::nanoseconds interval,
                              ITimerCallbackPtr callback, bool recurring,
                              ExpirationCount expirationCount) {
  if (interval <= std::chrono::nanoseconds::zero()) {
    return invalidParameter("Interval must be greater than zero.");
  }
  if (!callback) {
    return invalidParameter("Timer callback must not be empty.");
  }
  if (expirationCount && *expirationCount == 0) {
    return invalidParameter("Expiration count must be greater than zero.");
  }

  std::unique_lock loopLock{_loopMutex};
  // The previous loop is torn down outside the handle lock so that its
  // in-flight callback can still call back into this timer. Another start
  // may slip in meanwhile, in which case its loop is torn down as well.
  while (_loop.joinable()) {
    auto previousLoop = std::move(_loop);
    loopLock.unlock();
    haltLoop(std::move(previousLoop));
    loopLock.lock();
  }

  RunContext run{.generation = 0,
                 .callback = std::move(callback),
                 .recurring = recurring,
                 .expirationCount = expirationCount,
                 .name = _config.name(),
                 .logging = _config.logging(),
                 .eventSink = _config.eventSink()};
  {
    std::lock_guard stateLock{_shared->mutex};
    run.generation = ++_shared->generation;
    _shared->state = TimerState::Running;
    _shared->statistics = TimerStatistics{};
    _shared->interval = interval;
  }
  _expirationCount = expirationCount;
  auto started = run.started.get_future();
  try {
    _loop = std::jthread{&Timer::runLoop, _shared, std::move(run)};
  } catch (const std::system_error &) {
    // No loop to run the new generation, leave the timer stopped
    {
      std::lock_guard stateLock{_shared->mutex};
      _shared->state = TimerState::Stopped;
      _shared->interval = std::chrono::nanoseconds{0};
    }
    _expirationCount.reset();
    throw;
  }
  loopLock.unlock();
  // Started is reported by the new loop with no lock held, the caller only
  // returns once it is out so later control events cannot overtake it.
  started.wait();
  return {};
}

void Timer::runLoop(std::stop_token stopToken, SharedStatePtr shared,
                    RunContext run) {
  const auto runStart = SteadyClock::now();
  std::uint64_t tickCount = 0;

  // Reported by the loop itself so Started always precedes the first Tick
  report(run.logging, run.eventSink, TimerEventType::Started, run.name, 0,
         [&] {
           std::lock_guard stateLock{shared->mutex};
           return shared->interval;
         }(),
         run.recurring
             ? (run.expirationCount
                    ? std::format("recurring, expires after {} ticks",
                                  *run.expirationCount)
                    : std::string{"recurring"})
             : std::string{"once"});
  run.started.set_value();

  auto isStale = [&] {
    return stopToken.stop_requested() || shared->generation != run.generation;
  };

  while (true) {
    std::chrono::nanoseconds interval{};
    {
      std::unique_lock stateLock{shared->mutex};
      if (isStale() || shared->state == TimerState::Stopped) {
        return;
      }
      if (shared->state == TimerState::Paused) {
        shared->wakeCondition.wait(stateLock, stopToken, [&] {
          return shared->state != TimerState::Paused ||
                 shared->generation != run.generation;
        });
        continue;
      }

      // Interval is read fresh for every wait, an adjustment made during
      // this wait applies to the next one.
      interval = shared->interval;
      auto interrupted =
          shared->wakeCondition.wait_for(stateLock, stopToken, interval, [&] {
            return shared->state != TimerState::Running ||
                   shared->generation != run.generation;
          });
      if (interrupted || stopToken.stop_requested()) {
        continue;
      }
    }

    auto result = invokeCallback(*run.callback);

    std::uint64_t executionCount = 0;
    bool expired = false;
    bool finished = false;
    {
      std::lock_guard stateLock{shared->mutex};
      if (shared->generation != run.generation) {
        return;
      }
      ++tickCount;
      ++shared->statistics.executionCount;
      shared->statistics.elapsedTime = SteadyClock::now() - runStart;
      executionCount = shared->statistics.executionCount;

      expired = run.expirationCount && tickCount >= *run.expirationCount;
      finished = expired || !run.recurring;
      if (finished) {
        shared->state = TimerState::Stopped;
      }
    }

    if (!result) {
      if (run.eventSink) {
        report(run.logging, run.eventSink, TimerEventType::CallbackFailed,
               run.name, executionCount, interval,
               std::format("{}", result.error()));
      } else {
        std::cerr << std::format("Timer {} tick {}: {}", run.name,
                                 executionCount, result.error())
                  << std::endl;
      }
    }
    report(run.logging, run.eventSink, TimerEventType::Tick, run.name,
           executionCount, interval);

    if (finished) {
      report(run.logging, run.eventSink,
             expired ? TimerEventType::Expired : TimerEventType::Stopped,
             run.name, executionCount, interval,
             expired ? "expiration count reached" : "one time run complete");
      return;
    }
  }
}

void Timer::haltLoop(std::jthread loop) {
  if (!loop.joinable()) {
    return;
  }
  loop.request_stop();
  // A callback stopping or restarting its own timer runs on the loop thread
  // and cannot join itself. The loop exits once the callback returns.
  if (loop.get_id() == std::this_thread::get_id()) {
    loop.detach();
    return;
  }
  loop.join();
}

void Timer::report(const TimerLoggingConfig &logging,
                   const event_sink::ITimerEventSinkPtr &eventSink,
                   TimerEventType type, std::string_view name,
                   std::uint64_t executionCount,
                   std::chrono::nanoseconds interval,
                   std::string_view details) {
  if (!eventSink || !isReported(logging, type)) {
    return;
  }
  eventSink->onEvent(event_sink::makeTimerEvent(type, name, executionCount,
                                                interval, details));
}

void Timer::report(TimerEventType type, std::string_view details) const {
  if (!_config.eventSink() || !isReported(_config.logging(), type)) {
    return;
  }
  TimerStatistics statistics;
  std::chrono::nanoseconds interval;
  {
    std::lock_guard stateLock{_shared->mutex};
    statistics = _shared->statistics;
    interval = _shared->interval;
  }
  report(_config.logging(), _config.eventSink(), type, _config.name(),
         statistics.executionCount, interval, details);
}

} // namespace cadence::timers
