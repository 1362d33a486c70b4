#pragma once
#include "cadence/event_sink/interfaces.hpp"
#include "cadence/time.hpp"
#include "cadence/timers/CallableTimerCallback.hpp"
#include "cadence/timers/TimerConfig.hpp"
#include "cadence/timers/concepts.hpp"
#include "cadence/timers/interfaces.hpp"

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <future>
#include <memory>
#include <mutex>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

namespace cadence::timers {

// Runs a callback after a delay, once or repeatedly, on a dedicated background
// loop. All state is shared between the public operations and the loop through
// one mutex protected block, the mutex is never held across a wait or a
// callback invocation.
class Timer : public ITimer {
public:
  Timer();
  explicit Timer(TimerConfig config);
  ~Timer() override;

  Timer(const Timer &) = delete;
  Timer &operator=(const Timer &) = delete;

  Expected startOnce(std::chrono::nanoseconds delay,
                     ITimerCallbackPtr callback) override;

  Expected startOnce(DurationC auto delay, TimerActionC auto &&action) {
    return startOnce(toNanos(delay),
                     makeTimerCallback(std::forward<decltype(action)>(action)));
  }

  Expected startRecurring(std::chrono::nanoseconds interval,
                          ITimerCallbackPtr callback,
                          ExpirationCount expirationCount = {}) override;

  Expected startRecurring(DurationC auto interval, TimerActionC auto &&action,
                          ExpirationCount expirationCount = {}) {
    return startRecurring(
        toNanos(interval),
        makeTimerCallback(std::forward<decltype(action)>(action)),
        expirationCount);
  }

  Expected pause() override;
  Expected resume() override;
  Expected stop() override;
  Expected adjustInterval(std::chrono::nanoseconds newInterval) override;

  TimerState getState() const override;
  TimerStatistics getStatistics() const override;

  std::chrono::nanoseconds getInterval() const;
  ExpirationCount getExpirationCount() const;
  const std::string &name() const { return _config.name(); }

private:
  struct SharedState {
    mutable std::mutex mutex;
    // Wakes the loop out of a paused wait or an interval wait. Waits are
    // also registered against the loop's stop token.
    std::condition_variable_any wakeCondition;
    TimerState state{TimerState::Stopped};
    TimerStatistics statistics{};
    std::chrono::nanoseconds interval{0};
    // Bumped by every start so a loop left behind by a restart can never
    // touch the state of the run that replaced it.
    std::uint64_t generation{0};
  };
  using SharedStatePtr = std::shared_ptr<SharedState>;

  struct RunContext {
    std::uint64_t generation;
    ITimerCallbackPtr callback;
    bool recurring;
    ExpirationCount expirationCount;
    std::string name;
    TimerLoggingConfig logging;
    event_sink::ITimerEventSinkPtr eventSink;
    // Fulfilled once the loop reported the start of the run
    std::promise<void> started{};
  };

  Expected startInternal(std::chrono::nanoseconds interval,
                         ITimerCallbackPtr callback, bool recurring,
                         ExpirationCount expirationCount);

  static void runLoop(std::stop_token stopToken, SharedStatePtr shared,
                      RunContext run);

  static void haltLoop(std::jthread loop);

  static void report(const TimerLoggingConfig &logging,
                     const event_sink::ITimerEventSinkPtr &eventSink,
                     event_sink::TimerEventType type, std::string_view name,
                     std::uint64_t executionCount,
                     std::chrono::nanoseconds interval,
                     std::string_view details = {});

  void report(event_sink::TimerEventType type,
              std::string_view details = {}) const;

  TimerConfig _config;
  SharedStatePtr _shared;
  ExpirationCount _expirationCount{};

  // Guards ownership of the loop handle. Only the caller that moves the
  // handle out performs the teardown.
  mutable std::mutex _loopMutex;
  std::jthread _loop;
};

using TimerPtr = std::shared_ptr<Timer>;

static_assert(TimerC<Timer>);

} // namespace cadence::timers
