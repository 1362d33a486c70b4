#pragma once
#include "cadence/timers/interfaces.hpp"

#include <cstdint>
#include <map>
#include <mutex>
#include <vector>

namespace cadence::timers {

using TimerId = std::uint64_t;

// Registry of timers keyed by an identifier allocated on insertion.
// Identifiers start at 0 and are never reused by the same manager. All
// execution semantics stay with the timers themselves.
class TimerManager {
public:
  TimerManager() {}

  TimerManager(const TimerManager &) = delete;
  TimerManager &operator=(const TimerManager &) = delete;

  TimerId addTimer(ITimerPtr timer);

  // Returns the registered timer itself, not a copy, or null for an unknown
  // identifier.
  ITimerPtr getTimer(TimerId id) const;

  // Identifiers of timers that are not Stopped, in no particular order
  std::vector<TimerId> listTimers() const;

  // Stops every timer. Timers that are already stopped are skipped silently.
  void stopAll();

  std::size_t size() const;

private:
  mutable std::mutex _timersMutex;
  std::map<TimerId, ITimerPtr> _timers;
  TimerId _nextId{0};
};

} // namespace cadence::timers
