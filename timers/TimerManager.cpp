#include "cadence/timers/TimerManager.hpp"

#include <format>
#include <iostream>
#include <utility>

namespace cadence::timers {

TimerId TimerManager::addTimer(ITimerPtr timer) {
  std::lock_guard lock{_timersMutex};
  auto id = _nextId++;
  _timers.emplace(id, std::move(timer));
  return id;
}

ITimerPtr TimerManager::getTimer(TimerId id) const {
  std::lock_guard lock{_timersMutex};
  auto it = _timers.find(id);
  if (it == _timers.end()) {
    return {};
  }
  return it->second;
}

std::vector<TimerId> TimerManager::listTimers() const {
  std::lock_guard lock{_timersMutex};
  std::vector<TimerId> activeTimers;
  for (const auto &[id, timer] : _timers) {
    if (timer && timer->getState() != TimerState::Stopped) {
      activeTimers.push_back(id);
    }
  }
  return activeTimers;
}

void TimerManager::stopAll() {
  // Stopping joins each timer's loop, whose callback may call back into this
  // manager, so the timers are stopped outside the registry lock.
  std::vector<std::pair<TimerId, ITimerPtr>> timers;
  {
    std::lock_guard lock{_timersMutex};
    timers.assign(_timers.begin(), _timers.end());
  }
  for (auto &[id, timer] : timers) {
    if (!timer) {
      continue;
    }
    // Already stopped timers answer TimerStopped and are skipped
    if (auto result = timer->stop();
        !result && result.error().kind != TimerErrorKind::TimerStopped) {
      std::cerr << std::format("TimerManager failed to stop timer id={}: {}",
                               id, result.error())
                << std::endl;
    }
  }
}

std::size_t TimerManager::size() const {
  std::lock_guard lock{_timersMutex};
  return _timers.size();
}

} // namespace cadence::timers
