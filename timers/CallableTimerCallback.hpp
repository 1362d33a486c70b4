#pragma once

#include "cadence/timers/concepts.hpp"
#include "cadence/timers/interfaces.hpp"

#include <memory>
#include <type_traits>
#include <utility>

namespace cadence::timers {

// Adapts any callable returning Expected to the callback interface so
// lambdas can be handed straight to a timer.
template <TimerActionC ActionT>
class CallableTimerCallback : public ITimerCallback {
public:
  explicit CallableTimerCallback(ActionT &&action)
      : _action{std::move(action)} {}

  Expected execute() override { return _action(); }

private:
  ActionT _action;
};

ITimerCallbackPtr makeTimerCallback(TimerActionC auto &&action) {
  using ActionT = std::decay_t<decltype(action)>;
  return std::make_shared<CallableTimerCallback<ActionT>>(
      ActionT{std::forward<decltype(action)>(action)});
}

} // namespace cadence::timers
