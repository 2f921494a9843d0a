#include "migration/scheduler/PairingEngine.h"

#include <folly/logging/xlog.h>

namespace ostmig::migration {

size_t PairingEngine::runPass(SchedulerState &state) {
  size_t issued = 0;
  for (auto &[source, items] : state.cache.entries()) {
    if (items.empty() || state.sourceStates.get(source) != TargetState::READY) {
      continue;
    }
    auto target = state.destinationStates.firstReady();
    if (!target) {
      // every destination is busy or locked, later sources cannot be paired either
      break;
    }
    auto item = state.cache.pop(source);
    auto task = issuer_.issue(source, *target, item->path);
    XLOGF(DBG, "Pushing task {} for {} to task queue", task->tid(), task->path());
    // both ends are BLOCKED before any consumer can see the task
    taskQueue_.push(std::move(task), [&] {
      state.sourceStates.set(source, TargetState::BLOCKED);
      state.destinationStates.set(*target, TargetState::BLOCKED);
    });
    ++issued;
  }
  return issued;
}

}  // namespace ostmig::migration
