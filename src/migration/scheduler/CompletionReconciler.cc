#include "migration/scheduler/CompletionReconciler.h"

#include <folly/logging/xlog.h>

#include "migration/scheduler/MigrateTask.h"

namespace ostmig::migration {

Result<size_t> CompletionReconciler::drain(SchedulerState &state) {
  size_t applied = 0;
  while (auto tid = completionQueue_.tryPop()) {
    XLOGF(DBG, "Popped task {} from completion queue", *tid);
    RETURN_ON_ERROR(apply(state, *tid));
    ++applied;
  }
  return applied;
}

Result<Void> CompletionReconciler::apply(SchedulerState &state, std::string_view tid) {
  auto ids = parseTaskId(tid);
  RETURN_ON_ERROR(ids);
  auto &[source, target] = *ids;
  RETURN_ON_ERROR(state.sourceStates.complete(source));
  RETURN_ON_ERROR(state.destinationStates.complete(target));
  return Void{};
}

}  // namespace ostmig::migration
