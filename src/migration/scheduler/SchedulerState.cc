#include "migration/scheduler/SchedulerState.h"

#include <folly/logging/xlog.h>

namespace ostmig::migration {

Result<Void> SchedulerState::initDestinationStates(const std::vector<String> &destinations) {
  for (auto &target : destinations) {
    RETURN_ON_ERROR(destinationStates.evaluateFillLevel(target, fillLevels, threshold));
  }
  return Void{};
}

Result<Void> SchedulerState::updateFillLevels(FillLevelMap levels) {
  fillLevels = std::move(levels);
  RETURN_ON_ERROR(sourceStates.refresh(fillLevels, threshold));
  RETURN_ON_ERROR(destinationStates.refresh(fillLevels, threshold));
  return Void{};
}

Result<Void> SchedulerState::allocateSourceCaches() {
  auto pruned = cache.prune(sourceStates);
  if (!pruned.empty()) {
    XLOGF(INFO, "Pruned {} drained source caches", pruned.size());
  }
  for (auto &[source, items] : cache.entries()) {
    if (!items.empty() && !sourceStates.contains(source)) {
      RETURN_ON_ERROR(sourceStates.evaluateFillLevel(source, fillLevels, threshold));
    }
  }
  return Void{};
}

}  // namespace ostmig::migration
