#pragma once

#include <vector>

#include "migration/scheduler/MigrateItemCache.h"
#include "migration/scheduler/TargetStateMap.h"

namespace ostmig::migration {

// Everything the scheduling loop mutates. Owned by the scheduler thread and passed by reference into
// each step, never shared.
struct SchedulerState {
  explicit SchedulerState(int64_t threshold)
      : threshold(threshold) {}

  // Evaluate each configured destination for the first time.
  Result<Void> initDestinationStates(const std::vector<String> &destinations);

  // Replace the fill levels and re-derive every tracked target in both roles.
  Result<Void> updateFillLevels(FillLevelMap levels);

  // Prune drained idle sources, then give every non-empty source without a state its first
  // evaluation.
  Result<Void> allocateSourceCaches();

  int64_t threshold;
  FillLevelMap fillLevels;
  MigrateItemCache cache;
  TargetStateMap sourceStates{TargetRole::Source};
  TargetStateMap destinationStates{TargetRole::Destination};
};

}  // namespace ostmig::migration
