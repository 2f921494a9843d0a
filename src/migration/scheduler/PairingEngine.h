#pragma once

#include "common/utils/LockedQueue.h"
#include "migration/scheduler/SchedulerState.h"
#include "migration/scheduler/TaskIssuer.h"

namespace ostmig::migration {

using TaskQueue = LockedQueue<MigrateTaskPtr>;

// Greedy first-fit: every READY source with pending items is paired with the first READY destination
// in target id order. No weighting across destinations.
class PairingEngine {
 public:
  PairingEngine(ITaskIssuer &issuer, TaskQueue &taskQueue)
      : issuer_(issuer),
        taskQueue_(taskQueue) {}

  // Returns the number of tasks pushed.
  size_t runPass(SchedulerState &state);

 private:
  ITaskIssuer &issuer_;
  TaskQueue &taskQueue_;
};

}  // namespace ostmig::migration
