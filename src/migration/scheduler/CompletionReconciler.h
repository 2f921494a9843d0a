#pragma once

#include <string_view>

#include "common/utils/LockedQueue.h"
#include "migration/scheduler/SchedulerState.h"

namespace ostmig::migration {

using CompletionQueue = LockedQueue<String>;

// Frees the two targets of every finished task.
class CompletionReconciler {
 public:
  explicit CompletionReconciler(CompletionQueue &completionQueue)
      : completionQueue_(completionQueue) {}

  // Pop and apply completions until the queue is empty. Returns how many were applied.
  Result<size_t> drain(SchedulerState &state);

  static Result<Void> apply(SchedulerState &state, std::string_view tid);

 private:
  CompletionQueue &completionQueue_;
};

}  // namespace ostmig::migration
