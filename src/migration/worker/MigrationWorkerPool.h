#pragma once

#include <atomic>
#include <thread>
#include <vector>

#include "common/utils/ConfigBase.h"
#include "migration/scheduler/CompletionReconciler.h"
#include "migration/scheduler/PairingEngine.h"

namespace ostmig::migration::worker {

// Executes tasks from the task queue and reports every finished task id on the completion queue,
// whether the migration succeeded or not.
class MigrationWorkerPool {
 public:
  struct Config : public ConfigBase<Config> {
    CONFIG_ITEM(num_workers, 4L, ConfigCheckers::checkPositive);
    // log tasks instead of executing them
    CONFIG_ITEM(dry_run, false);
    CONFIG_ITEM(poll_interval_ms, 100L, ConfigCheckers::checkPositive);
  };

  MigrationWorkerPool(const Config &config, TaskQueue &taskQueue, CompletionQueue &completionQueue)
      : config_(config),
        taskQueue_(taskQueue),
        completionQueue_(completionQueue) {}
  ~MigrationWorkerPool() { stopAndJoin(); }

  Result<Void> start();
  // Tasks still queued are dropped, running ones finish first.
  void stopAndJoin();

  size_t executed() const { return executed_; }
  size_t failed() const { return failed_; }

 private:
  void run();

  const Config &config_;
  TaskQueue &taskQueue_;
  CompletionQueue &completionQueue_;

  std::atomic<bool> stop_ = true;
  std::vector<std::jthread> workers_;
  std::atomic<size_t> executed_ = 0;
  std::atomic<size_t> failed_ = 0;
};

}  // namespace ostmig::migration::worker
