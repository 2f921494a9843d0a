#pragma once

#include <functional>
#include <memory>

#include "common/utils/ConfigBase.h"
#include "migration/scheduler/MigrationScheduler.h"
#include "migration/worker/MigrationWorkerPool.h"

namespace ostmig::migration::server {

class MigrationServer {
 public:
  static constexpr auto kName = "Migration";

  struct Config : public ConfigBase<Config> {
    CONFIG_OBJ(scheduler, MigrationScheduler::Config);
    CONFIG_OBJ(workers, worker::MigrationWorkerPool::Config);
  };

  using FailureHandler = MigrationScheduler::FailureHandler;

  MigrationServer(const Config &config);
  ~MigrationServer();

  Result<Void> start(FailureHandler onFailure);

  // Stops the scheduler first so no new task is queued while the workers wind down.
  void stopAndJoin();

  TaskQueue &taskQueue() { return taskQueue_; }
  CompletionQueue &completionQueue() { return completionQueue_; }

 private:
  const Config &config_;

  TaskQueue taskQueue_;
  CompletionQueue completionQueue_;
  std::unique_ptr<worker::MigrationWorkerPool> workers_;
  std::unique_ptr<MigrationScheduler> scheduler_;
};

}  // namespace ostmig::migration::server
