#include "migration/worker/MigrationWorkerPool.h"

#include <fmt/format.h>
#include <folly/logging/xlog.h>
#include <folly/system/ThreadName.h>

namespace ostmig::migration::worker {

Result<Void> MigrationWorkerPool::start() {
  if (!stop_) return Void{};
  stop_ = false;

  for (int64_t i = 0; i < config_.num_workers(); ++i) {
    workers_.emplace_back(&MigrationWorkerPool::run, this);
    folly::setThreadName(workers_.back().get_id(), fmt::format("MigWorker{}", i));
  }
  XLOGF(INFO, "MigrationWorkerPool started {} workers, dry run {}", workers_.size(), config_.dry_run());
  return Void{};
}

void MigrationWorkerPool::stopAndJoin() {
  if (!stop_) {
    stop_ = true;
    workers_.clear();
    XLOGF(INFO, "MigrationWorkerPool stopped, executed {} tasks, {} failed", executed_.load(), failed_.load());
  }
}

void MigrationWorkerPool::run() {
  auto pollInterval = std::chrono::milliseconds(config_.poll_interval_ms());
  while (!stop_) {
    auto task = taskQueue_.popFor(pollInterval);
    if (!task) {
      continue;
    }
    auto &t = **task;
    if (config_.dry_run()) {
      XLOGF(INFO, "Dry run task {}: {}", t.tid(), t.path());
    } else {
      auto result = t.execute();
      if (UNLIKELY(!result)) {
        XLOGF(ERR, "Task {} for {} failed: {}", t.tid(), t.path(), result.error());
        ++failed_;
      }
    }
    ++executed_;
    completionQueue_.push(t.tid());
  }
}

}  // namespace ostmig::migration::worker
