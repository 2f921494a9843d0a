#include "migration/service/Server.h"

#include <fmt/ranges.h>
#include <folly/logging/xlog.h>

namespace ostmig::migration::server {
MigrationServer::MigrationServer(const MigrationServer::Config &config)
    : config_(config) {}

MigrationServer::~MigrationServer() {
  stopAndJoin();
  XLOGF(INFO, "Destroying MigrationServer");
}

Result<Void> MigrationServer::start(FailureHandler onFailure) {
  XLOGF(INFO,
        "Start MigrationServer, destination OSTs [{}], fill threshold {}%",
        fmt::join(config_.scheduler().destinations(), ","),
        config_.scheduler().ost_fill_threshold());

  workers_ = std::make_unique<worker::MigrationWorkerPool>(config_.workers(), taskQueue_, completionQueue_);
  RETURN_ON_ERROR(workers_->start());

  scheduler_ = MigrationScheduler::create(config_.scheduler(), taskQueue_, completionQueue_);
  RETURN_ON_ERROR(scheduler_->start(std::move(onFailure)));
  return Void{};
}

void MigrationServer::stopAndJoin() {
  if (scheduler_) {
    scheduler_->stopAndJoin();
    scheduler_.reset();
  }
  if (workers_) {
    workers_->stopAndJoin();
    workers_.reset();
  }
}

}  // namespace ostmig::migration::server
