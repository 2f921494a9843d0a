#include "migration/scheduler/MigrationScheduler.h"

#include <folly/logging/xlog.h>
#include <folly/system/ThreadName.h>

#include "migration/scheduler/LfsFillLevelSampler.h"
#include "migration/scheduler/RandomFillLevelSampler.h"

namespace ostmig::migration {

MigrationScheduler::MigrationScheduler(const Config &config,
                                       std::unique_ptr<IFillLevelSampler> sampler,
                                       std::unique_ptr<ITaskIssuer> issuer,
                                       TaskQueue &taskQueue,
                                       CompletionQueue &completionQueue)
    : config_(config),
      sampler_(std::move(sampler)),
      issuer_(std::move(issuer)),
      ingestor_(Path(config.input_dir())),
      pairing_(*issuer_, taskQueue),
      reconciler_(completionQueue),
      state_(config.ost_fill_threshold()),
      fillLevelTimer_{std::chrono::seconds(config.fill_level_update_interval_s()), {}},
      inputTimer_{std::chrono::seconds(config.input_reload_interval_s()), {}},
      cacheReportTimer_{std::chrono::seconds(config.cache_report_interval_s()), {}} {}

MigrationScheduler::~MigrationScheduler() { stopAndJoin(); }

std::unique_ptr<MigrationScheduler> MigrationScheduler::create(const Config &config,
                                                               TaskQueue &taskQueue,
                                                               CompletionQueue &completionQueue) {
  std::unique_ptr<IFillLevelSampler> sampler;
  std::unique_ptr<ITaskIssuer> issuer;
  if (config.local_mode()) {
    XLOGF(WARN, "MigrationScheduler runs in local mode, fill levels are random and tasks do nothing");
    sampler = std::make_unique<RandomFillLevelSampler>();
    issuer = std::make_unique<EmptyTaskIssuer>();
  } else {
    sampler = std::make_unique<LfsFillLevelSampler>(config.lfs_path(), config.fs_path());
    issuer = std::make_unique<LfsMigrateTaskIssuer>(config.lfs_path(), config.fs_path());
  }
  return std::make_unique<MigrationScheduler>(config,
                                              std::move(sampler),
                                              std::move(issuer),
                                              taskQueue,
                                              completionQueue);
}

Result<Void> MigrationScheduler::start(FailureHandler onFailure) {
  if (thread_.joinable()) {
    return makeError(StatusCode::kInvalidArg, "MigrationScheduler already started");
  }
  onFailure_ = std::move(onFailure);
  stop_ = false;
  thread_ = std::jthread(&MigrationScheduler::loop, this);
  folly::setThreadName(thread_.get_id(), "MigScheduler");
  return Void{};
}

void MigrationScheduler::stopAndJoin() {
  stop_ = true;
  thread_ = std::jthread{};
}

Result<Void> MigrationScheduler::init(Clock::time_point now) {
  currentStep_ = "init";
  RETURN_ON_ERROR(refreshFillLevels());
  RETURN_ON_ERROR(state_.initDestinationStates(config_.destinations()));
  RETURN_ON_ERROR(reloadInputFiles());

  fillLevelTimer_.next = now + fillLevelTimer_.interval;
  inputTimer_.next = now + inputTimer_.interval;
  cacheReportTimer_.next = now + cacheReportTimer_.interval;
  return Void{};
}

Result<Void> MigrationScheduler::runOnce(Clock::time_point now) {
  currentStep_ = "pairing";
  pairing_.runPass(state_);

  currentStep_ = "completion";
  RETURN_ON_ERROR(reconciler_.drain(state_));

  if (fillLevelTimer_.due(now)) {
    currentStep_ = "fill level update";
    RETURN_ON_ERROR(refreshFillLevels());
  }
  if (inputTimer_.due(now)) {
    currentStep_ = "input reload";
    RETURN_ON_ERROR(reloadInputFiles());
  }
  if (cacheReportTimer_.due(now)) {
    currentStep_ = "cache report";
    reportCacheSizes();
  }
  return Void{};
}

Result<Void> MigrationScheduler::refreshFillLevels() {
  XLOGF(INFO, "Update OST fill levels");
  auto begin = Clock::now();
  auto levels = sampler_->sample();
  RETURN_ON_ERROR(levels);
  auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - begin);
  XLOGF(INFO, "Elapsed time: {}ms - Number of OSTs: {}", elapsed.count(), levels->size());
  for (auto &[ost, level] : *levels) {
    XLOGF(DBG, "OST: {} - Fill Level: {}", ost, level);
  }
  return state_.updateFillLevels(std::move(*levels));
}

Result<Void> MigrationScheduler::reloadInputFiles() {
  XLOGF(INFO, "Load input files from {}", ingestor_.inputDir());
  RETURN_ON_ERROR(ingestor_.ingest(state_.cache));
  return state_.allocateSourceCaches();
}

void MigrationScheduler::reportCacheSizes() const {
  XLOGF(INFO, "OST cache sizes");
  if (state_.cache.empty()) {
    XLOGF(INFO, "No OST caches available!");
    return;
  }
  for (auto &[source, items] : state_.cache.entries()) {
    XLOGF(INFO, "OST: {} - Size: {}", source, items.size());
  }
}

void MigrationScheduler::loop() {
  XLOGF(INFO, "MigrationScheduler started!");

  auto result = [this]() -> Result<Void> {
    try {
      RETURN_ON_ERROR(init(Clock::now()));
      auto sleep = std::chrono::milliseconds(config_.loop_sleep_ms());
      while (!stop_) {
        RETURN_ON_ERROR(runOnce(Clock::now()));
        std::this_thread::sleep_for(sleep);
      }
    } catch (const std::exception &e) {
      return makeError(StatusCode::kUnknownError, e.what());
    }
    return Void{};
  }();

  if (UNLIKELY(!result)) {
    XLOGF(ERR, "MigrationScheduler failed in {}: {}", currentStep_, result.error());
    XLOGF(INFO, "MigrationScheduler exited!");
    if (onFailure_) {
      onFailure_(result.error());
    }
    return;
  }
  XLOGF(INFO, "MigrationScheduler finished!");
}

}  // namespace ostmig::migration
