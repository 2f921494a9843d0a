#pragma once

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <thread>

#include "common/utils/ConfigBase.h"
#include "common/utils/StringUtils.h"
#include "migration/scheduler/CompletionReconciler.h"
#include "migration/scheduler/FillLevelSampler.h"
#include "migration/scheduler/InputIngestor.h"
#include "migration/scheduler/PairingEngine.h"
#include "migration/scheduler/SchedulerState.h"
#include "migration/scheduler/TaskIssuer.h"

namespace ostmig::migration {

class MigrationScheduler {
 public:
  struct Config : public ConfigBase<Config> {
    CONFIG_ITEM(fs_path, "", ConfigCheckers::checkNotEmpty);
    CONFIG_ITEM(lfs_path, "/usr/bin/lfs", ConfigCheckers::checkNotEmpty);
    // comma separated OSTs files may be moved to
    CONFIG_ITEM(ost_targets, "", [](const String &s) { return !splitList(s).empty(); });
    CONFIG_ITEM(input_dir, "", ConfigCheckers::checkNotEmpty);
    // -1 means unset and fails validation
    CONFIG_ITEM(ost_fill_threshold, -1L, ConfigCheckers::checkPercentage);
    CONFIG_ITEM(local_mode, false);
    CONFIG_ITEM(fill_level_update_interval_s, 900L, ConfigCheckers::checkPositive);
    CONFIG_ITEM(input_reload_interval_s, 900L, ConfigCheckers::checkPositive);
    CONFIG_ITEM(cache_report_interval_s, 900L, ConfigCheckers::checkPositive);
    CONFIG_ITEM(loop_sleep_ms, 1L, ConfigCheckers::checkPositive);

   public:
    std::vector<String> destinations() const { return splitList(ost_targets()); }
  };

  using Clock = std::chrono::steady_clock;
  using FailureHandler = std::function<void(const Status &)>;

  MigrationScheduler(const Config &config,
                     std::unique_ptr<IFillLevelSampler> sampler,
                     std::unique_ptr<ITaskIssuer> issuer,
                     TaskQueue &taskQueue,
                     CompletionQueue &completionQueue);
  ~MigrationScheduler();

  // Real lfs sampler and tasks, or random fill levels and empty tasks in local mode.
  static std::unique_ptr<MigrationScheduler> create(const Config &config,
                                                    TaskQueue &taskQueue,
                                                    CompletionQueue &completionQueue);

  // Run the loop on its own thread. `onFailure` is called from that thread if the loop dies.
  Result<Void> start(FailureHandler onFailure);
  void stopAndJoin();

  // Startup steps: sample fill levels, evaluate destinations, ingest pending input files.
  Result<Void> init(Clock::time_point now);

  // One loop iteration: pairing pass, completions, then whichever maintenance actions are due.
  Result<Void> runOnce(Clock::time_point now);

  Result<Void> refreshFillLevels();
  Result<Void> reloadInputFiles();
  void reportCacheSizes() const;

  SchedulerState &state() { return state_; }
  const SchedulerState &state() const { return state_; }
  std::string_view currentStep() const { return currentStep_; }

 private:
  struct Timer {
    Clock::duration interval;
    Clock::time_point next;

    bool due(Clock::time_point now) {
      if (now < next) {
        return false;
      }
      next = now + interval;
      return true;
    }
  };

  void loop();

  const Config &config_;
  std::unique_ptr<IFillLevelSampler> sampler_;
  std::unique_ptr<ITaskIssuer> issuer_;
  InputIngestor ingestor_;
  PairingEngine pairing_;
  CompletionReconciler reconciler_;
  SchedulerState state_;

  Timer fillLevelTimer_;
  Timer inputTimer_;
  Timer cacheReportTimer_;
  std::string_view currentStep_ = "init";

  FailureHandler onFailure_;
  std::atomic<bool> stop_ = false;
  std::jthread thread_;
};

}  // namespace ostmig::migration
