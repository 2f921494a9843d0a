#pragma once

#include <folly/logging/xlog.h>
#include <memory>

#include "ApplicationBase.h"
#include "common/logging/LogConfig.h"
#include "common/logging/LogInit.h"

namespace ostmig {
template <class T>
requires requires {
  typename T::Config;
  std::string_view(T::kName);
}
class OnePhaseApplication : public ApplicationBase {
 public:
  class CommonConfig : public ConfigBase<CommonConfig> {
    CONFIG_OBJ(log, logging::LogConfig);
  };

  class Config : public ConfigBase<Config> {
   public:
    CONFIG_OBJ(common, CommonConfig);
    CONFIG_OBJ(server, typename T::Config);
  };

  explicit OnePhaseApplication(Config &config)
      : config_(config) {}

  static OnePhaseApplication &instance() {
    static Config config;
    static OnePhaseApplication app(config);
    return app;
  }

  Result<Void> initApplication() final {
    auto logConfigStr = logging::generateLogConfig(config_.common().log(), String(T::kName));
    XLOGF(INFO, "LogConfig: {}", logConfigStr);
    logging::initOrDie(logConfigStr);
    XLOGF(INFO, "Full Config:\n{}", config_.toString());

    server_ = std::make_unique<T>(config_.server());
    // a component that fails after startup takes the whole process down with exit code 1
    auto startResult = server_->start([](const Status &status) {
      XLOGF(ERR, "{} stops because of a fatal error: {}", T::kName, status);
      ApplicationBase::requestExit(1);
    });
    if (UNLIKELY(!startResult)) {
      XLOGF(ERR, "Start server failed: {}", startResult.error());
      RETURN_ERROR(startResult);
    }

    return Void{};
  }

  config::IConfig *getConfig() final { return &config_; }

  void stop() final {
    XLOGF(INFO, "Stop the server...");
    if (server_) {
      server_->stopAndJoin();
      server_.reset();
    }
    XLOGF(INFO, "Stop server finished.");
  }

 private:
  Config &config_;
  std::unique_ptr<T> server_;
};

}  // namespace ostmig
