#pragma once

#include "common/utils/ConfigBase.h"

namespace ostmig {
class ApplicationBase {
 public:
  int run(int argc, char *argv[]);

  static void handleSignal(int signum);

  // Leave the main loop and make `run` return `code`. Safe to call from any thread.
  static void requestExit(int code);

 protected:
  ApplicationBase() = default;
  ~ApplicationBase() = default;

  virtual void stop() = 0;

  virtual int mainLoop();

  virtual Result<Void> initApplication() = 0;

  virtual config::IConfig *getConfig() = 0;
};
}  // namespace ostmig
