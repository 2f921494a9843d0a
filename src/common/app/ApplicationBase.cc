#include "common/app/ApplicationBase.h"

#include <atomic>
#include <condition_variable>
#include <cstring>
#include <folly/logging/xlog.h>
#include <mutex>
#include <sys/signal.h>

#include "common/app/Thread.h"

namespace ostmig {
namespace {
std::mutex loopMutex;
std::condition_variable loopCv;
std::atomic<bool> exitLoop = false;
std::atomic<int> exitCode = 0;
}  // namespace

void ApplicationBase::handleSignal(int signum) {
  XLOGF(ERR, "Handle {} signal.", strsignal(signum));
  exitLoop = true;
  loopCv.notify_one();
}

void ApplicationBase::requestExit(int code) {
  {
    auto lock = std::unique_lock(loopMutex);
    exitCode = code;
    exitLoop = true;
  }
  loopCv.notify_one();
}

int ApplicationBase::run(int argc, char *argv[]) {
  Thread::blockInterruptSignals();

  // 10 parse flags, init folly and load config
  auto *config = getConfig();
  auto configRes = config->init(&argc, &argv);
  if (!configRes) {
    XLOGF(CRITICAL, "Load config failed: {}", configRes.error());
    return 1;
  }

  // 20 init application
  auto initRes = initApplication();
  if (!initRes) {
    XLOGF(CRITICAL, "Init application failed: {}", initRes.error());
    stop();
    return 1;
  }

  auto code = mainLoop();

  stop();

  return code;
}

int ApplicationBase::mainLoop() {
  signal(SIGINT, handleSignal);
  signal(SIGTERM, handleSignal);

  Thread::unblockInterruptSignals();

  {
    auto lock = std::unique_lock(loopMutex);
    loopCv.wait(lock, [] { return exitLoop.load(); });
  }

  return exitCode.load();
}

}  // namespace ostmig
