#include "common/app/Thread.h"

#include <pthread.h>
#include <sys/signal.h>

namespace ostmig {

namespace {
bool changeInterruptMask(int how) {
  sigset_t mask;
  sigemptyset(&mask);
  sigaddset(&mask, SIGINT);
  sigaddset(&mask, SIGTERM);
  return pthread_sigmask(how, &mask, nullptr) == 0;
}
}  // namespace

// The mask is inherited by threads created afterwards, so the scheduler and worker threads spawned
// during startup never receive SIGINT/SIGTERM; only the main loop does once it unblocks them.
bool Thread::blockInterruptSignals() { return changeInterruptMask(SIG_BLOCK); }

bool Thread::unblockInterruptSignals() { return changeInterruptMask(SIG_UNBLOCK); }

}  // namespace ostmig
