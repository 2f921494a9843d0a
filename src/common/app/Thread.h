#pragma once

namespace ostmig {

class Thread {
 public:
  static bool blockInterruptSignals();
  static bool unblockInterruptSignals();
};

}  // namespace ostmig
