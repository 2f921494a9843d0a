#include "common/logging/LogInit.h"

#include <cstdio>
#include <folly/logging/Init.h>

namespace ostmig::logging {

bool init(const String &config) {
  try {
    folly::initLogging(config);
  } catch (const std::exception &ex) {
    fprintf(stderr, "error parsing logging configuration: %s\n", ex.what());
    return false;
  }

  return true;
}

void initOrDie(const String &config) { folly::initLoggingOrDie(config); }
}  // namespace ostmig::logging
