#include "migration/scheduler/RandomFillLevelSampler.h"

#include <folly/Conv.h>
#include <folly/Random.h>

namespace ostmig::migration {

Result<FillLevelMap> RandomFillLevelSampler::sample() {
  FillLevelMap fillLevels;
  for (uint32_t i = 0; i < numTargets_; ++i) {
    fillLevels[folly::to<String>(i)] = minLevel_ + folly::Random::rand64(maxLevel_ - minLevel_ + 1);
  }
  return fillLevels;
}

}  // namespace ostmig::migration
