#pragma once

#include "migration/scheduler/FillLevelSampler.h"

namespace ostmig::migration {

// Stand-in for a real filesystem: OSTs "0".."<numTargets-1>" with levels drawn uniformly from
// [minLevel, maxLevel].
class RandomFillLevelSampler : public IFillLevelSampler {
 public:
  RandomFillLevelSampler(uint32_t numTargets = 10, int64_t minLevel = 40, int64_t maxLevel = 60)
      : numTargets_(numTargets),
        minLevel_(minLevel),
        maxLevel_(maxLevel) {}

  Result<FillLevelMap> sample() override;

 private:
  uint32_t numTargets_;
  int64_t minLevel_;
  int64_t maxLevel_;
};

}  // namespace ostmig::migration
