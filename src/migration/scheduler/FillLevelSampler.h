#pragma once

#include "common/utils/Result.h"
#include "migration/scheduler/TargetStateMap.h"

namespace ostmig::migration {

class IFillLevelSampler {
 public:
  virtual ~IFillLevelSampler() = default;

  // Current utilization in percent of every target known to the filesystem.
  virtual Result<FillLevelMap> sample() = 0;
};

}  // namespace ostmig::migration
