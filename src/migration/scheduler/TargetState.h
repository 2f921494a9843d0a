#pragma once

#include <cstdint>
#include <optional>

#include "common/utils/Result.h"

namespace ostmig::migration {

enum class TargetState : uint8_t {
  READY,
  LOCKED,
  BLOCKED,
  PENDING_LOCK,
};

enum class TargetRole : uint8_t {
  Source,
  Destination,
};

// A source is worth draining when it is above the threshold, a destination can take data when it is
// below it. Equal to the threshold is eligible in neither role.
inline bool isEligible(TargetRole role, int64_t fillLevel, int64_t threshold) {
  return role == TargetRole::Source ? fillLevel > threshold : fillLevel < threshold;
}

// Next state after a fresh fill level sample. `current` is empty if the target has never been
// evaluated in this role. An in-flight target stays in flight.
TargetState evaluateFillLevel(std::optional<TargetState> current, bool eligible);

// Next state once the task holding the target has finished. Only BLOCKED and PENDING_LOCK can
// complete, anything else means the bookkeeping is broken.
Result<TargetState> evaluateCompletion(std::optional<TargetState> current);

}  // namespace ostmig::migration
