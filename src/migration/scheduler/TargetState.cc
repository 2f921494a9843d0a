#include "migration/scheduler/TargetState.h"

#include <fmt/format.h>

#include "common/utils/StringUtils.h"

namespace ostmig::migration {

TargetState evaluateFillLevel(std::optional<TargetState> current, bool eligible) {
  if (!current.has_value()) {
    return eligible ? TargetState::READY : TargetState::LOCKED;
  }
  switch (*current) {
    case TargetState::READY:
      return eligible ? TargetState::READY : TargetState::LOCKED;
    case TargetState::LOCKED:
      return eligible ? TargetState::READY : TargetState::LOCKED;
    case TargetState::BLOCKED:
      return eligible ? TargetState::BLOCKED : TargetState::PENDING_LOCK;
    case TargetState::PENDING_LOCK:
      return TargetState::PENDING_LOCK;
  }
  return *current;
}

Result<TargetState> evaluateCompletion(std::optional<TargetState> current) {
  if (!current.has_value()) {
    return makeError(MigrationCode::kStateInconsistent, "completion for a target without state");
  }
  switch (*current) {
    case TargetState::BLOCKED:
      return TargetState::READY;
    case TargetState::PENDING_LOCK:
      return TargetState::LOCKED;
    default:
      return makeError(MigrationCode::kStateInconsistent,
                       fmt::format("completion for a target in state {}", toStringView(*current)));
  }
}

}  // namespace ostmig::migration
