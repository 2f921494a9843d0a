#include "migration/scheduler/TargetStateMap.h"

#include <folly/logging/xlog.h>

#include "common/utils/StringUtils.h"

namespace ostmig::migration {

std::optional<TargetState> TargetStateMap::get(const String &target) const {
  auto it = states_.find(target);
  if (it == states_.end()) {
    return std::nullopt;
  }
  return it->second;
}

Result<TargetState> TargetStateMap::evaluateFillLevel(const String &target,
                                                      const FillLevelMap &fillLevels,
                                                      int64_t threshold) {
  auto it = fillLevels.find(target);
  if (UNLIKELY(it == fillLevels.end())) {
    return MAKE_ERROR_F(MigrationCode::kUnknownTarget,
                        "{} target {} not found in fill levels",
                        toStringView(role_),
                        target);
  }
  auto eligible = isEligible(role_, it->second, threshold);
  auto prev = get(target);
  auto next = migration::evaluateFillLevel(prev, eligible);
  if (!prev || *prev != next) {
    XLOGF(DBG,
          "{} target {} fill level {} threshold {}: {} -> {}",
          toStringView(role_),
          target,
          it->second,
          threshold,
          prev ? toStringView(*prev) : "unset",
          toStringView(next));
  }
  states_[target] = next;
  return next;
}

Result<Void> TargetStateMap::refresh(const FillLevelMap &fillLevels, int64_t threshold) {
  for (auto &[target, state] : states_) {
    RETURN_ON_ERROR(evaluateFillLevel(target, fillLevels, threshold));
  }
  return Void{};
}

Result<TargetState> TargetStateMap::complete(const String &target) {
  auto next = evaluateCompletion(get(target));
  if (UNLIKELY(!next)) {
    return MAKE_ERROR_F(MigrationCode::kStateInconsistent,
                        "{} target {}: {}",
                        toStringView(role_),
                        target,
                        next.error().message());
  }
  states_[target] = *next;
  return *next;
}

std::optional<String> TargetStateMap::firstReady() const {
  for (auto &[target, state] : states_) {
    if (state == TargetState::READY) {
      return target;
    }
  }
  return std::nullopt;
}

std::vector<String> TargetStateMap::targetsIn(TargetState state) const {
  std::vector<String> out;
  for (auto &[target, s] : states_) {
    if (s == state) {
      out.push_back(target);
    }
  }
  return out;
}

}  // namespace ostmig::migration
