#pragma once

#include <map>
#include <optional>
#include <vector>

#include "common/utils/String.h"
#include "migration/scheduler/TargetState.h"

namespace ostmig::migration {

using FillLevelMap = std::map<String, int64_t>;

// States of all targets evaluated so far in one role. Iteration follows target id order, which is
// also the order destinations are tried in when pairing.
class TargetStateMap {
 public:
  explicit TargetStateMap(TargetRole role)
      : role_(role) {}

  TargetRole role() const { return role_; }

  std::optional<TargetState> get(const String &target) const;
  bool contains(const String &target) const { return states_.count(target) != 0; }

  void set(const String &target, TargetState state) { states_[target] = state; }
  void erase(const String &target) { states_.erase(target); }

  // Re-evaluate `target` against the current fill levels, creating the entry if needed.
  // Fails with kUnknownTarget if the sample has no value for it.
  Result<TargetState> evaluateFillLevel(const String &target, const FillLevelMap &fillLevels, int64_t threshold);

  // Re-evaluate every tracked target.
  Result<Void> refresh(const FillLevelMap &fillLevels, int64_t threshold);

  Result<TargetState> complete(const String &target);

  // First target in READY state, if any.
  std::optional<String> firstReady() const;

  std::vector<String> targetsIn(TargetState state) const;

  size_t size() const { return states_.size(); }
  bool empty() const { return states_.empty(); }
  const std::map<String, TargetState> &states() const { return states_; }

 private:
  TargetRole role_;
  std::map<String, TargetState> states_;
};

}  // namespace ostmig::migration
