#pragma once

#include <map>
#include <optional>
#include <vector>

#include "migration/scheduler/MigrateItem.h"
#include "migration/scheduler/TargetStateMap.h"

namespace ostmig::migration {

// Pending items grouped by source target. Items of one source are popped last-in first-out.
class MigrateItemCache {
 public:
  using Items = std::vector<MigrateItem>;

  void add(MigrateItem item);

  // Remove and return the most recently added item of `source`.
  std::optional<MigrateItem> pop(const String &source);

  const Items *find(const String &source) const;
  size_t size(const String &source) const;
  size_t totalSize() const;

  bool empty() const { return entries_.empty(); }
  size_t numSources() const { return entries_.size(); }
  const std::map<String, Items> &entries() const { return entries_; }

  // Drop drained entries whose source has no task in flight (READY, LOCKED or no state at all),
  // together with their source state. Returns the pruned sources.
  std::vector<String> prune(TargetStateMap &sourceStates);

 private:
  std::map<String, Items> entries_;
};

}  // namespace ostmig::migration
