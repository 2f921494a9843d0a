#include "migration/scheduler/MigrateItemCache.h"

#include <folly/logging/xlog.h>
#include <numeric>

namespace ostmig::migration {

void MigrateItemCache::add(MigrateItem item) {
  auto &items = entries_[item.source];
  items.push_back(std::move(item));
}

std::optional<MigrateItem> MigrateItemCache::pop(const String &source) {
  auto it = entries_.find(source);
  if (it == entries_.end() || it->second.empty()) {
    return std::nullopt;
  }
  auto item = std::move(it->second.back());
  it->second.pop_back();
  return item;
}

const MigrateItemCache::Items *MigrateItemCache::find(const String &source) const {
  auto it = entries_.find(source);
  return it == entries_.end() ? nullptr : &it->second;
}

size_t MigrateItemCache::size(const String &source) const {
  auto *items = find(source);
  return items ? items->size() : 0;
}

size_t MigrateItemCache::totalSize() const {
  return std::accumulate(entries_.begin(), entries_.end(), size_t{0}, [](size_t sum, const auto &entry) {
    return sum + entry.second.size();
  });
}

std::vector<String> MigrateItemCache::prune(TargetStateMap &sourceStates) {
  std::vector<String> pruned;
  for (auto it = entries_.begin(); it != entries_.end();) {
    auto state = sourceStates.get(it->first);
    bool idle = !state || *state == TargetState::READY || *state == TargetState::LOCKED;
    if (it->second.empty() && idle) {
      XLOGF(DBG, "Prune drained cache of source {}", it->first);
      sourceStates.erase(it->first);
      pruned.push_back(it->first);
      it = entries_.erase(it);
    } else {
      ++it;
    }
  }
  return pruned;
}

}  // namespace ostmig::migration
