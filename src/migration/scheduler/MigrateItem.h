#pragma once

#include "common/utils/String.h"

namespace ostmig::migration {

// One file waiting to be moved off `source`.
struct MigrateItem {
  String source;
  String path;

  bool operator==(const MigrateItem &) const = default;
};

}  // namespace ostmig::migration
