#pragma once

#include "common/utils/String.h"

namespace ostmig::logging {
bool init(const String &config);
void initOrDie(const String &config);
}  // namespace ostmig::logging
