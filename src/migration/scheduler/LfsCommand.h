#pragma once

#include <vector>

#include "common/utils/Result.h"
#include "common/utils/String.h"

namespace ostmig::migration {

// Run `lfs` with `args` and return its stdout. A non-zero exit status is an error carrying `code`.
Result<String> runLfs(const String &lfsPath, const std::vector<String> &args, status_code_t code);

}  // namespace ostmig::migration
