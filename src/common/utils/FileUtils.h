#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "common/utils/Path.h"
#include "common/utils/Result.h"

namespace ostmig {
Result<std::string> loadFile(const Path &path);

Result<Void> storeToFile(const Path &path, const std::string &content);

// Regular files directly under `dir` whose name ends with `suffix`, sorted by file name.
Result<std::vector<Path>> listFiles(const Path &dir, std::string_view suffix);

// Rename in place. Fails if `to` already exists.
Result<Void> renameFile(const Path &from, const Path &to);

}  // namespace ostmig
