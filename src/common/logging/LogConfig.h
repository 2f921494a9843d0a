#pragma once

#include <algorithm>
#include <folly/logging/LogLevel.h>
#include <optional>
#include <utility>
#include <vector>

#include "common/utils/ConfigBase.h"
#include "common/utils/String.h"

namespace ostmig::logging {
struct LogLevel {
  LogLevel() = default;
  LogLevel(folly::LogLevel l)
      : level(l) {}
  LogLevel(std::string_view s) { level = folly::stringToLogLevel(folly::StringPiece(s)); }

  String toString() const { return folly::logLevelToString(level); }
  operator folly::LogLevel() const { return level; }
  bool operator==(const LogLevel &o) const { return level == o.level; }

  folly::LogLevel level = folly::LogLevel::INFO;
};

// "migration.scheduler=DBG" -> {"migration.scheduler", DBG}
std::optional<std::pair<String, LogLevel>> parseCategoryLevel(std::string_view s);

// Every process logs to three handlers: `<app>.log` for everything at or above `level`,
// `<app>.err.log` for ERR and above, and stderr from `stderr_level` on.
struct LogConfig : public ConfigBase<LogConfig> {
  CONFIG_ITEM(level, LogLevel(folly::LogLevel::INFO));
  // empty means the working directory
  CONFIG_ITEM(log_dir, "");
  CONFIG_ITEM(async, true);
  CONFIG_ITEM(stderr_level, LogLevel(folly::LogLevel::FATAL));
  CONFIG_ITEM(category_levels, std::vector<String>(), [](const std::vector<String> &v) {
    return std::all_of(v.begin(), v.end(), [](const String &s) { return parseCategoryLevel(s).has_value(); });
  });
};

String generateLogConfig(const LogConfig &c, const String &appName);
}  // namespace ostmig::logging
