#include "LogConfig.h"

#include <fmt/format.h>
#include <folly/String.h>
#include <folly/dynamic.h>
#include <folly/json.h>
#include <folly/logging/xlog.h>
#include <stdexcept>

#include "common/utils/Path.h"

namespace ostmig::logging {
namespace {

folly::dynamic fileHandler(const LogConfig &c, const String &fileName, bool async) {
  auto path = c.log_dir().empty() ? Path(fileName) : Path(c.log_dir()) / fileName;
  return folly::dynamic::object("type", "file")(
      "options",
      folly::dynamic::object("path", path.string())("async", async ? "true" : "false"));
}

}  // namespace

std::optional<std::pair<String, LogLevel>> parseCategoryLevel(std::string_view s) {
  folly::StringPiece category, level;
  if (!folly::split('=', folly::StringPiece(s.data(), s.size()), category, level)) {
    return std::nullopt;
  }
  category = folly::trimWhitespace(category);
  level = folly::trimWhitespace(level);
  if (category.empty() || level.empty()) {
    return std::nullopt;
  }
  try {
    return std::make_pair(category.str(), LogLevel(std::string_view(level.data(), level.size())));
  } catch (const std::range_error &) {
    return std::nullopt;
  }
}

String generateLogConfig(const LogConfig &c, const String &appName) {
  auto normal = fileHandler(c, fmt::format("{}.log", appName), c.async());
  auto err = fileHandler(c, fmt::format("{}.err.log", appName), false);
  err["options"]["level"] = LogLevel(folly::LogLevel::ERR).toString();
  folly::dynamic console = folly::dynamic::object("type", "stream")(
      "options",
      folly::dynamic::object("stream", "stderr")("level", c.stderr_level().toString()));

  folly::dynamic categories = folly::dynamic::object(
      ".",
      folly::dynamic::object("level", c.level().toString())("handlers",
                                                             folly::dynamic::array("normal", "err", "fatal")));
  for (auto &entry : c.category_levels()) {
    if (auto parsed = parseCategoryLevel(entry)) {
      categories[parsed->first] = folly::dynamic::object("level", parsed->second.toString());
    }
  }

  folly::dynamic cfg = folly::dynamic::object("categories", std::move(categories))(
      "handlers",
      folly::dynamic::object("normal", std::move(normal))("err", std::move(err))("fatal", std::move(console)));

  std::string json;
  try {
    folly::json::serialization_opts opts;
    opts.pretty_formatting = false;
    json = folly::json::serialize(cfg, opts);
  } catch (folly::json::print_error &e) {
    XLOGF(FATAL, "Failed to generate log config, error {}", e.what());
  }
  return json;
}

}  // namespace ostmig::logging
