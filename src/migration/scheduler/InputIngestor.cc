#include "migration/scheduler/InputIngestor.h"

#include <boost/algorithm/string/classification.hpp>
#include <boost/filesystem.hpp>
#include <fmt/format.h>
#include <folly/String.h>
#include <folly/logging/xlog.h>

#include "common/utils/FileUtils.h"
#include "common/utils/StringUtils.h"

namespace ostmig::migration {

Result<MigrateItem> InputIngestor::parseLine(std::string_view line) {
  auto stripped = folly::trimWhitespace(folly::StringPiece(line.data(), line.size()));
  if (stripped.find(kFieldSeparator) != folly::StringPiece::npos) {
    return MAKE_ERROR_F(MigrationCode::kMalformedInputLine, "field separator '{}' in line", kFieldSeparator);
  }
  auto tokens = splitAndTransform(std::string_view(stripped.data(), stripped.size()),
                                  boost::is_space(),
                                  [](std::string_view s) { return String(s); });
  if (tokens.size() != 2) {
    return MAKE_ERROR_F(MigrationCode::kMalformedInputLine, "expect 2 fields, got {}", tokens.size());
  }
  return MigrateItem{std::move(tokens[0]), std::move(tokens[1])};
}

Result<IngestStats> InputIngestor::loadFile(const Path &file, MigrateItemCache &cache) const {
  auto content = ostmig::loadFile(file);
  RETURN_ON_ERROR(content);

  std::vector<folly::StringPiece> lines;
  folly::split('\n', *content, lines);
  // "a\nb\n" has two lines, not three
  if (!lines.empty() && lines.back().empty()) {
    lines.pop_back();
  }

  IngestStats stats;
  for (auto line : lines) {
    auto item = parseLine(std::string_view(line.data(), line.size()));
    if (!item) {
      XLOGF(WARN, "Skipped line in {}: {} ({})", file, line.str(), item.error().message());
      ++stats.skipped;
      continue;
    }
    XLOGF(DBG, "Load item {} from OST {}", item->path, item->source);
    cache.add(std::move(*item));
    ++stats.loaded;
  }
  XLOGF(INFO, "Loaded input file: {} - Loaded: {} - Skipped: {}", file, stats.loaded, stats.skipped);
  return stats;
}

Path InputIngestor::doneNameFor(const Path &file) {
  auto done = file;
  done += String(kDoneSuffix);
  // a reused batch name never replaces an older done file
  for (size_t n = 1; boost::filesystem::exists(done); ++n) {
    XLOGF_IF(WARN, n == 1, "{} already exists, keep it", done);
    done = file;
    done += fmt::format("{}.{}", kDoneSuffix, n);
  }
  return done;
}

Result<IngestStats> InputIngestor::ingest(MigrateItemCache &cache) const {
  auto files = listFiles(inputDir_, kInputSuffix);
  RETURN_ON_ERROR(files);

  IngestStats total;
  for (auto &file : *files) {
    auto done = doneNameFor(file);
    auto stats = loadFile(file, cache);
    RETURN_ON_ERROR(stats);
    RETURN_ON_ERROR(renameFile(file, done));
    total += *stats;
    ++total.files;
  }
  XLOGF(INFO, "Count of processed input files: {}", total.files);
  return total;
}

}  // namespace ostmig::migration
