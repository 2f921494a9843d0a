#pragma once

#include <string_view>

#include "common/utils/Path.h"
#include "migration/scheduler/MigrateItemCache.h"

namespace ostmig::migration {

struct IngestStats {
  size_t files = 0;
  size_t loaded = 0;
  size_t skipped = 0;

  IngestStats &operator+=(const IngestStats &o) {
    files += o.files;
    loaded += o.loaded;
    skipped += o.skipped;
    return *this;
  }
};

// Merges `*.input` files of the intake directory into the item cache. Each line is
// "<target> <path>". A merged file is renamed to `*.input.done` (or `*.input.done.<n>` when that
// name is taken) and never read again.
class InputIngestor {
 public:
  static constexpr std::string_view kInputSuffix = ".input";
  static constexpr std::string_view kDoneSuffix = ".done";
  // Reserved by the task wire format, never valid inside an intake line.
  static constexpr char kFieldSeparator = ';';

  explicit InputIngestor(Path inputDir)
      : inputDir_(std::move(inputDir)) {}

  const Path &inputDir() const { return inputDir_; }

  static Result<MigrateItem> parseLine(std::string_view line);

  // Merge one file, without renaming it.
  Result<IngestStats> loadFile(const Path &file, MigrateItemCache &cache) const;

  // Merge and rename every pending file, in file name order.
  Result<IngestStats> ingest(MigrateItemCache &cache) const;

  // `<file>.done`, or `<file>.done.<n>` with the first free n when that name is taken.
  static Path doneNameFor(const Path &file);

 private:
  Path inputDir_;
};

}  // namespace ostmig::migration
