#include "migration/scheduler/LfsFillLevelSampler.h"

#include <folly/Conv.h>
#include <folly/String.h>
#include <folly/logging/xlog.h>

#include "migration/scheduler/LfsCommand.h"

namespace ostmig::migration {
namespace {
constexpr folly::StringPiece kOstTag = "[OST:";

std::optional<String> ostIndex(folly::StringPiece mount) {
  auto pos = mount.find(kOstTag);
  if (pos == folly::StringPiece::npos || !mount.endsWith(']')) {
    return std::nullopt;
  }
  auto index = mount.subpiece(pos + kOstTag.size(), mount.size() - pos - kOstTag.size() - 1);
  auto value = folly::tryTo<uint32_t>(index);
  if (!value) {
    return std::nullopt;
  }
  return folly::to<String>(*value);
}
}  // namespace

Result<FillLevelMap> LfsFillLevelSampler::sample() {
  auto output = runLfs(lfsPath_, {"df", fsPath_}, MigrationCode::kFillLevelQueryFailed);
  RETURN_ON_ERROR(output);
  return parse(*output);
}

Result<FillLevelMap> LfsFillLevelSampler::parse(std::string_view output) {
  FillLevelMap fillLevels;
  std::vector<folly::StringPiece> lines;
  folly::split('\n', folly::StringPiece(output.data(), output.size()), lines, true);
  for (auto line : lines) {
    std::vector<folly::StringPiece> fields;
    folly::split(' ', folly::trimWhitespace(line), fields, true);
    if (fields.size() < 6) {
      continue;
    }
    auto index = ostIndex(fields[5]);
    if (!index) {
      continue;
    }
    auto use = fields[4];
    if (!use.endsWith('%')) {
      return MAKE_ERROR_F(MigrationCode::kFillLevelQueryFailed, "invalid use% column in line: {}", line.str());
    }
    auto percent = folly::tryTo<int64_t>(use.subpiece(0, use.size() - 1));
    if (!percent) {
      return MAKE_ERROR_F(MigrationCode::kFillLevelQueryFailed, "invalid use% column in line: {}", line.str());
    }
    fillLevels[*index] = *percent;
  }
  if (fillLevels.empty()) {
    return makeError(MigrationCode::kFillLevelQueryFailed, "no OST found in lfs df output");
  }
  return fillLevels;
}

}  // namespace ostmig::migration
