#include "migration/scheduler/MigrateTask.h"

#include <fmt/format.h>
#include <folly/logging/xlog.h>

#include "common/utils/Path.h"
#include "migration/scheduler/LfsCommand.h"

namespace ostmig::migration {

String makeTaskId(std::string_view source, std::string_view target) { return fmt::format("{}:{}", source, target); }

Result<std::pair<String, String>> parseTaskId(std::string_view tid) {
  auto pos = tid.find(':');
  if (pos == std::string_view::npos || tid.find(':', pos + 1) != std::string_view::npos) {
    return MAKE_ERROR_F(MigrationCode::kInvalidTaskId, "invalid task id {}", tid);
  }
  auto source = tid.substr(0, pos);
  auto target = tid.substr(pos + 1);
  if (source.empty() || target.empty()) {
    return MAKE_ERROR_F(MigrationCode::kInvalidTaskId, "invalid task id {}", tid);
  }
  return std::make_pair(String(source), String(target));
}

String LfsMigrateTask::fullPath() const {
  Path p(path());
  if (p.is_absolute() || fsPath_.empty()) {
    return p.string();
  }
  return (Path(fsPath_) / p).string();
}

Result<Void> LfsMigrateTask::execute() {
  auto file = fullPath();
  XLOGF(DBG, "Migrate {} from OST {} to OST {}", file, source(), target());
  auto res = runLfs(lfsPath_, {"migrate", "-o", target(), file}, MigrationCode::kTaskExecutionFailed);
  RETURN_ON_ERROR(res);
  return Void{};
}

}  // namespace ostmig::migration
