#include "migration/scheduler/TaskIssuer.h"

namespace ostmig::migration {

MigrateTaskPtr LfsMigrateTaskIssuer::issue(const String &source, const String &target, const String &path) {
  return std::make_unique<LfsMigrateTask>(lfsPath_, fsPath_, source, target, path);
}

MigrateTaskPtr EmptyTaskIssuer::issue(const String &source, const String &target, const String &path) {
  return std::make_unique<EmptyMigrateTask>(source, target, path);
}

}  // namespace ostmig::migration
