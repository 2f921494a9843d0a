#include <gtest/gtest.h>

#include "migration/scheduler/TaskIssuer.h"
#include "tests/GtestHelpers.h"

namespace ostmig::migration::test {
namespace {

TEST(TestMigrateTask, TaskId) {
  ASSERT_EQ(makeTaskId("3", "7"), "3:7");
  ASSERT_RESULT_EQ((std::pair<String, String>{"3", "7"}), parseTaskId("3:7"));

  for (auto tid : {"", "3", ":", "3:", ":7", "3:7:9", "3-7"}) {
    ASSERT_ERROR(parseTaskId(tid), MigrationCode::kInvalidTaskId) << tid;
  }
}

TEST(TestMigrateTask, Issuers) {
  EmptyTaskIssuer empty;
  auto task = empty.issue("A", "B", "/f1");
  ASSERT_EQ(task->tid(), "A:B");
  ASSERT_EQ(task->source(), "A");
  ASSERT_EQ(task->target(), "B");
  ASSERT_EQ(task->path(), "/f1");
  ASSERT_OK(task->execute());

  LfsMigrateTaskIssuer lfs("/usr/bin/lfs", "/mnt/fs");
  auto real = lfs.issue("1", "2", "dir/f");
  ASSERT_NE(dynamic_cast<LfsMigrateTask *>(real.get()), nullptr);
  ASSERT_EQ(real->tid(), "1:2");
}

TEST(TestMigrateTask, FullPath) {
  ASSERT_EQ(LfsMigrateTask("lfs", "/mnt/fs", "1", "2", "dir/f").fullPath(), "/mnt/fs/dir/f");
  ASSERT_EQ(LfsMigrateTask("lfs", "/mnt/fs", "1", "2", "/mnt/fs/dir/f").fullPath(), "/mnt/fs/dir/f");
  ASSERT_EQ(LfsMigrateTask("lfs", "", "1", "2", "dir/f").fullPath(), "dir/f");
}

TEST(TestMigrateTask, Execute) {
  ASSERT_OK(LfsMigrateTask("/bin/true", "/mnt/fs", "1", "2", "f").execute());
  ASSERT_ERROR(LfsMigrateTask("/bin/false", "/mnt/fs", "1", "2", "f").execute(),
               MigrationCode::kTaskExecutionFailed);
  ASSERT_ERROR(LfsMigrateTask("/nonexistent/lfs", "/mnt/fs", "1", "2", "f").execute(),
               MigrationCode::kTaskExecutionFailed);
}

}  // namespace
}  // namespace ostmig::migration::test
