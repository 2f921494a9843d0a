#pragma once

#include <memory>
#include <string_view>
#include <utility>

#include "common/utils/Result.h"
#include "common/utils/String.h"

namespace ostmig::migration {

// "<source>:<target>", the only thing reported back when a task finishes.
String makeTaskId(std::string_view source, std::string_view target);
Result<std::pair<String, String>> parseTaskId(std::string_view tid);

class MigrateTask {
 public:
  MigrateTask(String source, String target, String path)
      : source_(std::move(source)),
        target_(std::move(target)),
        path_(std::move(path)),
        tid_(makeTaskId(source_, target_)) {}
  virtual ~MigrateTask() = default;

  const String &source() const { return source_; }
  const String &target() const { return target_; }
  const String &path() const { return path_; }
  const String &tid() const { return tid_; }

  virtual Result<Void> execute() = 0;

 private:
  String source_;
  String target_;
  String path_;
  String tid_;
};

// Moves the file with `lfs migrate -o <target> <path>`.
class LfsMigrateTask : public MigrateTask {
 public:
  LfsMigrateTask(String lfsPath, String fsPath, String source, String target, String path)
      : MigrateTask(std::move(source), std::move(target), std::move(path)),
        lfsPath_(std::move(lfsPath)),
        fsPath_(std::move(fsPath)) {}

  Result<Void> execute() override;

  // `path` as passed to lfs: relative paths are resolved against the filesystem mount.
  String fullPath() const;

 private:
  String lfsPath_;
  String fsPath_;
};

// Does nothing, used when running without a filesystem.
class EmptyMigrateTask : public MigrateTask {
 public:
  using MigrateTask::MigrateTask;

  Result<Void> execute() override { return Void{}; }
};

using MigrateTaskPtr = std::unique_ptr<MigrateTask>;

}  // namespace ostmig::migration
