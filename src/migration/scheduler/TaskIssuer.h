#pragma once

#include "migration/scheduler/MigrateTask.h"

namespace ostmig::migration {

// Builds the task for one pairing. Chosen once at startup, real or empty.
class ITaskIssuer {
 public:
  virtual ~ITaskIssuer() = default;
  virtual MigrateTaskPtr issue(const String &source, const String &target, const String &path) = 0;
};

class LfsMigrateTaskIssuer : public ITaskIssuer {
 public:
  LfsMigrateTaskIssuer(String lfsPath, String fsPath)
      : lfsPath_(std::move(lfsPath)),
        fsPath_(std::move(fsPath)) {}

  MigrateTaskPtr issue(const String &source, const String &target, const String &path) override;

 private:
  String lfsPath_;
  String fsPath_;
};

class EmptyTaskIssuer : public ITaskIssuer {
 public:
  MigrateTaskPtr issue(const String &source, const String &target, const String &path) override;
};

}  // namespace ostmig::migration
