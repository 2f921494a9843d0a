#pragma once

#include <string_view>

#include "migration/scheduler/FillLevelSampler.h"

namespace ostmig::migration {

// Fill levels from `lfs df <fs_path>`.
class LfsFillLevelSampler : public IFillLevelSampler {
 public:
  LfsFillLevelSampler(String lfsPath, String fsPath)
      : lfsPath_(std::move(lfsPath)),
        fsPath_(std::move(fsPath)) {}

  Result<FillLevelMap> sample() override;

  // Parse `lfs df` output. OST rows look like
  //   fs-OST0003_UUID  1031992  600000  431992  60% /mnt/fs[OST:3]
  // and are keyed by the decimal index in the trailing "[OST:n]". MDT and summary rows are skipped.
  static Result<FillLevelMap> parse(std::string_view output);

 private:
  String lfsPath_;
  String fsPath_;
};

}  // namespace ostmig::migration
