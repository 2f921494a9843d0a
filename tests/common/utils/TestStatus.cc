#include <gtest/gtest.h>
#include <string>

#include "common/utils/Result.h"
#include "common/utils/Status.h"

namespace ostmig::tests {
namespace {
TEST(Status, testCtor) {
  Status s1(StatusCode::kInvalidArg);
  ASSERT_EQ(s1.code(), StatusCode::kInvalidArg);
  ASSERT_TRUE(s1.message().empty());
  ASSERT_FALSE(s1);

  Status s2(StatusCode::kIOError, "test");
  ASSERT_EQ(s2.code(), StatusCode::kIOError);
  ASSERT_EQ(s2.message(), "test");
  ASSERT_EQ(fmt::format("{}", s2), "IOError(4) test");

  Status ok(Status::OK);
  ASSERT_TRUE(ok.isOK());
  ASSERT_TRUE(ok);
}

TEST(Status, testCopy) {
  Status s2(MigrationCode::kUnknownTarget, "OST 7");
  Status s3 = s2;
  ASSERT_EQ(s2.code(), MigrationCode::kUnknownTarget);
  ASSERT_EQ(s2.message(), "OST 7");
  ASSERT_EQ(s3.code(), MigrationCode::kUnknownTarget);
  ASSERT_EQ(s3.message(), "OST 7");

  auto *ps3 = &s3;
  s3 = *ps3;
  ASSERT_EQ(s3.message(), "OST 7");

  Status s4(0);
  s4 = s3;
  ASSERT_EQ(s3.message(), "OST 7");
  ASSERT_EQ(s4.code(), MigrationCode::kUnknownTarget);
  ASSERT_EQ(s4.message(), "OST 7");
}

TEST(Status, testMove) {
  Status s2(StatusCode::kInvalidArg, "test");
  Status s3 = std::move(s2);
  ASSERT_EQ(s3.code(), StatusCode::kInvalidArg);
  ASSERT_EQ(s3.message(), "test");

  Status s4(0);
  s4 = std::move(s3);
  ASSERT_EQ(s4.code(), StatusCode::kInvalidArg);
  ASSERT_EQ(s4.message(), "test");
}

TEST(Status, testCodeNames) {
  ASSERT_EQ(StatusCode::toString(StatusCode::kOK), "OK");
  ASSERT_EQ(StatusCode::toString(MigrationCode::kStateInconsistent), "Migration::StateInconsistent");
  ASSERT_EQ(StatusCode::toString(-1), "UnknownStatusCode");
  // only codes the service reports are defined
  ASSERT_EQ(StatusCode::toString(1), "UnknownStatusCode");
  ASSERT_EQ(StatusCode::toString(3), "UnknownStatusCode");
  ASSERT_EQ(StatusCode::toString(5), "UnknownStatusCode");
  ASSERT_EQ(StatusCode::typeOf(StatusCode::kConfigParseError), StatusCodeType::Common);
  ASSERT_EQ(StatusCode::typeOf(MigrationCode::kInvalidTaskId), StatusCodeType::Migration);
}

Result<int> half(int v) {
  if (v % 2) {
    return makeError(StatusCode::kInvalidArg, "odd");
  }
  return v / 2;
}

Result<int> quarter(int v) {
  auto h = half(v);
  RETURN_ON_ERROR(h);
  return half(*h);
}

TEST(Status, testReturnOnError) {
  ASSERT_EQ(*quarter(8), 2);
  auto r = quarter(6);
  ASSERT_TRUE(r.hasError());
  ASSERT_EQ(r.error().code(), StatusCode::kInvalidArg);
  ASSERT_EQ(getStatusCode(r), StatusCode::kInvalidArg);
  ASSERT_EQ(getStatusCode(quarter(4)), StatusCode::kOK);
}
}  // namespace
}  // namespace ostmig::tests
