#include <gtest/gtest.h>

#include "migration/scheduler/CompletionReconciler.h"
#include "migration/scheduler/PairingEngine.h"
#include "tests/GtestHelpers.h"

namespace ostmig::migration::test {
namespace {

class TestCompletionReconciler : public ::testing::Test {
 protected:
  void SetUp() override {
    state_.fillLevels = {{"A", 60}, {"B", 40}};
    ASSERT_OK(state_.initDestinationStates({"B"}));
    state_.cache.add({"A", "/f1"});
    state_.cache.add({"A", "/f2"});
    ASSERT_OK(state_.allocateSourceCaches());
    ASSERT_EQ(engine_.runPass(state_), 1u);
    auto task = taskQueue_.tryPop();
    ASSERT_TRUE(task.has_value());
    tid_ = (*task)->tid();
  }

  SchedulerState state_{50};
  EmptyTaskIssuer issuer_;
  TaskQueue taskQueue_;
  CompletionQueue completionQueue_;
  PairingEngine engine_{issuer_, taskQueue_};
  CompletionReconciler reconciler_{completionQueue_};
  String tid_;
};

TEST_F(TestCompletionReconciler, ReleasesBothTargets) {
  ASSERT_EQ(tid_, "A:B");
  completionQueue_.push(tid_);
  ASSERT_RESULT_EQ(1u, reconciler_.drain(state_));
  ASSERT_EQ(state_.sourceStates.get("A"), TargetState::READY);
  ASSERT_EQ(state_.destinationStates.get("B"), TargetState::READY);
  ASSERT_TRUE(completionQueue_.empty());

  // the remaining item can be paired again
  ASSERT_EQ(engine_.runPass(state_), 1u);
  ASSERT_EQ(state_.cache.size("A"), 0u);
}

TEST_F(TestCompletionReconciler, PendingLockBecomesLocked) {
  ASSERT_OK(state_.updateFillLevels({{"A", 60}, {"B", 70}}));
  ASSERT_EQ(state_.sourceStates.get("A"), TargetState::BLOCKED);
  ASSERT_EQ(state_.destinationStates.get("B"), TargetState::PENDING_LOCK);

  // a PENDING_LOCK target ignores fill level changes while the task runs
  ASSERT_OK(state_.updateFillLevels({{"A", 60}, {"B", 10}}));
  ASSERT_EQ(state_.destinationStates.get("B"), TargetState::PENDING_LOCK);

  ASSERT_OK(CompletionReconciler::apply(state_, tid_));
  ASSERT_EQ(state_.sourceStates.get("A"), TargetState::READY);
  ASSERT_EQ(state_.destinationStates.get("B"), TargetState::LOCKED);
  ASSERT_EQ(engine_.runPass(state_), 0u);

  // the next fill level update makes it usable again
  ASSERT_OK(state_.updateFillLevels({{"A", 60}, {"B", 10}}));
  ASSERT_EQ(state_.destinationStates.get("B"), TargetState::READY);
  ASSERT_EQ(engine_.runPass(state_), 1u);
}

TEST_F(TestCompletionReconciler, InvalidTaskId) {
  ASSERT_ERROR(CompletionReconciler::apply(state_, "AB"), MigrationCode::kInvalidTaskId);
  ASSERT_ERROR(CompletionReconciler::apply(state_, "A:"), MigrationCode::kInvalidTaskId);
  ASSERT_ERROR(CompletionReconciler::apply(state_, "A:B:C"), MigrationCode::kInvalidTaskId);
  ASSERT_EQ(state_.sourceStates.get("A"), TargetState::BLOCKED);
  ASSERT_EQ(state_.destinationStates.get("B"), TargetState::BLOCKED);
}

TEST_F(TestCompletionReconciler, InconsistentState) {
  ASSERT_OK(CompletionReconciler::apply(state_, tid_));
  // second completion for the same pairing
  ASSERT_ERROR(CompletionReconciler::apply(state_, tid_), MigrationCode::kStateInconsistent);
  // targets that were never paired
  ASSERT_ERROR(CompletionReconciler::apply(state_, "X:Y"), MigrationCode::kStateInconsistent);
}

TEST_F(TestCompletionReconciler, DrainStopsAtFirstError) {
  completionQueue_.push(String("bogus"));
  completionQueue_.push(tid_);
  ASSERT_ERROR(reconciler_.drain(state_), MigrationCode::kInvalidTaskId);
  ASSERT_EQ(completionQueue_.size(), 1u);
}

}  // namespace
}  // namespace ostmig::migration::test
