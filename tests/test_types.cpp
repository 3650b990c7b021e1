/**
 * @file test_types.cpp
 * @brief Task and attempt state machines, wire names
 * @date 2025
 */

#include "overseer/core/types.hpp"

#include <gtest/gtest.h>

using namespace overseer::core;

TEST(TaskRecordTest, MovesForwardOnly) {
    TaskRecord task("t1");
    EXPECT_EQ(task.Status(), TaskStatus::PENDING);

    task.Transition(TaskStatus::CLAIMED);
    task.Transition(TaskStatus::RUNNING);
    task.Transition(TaskStatus::REVIEW);
    EXPECT_EQ(task.Status(), TaskStatus::REVIEW);

    EXPECT_THROW(task.Transition(TaskStatus::RUNNING), StateTransitionError);
    EXPECT_THROW(task.Transition(TaskStatus::REVIEW), StateTransitionError);
    EXPECT_GE(task.UpdatedAt(), task.CreatedAt());
}

TEST(TaskRecordTest, AppliedIsNeverSetLocally) {
    TaskRecord task("t1", TaskStatus::REVIEW);
    EXPECT_THROW(task.Transition(TaskStatus::APPLIED), StateTransitionError);
    EXPECT_FALSE(task.AdvanceTo(TaskStatus::APPLIED));
    EXPECT_EQ(task.Status(), TaskStatus::REVIEW);
}

TEST(TaskRecordTest, AdvanceToSkipsIntermediateStatesAndIgnoresBackwardMoves) {
    TaskRecord task("t1");
    EXPECT_TRUE(task.AdvanceTo(TaskStatus::REVIEW));
    EXPECT_FALSE(task.AdvanceTo(TaskStatus::RUNNING));
    EXPECT_FALSE(task.AdvanceTo(TaskStatus::REVIEW));
    EXPECT_EQ(task.Status(), TaskStatus::REVIEW);
}

TEST(AttemptRecordTest, SuccessPath) {
    AttemptRecord attempt("a1", "t1");
    EXPECT_EQ(attempt.Status(), AttemptStatus::QUEUED);
    attempt.MarkRunning();
    attempt.MarkSucceeded();
    EXPECT_EQ(attempt.Status(), AttemptStatus::SUCCEEDED);
    EXPECT_FALSE(attempt.Reason().has_value());
    EXPECT_TRUE(IsTerminal(attempt.Status()));
}

TEST(AttemptRecordTest, SucceededRequiresRunning) {
    AttemptRecord attempt("a1", "t1");
    EXPECT_THROW(attempt.MarkSucceeded(), StateTransitionError);
    EXPECT_EQ(attempt.Status(), AttemptStatus::QUEUED);
}

TEST(AttemptRecordTest, FailsFromQueuedOrRunning) {
    AttemptRecord queued("a1", "t1");
    queued.MarkFailed(FailureReason::SANDBOX_UNAVAILABLE);
    EXPECT_EQ(queued.Status(), AttemptStatus::FAILED);
    EXPECT_EQ(queued.Reason(), FailureReason::SANDBOX_UNAVAILABLE);

    AttemptRecord running("a2", "t1");
    running.MarkRunning();
    running.MarkFailed(FailureReason::TIMEOUT);
    EXPECT_EQ(running.Reason(), FailureReason::TIMEOUT);
}

TEST(AttemptRecordTest, TerminalStatesAreFinal) {
    AttemptRecord attempt("a1", "t1");
    attempt.MarkRunning();
    attempt.MarkFailed(FailureReason::WORKLOAD_FAILED);

    EXPECT_THROW(attempt.MarkFailed(FailureReason::TIMEOUT), StateTransitionError);
    EXPECT_THROW(attempt.MarkSucceeded(), StateTransitionError);
    EXPECT_THROW(attempt.MarkRunning(), StateTransitionError);
    EXPECT_EQ(attempt.Reason(), FailureReason::WORKLOAD_FAILED);
}

TEST(WireNamesTest, FailureReasons) {
    EXPECT_EQ(FailureReasonToString(FailureReason::ARTIFACT_UPLOAD_FAILED), "artifact_upload_failed");
    EXPECT_EQ(FailureReasonToString(FailureReason::SANDBOX_UNAVAILABLE), "sandbox_unavailable");
    EXPECT_EQ(FailureReasonToString(FailureReason::WORKLOAD_CRASHED), "workload_crashed");
    EXPECT_EQ(FailureReasonFromString("cache_unavailable"), FailureReason::CACHE_UNAVAILABLE);
    EXPECT_EQ(FailureReasonFromString("timeout"), FailureReason::TIMEOUT);
    EXPECT_FALSE(FailureReasonFromString("bogus").has_value());
}

TEST(WireNamesTest, Statuses) {
    EXPECT_EQ(TaskStatusToString(TaskStatus::REVIEW), "review");
    EXPECT_EQ(TaskStatusFromString("pending"), TaskStatus::PENDING);
    EXPECT_EQ(AttemptStatusToString(AttemptStatus::SUCCEEDED), "succeeded");
    EXPECT_EQ(AttemptStatusFromString("failed"), AttemptStatus::FAILED);
    EXPECT_FALSE(AttemptStatusFromString("done").has_value());
}

TEST(AttemptOutcomeTest, FailureFactory) {
    auto outcome = AttemptOutcome::Failure(FailureReason::WORKLOAD_CRASHED, "signal 9", true);
    EXPECT_FALSE(outcome.Succeeded());
    EXPECT_EQ(outcome.reason, FailureReason::WORKLOAD_CRASHED);
    EXPECT_EQ(outcome.detail, "signal 9");
    EXPECT_TRUE(outcome.tainted);
}
