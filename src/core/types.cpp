/**
 * @file types.cpp
 * @brief State machine enforcement and enum wire names
 * @date 2025
 */

#include "overseer/core/types.hpp"

#include <fmt/format.h>

namespace overseer {
namespace core {

// ============================================================================
// ENUM CONVERSIONS
// ============================================================================

std::string TaskStatusToString(TaskStatus status) {
    switch (status) {
        case TaskStatus::PENDING: return "pending";
        case TaskStatus::CLAIMED: return "claimed";
        case TaskStatus::RUNNING: return "running";
        case TaskStatus::REVIEW:  return "review";
        case TaskStatus::APPLIED: return "applied";
    }
    return "unknown";
}

std::optional<TaskStatus> TaskStatusFromString(const std::string& value) {
    if (value == "pending") return TaskStatus::PENDING;
    if (value == "claimed") return TaskStatus::CLAIMED;
    if (value == "running") return TaskStatus::RUNNING;
    if (value == "review")  return TaskStatus::REVIEW;
    if (value == "applied") return TaskStatus::APPLIED;
    return std::nullopt;
}

std::string AttemptStatusToString(AttemptStatus status) {
    switch (status) {
        case AttemptStatus::QUEUED:    return "queued";
        case AttemptStatus::RUNNING:   return "running";
        case AttemptStatus::SUCCEEDED: return "succeeded";
        case AttemptStatus::FAILED:    return "failed";
    }
    return "unknown";
}

std::optional<AttemptStatus> AttemptStatusFromString(const std::string& value) {
    if (value == "queued")    return AttemptStatus::QUEUED;
    if (value == "running")   return AttemptStatus::RUNNING;
    if (value == "succeeded") return AttemptStatus::SUCCEEDED;
    if (value == "failed")    return AttemptStatus::FAILED;
    return std::nullopt;
}

std::string FailureReasonToString(FailureReason reason) {
    switch (reason) {
        case FailureReason::TIMEOUT:                return "timeout";
        case FailureReason::CANCELLED:              return "cancelled";
        case FailureReason::WORKLOAD_FAILED:        return "workload_failed";
        case FailureReason::WORKLOAD_CRASHED:       return "workload_crashed";
        case FailureReason::SETUP_FAILED:           return "setup_failed";
        case FailureReason::CACHE_UNAVAILABLE:      return "cache_unavailable";
        case FailureReason::SANDBOX_UNAVAILABLE:    return "sandbox_unavailable";
        case FailureReason::ARTIFACT_UPLOAD_FAILED: return "artifact_upload_failed";
        case FailureReason::INTERNAL_ERROR:         return "internal_error";
    }
    return "internal_error";
}

std::optional<FailureReason> FailureReasonFromString(const std::string& value) {
    static const FailureReason all[] = {
        FailureReason::TIMEOUT, FailureReason::CANCELLED,
        FailureReason::WORKLOAD_FAILED, FailureReason::WORKLOAD_CRASHED,
        FailureReason::SETUP_FAILED, FailureReason::CACHE_UNAVAILABLE,
        FailureReason::SANDBOX_UNAVAILABLE, FailureReason::ARTIFACT_UPLOAD_FAILED,
        FailureReason::INTERNAL_ERROR
    };
    for (auto reason : all) {
        if (FailureReasonToString(reason) == value) {
            return reason;
        }
    }
    return std::nullopt;
}

// ============================================================================
// TASK RECORD
// ============================================================================

TaskRecord::TaskRecord(std::string id, TaskStatus status)
    : id_(std::move(id))
    , status_(status)
    , created_at_(std::chrono::system_clock::now())
    , updated_at_(created_at_) {
}

void TaskRecord::Transition(TaskStatus next) {
    if (next == TaskStatus::APPLIED) {
        throw StateTransitionError(fmt::format(
            "task {}: applied is reached only externally", id_));
    }
    if (static_cast<int>(next) <= static_cast<int>(status_)) {
        throw StateTransitionError(fmt::format(
            "task {}: cannot move from {} to {}", id_,
            TaskStatusToString(status_), TaskStatusToString(next)));
    }
    status_ = next;
    updated_at_ = std::chrono::system_clock::now();
}

bool TaskRecord::AdvanceTo(TaskStatus next) {
    if (next == TaskStatus::APPLIED ||
        static_cast<int>(next) <= static_cast<int>(status_)) {
        return false;
    }
    Transition(next);
    return true;
}

// ============================================================================
// ATTEMPT RECORD
// ============================================================================

AttemptRecord::AttemptRecord(std::string id, std::string task_id)
    : id_(std::move(id))
    , task_id_(std::move(task_id))
    , created_at_(std::chrono::system_clock::now())
    , updated_at_(created_at_) {
}

void AttemptRecord::MarkRunning() {
    if (status_ != AttemptStatus::QUEUED) {
        RejectTransition(AttemptStatus::RUNNING);
    }
    status_ = AttemptStatus::RUNNING;
    updated_at_ = std::chrono::system_clock::now();
}

void AttemptRecord::MarkSucceeded() {
    if (status_ != AttemptStatus::RUNNING) {
        RejectTransition(AttemptStatus::SUCCEEDED);
    }
    status_ = AttemptStatus::SUCCEEDED;
    updated_at_ = std::chrono::system_clock::now();
}

void AttemptRecord::MarkFailed(FailureReason reason) {
    if (IsTerminal(status_)) {
        RejectTransition(AttemptStatus::FAILED);
    }
    status_ = AttemptStatus::FAILED;
    reason_ = reason;
    updated_at_ = std::chrono::system_clock::now();
}

void AttemptRecord::RejectTransition(AttemptStatus next) const {
    throw StateTransitionError(fmt::format(
        "attempt {}: cannot move from {} to {}", id_,
        AttemptStatusToString(status_), AttemptStatusToString(next)));
}

// ============================================================================
// ATTEMPT OUTCOME
// ============================================================================

AttemptOutcome AttemptOutcome::Failure(FailureReason reason, std::string detail, bool tainted) {
    AttemptOutcome outcome;
    outcome.status = AttemptStatus::FAILED;
    outcome.reason = reason;
    outcome.detail = std::move(detail);
    outcome.tainted = tainted;
    return outcome;
}

} // namespace core
} // namespace overseer
