/**
 * @file types.hpp
 * @brief Task / Attempt data model and the local state machine
 * 
 * The control plane owns the authoritative copy of tasks and attempts; the
 * records here are the supervisor's local view. TaskRecord and AttemptRecord
 * enforce the allowed transitions and throw StateTransitionError on anything
 * else, so no attempt leaves a terminal state and no task moves backwards.
 * 
 * **State Machine**:
 * ```
 * Task:    PENDING -> CLAIMED -> RUNNING -> REVIEW (-> APPLIED, external)
 * Attempt: QUEUED -> RUNNING -> SUCCEEDED | FAILED
 * ```
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <stdexcept>
#include <filesystem>

namespace overseer {
namespace core {

/**
 * @enum TaskStatus
 * @brief Task lifecycle, forward-only in declaration order
 */
enum class TaskStatus {
    PENDING,    ///< Waiting for a supervisor
    CLAIMED,    ///< Claimed by a supervisor
    RUNNING,    ///< Attempt in progress
    REVIEW,     ///< Attempt finished, awaiting review
    APPLIED     ///< Changes applied (external action only)
};

/**
 * @enum AttemptStatus
 * @brief Attempt lifecycle
 */
enum class AttemptStatus {
    QUEUED,     ///< Created, waiting for a sandbox
    RUNNING,    ///< Workload started
    SUCCEEDED,  ///< Terminal: workload exited 0
    FAILED      ///< Terminal: see FailureReason
};

/**
 * @enum FailureReason
 * @brief Machine-readable reason carried by every failed attempt
 */
enum class FailureReason {
    TIMEOUT,                 ///< Wall-clock deadline exceeded
    CANCELLED,               ///< Operator cancellation or shutdown
    WORKLOAD_FAILED,         ///< Workload exited non-zero
    WORKLOAD_CRASHED,        ///< Workload killed by a signal
    SETUP_FAILED,            ///< Workspace / repository preparation failed
    CACHE_UNAVAILABLE,       ///< Cache hydration failed
    SANDBOX_UNAVAILABLE,     ///< No sandbox could be acquired
    ARTIFACT_UPLOAD_FAILED,  ///< Artifact upload retries exhausted
    INTERNAL_ERROR           ///< Unexpected supervisor error
};

std::string TaskStatusToString(TaskStatus status);
std::optional<TaskStatus> TaskStatusFromString(const std::string& value);

std::string AttemptStatusToString(AttemptStatus status);
std::optional<AttemptStatus> AttemptStatusFromString(const std::string& value);

/// Wire form, e.g. "artifact_upload_failed"
std::string FailureReasonToString(FailureReason reason);
std::optional<FailureReason> FailureReasonFromString(const std::string& value);

inline bool IsTerminal(AttemptStatus status) {
    return status == AttemptStatus::SUCCEEDED || status == AttemptStatus::FAILED;
}

/**
 * @class StateTransitionError
 * @brief Raised on a transition the state machine does not allow
 */
class StateTransitionError : public std::runtime_error {
public:
    explicit StateTransitionError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct RepositoryRef
 * @brief Repository a task operates on
 */
struct RepositoryRef {
    std::string id;                        ///< Stable identifier (mirror key)
    std::string name;                      ///< Display name
    std::string git_url;                   ///< Clone URL
    std::string default_branch{"main"};    ///< Branch checked out into the workspace
};

/**
 * @struct TaskSummary
 * @brief Entry of the pending task list
 */
struct TaskSummary {
    std::string id;
    std::string title;
    std::optional<std::string> environment_id;
};

/**
 * @struct TaskDetail
 * @brief Full task as returned by the control plane
 */
struct TaskDetail {
    std::string id;
    std::string title;
    std::optional<std::string> description;
    std::optional<std::string> environment_id;
    std::optional<RepositoryRef> repository;
    std::optional<std::string> assignee;
};

/**
 * @class TaskRecord
 * @brief Local task view with forward-only status
 */
class TaskRecord {
public:
    explicit TaskRecord(std::string id, TaskStatus status = TaskStatus::PENDING);
    
    /**
     * @brief Advance to a later status
     * @throws StateTransitionError if `next` is not strictly after the current
     *         status, or is APPLIED (reached only externally)
     */
    void Transition(TaskStatus next);
    
    /**
     * @brief Advance only if `next` is later, otherwise keep the current status
     * @return true if the status changed
     */
    bool AdvanceTo(TaskStatus next);
    
    const std::string& Id() const { return id_; }
    TaskStatus Status() const { return status_; }
    std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }
    std::chrono::system_clock::time_point UpdatedAt() const { return updated_at_; }

private:
    std::string id_;
    TaskStatus status_;
    std::chrono::system_clock::time_point created_at_;
    std::chrono::system_clock::time_point updated_at_;
};

/**
 * @class AttemptRecord
 * @brief Local attempt view; terminal states are final
 */
class AttemptRecord {
public:
    AttemptRecord(std::string id, std::string task_id);
    
    /// QUEUED -> RUNNING
    void MarkRunning();
    
    /// RUNNING -> SUCCEEDED
    void MarkSucceeded();
    
    /// QUEUED | RUNNING -> FAILED
    void MarkFailed(FailureReason reason);
    
    const std::string& Id() const { return id_; }
    const std::string& TaskId() const { return task_id_; }
    AttemptStatus Status() const { return status_; }
    std::optional<FailureReason> Reason() const { return reason_; }
    
    std::optional<std::string> diff_artifact_id;  ///< Set after upload
    std::optional<std::string> log_artifact_id;   ///< Set after upload
    
    std::chrono::system_clock::time_point CreatedAt() const { return created_at_; }
    std::chrono::system_clock::time_point UpdatedAt() const { return updated_at_; }

private:
    [[noreturn]] void RejectTransition(AttemptStatus next) const;
    
    std::string id_;
    std::string task_id_;
    AttemptStatus status_{AttemptStatus::QUEUED};
    std::optional<FailureReason> reason_;
    std::chrono::system_clock::time_point created_at_;
    std::chrono::system_clock::time_point updated_at_;
};

/**
 * @struct AttemptContext
 * @brief Everything the executor needs about a claimed attempt
 */
struct AttemptContext {
    std::string attempt_id;
    TaskDetail task;
};

/**
 * @struct AttemptOutcome
 * @brief Result of one executor invocation
 */
struct AttemptOutcome {
    AttemptStatus status{AttemptStatus::FAILED};   ///< SUCCEEDED or FAILED
    std::optional<FailureReason> reason;           ///< Set when FAILED
    bool tainted{false};                           ///< Sandbox must be destroyed
    std::string diff;                              ///< Diff artifact text
    std::string log;                               ///< Log artifact text
    std::optional<int> exit_code;                  ///< Workload exit code, if it exited
    std::chrono::milliseconds duration{0};         ///< Workload wall time
    std::string detail;                            ///< Human-readable failure detail
    
    bool Succeeded() const { return status == AttemptStatus::SUCCEEDED; }
    
    static AttemptOutcome Failure(FailureReason reason, std::string detail, bool tainted = false);
};

} // namespace core
} // namespace overseer
