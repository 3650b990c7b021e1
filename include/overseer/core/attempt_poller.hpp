/**
 * @file attempt_poller.hpp
 * @brief Polls the control plane and claims work within capacity
 * 
 * Each cycle: reap finished attempts, apply cancellation markers, list
 * pending tasks, and claim up to `max_concurrency - in_flight` of them.
 * A task with an attempt in flight locally is never claimed again until
 * that attempt finishes. Every claimed attempt runs on its own std::async
 * task through the AttemptHandler.
 * 
 * **Claim Sequence**:
 * ```
 * POST /tasks/{id}/claim      409 -> skip     task: pending -> claimed
 * POST /tasks/{id}/attempts   403/409 -> skip task: claimed -> running
 * GET  /tasks/{id}            detail (repository, description)
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "overseer/core/types.hpp"
#include "overseer/api/control_plane_client.hpp"

#include <string>
#include <vector>
#include <map>
#include <set>
#include <mutex>
#include <atomic>
#include <memory>
#include <future>
#include <optional>
#include <functional>
#include <condition_variable>
#include <filesystem>

namespace overseer {
namespace core {

/**
 * @struct AttemptHandle
 * @brief Shared state of one in-flight attempt
 * 
 * Records are guarded by `mutex`; `cancel` is observed by the pool and the
 * executor without locking.
 */
struct AttemptHandle {
    AttemptHandle(AttemptContext ctx, TaskRecord task_record)
        : context(std::move(ctx))
        , task(std::move(task_record))
        , attempt(context.attempt_id, context.task.id) {}
    
    AttemptContext context;
    TaskRecord task;
    AttemptRecord attempt;
    std::atomic<bool> cancel{false};
    std::optional<std::string> claim_error;   ///< Detail fetch failed after the attempt was created
    std::mutex mutex;
};

/**
 * @struct PollerSettings
 * @brief Poller knobs taken from SupervisorConfig
 */
struct PollerSettings {
    std::chrono::milliseconds poll_interval{5000};
    std::size_t max_concurrency{1};
    std::optional<std::string> environment_id;
    std::filesystem::path cancel_dir;                    ///< Marker files named by attempt id
    std::chrono::milliseconds observation_interval{250}; ///< Marker / reap check period between polls
};

/**
 * @class AttemptPoller
 * @brief Claims attempts and tracks them until they finish
 */
class AttemptPoller {
public:
    using AttemptHandler = std::function<void(const std::shared_ptr<AttemptHandle>&)>;
    
    AttemptPoller(PollerSettings settings,
                  std::shared_ptr<api::ControlPlaneClient> client,
                  AttemptHandler handler);
    ~AttemptPoller();
    
    AttemptPoller(const AttemptPoller&) = delete;
    AttemptPoller& operator=(const AttemptPoller&) = delete;
    
    /**
     * @brief Poll until Stop() is called
     * 
     * Control plane errors are logged and the next cycle proceeds.
     */
    void Run();
    
    /// Ask Run() to return after its current step
    void Stop();
    
    /**
     * @brief One poll cycle
     * @return Number of attempts dispatched
     * @throws api::ControlPlaneError if the task list cannot be fetched
     */
    std::size_t PollOnce();
    
    /**
     * @brief Claim one task (subject to the in-flight rule) and dispatch it
     * @return true if an attempt was dispatched
     */
    bool ClaimAndDispatch(const TaskSummary& summary);
    
    /**
     * @brief Request cooperative cancellation of an in-flight attempt
     * @return false if the attempt is not in flight
     */
    bool Cancel(const std::string& attempt_id);
    
    /// Cancel every in-flight attempt
    void CancelAll();
    
    /// Apply `<cancel_dir>/<attempt id>` markers; returns how many matched
    std::size_t ApplyCancelMarkers();
    
    /// Collect finished attempts; returns how many were reaped
    std::size_t Reap();
    
    /**
     * @brief Wait for all in-flight attempts to finish
     * @return false if some are still running at the timeout
     */
    bool Drain(std::chrono::milliseconds timeout);
    
    std::size_t InFlight() const;
    bool IsTaskInFlight(const std::string& task_id) const;
    std::vector<std::string> InFlightAttempts() const;

private:
    struct InFlightEntry {
        std::shared_ptr<AttemptHandle> handle;
        std::future<void> done;
    };
    
    bool ReserveTask(const std::string& task_id);
    void ReleaseReservation(const std::string& task_id);
    
    PollerSettings settings_;
    std::shared_ptr<api::ControlPlaneClient> client_;
    AttemptHandler handler_;
    
    mutable std::mutex mutex_;
    std::condition_variable stop_cv_;
    std::map<std::string, InFlightEntry> in_flight_;   ///< Keyed by task id
    std::set<std::string> reserved_;                   ///< Tasks being claimed right now
    bool stopping_{false};
};

} // namespace core
} // namespace overseer
