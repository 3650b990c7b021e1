/**
 * @file executor.hpp
 * @brief Runs one claimed attempt inside an acquired sandbox
 * 
 * **Execution Pipeline**:
 * ```
 * 1. Workspace   <workspace_root>/<attempt id>, fresh
 * 2. Repository  mirror sync (clone --mirror | remote update --prune),
 *                then clone of the default branch from the mirror;
 *                `git init` when the task names no repository
 * 3. Workload    /bin/sh -c <command> under the attempt deadline,
 *                or the built-in TASK_LOG.md workload
 * 4. Artifacts   log = header + combined output,
 *                diff = git add -A && git diff --cached --output=<workspace>.diff
 * ```
 * 
 * **Outcome Mapping**:
 * | Workload result        | Attempt                   | Sandbox |
 * |------------------------|---------------------------|---------|
 * | exit 0                 | succeeded                 | clean   |
 * | exit != 0              | failed / workload_failed  | clean   |
 * | killed by a signal     | failed / workload_crashed | tainted |
 * | deadline exceeded      | failed / timeout          | tainted |
 * | cancelled while running| failed / cancelled        | tainted |
 * | workspace / git error  | failed / setup_failed     | clean   |
 * 
 * @date 2025
 */

#pragma once

#include "overseer/core/types.hpp"
#include "overseer/core/config.hpp"
#include "overseer/core/cache_hydrator.hpp"
#include "overseer/core/sandbox_pool.hpp"

#include <string>
#include <memory>
#include <atomic>
#include <optional>
#include <filesystem>

namespace overseer {
namespace core {

/**
 * @class Executor
 * @brief Workspace preparation, workload execution and artifact capture
 * 
 * Stateless across attempts; one instance serves all concurrent attempts.
 * 
 * **Usage Example**:
 * @code
 * Executor executor(config.executor, hydrator);
 * SandboxLease lease = pool.Acquire();
 * AttemptOutcome outcome = executor.Execute(context, lease, hydrator->Ensure(), cancel_flag);
 * // lease is marked clean or tainted according to the outcome
 * @endcode
 */
class Executor {
public:
    Executor(ExecutorConfig config, std::shared_ptr<CacheHydrator> hydrator);
    
    /**
     * @brief Run one attempt to a terminal outcome
     * 
     * Never throws for workload or setup failures; those become the
     * outcome's FailureReason. Marks `lease` clean or tainted.
     * 
     * @param context Claimed attempt and its task
     * @param lease Sandbox assigned to this attempt
     * @param paths Hydrated cache paths
     * @param cancel Cooperative cancellation flag
     */
    AttemptOutcome Execute(const AttemptContext& context, SandboxLease& lease,
                           const CachePaths& paths, const std::atomic<bool>& cancel);
    
    /**
     * @brief Workspace directory used for an attempt id
     */
    std::filesystem::path WorkspaceFor(const std::string& attempt_id) const;
    
    const ExecutorConfig& GetConfig() const { return config_; }

private:
    struct GitResult {
        bool ok{false};
        std::string output;
    };
    
    /// Prepare the workspace; returns the mirror used (if any) or throws
    std::optional<MirrorInfo> PrepareWorkspace(const AttemptContext& context, const CachePaths& paths,
                                               const std::filesystem::path& workspace,
                                               const std::atomic<bool>& cancel);
    void SyncMirror(const RepositoryRef& repository, MirrorInfo& mirror, const std::atomic<bool>& cancel);
    
    GitResult Git(const std::vector<std::string>& args, const std::atomic<bool>* cancel) const;
    std::string ComputeDiff(const std::filesystem::path& workspace, std::string& error) const;
    
    std::string BuildLogHeader(const AttemptContext& context, const std::string& snapshot_id,
                               const CachePaths& paths, const std::optional<MirrorInfo>& mirror) const;
    void RunBuiltinWorkload(const AttemptContext& context, const std::string& snapshot_id,
                            const CachePaths& paths, const std::optional<MirrorInfo>& mirror,
                            const std::filesystem::path& workspace) const;
    void CleanupWorkspace(const std::filesystem::path& workspace) const;
    
    ExecutorConfig config_;
    std::shared_ptr<CacheHydrator> hydrator_;
};

/**
 * @class SetupError
 * @brief Workspace or repository preparation failed
 */
class SetupError : public std::runtime_error {
public:
    explicit SetupError(const std::string& message)
        : std::runtime_error(message) {}
};

} // namespace core
} // namespace overseer
