/**
 * @file supervisor.hpp
 * @brief Top-level orchestration of pool, poller, executor and reporter
 * 
 * **Attempt Flow**:
 * ```
 * Poller claims attempt
 *   -> CacheHydrator::Ensure()            cache_unavailable on error
 *   -> SandboxPool::Acquire()             sandbox_unavailable / cancelled
 *   -> Executor::Execute()                attempt queued -> running -> terminal
 *   -> ArtifactReporter::Report()         uploads + completion
 *   -> SandboxLease::Release()            clean -> idle, tainted -> destroyed
 * ```
 * 
 * The supervisor also owns the operator-visible state: the last successful
 * snapshot id (mirrored to `<state_dir>/last-snapshot.txt`) and the cancel
 * marker directory `<state_dir>/cancel/`.
 * 
 * @date 2025
 */

#pragma once

#include "overseer/core/config.hpp"
#include "overseer/core/types.hpp"
#include "overseer/core/sandbox_pool.hpp"
#include "overseer/core/attempt_poller.hpp"
#include "overseer/core/artifact_reporter.hpp"
#include "overseer/core/snapshot_provider.hpp"
#include "overseer/api/control_plane_client.hpp"

#include <string>
#include <memory>
#include <optional>
#include <chrono>
#include <filesystem>

namespace overseer {
namespace core {

/**
 * @class Supervisor
 * @brief Runs the claim / execute / report loop until shutdown
 * 
 * **Usage Example**:
 * @code
 * auto config = LoadEverything();
 * auto client = std::make_shared<api::HttpControlPlaneClient>(
 *     config.control_plane, std::make_shared<api::CurlTransport>());
 * 
 * Supervisor supervisor(config, client, CreateSnapshotProvider(config.snapshot));
 * supervisor.Start();
 * supervisor.Run();          // returns after Shutdown()
 * @endcode
 */
class Supervisor {
public:
    Supervisor(SupervisorConfig config,
               std::shared_ptr<api::ControlPlaneClient> client,
               std::shared_ptr<SnapshotProvider> provider);
    ~Supervisor();
    
    Supervisor(const Supervisor&) = delete;
    Supervisor& operator=(const Supervisor&) = delete;
    
    /**
     * @brief Prepare state directories, hydrate caches and start the pool
     * @throws CacheError if the cache root cannot be created
     * @throws std::runtime_error if the state directory cannot be created
     */
    void Start();
    
    /**
     * @brief Wait up to `timeout` for the pool to reach its target
     * @return true if the pool is warm
     */
    bool WarmUp(std::chrono::milliseconds timeout);
    
    /// Poll and execute until Shutdown() (starts the pool if needed)
    void Run();
    
    /**
     * @brief Stop polling, cancel in-flight attempts, wait for them, stop the pool
     * 
     * Safe to call from another thread while Run() is active.
     */
    void Shutdown(std::chrono::milliseconds drain_timeout = std::chrono::seconds(60));
    
    /**
     * @brief Cancel an in-flight attempt
     * @return false if the attempt is not in flight here
     */
    bool CancelAttempt(const std::string& attempt_id);
    
    /**
     * @brief Drive one claimed attempt to a reported terminal state
     * 
     * Invoked on the poller's worker tasks.
     */
    void ProcessAttempt(AttemptHandle& handle);
    
    std::optional<std::string> LastSnapshot() const;
    PoolMetrics PoolStatus() const;
    
    SandboxPool& Pool();
    AttemptPoller& Poller();
    ArtifactReporter& Reporter();
    
    const SupervisorConfig& GetConfig() const { return config_; }
    
    /// Path of the last-snapshot marker file
    std::filesystem::path SnapshotMarkerPath() const;

private:
    void RecordSnapshot(const std::string& snapshot_id);
    void FinishAttempt(AttemptHandle& handle, AttemptStatus status, std::optional<FailureReason> reason);
    
    SupervisorConfig config_;
    
    class Impl;
    std::unique_ptr<Impl> impl_;  ///< Components and shared state
};

} // namespace core
} // namespace overseer
