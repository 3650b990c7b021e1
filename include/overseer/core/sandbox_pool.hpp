/**
 * @file sandbox_pool.hpp
 * @brief Bounded warm pool of sandboxes with background replenishment
 * 
 * The pool keeps `target_size` sandboxes idle (or warming) and hands them out
 * exclusively through SandboxLease. A single mutex guards all bookkeeping;
 * provider calls happen outside it, with the slot reserved as WARMING so the
 * hard bound `idle + assigned + warming <= max_size` holds throughout.
 * 
 * **Sandbox Lifecycle**:
 * ```
 * WARMING -> IDLE -> ASSIGNED -> IDLE      (clean release, reused as-is)
 *                             -> DESTROYED (taint, pool shrink, shutdown)
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "overseer/core/config.hpp"
#include "overseer/core/snapshot_provider.hpp"

#include <string>
#include <map>
#include <deque>
#include <mutex>
#include <atomic>
#include <thread>
#include <memory>
#include <optional>
#include <functional>
#include <condition_variable>
#include <chrono>
#include <stdexcept>

namespace overseer {
namespace core {

/**
 * @enum SandboxState
 * @brief Sandbox lifecycle state
 */
enum class SandboxState {
    WARMING,    ///< Prewarm in flight
    IDLE,       ///< In the pool, available
    ASSIGNED,   ///< Held by exactly one lease
    DESTROYED   ///< Terminal
};

/**
 * @enum ReleaseOutcome
 * @brief How an assigned sandbox is returned
 */
enum class ReleaseOutcome {
    CLEAN,      ///< Safe to reuse
    TAINTED     ///< Must be destroyed and replaced
};

std::string SandboxStateToString(SandboxState state);

/**
 * @class PoolExhaustedError
 * @brief No sandbox could be handed out (fail-fast, timeout, shutdown, cancel)
 */
class PoolExhaustedError : public std::runtime_error {
public:
    explicit PoolExhaustedError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct Sandbox
 * @brief Pool bookkeeping for one sandbox
 */
struct Sandbox {
    std::string snapshot_id;                         ///< Stable identifier
    SandboxState state{SandboxState::IDLE};
    std::chrono::system_clock::time_point created_at;
    std::size_t reuse_count{0};                      ///< Clean releases so far
};

/**
 * @struct PoolMetrics
 * @brief Point-in-time pool counters
 */
struct PoolMetrics {
    std::size_t idle{0};
    std::size_t assigned{0};
    std::size_t warming{0};
    std::size_t target{0};
    std::size_t max{0};
    std::size_t destroyed_total{0};
    std::size_t prewarm_failures{0};
    std::optional<std::string> last_snapshot;        ///< Id of the latest successful prewarm
};

class SandboxPool;

/**
 * @class SandboxLease
 * @brief Exclusive, move-only handle on an assigned sandbox
 * 
 * A lease that goes out of scope without an explicit Release() returns its
 * sandbox as TAINTED unless MarkClean() was called. The lease must not
 * outlive the pool that issued it.
 */
class SandboxLease {
public:
    SandboxLease() = default;
    SandboxLease(SandboxPool* pool, std::string snapshot_id);
    ~SandboxLease();
    
    SandboxLease(const SandboxLease&) = delete;
    SandboxLease& operator=(const SandboxLease&) = delete;
    SandboxLease(SandboxLease&& other) noexcept;
    SandboxLease& operator=(SandboxLease&& other) noexcept;
    
    const std::string& SnapshotId() const { return snapshot_id_; }
    bool Valid() const { return pool_ != nullptr; }
    explicit operator bool() const { return Valid(); }
    
    void MarkClean() { outcome_ = ReleaseOutcome::CLEAN; }
    void MarkTainted() { outcome_ = ReleaseOutcome::TAINTED; }
    ReleaseOutcome Outcome() const { return outcome_; }
    
    /**
     * @brief Return the sandbox with the marked outcome
     * @return Pool's answer; false if the lease was already released
     */
    bool Release();

private:
    SandboxPool* pool_{nullptr};
    std::string snapshot_id_;
    ReleaseOutcome outcome_{ReleaseOutcome::TAINTED};
};

/**
 * @class SandboxPool
 * @brief Warm pool manager
 * 
 * **Usage Example**:
 * @code
 * PoolConfig config;
 * config.target_size = 2;
 * config.max_size = 4;
 * 
 * SandboxPool pool(config, std::make_shared<GeneratedSnapshotProvider>());
 * pool.Start();
 * pool.WaitForIdle(2, std::chrono::seconds(30));
 * 
 * {
 *     SandboxLease lease = pool.Acquire();
 *     RunWorkload(lease.SnapshotId());
 *     lease.MarkClean();
 * }   // released here
 * 
 * pool.Stop();
 * @endcode
 */
class SandboxPool {
public:
    using SnapshotListener = std::function<void(const std::string& snapshot_id)>;
    
    SandboxPool(PoolConfig config, std::shared_ptr<SnapshotProvider> provider);
    ~SandboxPool();
    
    SandboxPool(const SandboxPool&) = delete;
    SandboxPool& operator=(const SandboxPool&) = delete;
    
    /**
     * @brief Launch the replenishment thread
     */
    void Start();
    
    /**
     * @brief Stop replenishing, fail pending acquires and destroy idle sandboxes
     * 
     * Assigned sandboxes are destroyed when their leases are released.
     */
    void Stop();
    
    /**
     * @brief Take an idle sandbox, applying the acquire policy when none is idle
     * 
     * @param cancel Optional flag; a set flag aborts a waiting acquire
     * @return Lease on an ASSIGNED sandbox
     * @throws PoolExhaustedError on fail-fast, timeout, cancellation or shutdown
     */
    SandboxLease Acquire(const std::atomic<bool>* cancel = nullptr);
    
    /**
     * @brief Return an assigned sandbox
     * 
     * Releasing an id that is not ASSIGNED is a logged no-op.
     * 
     * @return true if the sandbox was assigned and is now idle or destroyed
     */
    bool Release(const std::string& snapshot_id, ReleaseOutcome outcome);
    
    /**
     * @brief Produce one sandbox synchronously into the idle set
     * 
     * Honors the hard bound and the retry policy. Used for start-up warm-up.
     * 
     * @return true if a sandbox was added
     */
    bool Prewarm();
    
    PoolMetrics Metrics() const;
    
    /**
     * @brief Block until at least `count` sandboxes are idle
     * @return false on timeout or shutdown
     */
    bool WaitForIdle(std::size_t count, std::chrono::milliseconds timeout) const;
    
    /**
     * @brief Current state of a sandbox id
     * @return State, DESTROYED for recently destroyed ids, nullopt if unknown
     */
    std::optional<SandboxState> StateOf(const std::string& snapshot_id) const;
    
    /// Invoked after every successful prewarm, outside the pool lock
    void SetSnapshotListener(SnapshotListener listener);
    
    const PoolConfig& GetConfig() const { return config_; }

private:
    enum class PrewarmResult {
        ADDED,      ///< A sandbox joined the pool
        SKIPPED,    ///< No deficit or no capacity left
        FAILED      ///< Every try failed, or the pool is stopping
    };
    
    void ReplenishLoop();
    
    /// Reserve a WARMING slot and run the provider with the backoff policy
    PrewarmResult ProduceWithRetry(bool require_deficit);
    /// Run the provider for an already reserved WARMING slot and publish the result
    std::optional<std::string> ProduceReserved(bool as_assigned, std::string& error);
    bool ReserveWarmingSlot(bool require_deficit);
    void DestroySandbox(const std::string& snapshot_id, const char* why);
    void RetireLocked(const std::string& snapshot_id);
    bool SleepUnlessStopping(std::chrono::milliseconds delay);
    
    std::size_t TotalLocked() const { return idle_queue_.size() + assigned_ + warming_; }
    std::size_t DeficitLocked() const;
    
    PoolConfig config_;
    std::shared_ptr<SnapshotProvider> provider_;
    
    mutable std::mutex mutex_;
    mutable std::condition_variable idle_cv_;       ///< Idle set grew, or stopping
    std::condition_variable replenish_cv_;          ///< Deficit may have grown, or stopping
    
    std::map<std::string, Sandbox> sandboxes_;      ///< Live (IDLE / ASSIGNED) sandboxes
    std::deque<std::string> idle_queue_;            ///< FIFO of IDLE ids
    std::deque<std::string> retired_;               ///< Recently destroyed ids
    std::size_t assigned_{0};
    std::size_t warming_{0};
    std::size_t destroyed_total_{0};
    std::size_t prewarm_failures_{0};
    std::optional<std::string> last_snapshot_;
    bool replenish_requested_{false};
    bool stopping_{false};
    
    SnapshotListener listener_;
    std::thread replenisher_;
};

} // namespace core
} // namespace overseer
