/**
 * @file sandbox_pool.cpp
 * @brief Warm pool bookkeeping, acquire policies and replenishment
 * 
 * All counters and per-sandbox states change under `mutex_`. Provider calls
 * (prewarm and teardown) run outside the lock; a prewarm holds a WARMING
 * slot for its whole duration so capacity is never over-committed.
 * 
 * @date 2025
 */

#include "overseer/core/sandbox_pool.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <utility>
#include <vector>

namespace overseer {
namespace core {

namespace {

constexpr std::size_t kRetiredHistory = 1024;
constexpr std::chrono::milliseconds kAcquireObservation{200};

} // anonymous namespace

std::string SandboxStateToString(SandboxState state) {
    switch (state) {
        case SandboxState::WARMING:   return "warming";
        case SandboxState::IDLE:      return "idle";
        case SandboxState::ASSIGNED:  return "assigned";
        case SandboxState::DESTROYED: return "destroyed";
    }
    return "unknown";
}

// ============================================================================
// LEASE
// ============================================================================

SandboxLease::SandboxLease(SandboxPool* pool, std::string snapshot_id)
    : pool_(pool)
    , snapshot_id_(std::move(snapshot_id)) {
}

SandboxLease::~SandboxLease() {
    if (pool_) {
        Release();
    }
}

SandboxLease::SandboxLease(SandboxLease&& other) noexcept
    : pool_(std::exchange(other.pool_, nullptr))
    , snapshot_id_(std::move(other.snapshot_id_))
    , outcome_(other.outcome_) {
}

SandboxLease& SandboxLease::operator=(SandboxLease&& other) noexcept {
    if (this != &other) {
        if (pool_) {
            Release();
        }
        pool_ = std::exchange(other.pool_, nullptr);
        snapshot_id_ = std::move(other.snapshot_id_);
        outcome_ = other.outcome_;
    }
    return *this;
}

bool SandboxLease::Release() {
    if (!pool_) {
        return false;
    }
    SandboxPool* pool = std::exchange(pool_, nullptr);
    return pool->Release(snapshot_id_, outcome_);
}

// ============================================================================
// LIFECYCLE
// ============================================================================

SandboxPool::SandboxPool(PoolConfig config, std::shared_ptr<SnapshotProvider> provider)
    : config_(std::move(config))
    , provider_(std::move(provider)) {
    config_.max_size = std::max<std::size_t>(config_.max_size, 1);
}

SandboxPool::~SandboxPool() {
    Stop();
}

void SandboxPool::Start() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (replenisher_.joinable() || stopping_) {
        return;
    }
    spdlog::info("Starting sandbox pool: target={} max={} policy={} provider={}",
                 config_.target_size, config_.max_size,
                 AcquirePolicyToString(config_.acquire_policy), provider_->Name());
    replenisher_ = std::thread(&SandboxPool::ReplenishLoop, this);
}

void SandboxPool::Stop() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (stopping_ && !replenisher_.joinable() && idle_queue_.empty()) {
            return;
        }
        stopping_ = true;
    }
    
    provider_->Cancel();
    replenish_cv_.notify_all();
    idle_cv_.notify_all();
    
    if (replenisher_.joinable()) {
        replenisher_.join();
    }
    
    std::vector<std::string> idle;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        idle.assign(idle_queue_.begin(), idle_queue_.end());
        idle_queue_.clear();
        for (const auto& id : idle) {
            sandboxes_.erase(id);
            RetireLocked(id);
        }
    }
    
    for (const auto& id : idle) {
        DestroySandbox(id, "pool stopping");
    }
    spdlog::info("Sandbox pool stopped ({} idle sandboxes destroyed)", idle.size());
}

void SandboxPool::SetSnapshotListener(SnapshotListener listener) {
    std::lock_guard<std::mutex> lock(mutex_);
    listener_ = std::move(listener);
}

// ============================================================================
// ACQUIRE / RELEASE
// ============================================================================

SandboxLease SandboxPool::Acquire(const std::atomic<bool>* cancel) {
    std::optional<std::chrono::steady_clock::time_point> deadline;
    if (config_.acquire_timeout) {
        deadline = std::chrono::steady_clock::now() + *config_.acquire_timeout;
    }
    
    bool cold_tried = false;
    bool logged_wait = false;
    std::unique_lock<std::mutex> lock(mutex_);
    
    while (true) {
        if (stopping_) {
            throw PoolExhaustedError("sandbox pool is stopping");
        }
        if (cancel && cancel->load()) {
            throw PoolExhaustedError("acquire cancelled");
        }
        
        if (!idle_queue_.empty()) {
            std::string id = idle_queue_.front();
            idle_queue_.pop_front();
            sandboxes_.at(id).state = SandboxState::ASSIGNED;
            ++assigned_;
            replenish_requested_ = true;
            lock.unlock();
            replenish_cv_.notify_one();
            spdlog::debug("Acquired sandbox {}", id);
            return SandboxLease(this, id);
        }
        
        if (config_.acquire_policy == AcquirePolicy::FAIL_FAST) {
            throw PoolExhaustedError(fmt::format(
                "no idle sandbox (assigned={}, warming={}, max={})",
                assigned_, warming_, config_.max_size));
        }
        
        if (config_.acquire_policy == AcquirePolicy::COLD && !cold_tried &&
            TotalLocked() < config_.max_size) {
            cold_tried = true;
            ++warming_;
            lock.unlock();
            
            spdlog::info("No idle sandbox, cold prewarm inline");
            std::string error;
            auto id = ProduceReserved(true, error);
            if (id) {
                return SandboxLease(this, *id);
            }
            spdlog::warn("Cold prewarm failed ({}), waiting for a release", error);
            lock.lock();
            continue;
        }
        
        if (!logged_wait) {
            spdlog::debug("Waiting for an idle sandbox (assigned={}, warming={})", assigned_, warming_);
            logged_wait = true;
        }
        
        auto slice = kAcquireObservation;
        if (deadline) {
            auto now = std::chrono::steady_clock::now();
            if (now >= *deadline) {
                throw PoolExhaustedError("timed out waiting for an idle sandbox");
            }
            slice = std::min(slice, std::chrono::duration_cast<std::chrono::milliseconds>(*deadline - now) +
                                    std::chrono::milliseconds(1));
        }
        idle_cv_.wait_for(lock, slice);
    }
}

bool SandboxPool::Release(const std::string& snapshot_id, ReleaseOutcome outcome) {
    const char* why = nullptr;
    bool schedule_replacement = false;
    {
        std::unique_lock<std::mutex> lock(mutex_);
        auto it = sandboxes_.find(snapshot_id);
        if (it == sandboxes_.end() || it->second.state != SandboxState::ASSIGNED) {
            auto state = it == sandboxes_.end()
                ? std::string("unknown") : SandboxStateToString(it->second.state);
            spdlog::error("Ignoring release of sandbox {}: not assigned (state {})", snapshot_id, state);
            return false;
        }
        
        --assigned_;
        
        if (outcome == ReleaseOutcome::CLEAN && !stopping_ &&
            idle_queue_.size() < config_.target_size) {
            it->second.state = SandboxState::IDLE;
            ++it->second.reuse_count;
            idle_queue_.push_back(snapshot_id);
            lock.unlock();
            idle_cv_.notify_all();
            spdlog::debug("Recycled sandbox {}", snapshot_id);
            return true;
        }
        
        if (outcome == ReleaseOutcome::TAINTED) {
            why = "tainted";
            schedule_replacement = !stopping_;
            replenish_requested_ = replenish_requested_ || schedule_replacement;
        } else {
            why = stopping_ ? "pool stopping" : "pool shrink";
        }
        sandboxes_.erase(it);
        RetireLocked(snapshot_id);
    }
    
    DestroySandbox(snapshot_id, why);
    if (schedule_replacement) {
        replenish_cv_.notify_one();
    }
    idle_cv_.notify_all();
    return true;
}

// ============================================================================
// PREWARM
// ============================================================================

bool SandboxPool::Prewarm() {
    return ProduceWithRetry(false) == PrewarmResult::ADDED;
}

bool SandboxPool::ReserveWarmingSlot(bool require_deficit) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopping_ || TotalLocked() >= config_.max_size) {
        return false;
    }
    if (require_deficit && DeficitLocked() == 0) {
        return false;
    }
    ++warming_;
    return true;
}

std::optional<std::string> SandboxPool::ProduceReserved(bool as_assigned, std::string& error) {
    std::string snapshot_id;
    try {
        snapshot_id = provider_->ProduceSnapshot(config_.snapshot_template);
    } catch (const std::exception& e) {
        error = e.what();
    }
    
    bool accepted = false;
    bool stopped = false;
    SnapshotListener listener;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        --warming_;
        
        if (error.empty() && snapshot_id.empty()) {
            error = "provider returned an empty snapshot id";
        } else if (error.empty() && sandboxes_.count(snapshot_id) > 0) {
            error = "provider returned duplicate snapshot id " + snapshot_id;
        }
        
        if (!error.empty()) {
            ++prewarm_failures_;
        } else if (stopping_) {
            stopped = true;
            RetireLocked(snapshot_id);
        } else {
            Sandbox sandbox;
            sandbox.snapshot_id = snapshot_id;
            sandbox.state = as_assigned ? SandboxState::ASSIGNED : SandboxState::IDLE;
            sandbox.created_at = std::chrono::system_clock::now();
            sandboxes_.emplace(snapshot_id, sandbox);
            
            if (as_assigned) {
                ++assigned_;
            } else {
                idle_queue_.push_back(snapshot_id);
            }
            last_snapshot_ = snapshot_id;
            listener = listener_;
            accepted = true;
        }
    }
    // A freed WARMING slot can unblock a cold acquire as well
    idle_cv_.notify_all();
    
    if (stopped) {
        DestroySandbox(snapshot_id, "pool stopping");
        error = "pool is stopping";
        return std::nullopt;
    }
    if (!accepted) {
        return std::nullopt;
    }
    
    spdlog::info("Prewarmed sandbox {} via {}", snapshot_id, provider_->Name());
    if (listener) {
        listener(snapshot_id);
    }
    return snapshot_id;
}

SandboxPool::PrewarmResult SandboxPool::ProduceWithRetry(bool require_deficit) {
    const auto& backoff = config_.prewarm_backoff;
    const int tries = std::max(backoff.max_retries, 0) + 1;
    
    for (int attempt = 0; attempt < tries; ++attempt) {
        if (attempt > 0 && !SleepUnlessStopping(backoff.DelayFor(attempt - 1))) {
            return PrewarmResult::FAILED;
        }
        if (!ReserveWarmingSlot(require_deficit)) {
            std::lock_guard<std::mutex> lock(mutex_);
            return stopping_ ? PrewarmResult::FAILED : PrewarmResult::SKIPPED;
        }
        
        std::string error;
        if (ProduceReserved(false, error)) {
            return PrewarmResult::ADDED;
        }
        spdlog::warn("Prewarm try {}/{} failed: {}", attempt + 1, tries, error);
    }
    
    spdlog::error("Prewarm gave up after {} tries; replenishment continues next pass", tries);
    return PrewarmResult::FAILED;
}

// ============================================================================
// REPLENISHMENT
// ============================================================================

std::size_t SandboxPool::DeficitLocked() const {
    std::size_t have = idle_queue_.size() + warming_;
    if (have >= config_.target_size) {
        return 0;
    }
    std::size_t total = TotalLocked();
    std::size_t room = config_.max_size > total ? config_.max_size - total : 0;
    return std::min(config_.target_size - have, room);
}

void SandboxPool::ReplenishLoop() {
    spdlog::debug("Replenisher running");
    
    while (true) {
        {
            std::unique_lock<std::mutex> lock(mutex_);
            replenish_cv_.wait_for(lock, config_.replenish_interval, [this] {
                return stopping_ || replenish_requested_ || DeficitLocked() > 0;
            });
            if (stopping_) {
                break;
            }
            replenish_requested_ = false;
            
            std::size_t deficit = DeficitLocked();
            if (deficit == 0) {
                continue;
            }
            spdlog::info("Pool below target: idle={} warming={} assigned={} target={} deficit={}",
                         idle_queue_.size(), warming_, assigned_, config_.target_size, deficit);
        }
        
        PrewarmResult result = ProduceWithRetry(true);
        if (result == PrewarmResult::FAILED) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                if (stopping_) {
                    break;
                }
                spdlog::warn("Pool health: {} of {} sandboxes idle, {} prewarm failures so far",
                             idle_queue_.size(), config_.target_size, prewarm_failures_);
            }
            if (!SleepUnlessStopping(config_.replenish_interval)) {
                break;
            }
        }
    }
    
    spdlog::debug("Replenisher exited");
}

bool SandboxPool::SleepUnlessStopping(std::chrono::milliseconds delay) {
    std::unique_lock<std::mutex> lock(mutex_);
    return !replenish_cv_.wait_for(lock, delay, [this] { return stopping_; });
}

// ============================================================================
// TEARDOWN AND OBSERVATION
// ============================================================================

void SandboxPool::DestroySandbox(const std::string& snapshot_id, const char* why) {
    spdlog::info("Destroying sandbox {} ({})", snapshot_id, why);
    try {
        provider_->Destroy(snapshot_id);
    } catch (const std::exception& e) {
        spdlog::warn("Teardown of sandbox {} failed: {}", snapshot_id, e.what());
    }
}

void SandboxPool::RetireLocked(const std::string& snapshot_id) {
    ++destroyed_total_;
    retired_.push_back(snapshot_id);
    if (retired_.size() > kRetiredHistory) {
        retired_.pop_front();
    }
}

PoolMetrics SandboxPool::Metrics() const {
    std::lock_guard<std::mutex> lock(mutex_);
    PoolMetrics metrics;
    metrics.idle = idle_queue_.size();
    metrics.assigned = assigned_;
    metrics.warming = warming_;
    metrics.target = config_.target_size;
    metrics.max = config_.max_size;
    metrics.destroyed_total = destroyed_total_;
    metrics.prewarm_failures = prewarm_failures_;
    metrics.last_snapshot = last_snapshot_;
    return metrics;
}

bool SandboxPool::WaitForIdle(std::size_t count, std::chrono::milliseconds timeout) const {
    std::unique_lock<std::mutex> lock(mutex_);
    idle_cv_.wait_for(lock, timeout, [&] {
        return stopping_ || idle_queue_.size() >= count;
    });
    return idle_queue_.size() >= count;
}

std::optional<SandboxState> SandboxPool::StateOf(const std::string& snapshot_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = sandboxes_.find(snapshot_id);
    if (it != sandboxes_.end()) {
        return it->second.state;
    }
    if (std::find(retired_.begin(), retired_.end(), snapshot_id) != retired_.end()) {
        return SandboxState::DESTROYED;
    }
    return std::nullopt;
}

} // namespace core
} // namespace overseer
