/**
 * @file supervisor.cpp
 * @brief Component wiring and per-attempt orchestration
 * @date 2025
 */

#include "overseer/core/supervisor.hpp"
#include "overseer/core/cache_hydrator.hpp"
#include "overseer/core/executor.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <atomic>
#include <fstream>

namespace overseer {
namespace core {

namespace fs = std::filesystem;

// ============================================================================
// PIMPL
// ============================================================================

class Supervisor::Impl {
public:
    std::shared_ptr<api::ControlPlaneClient> client;
    std::shared_ptr<CacheHydrator> hydrator;
    std::unique_ptr<SandboxPool> pool;
    std::unique_ptr<Executor> executor;
    std::unique_ptr<ArtifactReporter> reporter;
    std::unique_ptr<AttemptPoller> poller;   // last: destroyed first
    
    std::atomic<bool> started{false};
    std::atomic<bool> shut_down{false};
};

Supervisor::Supervisor(SupervisorConfig config,
                       std::shared_ptr<api::ControlPlaneClient> client,
                       std::shared_ptr<SnapshotProvider> provider)
    : config_(std::move(config))
    , impl_(std::make_unique<Impl>()) {
    NormalizeConfig(config_);
    ResolveDerivedPaths(config_);
    
    impl_->client = std::move(client);
    impl_->hydrator = std::make_shared<CacheHydrator>(config_.cache_root);
    impl_->pool = std::make_unique<SandboxPool>(config_.pool, std::move(provider));
    impl_->executor = std::make_unique<Executor>(config_.executor, impl_->hydrator);
    impl_->reporter = std::make_unique<ArtifactReporter>(config_.reporter, impl_->client);
    
    PollerSettings settings;
    settings.poll_interval = std::chrono::duration_cast<std::chrono::milliseconds>(config_.poll_interval);
    settings.max_concurrency = config_.max_concurrency;
    settings.environment_id = config_.environment_id;
    settings.cancel_dir = config_.state_dir / "cancel";
    
    impl_->poller = std::make_unique<AttemptPoller>(settings, impl_->client,
        [this](const std::shared_ptr<AttemptHandle>& handle) {
            try {
                ProcessAttempt(*handle);
            } catch (const std::exception& e) {
                spdlog::error("Attempt {} aborted: {}", handle->context.attempt_id, e.what());
                bool terminal = false;
                {
                    std::lock_guard<std::mutex> lock(handle->mutex);
                    terminal = IsTerminal(handle->attempt.Status());
                }
                if (!terminal) {
                    impl_->reporter->ReportFailure(handle->context.attempt_id, FailureReason::INTERNAL_ERROR);
                    FinishAttempt(*handle, AttemptStatus::FAILED, FailureReason::INTERNAL_ERROR);
                }
            }
        });
}

Supervisor::~Supervisor() {
    Shutdown(std::chrono::seconds(10));
}

// ============================================================================
// LIFECYCLE
// ============================================================================

void Supervisor::Start() {
    if (impl_->started.exchange(true)) {
        return;
    }
    
    spdlog::info("═══════════════════════════════════════════════════════════════");
    spdlog::info("Overseer supervisor starting");
    spdlog::info("  Control plane: {}", config_.control_plane.api_base);
    spdlog::info("  Cache root:    {}", config_.cache_root.string());
    spdlog::info("  State dir:     {}", config_.state_dir.string());
    spdlog::info("  Pool:          target {} / max {} ({})", config_.pool.target_size,
                 config_.pool.max_size, AcquirePolicyToString(config_.pool.acquire_policy));
    spdlog::info("═══════════════════════════════════════════════════════════════");
    
    fs::create_directories(config_.state_dir);
    fs::create_directories(config_.state_dir / "cancel");
    fs::create_directories(config_.executor.workspace_root);
    
    auto paths = impl_->hydrator->Ensure();
    spdlog::info("Cache directories ready under {}", paths.root.string());
    
    std::ifstream previous(SnapshotMarkerPath());
    std::string previous_id;
    if (previous && std::getline(previous, previous_id) && !previous_id.empty()) {
        spdlog::info("Previous run's last snapshot: {}", previous_id);
    }
    
    impl_->pool->SetSnapshotListener([this](const std::string& snapshot_id) {
        RecordSnapshot(snapshot_id);
    });
    impl_->pool->Start();
}

bool Supervisor::WarmUp(std::chrono::milliseconds timeout) {
    bool warm = impl_->pool->WaitForIdle(config_.pool.target_size, timeout);
    auto metrics = impl_->pool->Metrics();
    if (warm) {
        spdlog::info("Sandbox pool warm: {} idle", metrics.idle);
    } else {
        spdlog::warn("Sandbox pool not warm after {} ms: {} of {} idle", timeout.count(),
                     metrics.idle, metrics.target);
    }
    return warm;
}

void Supervisor::Run() {
    Start();
    impl_->poller->Run();
}

void Supervisor::Shutdown(std::chrono::milliseconds drain_timeout) {
    if (impl_->shut_down.exchange(true)) {
        return;
    }
    
    spdlog::info("Shutting down: {} attempt(s) in flight", impl_->poller->InFlight());
    impl_->poller->Stop();
    impl_->poller->CancelAll();
    if (!impl_->poller->Drain(drain_timeout)) {
        spdlog::warn("Attempts still running after {} ms drain", drain_timeout.count());
    }
    impl_->pool->Stop();
}

bool Supervisor::CancelAttempt(const std::string& attempt_id) {
    return impl_->poller->Cancel(attempt_id);
}

// ============================================================================
// ATTEMPT ORCHESTRATION
// ============================================================================

void Supervisor::ProcessAttempt(AttemptHandle& handle) {
    const AttemptContext& context = handle.context;
    
    auto fail_early = [&](FailureReason reason, const std::string& detail) {
        spdlog::error("Attempt {} for task {} failed before execution: {} ({})",
                      context.attempt_id, context.task.id, FailureReasonToString(reason), detail);
        impl_->reporter->ReportFailure(context.attempt_id, reason);
        FinishAttempt(handle, AttemptStatus::FAILED, reason);
    };
    
    if (handle.claim_error) {
        fail_early(FailureReason::INTERNAL_ERROR, *handle.claim_error);
        return;
    }
    
    CachePaths paths;
    try {
        paths = impl_->hydrator->Ensure();
    } catch (const CacheError& e) {
        fail_early(FailureReason::CACHE_UNAVAILABLE, e.what());
        return;
    }
    
    SandboxLease lease;
    try {
        lease = impl_->pool->Acquire(&handle.cancel);
    } catch (const PoolExhaustedError& e) {
        fail_early(handle.cancel.load() ? FailureReason::CANCELLED : FailureReason::SANDBOX_UNAVAILABLE,
                   e.what());
        return;
    }
    
    {
        std::lock_guard<std::mutex> lock(handle.mutex);
        handle.attempt.MarkRunning();
    }
    spdlog::info("Attempt {} running: task {}, snapshot {}, git cache {}, npm {}, pip {}, cargo {}",
                 context.attempt_id, context.task.id, lease.SnapshotId(), paths.git.string(),
                 paths.npm.string(), paths.pip.string(), paths.cargo.string());
    
    AttemptOutcome outcome;
    try {
        outcome = impl_->executor->Execute(context, lease, paths, handle.cancel);
    } catch (const std::exception& e) {
        spdlog::error("Executor error on attempt {}: {}", context.attempt_id, e.what());
        outcome = AttemptOutcome::Failure(FailureReason::INTERNAL_ERROR, e.what(), true);
        lease.MarkTainted();
    }
    
    auto result = impl_->reporter->Report(context.attempt_id, outcome);
    lease.Release();
    FinishAttempt(handle, result.status, result.reason);
}

void Supervisor::FinishAttempt(AttemptHandle& handle, AttemptStatus status,
                               std::optional<FailureReason> reason) {
    std::lock_guard<std::mutex> lock(handle.mutex);
    if (status == AttemptStatus::SUCCEEDED) {
        handle.attempt.MarkSucceeded();
    } else {
        handle.attempt.MarkFailed(reason.value_or(FailureReason::INTERNAL_ERROR));
    }
    handle.task.AdvanceTo(TaskStatus::REVIEW);
    
    spdlog::info("Attempt {} finished as {}; task {} now {}", handle.attempt.Id(),
                 AttemptStatusToString(handle.attempt.Status()), handle.task.Id(),
                 TaskStatusToString(handle.task.Status()));
}

// ============================================================================
// OBSERVABLE STATE
// ============================================================================

fs::path Supervisor::SnapshotMarkerPath() const {
    return config_.state_dir / "last-snapshot.txt";
}

void Supervisor::RecordSnapshot(const std::string& snapshot_id) {
    const fs::path marker = SnapshotMarkerPath();
    const fs::path temp = marker.string() + ".tmp";
    
    {
        std::ofstream out(temp, std::ios::trunc);
        out << snapshot_id << "\n";
        if (!out) {
            spdlog::warn("Could not write snapshot marker {}", temp.string());
            return;
        }
    }
    
    std::error_code ec;
    fs::rename(temp, marker, ec);
    if (ec) {
        spdlog::warn("Could not update snapshot marker {}: {}", marker.string(), ec.message());
    }
}

std::optional<std::string> Supervisor::LastSnapshot() const {
    return impl_->pool->Metrics().last_snapshot;
}

PoolMetrics Supervisor::PoolStatus() const {
    return impl_->pool->Metrics();
}

SandboxPool& Supervisor::Pool() { return *impl_->pool; }
AttemptPoller& Supervisor::Poller() { return *impl_->poller; }
ArtifactReporter& Supervisor::Reporter() { return *impl_->reporter; }

} // namespace core
} // namespace overseer
