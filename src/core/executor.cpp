/**
 * @file executor.cpp
 * @brief Attempt execution pipeline
 * @date 2025
 */

#include "overseer/core/executor.hpp"
#include "overseer/utils/process_utils.hpp"
#include "overseer/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>
#include <iterator>
#include <sstream>

namespace overseer {
namespace core {

namespace fs = std::filesystem;
using utils::StringUtils;

namespace {

constexpr std::chrono::seconds kDiffTimeout{120};

std::map<std::string, std::string> GitEnvironment() {
    return {
        {"GIT_TERMINAL_PROMPT", "0"},
        {"GIT_ASKPASS", "true"},
        {"LC_ALL", "C"}
    };
}

} // anonymous namespace

Executor::Executor(ExecutorConfig config, std::shared_ptr<CacheHydrator> hydrator)
    : config_(std::move(config))
    , hydrator_(std::move(hydrator)) {
}

fs::path Executor::WorkspaceFor(const std::string& attempt_id) const {
    return config_.workspace_root / StringUtils::SanitizePathComponent(attempt_id);
}

// ============================================================================
// EXECUTION
// ============================================================================

AttemptOutcome Executor::Execute(const AttemptContext& context, SandboxLease& lease,
                                 const CachePaths& paths, const std::atomic<bool>& cancel) {
    const std::string& snapshot_id = lease.SnapshotId();
    const fs::path workspace = WorkspaceFor(context.attempt_id);
    
    spdlog::info("Executing attempt {} for task {} in sandbox {} (workspace {})",
                 context.attempt_id, context.task.id, snapshot_id, workspace.string());
    
    // Setup touches only the host workspace and cache, never the sandbox
    lease.MarkClean();
    
    std::optional<MirrorInfo> mirror;
    try {
        mirror = PrepareWorkspace(context, paths, workspace, cancel);
    } catch (const std::exception& e) {
        auto reason = cancel.load() ? FailureReason::CANCELLED : FailureReason::SETUP_FAILED;
        spdlog::error("Attempt {} setup failed: {}", context.attempt_id, e.what());
        auto outcome = AttemptOutcome::Failure(reason, e.what());
        outcome.log = BuildLogHeader(context, snapshot_id, paths, mirror) +
                      "\nSetup failed: " + e.what() + "\n";
        CleanupWorkspace(workspace);
        return outcome;
    }
    
    std::string header = BuildLogHeader(context, snapshot_id, paths, mirror);
    AttemptOutcome outcome;
    std::string workload_output;
    
    if (cancel.load()) {
        outcome = AttemptOutcome::Failure(FailureReason::CANCELLED, "cancelled before the workload started");
    } else if (!config_.workload_command) {
        auto started = std::chrono::steady_clock::now();
        try {
            RunBuiltinWorkload(context, snapshot_id, paths, mirror, workspace);
            outcome.status = AttemptStatus::SUCCEEDED;
            outcome.exit_code = 0;
            workload_output = "Recorded task entry in TASK_LOG.md\n";
        } catch (const std::exception& e) {
            outcome = AttemptOutcome::Failure(FailureReason::WORKLOAD_FAILED, e.what());
            workload_output = std::string(e.what()) + "\n";
        }
        outcome.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started);
    } else {
        utils::ProcessOptions options;
        options.argv = {"/bin/sh", "-c", *config_.workload_command};
        options.working_directory = workspace;
        options.merge_stderr = true;
        options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.attempt_timeout);
        options.cancel_flag = &cancel;
        options.poll_interval = config_.observation_interval;
        options.environment = {
            {"OVERSEER_TASK_ID", context.task.id},
            {"OVERSEER_ATTEMPT_ID", context.attempt_id},
            {"OVERSEER_SNAPSHOT_ID", snapshot_id},
            {"OVERSEER_TASK_TITLE", context.task.title},
            {"OVERSEER_TASK_DESCRIPTION", context.task.description.value_or("")},
            {"OVERSEER_WORKSPACE", workspace.string()},
            {"OVERSEER_CACHE_ROOT", paths.root.string()},
            {"npm_config_cache", paths.npm.string()},
            {"PIP_CACHE_DIR", paths.pip.string()},
            {"CARGO_HOME", paths.cargo.string()}
        };
        if (mirror) {
            options.environment["OVERSEER_GIT_MIRROR"] = mirror->path.string();
        }
        
        auto result = utils::RunProcess(options);
        workload_output = result.stdout_output;
        
        if (!result.started) {
            outcome = AttemptOutcome::Failure(FailureReason::INTERNAL_ERROR,
                                              "workload did not start: " + result.error);
        } else if (result.timed_out) {
            outcome = AttemptOutcome::Failure(FailureReason::TIMEOUT,
                fmt::format("deadline of {}s exceeded", config_.attempt_timeout.count()), true);
        } else if (result.cancelled) {
            outcome = AttemptOutcome::Failure(FailureReason::CANCELLED, "cancelled while running", true);
        } else if (result.term_signal != 0) {
            outcome = AttemptOutcome::Failure(FailureReason::WORKLOAD_CRASHED,
                                              utils::DescribeTermination(result), true);
        } else if (result.exit_code != 0) {
            outcome = AttemptOutcome::Failure(FailureReason::WORKLOAD_FAILED,
                                              utils::DescribeTermination(result));
            outcome.exit_code = result.exit_code;
        } else {
            outcome.status = AttemptStatus::SUCCEEDED;
            outcome.exit_code = 0;
        }
        outcome.duration = result.duration;
        
        if (result.output_truncated) {
            workload_output += "\n[output truncated]\n";
        }
    }
    
    std::string diff_error;
    outcome.diff = ComputeDiff(workspace, diff_error);
    if (!diff_error.empty()) {
        spdlog::error("Attempt {}: diff failed: {}", context.attempt_id, diff_error);
        if (outcome.Succeeded()) {
            outcome = AttemptOutcome::Failure(FailureReason::INTERNAL_ERROR, "diff failed: " + diff_error);
        }
    }
    
    std::ostringstream log;
    log << header;
    log << "\n--- workload output ---\n";
    log << workload_output;
    if (!workload_output.empty() && workload_output.back() != '\n') {
        log << '\n';
    }
    log << "--- end of output ---\n";
    if (outcome.Succeeded()) {
        log << fmt::format("Attempt {} succeeded in {} ms\n", context.attempt_id, outcome.duration.count());
    } else {
        log << fmt::format("Attempt {} failed: {} ({})\n", context.attempt_id,
                           FailureReasonToString(*outcome.reason), outcome.detail);
    }
    outcome.log = log.str();
    
    if (outcome.tainted) {
        lease.MarkTainted();
    } else {
        lease.MarkClean();
    }
    
    CleanupWorkspace(workspace);
    
    if (outcome.Succeeded()) {
        spdlog::info("Attempt {} succeeded ({} bytes of diff)", context.attempt_id, outcome.diff.size());
    } else {
        spdlog::warn("Attempt {} failed: {} ({}), sandbox {}", context.attempt_id,
                     FailureReasonToString(*outcome.reason), outcome.detail,
                     outcome.tainted ? "tainted" : "clean");
    }
    return outcome;
}

// ============================================================================
// WORKSPACE AND REPOSITORY
// ============================================================================

std::optional<MirrorInfo> Executor::PrepareWorkspace(const AttemptContext& context, const CachePaths& paths,
                                                     const fs::path& workspace,
                                                     const std::atomic<bool>& cancel) {
    std::error_code ec;
    fs::remove_all(workspace, ec);
    if (ec) {
        throw SetupError(fmt::format("cannot clear workspace {}: {}", workspace.string(), ec.message()));
    }
    fs::create_directories(workspace, ec);
    if (ec) {
        throw SetupError(fmt::format("cannot create workspace {}: {}", workspace.string(), ec.message()));
    }
    
    if (!context.task.repository) {
        auto init = Git({"init", "-q", workspace.string()}, &cancel);
        if (!init.ok) {
            throw SetupError("git init failed: " + StringUtils::Trim(init.output));
        }
        return std::nullopt;
    }
    
    const auto& repository = *context.task.repository;
    auto lock = hydrator_->LockRepository(repository.id);
    MirrorInfo mirror = hydrator_->MirrorFor(paths, repository);
    SyncMirror(repository, mirror, cancel);
    
    auto clone = Git({"clone", "-q", "--branch", repository.default_branch, "--single-branch",
                      mirror.path.string(), workspace.string()}, &cancel);
    if (!clone.ok) {
        throw SetupError(fmt::format("clone of {} ({}) from mirror failed: {}", repository.name,
                                     repository.default_branch, StringUtils::Trim(clone.output)));
    }
    return mirror;
}

void Executor::SyncMirror(const RepositoryRef& repository, MirrorInfo& mirror, const std::atomic<bool>& cancel) {
    if (mirror.hit) {
        spdlog::info("Git mirror hit for {}: {}", repository.name, mirror.path.string());
        auto update = Git({"--git-dir", mirror.path.string(), "remote", "update", "--prune"}, &cancel);
        if (!update.ok) {
            if (cancel.load()) {
                throw SetupError("cancelled during mirror update");
            }
            // A stale mirror still serves the clone
            spdlog::warn("Mirror update for {} failed, using cached state: {}",
                         repository.name, StringUtils::Trim(update.output));
        }
        return;
    }
    
    spdlog::info("Git mirror miss for {}, cloning {} into {}", repository.name,
                 repository.git_url, mirror.path.string());
    std::error_code ec;
    fs::remove_all(mirror.path, ec);
    
    auto clone = Git({"clone", "--mirror", "-q", repository.git_url, mirror.path.string()}, &cancel);
    if (!clone.ok) {
        fs::remove_all(mirror.path, ec);
        throw SetupError(fmt::format("mirror clone of {} failed: {}", repository.git_url,
                                     StringUtils::Trim(clone.output)));
    }
}

Executor::GitResult Executor::Git(const std::vector<std::string>& args, const std::atomic<bool>* cancel) const {
    utils::ProcessOptions options;
    options.argv.reserve(args.size() + 1);
    options.argv.push_back("git");
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.environment = GitEnvironment();
    options.merge_stderr = true;
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(config_.git_timeout);
    options.cancel_flag = cancel;
    options.poll_interval = config_.observation_interval;
    
    auto result = utils::RunProcess(options);
    GitResult git;
    git.ok = result.Succeeded();
    git.output = result.started ? result.stdout_output : result.error;
    if (!git.ok && result.started) {
        git.output += " [" + utils::DescribeTermination(result) + "]";
    }
    return git;
}

std::string Executor::ComputeDiff(const fs::path& workspace, std::string& error) const {
    const std::string dir = workspace.string();
    
    utils::ProcessOptions add;
    add.argv = {"git", "-C", dir, "add", "-A"};
    add.environment = GitEnvironment();
    add.merge_stderr = true;
    add.timeout = kDiffTimeout;
    auto added = utils::RunProcess(add);
    if (!added.Succeeded()) {
        error = "git add failed: " + StringUtils::Trim(added.started ? added.stdout_output : added.error);
        return "";
    }
    
    // Written to a file beside the workspace; captured stdout is size-capped
    std::error_code ec;
    const fs::path patch_file = fs::absolute(workspace, ec).string() + ".diff";
    if (ec) {
        error = "cannot resolve workspace path: " + ec.message();
        return "";
    }
    
    utils::ProcessOptions diff;
    diff.argv = {"git", "-C", dir, "diff", "--cached", "--no-color", "--binary",
                 "--output=" + patch_file.string()};
    diff.environment = GitEnvironment();
    diff.timeout = kDiffTimeout;
    auto result = utils::RunProcess(diff);
    if (!result.Succeeded()) {
        error = "git diff failed: " + StringUtils::Trim(result.started ? result.stderr_output : result.error);
        fs::remove(patch_file, ec);
        return "";
    }
    
    std::string patch;
    {
        std::ifstream in(patch_file, std::ios::binary);
        if (!in) {
            error = "cannot read " + patch_file.string();
            fs::remove(patch_file, ec);
            return "";
        }
        patch.assign(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
        if (in.bad()) {
            error = "failed reading " + patch_file.string();
            patch.clear();
        }
    }
    fs::remove(patch_file, ec);
    return patch;
}

// ============================================================================
// LOG AND BUILT-IN WORKLOAD
// ============================================================================

std::string Executor::BuildLogHeader(const AttemptContext& context, const std::string& snapshot_id,
                                     const CachePaths& paths, const std::optional<MirrorInfo>& mirror) const {
    std::ostringstream log;
    log << "[" << StringUtils::FormatTimestamp(std::chrono::system_clock::now()) << "] "
        << "Attempt " << context.attempt_id << " for task " << context.task.id
        << " (" << context.task.title << ")\n";
    log << "Using prewarmed snapshot: " << snapshot_id << "\n";
    log << "Cache hits:\n";
    if (mirror) {
        log << "- Git mirror: " << mirror->path.string() << (mirror->hit ? " (hit)" : " (miss)") << "\n";
    } else {
        log << "- Git mirror: none\n";
    }
    log << "- npm cache: " << paths.npm.string() << "\n";
    log << "- pip cache: " << paths.pip.string() << "\n";
    log << "- cargo cache: " << paths.cargo.string() << "\n";
    
    const auto& task = context.task;
    if (task.repository) {
        log << "Repository: " << task.repository->name << " (" << task.repository->git_url
            << ") default branch " << task.repository->default_branch
            << " (id " << task.repository->id << ")\n";
    }
    if (task.environment_id) {
        log << "Environment: " << *task.environment_id << "\n";
    }
    return log.str();
}

void Executor::RunBuiltinWorkload(const AttemptContext& context, const std::string& snapshot_id,
                                  const CachePaths& paths, const std::optional<MirrorInfo>& mirror,
                                  const fs::path& workspace) const {
    const auto& task = context.task;
    std::ofstream out(workspace / "TASK_LOG.md", std::ios::app);
    if (!out) {
        throw std::runtime_error("cannot open TASK_LOG.md in " + workspace.string());
    }
    
    out << "## Task " << task.id << " (" << task.title << ")\n";
    out << "Processed at " << StringUtils::FormatTimestamp(std::chrono::system_clock::now())
        << " by overseer\n";
    out << "Using snapshot: " << snapshot_id << "\n";
    out << "Cache root: " << paths.root.string() << "\n";
    if (mirror) {
        out << "Repository mirror cache: " << mirror->path.string() << "\n";
    }
    out << "npm cache: " << paths.npm.string() << "\n";
    out << "pip cache: " << paths.pip.string() << "\n";
    out << "cargo cache: " << paths.cargo.string() << "\n";
    if (task.environment_id) {
        out << "Environment: " << *task.environment_id << "\n";
    }
    if (task.description) {
        for (const auto& line : StringUtils::SplitLines(*task.description)) {
            out << "> " << line << "\n";
        }
    }
    out << "\n";
    
    if (!out) {
        throw std::runtime_error("failed writing TASK_LOG.md");
    }
}

void Executor::CleanupWorkspace(const fs::path& workspace) const {
    if (config_.keep_workspaces) {
        spdlog::debug("Keeping workspace {}", workspace.string());
        return;
    }
    std::error_code ec;
    fs::remove_all(workspace, ec);
    if (ec) {
        spdlog::warn("Failed to remove workspace {}: {}", workspace.string(), ec.message());
    }
}

} // namespace core
} // namespace overseer
