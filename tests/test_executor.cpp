/**
 * @file test_executor.cpp
 * @brief Workspace preparation, workload outcomes, diff and log capture
 * @date 2025
 */

#include "overseer/core/executor.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include <thread>

using namespace overseer::core;
using overseer::test::FakeSnapshotProvider;
using overseer::test::HasTool;
using overseer::test::RunCommand;
using overseer::test::TempDir;
using overseer::test::WriteText;
using ::testing::HasSubstr;
using ::testing::Not;

namespace fs = std::filesystem;

namespace {

class ExecutorTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!HasTool("git") || !HasTool("sh")) {
            GTEST_SKIP() << "git and sh are required";
        }
        hydrator = std::make_shared<CacheHydrator>(temp / "cache");
        paths = hydrator->Ensure();

        config.workspace_root = temp / "workspaces";
        config.attempt_timeout = std::chrono::seconds(30);
        config.git_timeout = std::chrono::seconds(60);
        config.observation_interval = std::chrono::milliseconds(20);

        PoolConfig pool_config;
        pool_config.target_size = 1;
        pool_config.max_size = 1;
        pool_config.prewarm_backoff.max_retries = 0;
        pool = std::make_unique<SandboxPool>(pool_config, provider);
        ASSERT_TRUE(pool->Prewarm());
    }

    static AttemptContext Context(const std::string& task_id = "t1") {
        AttemptContext context;
        context.attempt_id = "attempt-" + task_id;
        context.task.id = task_id;
        context.task.title = "Update docs";
        context.task.description = "first line\nsecond line";
        context.task.environment_id = "env-1";
        return context;
    }

    AttemptOutcome Run(const std::optional<std::string>& command, SandboxLease& lease,
                       const AttemptContext& context = Context()) {
        config.workload_command = command;
        Executor executor(config, hydrator);
        return executor.Execute(context, lease, paths, cancel);
    }

    TempDir temp;
    std::shared_ptr<CacheHydrator> hydrator;
    CachePaths paths;
    ExecutorConfig config;
    std::shared_ptr<FakeSnapshotProvider> provider = std::make_shared<FakeSnapshotProvider>();
    std::unique_ptr<SandboxPool> pool;
    std::atomic<bool> cancel{false};
};

} // anonymous namespace

TEST_F(ExecutorTest, BuiltinWorkloadRecordsTaskLog) {
    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::nullopt, lease);

    ASSERT_TRUE(outcome.Succeeded()) << outcome.detail;
    EXPECT_EQ(lease.Outcome(), ReleaseOutcome::CLEAN);
    EXPECT_THAT(outcome.diff, HasSubstr("TASK_LOG.md"));
    EXPECT_THAT(outcome.diff, HasSubstr("+## Task t1 (Update docs)"));
    EXPECT_THAT(outcome.diff, HasSubstr("+> second line"));
    EXPECT_THAT(outcome.log, HasSubstr("Using prewarmed snapshot: " + lease.SnapshotId()));
    EXPECT_THAT(outcome.log, HasSubstr("- Git mirror: none"));
    EXPECT_THAT(outcome.log, HasSubstr("- npm cache: " + paths.npm.string()));
    EXPECT_THAT(outcome.log, HasSubstr("Environment: env-1"));
    EXPECT_FALSE(fs::exists(config.workspace_root / "attempt-t1"));
}

TEST_F(ExecutorTest, NoChangesYieldEmptyDiff) {
    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::string("true"), lease);

    ASSERT_TRUE(outcome.Succeeded()) << outcome.detail;
    EXPECT_TRUE(outcome.diff.empty());
    EXPECT_EQ(outcome.exit_code, std::optional<int>(0));
    EXPECT_THAT(outcome.log, HasSubstr("--- workload output ---"));
}

TEST_F(ExecutorTest, WorkloadSeesAttemptEnvironment) {
    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::string(
        "printf '%s\\n' \"$OVERSEER_TASK_ID\" > task.txt; "
        "echo \"snapshot=$OVERSEER_SNAPSHOT_ID\"; "
        "echo \"pip=$PIP_CACHE_DIR\" >&2"), lease);

    ASSERT_TRUE(outcome.Succeeded()) << outcome.detail;
    EXPECT_THAT(outcome.diff, HasSubstr("+t1"));
    EXPECT_THAT(outcome.log, HasSubstr("snapshot=" + lease.SnapshotId()));
    EXPECT_THAT(outcome.log, HasSubstr("pip=" + paths.pip.string()));
}

TEST_F(ExecutorTest, NonZeroExitIsWorkloadFailure) {
    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::string("echo broken > broken.txt; exit 3"), lease);

    EXPECT_EQ(outcome.status, AttemptStatus::FAILED);
    EXPECT_EQ(outcome.reason, FailureReason::WORKLOAD_FAILED);
    EXPECT_EQ(outcome.exit_code, std::optional<int>(3));
    EXPECT_FALSE(outcome.tainted);
    EXPECT_EQ(lease.Outcome(), ReleaseOutcome::CLEAN);
    EXPECT_THAT(outcome.diff, HasSubstr("+broken"));
    EXPECT_THAT(outcome.log, HasSubstr("workload_failed"));
}

TEST_F(ExecutorTest, TimeoutTaintsSandbox) {
    config.attempt_timeout = std::chrono::seconds(1);
    SandboxLease lease = pool->Acquire();

    auto started = std::chrono::steady_clock::now();
    auto outcome = Run(std::string("sleep 30"), lease);

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(15));
    EXPECT_EQ(outcome.reason, FailureReason::TIMEOUT);
    EXPECT_TRUE(outcome.tainted);
    EXPECT_EQ(lease.Outcome(), ReleaseOutcome::TAINTED);

    const std::string id = lease.SnapshotId();
    lease.Release();
    EXPECT_EQ(pool->StateOf(id), SandboxState::DESTROYED);
}

TEST_F(ExecutorTest, CancellationWhileRunningTaintsSandbox) {
    SandboxLease lease = pool->Acquire();
    std::thread canceller([this] {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        cancel.store(true);
    });
    auto outcome = Run(std::string("sleep 30"), lease);
    canceller.join();

    EXPECT_EQ(outcome.reason, FailureReason::CANCELLED);
    EXPECT_TRUE(outcome.tainted);
    EXPECT_EQ(lease.Outcome(), ReleaseOutcome::TAINTED);
}

TEST_F(ExecutorTest, CancellationBeforeStartLeavesSandboxClean) {
    cancel.store(true);
    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::string("echo never > ran.txt"), lease);

    EXPECT_EQ(outcome.reason, FailureReason::CANCELLED);
    EXPECT_FALSE(outcome.tainted);
    EXPECT_EQ(lease.Outcome(), ReleaseOutcome::CLEAN);
    EXPECT_THAT(outcome.diff, Not(HasSubstr("never")));
}

TEST_F(ExecutorTest, KeepsWorkspaceWhenConfigured) {
    config.keep_workspaces = true;
    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::string("echo kept > kept.txt"), lease);

    ASSERT_TRUE(outcome.Succeeded()) << outcome.detail;
    EXPECT_TRUE(fs::exists(config.workspace_root / "attempt-t1" / "kept.txt"));
}

TEST_F(ExecutorTest, RepositoryIsClonedThroughMirror) {
    const fs::path source = temp / "source";
    fs::create_directories(source);
    ASSERT_TRUE(RunCommand({"git", "init", "-q"}, source));
    ASSERT_TRUE(RunCommand({"git", "symbolic-ref", "HEAD", "refs/heads/main"}, source));
    WriteText(source / "README.md", "hello\n");
    ASSERT_TRUE(RunCommand({"git", "add", "README.md"}, source));
    ASSERT_TRUE(RunCommand({"git", "-c", "user.name=Test", "-c", "user.email=test@example.com",
                            "commit", "-q", "-m", "initial"}, source));

    auto context = Context("t-repo");
    RepositoryRef repository;
    repository.id = "org/repo";
    repository.name = "repo";
    repository.git_url = source.string();
    repository.default_branch = "main";
    context.task.repository = repository;

    {
        SandboxLease lease = pool->Acquire();
        auto outcome = Run(std::string("echo change >> README.md"), lease, context);
        ASSERT_TRUE(outcome.Succeeded()) << outcome.detail << "\n" << outcome.log;
        EXPECT_THAT(outcome.diff, HasSubstr("+change"));
        EXPECT_THAT(outcome.diff, Not(HasSubstr("+hello")));
        EXPECT_THAT(outcome.log, HasSubstr("(miss)"));
        EXPECT_THAT(outcome.log, HasSubstr("Repository: repo"));
        lease.MarkClean();
    }

    EXPECT_TRUE(fs::is_regular_file(paths.git / "org_repo" / "HEAD"));

    SandboxLease lease = pool->Acquire();
    auto again = Run(std::string("true"), lease, context);
    ASSERT_TRUE(again.Succeeded()) << again.detail;
    EXPECT_THAT(again.log, HasSubstr("(hit)"));
    EXPECT_TRUE(again.diff.empty());
}

TEST_F(ExecutorTest, UnreachableRepositoryIsSetupFailure) {
    auto context = Context("t-missing");
    RepositoryRef repository;
    repository.id = "missing";
    repository.name = "missing";
    repository.git_url = (temp / "does-not-exist").string();
    context.task.repository = repository;

    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::string("true"), lease, context);

    EXPECT_EQ(outcome.reason, FailureReason::SETUP_FAILED);
    EXPECT_FALSE(outcome.tainted);
    EXPECT_EQ(lease.Outcome(), ReleaseOutcome::CLEAN);
    EXPECT_THAT(outcome.log, HasSubstr("Setup failed"));
    EXPECT_FALSE(fs::exists(paths.git / "missing"));
}

TEST_F(ExecutorTest, DiffBeyondCaptureLimitIsComplete) {
    const std::size_t capture_limit = overseer::utils::ProcessOptions{}.max_output_bytes;
    const std::size_t line_bytes = capture_limit + 1024 * 1024;

    SandboxLease lease = pool->Acquire();
    auto outcome = Run("head -c " + std::to_string(line_bytes) +
                       " /dev/zero | tr '\\000' 'a' > big.txt && echo >> big.txt", lease);

    ASSERT_TRUE(outcome.Succeeded()) << outcome.detail;
    EXPECT_GT(outcome.diff.size(), line_bytes);
    ASSERT_FALSE(outcome.diff.empty());
    EXPECT_EQ(outcome.diff.back(), '\n');
    EXPECT_THAT(outcome.diff.substr(0, 512), HasSubstr("+++ b/big.txt"));
    EXPECT_FALSE(fs::exists(config.workspace_root / "attempt-t1.diff"));
}

TEST_F(ExecutorTest, NonUtf8BytesAreCapturedVerbatim) {
    SandboxLease lease = pool->Acquire();
    auto outcome = Run(std::string("printf 'caf\\351\\n' > latin1.txt; printf 'caf\\351\\n'"), lease);

    ASSERT_TRUE(outcome.Succeeded()) << outcome.detail;
    EXPECT_THAT(outcome.diff, HasSubstr("+caf\xe9\n"));
    EXPECT_THAT(outcome.log, HasSubstr("caf\xe9\n"));
}
