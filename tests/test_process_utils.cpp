/**
 * @file test_process_utils.cpp
 * @brief Child process capture, deadlines, cancellation and termination
 * @date 2025
 */

#include "overseer/utils/process_utils.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <csignal>
#include <thread>

using namespace overseer::utils;
using overseer::test::HasTool;
using overseer::test::TempDir;

namespace {

class ProcessUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!HasTool("sh")) {
            GTEST_SKIP() << "sh is required";
        }
    }

    static ProcessOptions Shell(const std::string& script) {
        ProcessOptions options;
        options.argv = {"sh", "-c", script};
        options.timeout = std::chrono::seconds(30);
        options.poll_interval = std::chrono::milliseconds(10);
        return options;
    }
};

} // anonymous namespace

TEST_F(ProcessUtilsTest, CapturesStreamsAndExitCode) {
    auto result = RunProcess(Shell("echo out; echo err >&2; exit 7"));
    EXPECT_TRUE(result.started);
    EXPECT_EQ(result.exit_code, 7);
    EXPECT_EQ(result.term_signal, 0);
    EXPECT_EQ(result.stdout_output, "out\n");
    EXPECT_EQ(result.stderr_output, "err\n");
    EXPECT_FALSE(result.Succeeded());
    EXPECT_EQ(DescribeTermination(result), "exit code 7");
}

TEST_F(ProcessUtilsTest, MergesStderrWhenAsked) {
    auto options = Shell("echo one; echo two >&2");
    options.merge_stderr = true;
    auto result = RunProcess(options);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_EQ(result.stdout_output, "one\ntwo\n");
    EXPECT_TRUE(result.stderr_output.empty());
}

TEST_F(ProcessUtilsTest, FeedsStdinAndEnvironment) {
    auto options = Shell("read line; echo \"$line-$OVERSEER_TEST_VALUE-${HOME:-unset}\"");
    options.stdin_data = "input\n";
    options.environment["OVERSEER_TEST_VALUE"] = "env";
    options.unset_environment = {"HOME"};
    auto result = RunProcess(options);
    ASSERT_TRUE(result.Succeeded()) << result.stderr_output;
    EXPECT_EQ(result.stdout_output, "input-env-unset\n");
}

TEST_F(ProcessUtilsTest, RunsInWorkingDirectory) {
    TempDir dir;
    auto options = Shell("pwd -P");
    options.working_directory = dir.Path();
    auto result = RunProcess(options);
    ASSERT_TRUE(result.Succeeded());
    EXPECT_EQ(overseer::utils::StringUtils::Trim(result.stdout_output),
              std::filesystem::canonical(dir.Path()).string());
}

TEST_F(ProcessUtilsTest, DeadlineKillsChild) {
    auto options = Shell("sleep 30");
    options.timeout = std::chrono::milliseconds(200);
    auto started = std::chrono::steady_clock::now();
    auto result = RunProcess(options);

    EXPECT_TRUE(result.timed_out);
    EXPECT_FALSE(result.Succeeded());
    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(10));
}

TEST_F(ProcessUtilsTest, CancelFlagKillsChild) {
    std::atomic<bool> cancel{false};
    auto options = Shell("sleep 30");
    options.cancel_flag = &cancel;
    std::thread canceller([&cancel] {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        cancel.store(true);
    });
    auto result = RunProcess(options);
    canceller.join();

    EXPECT_TRUE(result.cancelled);
    EXPECT_FALSE(result.timed_out);
    EXPECT_EQ(DescribeTermination(result), "cancelled");
}

TEST_F(ProcessUtilsTest, ReportsTerminatingSignal) {
    auto result = RunProcess(Shell("kill -KILL $$"));
    EXPECT_TRUE(result.started);
    EXPECT_EQ(result.term_signal, SIGKILL);
    EXPECT_FALSE(result.Succeeded());
}

TEST_F(ProcessUtilsTest, CapsCapturedOutput) {
    auto options = Shell("i=0; while [ $i -lt 200 ]; do echo 0123456789; i=$((i+1)); done");
    options.max_output_bytes = 100;
    auto result = RunProcess(options);
    EXPECT_TRUE(result.Succeeded());
    EXPECT_TRUE(result.output_truncated);
    EXPECT_LE(result.stdout_output.size(), 100u);
}

TEST(ProcessLaunchTest, MissingProgramDoesNotStart) {
    ProcessOptions options;
    options.argv = {"/nonexistent/overseer-binary"};
    auto result = RunProcess(options);
    EXPECT_FALSE(result.started);
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(result.Succeeded());
}

TEST(ProcessLaunchTest, FindsExecutablesOnPath) {
    if (!HasTool("sh")) {
        GTEST_SKIP() << "sh is required";
    }
    auto sh = FindExecutable("sh");
    ASSERT_TRUE(sh.has_value());
    EXPECT_EQ(sh->filename(), "sh");
    EXPECT_FALSE(FindExecutable("overseer-no-such-tool").has_value());
}
