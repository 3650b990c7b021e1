/**
 * @file process_utils.hpp
 * @brief Child process execution with deadlines and cooperative cancellation
 * 
 * Every external program the supervisor drives (prewarm hooks, git, curl,
 * the container runtime and the workload itself) goes through RunProcess.
 * The child runs in its own process group so that a timeout or cancellation
 * terminates the whole subtree: SIGTERM first, SIGKILL after a grace period.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <atomic>
#include <chrono>
#include <optional>
#include <filesystem>

namespace overseer {
namespace utils {

/**
 * @struct ProcessOptions
 * @brief How to launch and supervise a child process
 */
struct ProcessOptions {
    std::vector<std::string> argv;                 ///< Program and arguments (argv[0] resolved via PATH)
    std::filesystem::path working_directory;       ///< Child cwd (empty = inherit)
    std::map<std::string, std::string> environment;  ///< Variables set on top of the inherited environment
    std::vector<std::string> unset_environment;    ///< Variables removed from the inherited environment
    std::string stdin_data;                        ///< Bytes written to the child's stdin, then closed
    bool merge_stderr{false};                      ///< Send stderr into stdout_output (combined log)
    
    std::chrono::milliseconds timeout{0};          ///< Wall-clock deadline (0 = none)
    const std::atomic<bool>* cancel_flag{nullptr}; ///< Checked at every observation point
    std::chrono::milliseconds poll_interval{50};   ///< Observation interval
    std::chrono::milliseconds kill_grace{2000};    ///< SIGTERM → SIGKILL delay
    std::size_t max_output_bytes{16 * 1024 * 1024};  ///< Per-stream capture limit
};

/**
 * @struct ProcessResult
 * @brief Outcome of a child process
 */
struct ProcessResult {
    bool started{false};            ///< fork/exec succeeded
    int exit_code{-1};              ///< Exit status (valid when term_signal == 0)
    int term_signal{0};             ///< Signal that terminated the child, 0 if exited
    bool timed_out{false};          ///< Deadline exceeded, child was killed
    bool cancelled{false};          ///< Cancel flag observed, child was killed
    bool output_truncated{false};   ///< A stream exceeded max_output_bytes
    std::string stdout_output;      ///< Captured stdout (plus stderr if merged)
    std::string stderr_output;      ///< Captured stderr (empty if merged)
    std::chrono::milliseconds duration{0};  ///< Wall-clock runtime
    std::string error;              ///< Launch failure description
    
    /// Exited normally with status 0, not killed by us or by a signal
    bool Succeeded() const {
        return started && !timed_out && !cancelled && term_signal == 0 && exit_code == 0;
    }
};

/**
 * @brief Run a child process to completion
 * 
 * Never throws for child failures; launch errors are reported through
 * ProcessResult::started / ProcessResult::error.
 * 
 * **Usage Example**:
 * @code
 * ProcessOptions options;
 * options.argv = {"git", "-C", workspace.string(), "status", "--porcelain"};
 * options.timeout = std::chrono::seconds(30);
 * auto result = RunProcess(options);
 * if (!result.Succeeded()) {
 *     spdlog::error("git status failed: {}", result.stderr_output);
 * }
 * @endcode
 * 
 * @param options Launch configuration
 * @return Captured output and termination details
 */
ProcessResult RunProcess(const ProcessOptions& options);

/**
 * @brief Locate an executable on PATH
 * @param name Program name (returned as-is if it contains a '/')
 * @return Absolute path if found and executable
 */
std::optional<std::filesystem::path> FindExecutable(const std::string& name);

/**
 * @brief Human-readable summary of how a process ended
 * @param result Process result
 * @return e.g. "exit code 1", "killed by signal 9", "timed out"
 */
std::string DescribeTermination(const ProcessResult& result);

} // namespace utils
} // namespace overseer
