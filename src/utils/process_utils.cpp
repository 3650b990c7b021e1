/**
 * @file process_utils.cpp
 * @brief fork/exec based process runner with output capture
 * 
 * **Execution Model**:
 * ```
 * parent                          child
 *   prepare argv/envp/cwd
 *   fork ───────────────────────► setpgid(0, 0)
 *                                 dup2 pipes onto 0/1/2
 *                                 chdir, execvpe
 *   exec status pipe ◄──────────  (CLOEXEC: EOF on success, errno on failure)
 *   poll loop:
 *     read stdout/stderr, feed stdin
 *     waitpid(WNOHANG)
 *     deadline / cancel flag ─► killpg(SIGTERM) ... grace ... killpg(SIGKILL)
 * ```
 * 
 * Only async-signal-safe calls are made between fork and exec; everything
 * the child needs (argv, envp, cwd) is materialised beforehand.
 * 
 * @date 2025
 */

#include "overseer/utils/process_utils.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <sstream>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace overseer {
namespace utils {

namespace {

constexpr std::chrono::milliseconds kDrainWindow{500};

void IgnoreSigpipeOnce() {
    static std::once_flag once;
    std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void SetNonBlocking(int fd) {
    if (fd < 0) {
        return;
    }
    int flags = fcntl(fd, F_GETFL, 0);
    if (flags >= 0) {
        (void)fcntl(fd, F_SETFL, flags | O_NONBLOCK);
    }
}

std::vector<std::string> BuildEnvironment(const ProcessOptions& options) {
    std::map<std::string, std::string> merged;
    
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string pair(*entry);
        auto eq = pair.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        merged[pair.substr(0, eq)] = pair.substr(eq + 1);
    }
    
    for (const auto& name : options.unset_environment) {
        merged.erase(name);
    }
    for (const auto& [name, value] : options.environment) {
        merged[name] = value;
    }
    
    std::vector<std::string> result;
    result.reserve(merged.size());
    for (const auto& [name, value] : merged) {
        result.push_back(name + "=" + value);
    }
    return result;
}

void AppendCapped(std::string& out, const char* data, std::size_t size,
                  std::size_t cap, bool& truncated) {
    std::size_t room = cap > out.size() ? cap - out.size() : 0;
    if (size > room) {
        truncated = true;
        size = room;
    }
    out.append(data, size);
}

// Read everything currently available; closes fd on EOF or hard error
void DrainPipe(int& fd, std::string& out, std::size_t cap, bool& truncated) {
    char buffer[4096];
    while (fd >= 0) {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n > 0) {
            AppendCapped(out, buffer, static_cast<std::size_t>(n), cap, truncated);
            continue;
        }
        if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
            return;
        }
        if (n < 0 && errno == EINTR) {
            continue;
        }
        CloseFd(fd);
    }
}

void SignalGroup(pid_t pid, int sig) {
    if (::kill(-pid, sig) != 0 && errno == ESRCH) {
        (void)::kill(pid, sig);
    }
}

} // anonymous namespace

// ============================================================================
// PROCESS EXECUTION
// ============================================================================

ProcessResult RunProcess(const ProcessOptions& options) {
    ProcessResult result;
    
    if (options.argv.empty() || options.argv[0].empty()) {
        result.error = "empty argv";
        return result;
    }
    
    IgnoreSigpipeOnce();
    
    std::vector<char*> argv;
    argv.reserve(options.argv.size() + 1);
    for (const auto& arg : options.argv) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    
    auto env_storage = BuildEnvironment(options);
    std::vector<char*> envp;
    envp.reserve(env_storage.size() + 1);
    for (auto& entry : env_storage) {
        envp.push_back(const_cast<char*>(entry.c_str()));
    }
    envp.push_back(nullptr);
    
    const std::string cwd = options.working_directory.string();
    
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    
    auto close_all = [&]() {
        for (int* p : {in_pipe, out_pipe, err_pipe, exec_pipe}) {
            CloseFd(p[0]);
            CloseFd(p[1]);
        }
    };
    
    if (pipe2(in_pipe, O_CLOEXEC) != 0 || pipe2(out_pipe, O_CLOEXEC) != 0 ||
        (!options.merge_stderr && pipe2(err_pipe, O_CLOEXEC) != 0) ||
        pipe2(exec_pipe, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        close_all();
        return result;
    }
    
    const auto start = std::chrono::steady_clock::now();
    pid_t pid = fork();
    
    if (pid < 0) {
        result.error = std::string("fork failed: ") + std::strerror(errno);
        close_all();
        return result;
    }
    
    if (pid == 0) {
        // child
        (void)setpgid(0, 0);
        (void)dup2(in_pipe[0], STDIN_FILENO);
        (void)dup2(out_pipe[1], STDOUT_FILENO);
        (void)dup2(options.merge_stderr ? out_pipe[1] : err_pipe[1], STDERR_FILENO);
        (void)signal(SIGPIPE, SIG_DFL);
        
        if (!cwd.empty() && chdir(cwd.c_str()) != 0) {
            int err = errno;
            (void)!write(exec_pipe[1], &err, sizeof(err));
            _exit(127);
        }
        
        execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        (void)!write(exec_pipe[1], &err, sizeof(err));
        _exit(127);
    }
    
    // parent
    (void)setpgid(pid, pid);
    CloseFd(in_pipe[0]);
    CloseFd(out_pipe[1]);
    CloseFd(err_pipe[1]);
    CloseFd(exec_pipe[1]);
    
    int exec_errno = 0;
    ssize_t exec_read;
    do {
        exec_read = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
    } while (exec_read < 0 && errno == EINTR);
    CloseFd(exec_pipe[0]);
    
    if (exec_read == static_cast<ssize_t>(sizeof(exec_errno))) {
        int status = 0;
        (void)waitpid(pid, &status, 0);
        result.error = "failed to execute " + options.argv[0] + ": " + std::strerror(exec_errno);
        close_all();
        return result;
    }
    
    result.started = true;
    
    int stdin_fd = in_pipe[1];
    int stdout_fd = out_pipe[0];
    int stderr_fd = err_pipe[0];
    in_pipe[1] = out_pipe[0] = err_pipe[0] = -1;
    
    SetNonBlocking(stdin_fd);
    SetNonBlocking(stdout_fd);
    SetNonBlocking(stderr_fd);
    
    std::size_t stdin_offset = 0;
    if (options.stdin_data.empty()) {
        CloseFd(stdin_fd);
    }
    
    bool exited = false;
    int status = 0;
    bool term_sent = false;
    bool kill_sent = false;
    std::chrono::steady_clock::time_point kill_at{};
    std::optional<std::chrono::steady_clock::time_point> drain_until;
    
    const int poll_ms = static_cast<int>(std::max<long long>(1, options.poll_interval.count()));
    
    while (true) {
        pollfd fds[3];
        nfds_t count = 0;
        if (stdout_fd >= 0) fds[count++] = {stdout_fd, POLLIN, 0};
        if (stderr_fd >= 0) fds[count++] = {stderr_fd, POLLIN, 0};
        if (stdin_fd >= 0) fds[count++] = {stdin_fd, POLLOUT, 0};
        
        if (count > 0) {
            (void)poll(fds, count, poll_ms);
        } else if (!exited) {
            (void)poll(nullptr, 0, poll_ms);
        }
        
        DrainPipe(stdout_fd, result.stdout_output, options.max_output_bytes, result.output_truncated);
        DrainPipe(stderr_fd, result.stderr_output, options.max_output_bytes, result.output_truncated);
        
        while (stdin_fd >= 0 && stdin_offset < options.stdin_data.size()) {
            ssize_t n = ::write(stdin_fd, options.stdin_data.data() + stdin_offset,
                                options.stdin_data.size() - stdin_offset);
            if (n > 0) {
                stdin_offset += static_cast<std::size_t>(n);
            } else if (n < 0 && errno == EINTR) {
                continue;
            } else if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK)) {
                break;
            } else {
                CloseFd(stdin_fd);  // EPIPE: child stopped reading
            }
        }
        if (stdin_fd >= 0 && stdin_offset >= options.stdin_data.size()) {
            CloseFd(stdin_fd);
        }
        
        if (!exited) {
            pid_t waited = waitpid(pid, &status, WNOHANG);
            if (waited == pid) {
                exited = true;
            }
        }
        
        auto now = std::chrono::steady_clock::now();
        
        if (exited) {
            if (stdout_fd < 0 && stderr_fd < 0) {
                break;
            }
            // Grandchildren may still hold the pipes open
            if (!drain_until) {
                drain_until = now + kDrainWindow;
            } else if (now >= *drain_until) {
                break;
            }
            continue;
        }
        
        if (!term_sent) {
            if (options.timeout.count() > 0 && now - start >= options.timeout) {
                result.timed_out = true;
            } else if (options.cancel_flag && options.cancel_flag->load()) {
                result.cancelled = true;
            }
            
            if (result.timed_out || result.cancelled) {
                spdlog::debug("Terminating process group {} ({})", pid,
                              result.timed_out ? "deadline exceeded" : "cancelled");
                SignalGroup(pid, SIGTERM);
                term_sent = true;
                kill_at = now + options.kill_grace;
            }
        } else if (!kill_sent && now >= kill_at) {
            spdlog::debug("Process group {} ignored SIGTERM, sending SIGKILL", pid);
            SignalGroup(pid, SIGKILL);
            kill_sent = true;
        }
    }
    
    CloseFd(stdin_fd);
    CloseFd(stdout_fd);
    CloseFd(stderr_fd);
    
    if (term_sent) {
        // Reap stragglers left in the group
        (void)::kill(-pid, SIGKILL);
    }
    
    if (WIFEXITED(status)) {
        result.exit_code = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.term_signal = WTERMSIG(status);
        result.exit_code = 128 + result.term_signal;
    }
    
    result.duration = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    
    return result;
}

// ============================================================================
// HELPERS
// ============================================================================

std::optional<std::filesystem::path> FindExecutable(const std::string& name) {
    if (name.empty()) {
        return std::nullopt;
    }
    
    if (name.find('/') != std::string::npos) {
        if (::access(name.c_str(), X_OK) == 0) {
            return std::filesystem::path(name);
        }
        return std::nullopt;
    }
    
    const char* path_env = std::getenv("PATH");
    std::string path_list = path_env ? path_env : "/usr/local/bin:/usr/bin:/bin";
    
    std::istringstream stream(path_list);
    std::string dir;
    while (std::getline(stream, dir, ':')) {
        if (dir.empty()) {
            dir = ".";
        }
        auto candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0) {
            return candidate;
        }
    }
    
    return std::nullopt;
}

std::string DescribeTermination(const ProcessResult& result) {
    if (!result.started) {
        return "not started (" + result.error + ")";
    }
    if (result.timed_out) {
        return "timed out after " + std::to_string(result.duration.count()) + " ms";
    }
    if (result.cancelled) {
        return "cancelled";
    }
    if (result.term_signal != 0) {
        return "killed by signal " + std::to_string(result.term_signal);
    }
    return "exit code " + std::to_string(result.exit_code);
}

} // namespace utils
} // namespace overseer
