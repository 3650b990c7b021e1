/**
 * @file test_helpers.hpp
 * @brief Fakes and fixtures shared by the unit tests
 * @date 2025
 */

#pragma once

#include "overseer/api/control_plane_client.hpp"
#include "overseer/api/http_transport.hpp"
#include "overseer/core/snapshot_provider.hpp"
#include "overseer/utils/process_utils.hpp"
#include "overseer/utils/string_utils.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <atomic>
#include <chrono>
#include <deque>
#include <filesystem>
#include <fstream>
#include <functional>
#include <iterator>
#include <map>
#include <mutex>
#include <optional>
#include <set>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

namespace overseer {
namespace test {

namespace fs = std::filesystem;

/// Unique scratch directory removed on destruction
class TempDir {
public:
    TempDir()
        : path_(fs::temp_directory_path() / ("overseer-test-" + utils::StringUtils::GenerateUUID())) {
        fs::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& Path() const { return path_; }
    fs::path operator/(const std::string& name) const { return path_ / name; }

private:
    fs::path path_;
};

inline bool HasTool(const std::string& name) {
    return utils::FindExecutable(name).has_value();
}

inline void WriteText(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::trunc);
    out << content;
}

inline std::string ReadText(const fs::path& path) {
    std::ifstream in(path);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/// Write an executable /bin/sh script
inline fs::path WriteScript(const fs::path& path, const std::string& body) {
    WriteText(path, "#!/bin/sh\n" + body + "\n");
    fs::permissions(path, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec,
                    fs::perm_options::replace);
    return path;
}

/// Run a command and return whether it exited 0
inline bool RunCommand(const std::vector<std::string>& argv, const fs::path& cwd = {}) {
    utils::ProcessOptions options;
    options.argv = argv;
    options.working_directory = cwd;
    options.merge_stderr = true;
    options.timeout = std::chrono::seconds(60);
    return utils::RunProcess(options).Succeeded();
}

/// Poll `predicate` until it holds or `timeout` passes
inline bool WaitUntil(const std::function<bool()>& predicate,
                      std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (predicate()) {
            return true;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
    }
    return predicate();
}

// ============================================================================
// SNAPSHOT PROVIDER
// ============================================================================

class FakeSnapshotProvider : public core::SnapshotProvider {
public:
    std::string ProduceSnapshot(const std::optional<std::string>& snapshot_template) override {
        std::this_thread::sleep_for(delay);
        std::lock_guard<std::mutex> lock(mutex_);
        ++calls_;
        last_template_ = snapshot_template;
        if (failures_remaining > 0) {
            --failures_remaining;
            throw core::SnapshotError("scripted prewarm failure");
        }
        std::string id = fixed_id.empty() ? "fake-" + std::to_string(++counter_) : fixed_id;
        produced_.push_back(id);
        return id;
    }

    void Destroy(const std::string& snapshot_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        destroyed_.push_back(snapshot_id);
    }

    std::string Name() const override { return "fake"; }

    std::size_t Calls() const { std::lock_guard<std::mutex> lock(mutex_); return calls_; }
    std::vector<std::string> Produced() const { std::lock_guard<std::mutex> lock(mutex_); return produced_; }
    std::vector<std::string> Destroyed() const { std::lock_guard<std::mutex> lock(mutex_); return destroyed_; }
    std::optional<std::string> LastTemplate() const { std::lock_guard<std::mutex> lock(mutex_); return last_template_; }

    bool WasDestroyed(const std::string& id) const {
        auto destroyed = Destroyed();
        return std::find(destroyed.begin(), destroyed.end(), id) != destroyed.end();
    }

    int failures_remaining{0};                  ///< Next N calls throw
    std::string fixed_id;                       ///< Non-empty: always return this id
    std::chrono::milliseconds delay{0};         ///< Simulated prewarm latency

private:
    mutable std::mutex mutex_;
    std::size_t calls_{0};
    std::size_t counter_{0};
    std::vector<std::string> produced_;
    std::vector<std::string> destroyed_;
    std::optional<std::string> last_template_;
};

// ============================================================================
// CONTROL PLANE
// ============================================================================

class FakeControlPlane : public api::ControlPlaneClient {
public:
    std::vector<core::TaskSummary> ListPendingTasks(
        const std::optional<std::string>& environment_id) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++list_calls;
        last_environment = environment_id;
        std::vector<core::TaskSummary> result;
        for (const auto& task : pending) {
            if (!environment_id || task.environment_id == environment_id) {
                result.push_back(task);
            }
        }
        return result;
    }

    bool ClaimTask(const std::string& task_id) override {
        std::lock_guard<std::mutex> lock(mutex);
        claimed.push_back(task_id);
        return conflicting.count(task_id) == 0;
    }

    std::optional<std::string> CreateAttempt(const std::string& task_id,
                                             const std::optional<std::string>& /*environment_id*/) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++create_calls;
        if (not_assignee.count(task_id) > 0) {
            return std::nullopt;
        }
        return "attempt-" + task_id + "-" + std::to_string(create_calls);
    }

    core::TaskDetail GetTask(const std::string& task_id) override {
        std::lock_guard<std::mutex> lock(mutex);
        if (get_task_status != 200) {
            throw api::ControlPlaneError("get task failed", get_task_status);
        }
        auto it = details.find(task_id);
        if (it != details.end()) {
            return it->second;
        }
        core::TaskDetail detail;
        detail.id = task_id;
        detail.title = "Task " + task_id;
        return detail;
    }

    std::string UploadArtifact(const api::ArtifactUpload& artifact) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++upload_calls;
        if (!upload_exception.empty()) {
            throw std::runtime_error(upload_exception);
        }
        if (upload_failures_remaining > 0) {
            --upload_failures_remaining;
            throw api::ControlPlaneError("upload failed", upload_failure_status);
        }
        uploads.push_back(artifact);
        return artifact.kind + "-artifact-" + std::to_string(uploads.size());
    }

    void CompleteAttempt(const std::string& attempt_id, const api::CompletionReport& report) override {
        std::lock_guard<std::mutex> lock(mutex);
        ++complete_calls;
        if (complete_failures_remaining > 0) {
            --complete_failures_remaining;
            throw api::ControlPlaneError("complete failed", complete_failure_status);
        }
        completions.emplace_back(attempt_id, report);
    }

    std::size_t CompletionCount() {
        std::lock_guard<std::mutex> lock(mutex);
        return completions.size();
    }

    std::mutex mutex;
    std::vector<core::TaskSummary> pending;
    std::map<std::string, core::TaskDetail> details;
    std::set<std::string> conflicting;         ///< ClaimTask answers 409
    std::set<std::string> not_assignee;        ///< CreateAttempt answers 403
    int get_task_status{200};
    int upload_failures_remaining{0};
    int upload_failure_status{503};
    std::string upload_exception;              ///< Non-empty: UploadArtifact throws std::runtime_error
    int complete_failures_remaining{0};
    int complete_failure_status{503};

    int list_calls{0};
    int create_calls{0};
    int upload_calls{0};
    int complete_calls{0};
    std::optional<std::string> last_environment;
    std::vector<std::string> claimed;
    std::vector<api::ArtifactUpload> uploads;
    std::vector<std::pair<std::string, api::CompletionReport>> completions;
};

// ============================================================================
// HTTP TRANSPORT
// ============================================================================

class ScriptedTransport : public api::HttpTransport {
public:
    using Handler = std::function<api::HttpResponse(const api::HttpRequest&)>;

    explicit ScriptedTransport(Handler handler) : handler_(std::move(handler)) {}

    api::HttpResponse Send(const api::HttpRequest& request) override {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            requests_.push_back(request);
        }
        return handler_(request);
    }

    std::vector<api::HttpRequest> Requests() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return requests_;
    }

private:
    Handler handler_;
    mutable std::mutex mutex_;
    std::vector<api::HttpRequest> requests_;
};

inline api::HttpResponse Respond(int status, const std::string& body = "") {
    api::HttpResponse response;
    response.status = status;
    response.body = body;
    return response;
}

} // namespace test
} // namespace overseer
