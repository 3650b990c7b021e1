/**
 * @file control_plane_client.hpp
 * @brief Control plane API used by the poller and the artifact reporter
 * 
 * **Endpoints** (JSON over HTTP, bearer token):
 * ```
 * POST /auth/session                 {email, password} -> {access_token}
 * GET  /tasks?status=pending         -> [{id, title, environment_id?}]
 * POST /tasks/{id}/claim             409 = claimed elsewhere
 * POST /tasks/{id}/attempts          {environment_id?} -> {id}; 403 / 409 = skip
 * GET  /tasks/{id}                   -> task detail with repository
 * POST /artifacts                    {attempt_id, kind, content, sha256} -> {id}
 * POST /tasks/attempts/{id}/complete {status, diff_artifact_id?, log_artifact_id?, reason?}
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "overseer/api/http_transport.hpp"
#include "overseer/core/config.hpp"
#include "overseer/core/types.hpp"

#include <string>
#include <vector>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>

namespace overseer {
namespace api {

/**
 * @class ControlPlaneError
 * @brief Failed control plane call; carries the HTTP status (0 = transport)
 */
class ControlPlaneError : public std::runtime_error {
public:
    ControlPlaneError(const std::string& message, int status)
        : std::runtime_error(message), status_(status) {}
    
    int Status() const { return status_; }
    bool IsTransient() const { return IsTransientStatus(status_); }

private:
    int status_;
};

/**
 * @struct ArtifactUpload
 * @brief One artifact to store
 */
struct ArtifactUpload {
    std::string attempt_id;
    std::string kind;       ///< "diff" or "log"
    std::string content;
    std::string sha256;     ///< Hex digest of content
};

/**
 * @struct CompletionReport
 * @brief Terminal attempt state sent to the completion endpoint
 */
struct CompletionReport {
    core::AttemptStatus status{core::AttemptStatus::FAILED};
    std::optional<std::string> diff_artifact_id;
    std::optional<std::string> log_artifact_id;
    std::optional<core::FailureReason> reason;
};

/**
 * @class ControlPlaneClient
 * @brief Control plane operations
 * 
 * Every method throws ControlPlaneError for failures other than the
 * documented skip cases.
 */
class ControlPlaneClient {
public:
    virtual ~ControlPlaneClient() = default;
    
    /// Pending tasks, optionally restricted to one environment
    virtual std::vector<core::TaskSummary> ListPendingTasks(
        const std::optional<std::string>& environment_id) = 0;
    
    /// @return false when the task is already claimed elsewhere (409)
    virtual bool ClaimTask(const std::string& task_id) = 0;
    
    /// @return Attempt id, or nullopt when not the assignee (403) or an attempt already runs (409)
    virtual std::optional<std::string> CreateAttempt(const std::string& task_id,
                                                     const std::optional<std::string>& environment_id) = 0;
    
    virtual core::TaskDetail GetTask(const std::string& task_id) = 0;
    
    /// @return Artifact id
    virtual std::string UploadArtifact(const ArtifactUpload& artifact) = 0;
    
    virtual void CompleteAttempt(const std::string& attempt_id, const CompletionReport& report) = 0;
};

/**
 * @class HttpControlPlaneClient
 * @brief ControlPlaneClient over an HttpTransport
 * 
 * Logs in lazily with the service account; a 401 on any call triggers one
 * re-login and a single retry of that call. Safe to share between threads.
 */
class HttpControlPlaneClient : public ControlPlaneClient {
public:
    HttpControlPlaneClient(core::ControlPlaneConfig config, std::shared_ptr<HttpTransport> transport);
    
    std::vector<core::TaskSummary> ListPendingTasks(
        const std::optional<std::string>& environment_id) override;
    bool ClaimTask(const std::string& task_id) override;
    std::optional<std::string> CreateAttempt(const std::string& task_id,
                                             const std::optional<std::string>& environment_id) override;
    core::TaskDetail GetTask(const std::string& task_id) override;
    std::string UploadArtifact(const ArtifactUpload& artifact) override;
    void CompleteAttempt(const std::string& attempt_id, const CompletionReport& report) override;
    
    /**
     * @brief Obtain a fresh access token
     * @throws ControlPlaneError if the login is rejected
     */
    void Login();

private:
    HttpResponse Call(const std::string& method, const std::string& path,
                      const std::optional<std::string>& body);
    HttpResponse SendWithToken(const std::string& method, const std::string& path,
                               const std::optional<std::string>& body, const std::string& token);
    std::string CurrentToken();
    std::string Url(const std::string& path) const;
    
    core::ControlPlaneConfig config_;
    std::shared_ptr<HttpTransport> transport_;
    std::mutex token_mutex_;
    std::string token_;
};

/**
 * @brief Parse a task detail document
 * @throws ControlPlaneError on missing or mistyped fields
 */
core::TaskDetail ParseTaskDetail(const std::string& body);

} // namespace api
} // namespace overseer
