/**
 * @file control_plane_client.cpp
 * @brief HTTP control plane client
 * @date 2025
 */

#include "overseer/api/control_plane_client.hpp"
#include "overseer/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <cctype>

using json = nlohmann::json;

namespace overseer {
namespace api {

using utils::StringUtils;

namespace {

[[noreturn]] void Fail(const std::string& what, const HttpResponse& response) {
    std::string detail = response.status == 0
        ? response.error
        : StringUtils::Truncate(StringUtils::Trim(response.body), 300);
    throw ControlPlaneError(fmt::format("{} failed: HTTP {} {}", what, response.status, detail),
                            response.status);
}

json ParseBody(const std::string& what, const HttpResponse& response) {
    try {
        return json::parse(response.body);
    } catch (const json::parse_error& e) {
        throw ControlPlaneError(fmt::format("{}: invalid JSON response: {}", what, e.what()),
                                response.status);
    }
}

std::optional<std::string> OptionalString(const json& node, const char* key) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return std::nullopt;
    }
    return it->get<std::string>();
}

// Percent-encode everything outside the RFC 3986 unreserved set
std::string EncodePathSegment(const std::string& segment) {
    static const char* hex = "0123456789ABCDEF";
    std::string encoded;
    for (unsigned char c : segment) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            encoded.push_back(static_cast<char>(c));
        } else {
            encoded.push_back('%');
            encoded.push_back(hex[c >> 4]);
            encoded.push_back(hex[c & 0x0F]);
        }
    }
    return encoded;
}

} // anonymous namespace

// ============================================================================
// PARSING
// ============================================================================

core::TaskDetail ParseTaskDetail(const std::string& body) {
    try {
        auto root = json::parse(body);
        
        core::TaskDetail detail;
        detail.id = root.at("id").get<std::string>();
        detail.title = root.value("title", std::string());
        detail.description = OptionalString(root, "description");
        detail.environment_id = OptionalString(root, "environment_id");
        detail.assignee = OptionalString(root, "assignee_id");
        
        auto repo = root.find("repository");
        if (repo != root.end() && repo->is_object()) {
            core::RepositoryRef repository;
            repository.id = repo->at("id").get<std::string>();
            repository.name = repo->value("name", repository.id);
            repository.git_url = repo->at("git_url").get<std::string>();
            repository.default_branch = repo->value("default_branch", std::string("main"));
            if (repository.default_branch.empty()) {
                repository.default_branch = "main";
            }
            detail.repository = repository;
        }
        return detail;
    } catch (const json::exception& e) {
        throw ControlPlaneError(fmt::format("malformed task detail: {}", e.what()), 200);
    }
}

// ============================================================================
// CLIENT
// ============================================================================

HttpControlPlaneClient::HttpControlPlaneClient(core::ControlPlaneConfig config,
                                               std::shared_ptr<HttpTransport> transport)
    : config_(std::move(config))
    , transport_(std::move(transport)) {
    while (StringUtils::EndsWith(config_.api_base, "/")) {
        config_.api_base.pop_back();
    }
}

std::string HttpControlPlaneClient::Url(const std::string& path) const {
    return config_.api_base + path;
}

void HttpControlPlaneClient::Login() {
    std::lock_guard<std::mutex> lock(token_mutex_);
    
    HttpRequest request;
    request.method = "POST";
    request.url = Url("/auth/session");
    request.headers["Content-Type"] = "application/json";
    request.headers["Accept"] = "application/json";
    request.body = json{{"email", config_.email}, {"password", config_.password}}.dump();
    request.timeout = config_.request_timeout;
    
    auto response = transport_->Send(request);
    if (!response.Ok()) {
        Fail("login as " + config_.email, response);
    }
    
    auto body = ParseBody("login", response);
    auto token = body.find("access_token");
    if (token == body.end() || !token->is_string() || token->get<std::string>().empty()) {
        throw ControlPlaneError("login response carries no access_token", response.status);
    }
    token_ = token->get<std::string>();
    spdlog::info("Authenticated with control plane as {}", config_.email);
}

std::string HttpControlPlaneClient::CurrentToken() {
    {
        std::lock_guard<std::mutex> lock(token_mutex_);
        if (!token_.empty()) {
            return token_;
        }
    }
    Login();
    std::lock_guard<std::mutex> lock(token_mutex_);
    return token_;
}

HttpResponse HttpControlPlaneClient::SendWithToken(const std::string& method, const std::string& path,
                                                   const std::optional<std::string>& body,
                                                   const std::string& token) {
    HttpRequest request;
    request.method = method;
    request.url = Url(path);
    request.headers["Authorization"] = "Bearer " + token;
    request.headers["Accept"] = "application/json";
    if (body) {
        request.headers["Content-Type"] = "application/json";
        request.body = body;
    }
    request.timeout = config_.request_timeout;
    return transport_->Send(request);
}

HttpResponse HttpControlPlaneClient::Call(const std::string& method, const std::string& path,
                                          const std::optional<std::string>& body) {
    auto response = SendWithToken(method, path, body, CurrentToken());
    if (response.status == 401) {
        spdlog::info("Access token rejected, logging in again");
        Login();
        response = SendWithToken(method, path, body, CurrentToken());
    }
    return response;
}

std::vector<core::TaskSummary> HttpControlPlaneClient::ListPendingTasks(
    const std::optional<std::string>& environment_id) {
    auto response = Call("GET", "/tasks?status=pending", std::nullopt);
    if (!response.Ok()) {
        Fail("list pending tasks", response);
    }
    
    auto body = ParseBody("list pending tasks", response);
    if (!body.is_array()) {
        throw ControlPlaneError("list pending tasks: expected a JSON array", response.status);
    }
    
    std::vector<core::TaskSummary> tasks;
    try {
        for (const auto& item : body) {
            core::TaskSummary task;
            task.id = item.at("id").get<std::string>();
            task.title = item.value("title", std::string());
            task.environment_id = OptionalString(item, "environment_id");
            
            if (environment_id && task.environment_id != environment_id) {
                continue;
            }
            tasks.push_back(std::move(task));
        }
    } catch (const json::exception& e) {
        throw ControlPlaneError(fmt::format("malformed task list: {}", e.what()), response.status);
    }
    return tasks;
}

bool HttpControlPlaneClient::ClaimTask(const std::string& task_id) {
    auto response = Call("POST", "/tasks/" + EncodePathSegment(task_id) + "/claim", std::nullopt);
    if (response.status == 409) {
        spdlog::debug("Task {} already claimed elsewhere", task_id);
        return false;
    }
    if (!response.Ok()) {
        Fail("claim task " + task_id, response);
    }
    return true;
}

std::optional<std::string> HttpControlPlaneClient::CreateAttempt(
    const std::string& task_id, const std::optional<std::string>& environment_id) {
    json payload = json::object();
    if (environment_id) {
        payload["environment_id"] = *environment_id;
    }
    
    auto response = Call("POST", "/tasks/" + EncodePathSegment(task_id) + "/attempts", payload.dump());
    if (response.status == 403) {
        spdlog::info("Not the assignee of task {}, skipping", task_id);
        return std::nullopt;
    }
    if (response.status == 409) {
        spdlog::info("Task {} already has a running attempt, skipping", task_id);
        return std::nullopt;
    }
    if (!response.Ok()) {
        Fail("create attempt for task " + task_id, response);
    }
    
    auto body = ParseBody("create attempt", response);
    auto id = body.find("id");
    if (id == body.end() || !id->is_string()) {
        throw ControlPlaneError("create attempt: response carries no id", response.status);
    }
    return id->get<std::string>();
}

core::TaskDetail HttpControlPlaneClient::GetTask(const std::string& task_id) {
    auto response = Call("GET", "/tasks/" + EncodePathSegment(task_id), std::nullopt);
    if (!response.Ok()) {
        Fail("get task " + task_id, response);
    }
    return ParseTaskDetail(response.body);
}

std::string HttpControlPlaneClient::UploadArtifact(const ArtifactUpload& artifact) {
    json payload = {
        {"attempt_id", artifact.attempt_id},
        {"kind", artifact.kind},
        {"content", artifact.content},
        {"sha256", artifact.sha256}
    };
    
    // Malformed UTF-8 in workload output must not abort the upload
    auto response = Call("POST", "/artifacts",
                         payload.dump(-1, ' ', false, json::error_handler_t::replace));
    if (!response.Ok()) {
        Fail(fmt::format("upload {} artifact for attempt {}", artifact.kind, artifact.attempt_id), response);
    }
    
    auto body = ParseBody("upload artifact", response);
    auto id = body.find("id");
    if (id == body.end() || !id->is_string()) {
        throw ControlPlaneError("upload artifact: response carries no id", response.status);
    }
    return id->get<std::string>();
}

void HttpControlPlaneClient::CompleteAttempt(const std::string& attempt_id, const CompletionReport& report) {
    json payload = {{"status", core::AttemptStatusToString(report.status)}};
    payload["diff_artifact_id"] = report.diff_artifact_id ? json(*report.diff_artifact_id) : json(nullptr);
    payload["log_artifact_id"] = report.log_artifact_id ? json(*report.log_artifact_id) : json(nullptr);
    payload["reason"] = report.reason ? json(core::FailureReasonToString(*report.reason)) : json(nullptr);
    
    auto response = Call("POST", "/tasks/attempts/" + EncodePathSegment(attempt_id) + "/complete",
                         payload.dump());
    if (!response.Ok()) {
        Fail("complete attempt " + attempt_id, response);
    }
}

} // namespace api
} // namespace overseer
