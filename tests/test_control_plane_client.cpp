/**
 * @file test_control_plane_client.cpp
 * @brief Request shapes, status handling and re-authentication
 * @date 2025
 */

#include "overseer/api/control_plane_client.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>
#include <nlohmann/json.hpp>

using namespace overseer;
using overseer::test::Respond;
using overseer::test::ScriptedTransport;
using json = nlohmann::json;

namespace {

core::ControlPlaneConfig Config() {
    core::ControlPlaneConfig config;
    config.api_base = "http://control.test/";
    config.email = "svc@example.com";
    config.password = "secret";
    return config;
}

api::HttpResponse Login(const std::string& token = "tok-1") {
    return Respond(200, json{{"access_token", token}}.dump());
}

} // anonymous namespace

TEST(ControlPlaneClientTest, LogsInOnceAndSendsBearerToken) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            return Login();
        }
        return Respond(200, R"([{"id":"t1","title":"One","environment_id":"env-a"}])");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    auto first = client.ListPendingTasks(std::nullopt);
    auto second = client.ListPendingTasks(std::nullopt);
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].id, "t1");
    EXPECT_EQ(first[0].environment_id, std::optional<std::string>("env-a"));
    EXPECT_EQ(second.size(), 1u);

    auto requests = transport->Requests();
    ASSERT_EQ(requests.size(), 3u);
    EXPECT_EQ(requests[0].method, "POST");
    auto credentials = json::parse(*requests[0].body);
    EXPECT_EQ(credentials["email"].get<std::string>(), "svc@example.com");
    EXPECT_EQ(credentials["password"].get<std::string>(), "secret");
    EXPECT_EQ(requests[1].url, "http://control.test/tasks?status=pending");
    EXPECT_EQ(requests[1].headers.at("Authorization"), "Bearer tok-1");
    EXPECT_EQ(requests[2].headers.at("Authorization"), "Bearer tok-1");
}

TEST(ControlPlaneClientTest, ReauthenticatesOnceAfterUnauthorized) {
    int logins = 0;
    int lists = 0;
    auto transport = std::make_shared<ScriptedTransport>([&](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            ++logins;
            return Login("tok-" + std::to_string(logins));
        }
        ++lists;
        if (request.headers.at("Authorization") == "Bearer tok-1") {
            return Respond(401, R"({"detail":"expired"})");
        }
        return Respond(200, "[]");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    EXPECT_TRUE(client.ListPendingTasks(std::nullopt).empty());
    EXPECT_EQ(logins, 2);
    EXPECT_EQ(lists, 2);
}

TEST(ControlPlaneClientTest, FiltersTasksByEnvironment) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            return Login();
        }
        return Respond(200, R"([
            {"id":"t1","title":"One","environment_id":"env-a"},
            {"id":"t2","title":"Two","environment_id":"env-b"},
            {"id":"t3","title":"Three","environment_id":null}
        ])");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    auto tasks = client.ListPendingTasks(std::string("env-b"));
    ASSERT_EQ(tasks.size(), 1u);
    EXPECT_EQ(tasks[0].id, "t2");
    EXPECT_EQ(client.ListPendingTasks(std::nullopt).size(), 3u);
}

TEST(ControlPlaneClientTest, ClaimConflictReturnsFalse) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            return Login();
        }
        if (request.url == "http://control.test/tasks/taken/claim") {
            return Respond(409, R"({"detail":"already claimed"})");
        }
        return Respond(200, "{}");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    EXPECT_FALSE(client.ClaimTask("taken"));
    EXPECT_TRUE(client.ClaimTask("free"));
}

TEST(ControlPlaneClientTest, CreateAttemptHandlesRefusals) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            return Login();
        }
        if (request.url == "http://control.test/tasks/foreign/attempts") {
            return Respond(403, R"({"detail":"not assignee"})");
        }
        if (request.url == "http://control.test/tasks/busy/attempts") {
            return Respond(409, R"({"detail":"attempt running"})");
        }
        return Respond(201, R"({"id":"attempt-9","status":"queued"})");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    EXPECT_FALSE(client.CreateAttempt("foreign", std::nullopt).has_value());
    EXPECT_FALSE(client.CreateAttempt("busy", std::nullopt).has_value());
    EXPECT_EQ(client.CreateAttempt("mine", std::string("env-a")), std::optional<std::string>("attempt-9"));

    auto last = transport->Requests().back();
    EXPECT_EQ(json::parse(*last.body)["environment_id"].get<std::string>(), "env-a");
}

TEST(ControlPlaneClientTest, ServerErrorsAreTransient) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            return Login();
        }
        return Respond(503, "unavailable");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    try {
        client.UploadArtifact({"a1", "log", "text", "abc"});
        FAIL() << "expected ControlPlaneError";
    } catch (const api::ControlPlaneError& e) {
        EXPECT_EQ(e.Status(), 503);
        EXPECT_TRUE(e.IsTransient());
    }
}

TEST(ControlPlaneClientTest, ClientErrorsArePermanent) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            return Login();
        }
        return Respond(422, R"({"detail":"bad payload"})");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    try {
        client.CompleteAttempt("a1", {});
        FAIL() << "expected ControlPlaneError";
    } catch (const api::ControlPlaneError& e) {
        EXPECT_EQ(e.Status(), 422);
        EXPECT_FALSE(e.IsTransient());
    }
}

TEST(ControlPlaneClientTest, FailedLoginThrows) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest&) {
        return Respond(401, R"({"detail":"bad credentials"})");
    });
    api::HttpControlPlaneClient client(Config(), transport);
    EXPECT_THROW(client.ListPendingTasks(std::nullopt), api::ControlPlaneError);
}

TEST(ControlPlaneClientTest, UploadAndCompletePayloads) {
    auto transport = std::make_shared<ScriptedTransport>([](const api::HttpRequest& request) {
        if (request.url == "http://control.test/auth/session") {
            return Login();
        }
        if (request.url == "http://control.test/artifacts") {
            return Respond(201, R"({"id":"art-1"})");
        }
        return Respond(200, "{}");
    });
    api::HttpControlPlaneClient client(Config(), transport);

    EXPECT_EQ(client.UploadArtifact({"a1", "diff", "+line\n", "feed"}), "art-1");

    api::CompletionReport report;
    report.status = core::AttemptStatus::SUCCEEDED;
    report.diff_artifact_id = "art-1";
    client.CompleteAttempt("a/1", report);

    auto requests = transport->Requests();
    auto upload = json::parse(*requests[1].body);
    EXPECT_EQ(upload["attempt_id"].get<std::string>(), "a1");
    EXPECT_EQ(upload["kind"].get<std::string>(), "diff");
    EXPECT_EQ(upload["content"].get<std::string>(), "+line\n");
    EXPECT_EQ(upload["sha256"].get<std::string>(), "feed");

    EXPECT_EQ(requests[2].url, "http://control.test/tasks/attempts/a%2F1/complete");
    auto complete = json::parse(*requests[2].body);
    EXPECT_EQ(complete["status"].get<std::string>(), "succeeded");
    EXPECT_EQ(complete["diff_artifact_id"].get<std::string>(), "art-1");
    EXPECT_TRUE(complete["log_artifact_id"].is_null());
    EXPECT_TRUE(complete["reason"].is_null());
}

TEST(ControlPlaneClientTest, ParsesTaskDetail) {
    auto detail = api::ParseTaskDetail(R"({
        "id": "t1",
        "title": "Fix",
        "description": null,
        "environment_id": "env-a",
        "assignee_id": "user-7",
        "repository": {"id": "r1", "name": "app", "git_url": "https://git.test/app.git"}
    })");

    EXPECT_EQ(detail.id, "t1");
    EXPECT_FALSE(detail.description.has_value());
    EXPECT_EQ(detail.assignee, std::optional<std::string>("user-7"));
    ASSERT_TRUE(detail.repository.has_value());
    EXPECT_EQ(detail.repository->default_branch, "main");
    EXPECT_EQ(detail.repository->git_url, "https://git.test/app.git");

    EXPECT_THROW(api::ParseTaskDetail(R"({"title":"no id"})"), api::ControlPlaneError);
    EXPECT_THROW(api::ParseTaskDetail("not json"), api::ControlPlaneError);
}
