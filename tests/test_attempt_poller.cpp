/**
 * @file test_attempt_poller.cpp
 * @brief Claiming, local de-duplication, capacity and cancellation markers
 * @date 2025
 */

#include "overseer/core/attempt_poller.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace overseer::core;
using overseer::test::FakeControlPlane;
using overseer::test::TempDir;
using overseer::test::WaitUntil;
using overseer::test::WriteText;

namespace {

/// Keeps dispatched attempts in flight until opened or cancelled
class Gate {
public:
    void Open() { open_.store(true); }

    AttemptPoller::AttemptHandler Handler() {
        return [this](const std::shared_ptr<AttemptHandle>& handle) {
            {
                std::lock_guard<std::mutex> lock(mutex_);
                handles_.push_back(handle);
            }
            while (!open_.load() && !handle->cancel.load()) {
                std::this_thread::sleep_for(std::chrono::milliseconds(5));
            }
        };
    }

    std::vector<std::shared_ptr<AttemptHandle>> Handles() {
        std::lock_guard<std::mutex> lock(mutex_);
        return handles_;
    }

private:
    std::atomic<bool> open_{false};
    std::mutex mutex_;
    std::vector<std::shared_ptr<AttemptHandle>> handles_;
};

TaskSummary Task(const std::string& id, std::optional<std::string> environment = std::nullopt) {
    TaskSummary task;
    task.id = id;
    task.title = "Title " + id;
    task.environment_id = std::move(environment);
    return task;
}

PollerSettings Settings(std::size_t concurrency) {
    PollerSettings settings;
    settings.poll_interval = std::chrono::milliseconds(50);
    settings.max_concurrency = concurrency;
    settings.observation_interval = std::chrono::milliseconds(10);
    return settings;
}

} // anonymous namespace

TEST(AttemptPollerTest, SecondClaimOfInFlightTaskIsSkippedLocally) {
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1")};
    AttemptPoller poller(Settings(2), client, gate.Handler());

    EXPECT_EQ(poller.PollOnce(), 1u);
    EXPECT_TRUE(poller.IsTaskInFlight("t1"));

    // The control plane still lists the task; the poller must not claim it again
    EXPECT_EQ(poller.PollOnce(), 0u);
    EXPECT_FALSE(poller.ClaimAndDispatch(Task("t1")));
    EXPECT_EQ(client->create_calls, 1);
    EXPECT_EQ(client->claimed.size(), 1u);
    EXPECT_EQ(poller.InFlight(), 1u);

    gate.Open();
    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
    EXPECT_FALSE(poller.IsTaskInFlight("t1"));
}

TEST(AttemptPollerTest, DispatchesWithClaimedStatesAndDetail) {
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1", std::string("env-a"))};
    TaskDetail detail;
    detail.id = "t1";
    detail.title = "Fix the build";
    detail.description = "details";
    detail.environment_id = "env-a";
    client->details["t1"] = detail;
    AttemptPoller poller(Settings(1), client, gate.Handler());

    ASSERT_EQ(poller.PollOnce(), 1u);
    ASSERT_TRUE(WaitUntil([&] { return gate.Handles().size() == 1; }));

    auto handle = gate.Handles().front();
    EXPECT_EQ(handle->context.task.title, "Fix the build");
    EXPECT_EQ(handle->context.task.description, std::optional<std::string>("details"));
    EXPECT_EQ(handle->task.Status(), TaskStatus::RUNNING);
    EXPECT_EQ(handle->attempt.Status(), AttemptStatus::QUEUED);
    EXPECT_EQ(handle->attempt.TaskId(), "t1");
    EXPECT_FALSE(handle->claim_error.has_value());
    EXPECT_EQ(poller.InFlightAttempts(), std::vector<std::string>{handle->context.attempt_id});

    gate.Open();
    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
}

TEST(AttemptPollerTest, ClaimConflictIsSkipped) {
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1")};
    client->conflicting = {"t1"};
    AttemptPoller poller(Settings(1), client, gate.Handler());

    EXPECT_EQ(poller.PollOnce(), 0u);
    EXPECT_EQ(client->create_calls, 0);
    EXPECT_EQ(poller.InFlight(), 0u);
}

TEST(AttemptPollerTest, RejectedAttemptCreationIsSkipped) {
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1"), Task("t2")};
    client->not_assignee = {"t1"};
    AttemptPoller poller(Settings(2), client, gate.Handler());

    EXPECT_EQ(poller.PollOnce(), 1u);
    EXPECT_FALSE(poller.IsTaskInFlight("t1"));
    EXPECT_TRUE(poller.IsTaskInFlight("t2"));

    gate.Open();
    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
}

TEST(AttemptPollerTest, DetailFetchFailureStillDispatches) {
    Gate gate;
    gate.Open();
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1")};
    client->get_task_status = 500;
    AttemptPoller poller(Settings(1), client, gate.Handler());

    ASSERT_EQ(poller.PollOnce(), 1u);
    ASSERT_TRUE(WaitUntil([&] { return gate.Handles().size() == 1; }));

    auto handle = gate.Handles().front();
    ASSERT_TRUE(handle->claim_error.has_value());
    EXPECT_EQ(handle->context.task.id, "t1");
    EXPECT_EQ(handle->context.task.title, "Title t1");
    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
}

TEST(AttemptPollerTest, RespectsMaxConcurrency) {
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1"), Task("t2"), Task("t3")};
    AttemptPoller poller(Settings(2), client, gate.Handler());

    EXPECT_EQ(poller.PollOnce(), 2u);
    EXPECT_EQ(poller.InFlight(), 2u);

    // At capacity the control plane is not even asked
    int lists = client->list_calls;
    EXPECT_EQ(poller.PollOnce(), 0u);
    EXPECT_EQ(client->list_calls, lists);

    gate.Open();
    ASSERT_TRUE(poller.Drain(std::chrono::seconds(5)));
    EXPECT_EQ(poller.PollOnce(), 2u);
    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
}

TEST(AttemptPollerTest, ForwardsEnvironmentFilter) {
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1", std::string("env-a")), Task("t2", std::string("env-b"))};
    auto settings = Settings(4);
    settings.environment_id = "env-b";
    AttemptPoller poller(settings, client, gate.Handler());

    EXPECT_EQ(poller.PollOnce(), 1u);
    EXPECT_EQ(client->last_environment, std::optional<std::string>("env-b"));
    EXPECT_TRUE(poller.IsTaskInFlight("t2"));

    gate.Open();
    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
}

TEST(AttemptPollerTest, CancelMarkerCancelsAttempt) {
    TempDir dir;
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1")};
    auto settings = Settings(1);
    settings.cancel_dir = dir.Path();
    AttemptPoller poller(settings, client, gate.Handler());

    ASSERT_EQ(poller.PollOnce(), 1u);
    ASSERT_TRUE(WaitUntil([&] { return gate.Handles().size() == 1; }));
    auto handle = gate.Handles().front();

    WriteText(dir / "unrelated-attempt", "");
    WriteText(dir / handle->context.attempt_id, "");
    EXPECT_EQ(poller.ApplyCancelMarkers(), 1u);
    EXPECT_TRUE(handle->cancel.load());
    EXPECT_FALSE(std::filesystem::exists(dir / handle->context.attempt_id));
    EXPECT_TRUE(std::filesystem::exists(dir / "unrelated-attempt"));

    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
}

TEST(AttemptPollerTest, CancelUnknownAttemptReturnsFalse) {
    Gate gate;
    auto client = std::make_shared<FakeControlPlane>();
    AttemptPoller poller(Settings(1), client, gate.Handler());
    EXPECT_FALSE(poller.Cancel("nope"));
}

TEST(AttemptPollerTest, RunReturnsAfterStop) {
    Gate gate;
    gate.Open();
    auto client = std::make_shared<FakeControlPlane>();
    client->pending = {Task("t1")};
    AttemptPoller poller(Settings(1), client, gate.Handler());

    std::thread runner([&poller] { poller.Run(); });
    ASSERT_TRUE(WaitUntil([&] { return gate.Handles().size() >= 1; }));
    poller.Stop();
    runner.join();
    EXPECT_TRUE(poller.Drain(std::chrono::seconds(5)));
}
