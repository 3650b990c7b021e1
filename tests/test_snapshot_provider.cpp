/**
 * @file test_snapshot_provider.cpp
 * @brief Hook, generated and factory-selected snapshot providers
 * @date 2025
 */

#include "overseer/core/snapshot_provider.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

using namespace overseer::core;
using overseer::test::HasTool;
using overseer::test::ReadText;
using overseer::test::TempDir;
using overseer::test::WriteScript;

namespace {

class HookProviderTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!HasTool("sh")) {
            GTEST_SKIP() << "sh is required";
        }
    }

    HookSnapshotProvider Provider(const std::string& prewarm_body, const std::string& destroy_body = "") {
        auto prewarm = WriteScript(dir / "prewarm.sh", prewarm_body);
        std::filesystem::path destroy;
        if (!destroy_body.empty()) {
            destroy = WriteScript(dir / "destroy.sh", destroy_body);
        }
        return HookSnapshotProvider(prewarm, destroy, std::chrono::seconds(10));
    }

    TempDir dir;
};

} // anonymous namespace

TEST_F(HookProviderTest, ReturnsPrintedSnapshotId) {
    auto provider = Provider("echo \"snap-$OVERSEER_SNAPSHOT_EVENT\"");
    EXPECT_EQ(provider.ProduceSnapshot(std::nullopt), "snap-prewarm");
    EXPECT_EQ(provider.Name(), "hook");
}

TEST_F(HookProviderTest, PassesTemplate) {
    auto provider = Provider("echo \"from-${OVERSEER_SNAPSHOT_TEMPLATE:-none}\"");
    EXPECT_EQ(provider.ProduceSnapshot(std::string("golden")), "from-golden");
    EXPECT_EQ(provider.ProduceSnapshot(std::nullopt), "from-none");
}

TEST_F(HookProviderTest, RejectsAmbiguousOrEmptyOutput) {
    auto two_lines = Provider("echo one; echo two");
    EXPECT_THROW(two_lines.ProduceSnapshot(std::nullopt), SnapshotError);

    auto silent = Provider("true");
    EXPECT_THROW(silent.ProduceSnapshot(std::nullopt), SnapshotError);
}

TEST_F(HookProviderTest, NonZeroExitIsError) {
    auto provider = Provider("echo snap-1; echo 'no capacity' >&2; exit 4");
    try {
        provider.ProduceSnapshot(std::nullopt);
        FAIL() << "expected SnapshotError";
    } catch (const SnapshotError& e) {
        EXPECT_NE(std::string(e.what()).find("no capacity"), std::string::npos);
    }
}

TEST_F(HookProviderTest, DestroyHookReceivesSnapshotId) {
    const auto record = dir / "destroyed.txt";
    auto provider = Provider("echo snap-1",
                             "echo \"$OVERSEER_SNAPSHOT_EVENT $OVERSEER_SNAPSHOT_ID\" > '" + record.string() + "'");
    provider.Destroy("snap-1");
    EXPECT_EQ(ReadText(record), "destroy snap-1\n");

    auto failing = Provider("echo snap-2", "exit 1");
    EXPECT_THROW(failing.Destroy("snap-2"), SnapshotError);
}

TEST(GeneratedProviderTest, ProducesUniqueIds) {
    GeneratedSnapshotProvider provider;
    auto first = provider.ProduceSnapshot(std::nullopt);
    auto second = provider.ProduceSnapshot(std::string("ignored"));
    EXPECT_EQ(first.rfind("snapshot-", 0), 0u);
    EXPECT_NE(first, second);
    EXPECT_NO_THROW(provider.Destroy(first));
}

TEST(SnapshotProviderFactoryTest, SelectsBackend) {
    SnapshotConfig config;
    EXPECT_EQ(CreateSnapshotProvider(config)->Name(), "generated");

    config.backend = SnapshotBackend::HOOK;
    config.prewarm_hook = "/opt/prewarm.sh";
    EXPECT_EQ(CreateSnapshotProvider(config)->Name(), "hook");

    config.backend = SnapshotBackend::CONTAINER;
    EXPECT_EQ(CreateSnapshotProvider(config)->Name(), "container");
}
