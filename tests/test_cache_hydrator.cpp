/**
 * @file test_cache_hydrator.cpp
 * @brief Cache layout, mirror lookup and per-repository locking
 * @date 2025
 */

#include "overseer/core/cache_hydrator.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <future>

using namespace overseer::core;
using overseer::test::TempDir;
using overseer::test::WriteText;

namespace fs = std::filesystem;

TEST(CacheHydratorTest, EnsureCreatesLayout) {
    TempDir dir;
    CacheHydrator hydrator(dir / "cache");
    auto paths = hydrator.Ensure();

    EXPECT_EQ(paths.root, (dir / "cache").lexically_normal());
    for (const auto& path : {paths.git, paths.npm, paths.pip, paths.cargo}) {
        EXPECT_TRUE(fs::is_directory(path)) << path;
    }
    EXPECT_EQ(paths.git.filename(), "git");
    EXPECT_EQ(paths.cargo.filename(), "cargo");

    // Second call is a no-op on an existing layout
    EXPECT_EQ(hydrator.Ensure().npm, paths.npm);
}

TEST(CacheHydratorTest, RelativeRootIsMadeAbsolute) {
    CacheHydrator hydrator("relative-cache-root");
    TempDir dir;
    auto previous = fs::current_path();
    fs::current_path(dir.Path());
    auto paths = hydrator.Ensure();
    fs::current_path(previous);

    EXPECT_TRUE(paths.root.is_absolute());
    EXPECT_EQ(paths.root.filename(), "relative-cache-root");
}

TEST(CacheHydratorTest, FileInTheWayIsCacheError) {
    TempDir dir;
    WriteText(dir / "cache", "not a directory");
    CacheHydrator hydrator(dir / "cache");
    EXPECT_THROW(hydrator.Ensure(), CacheError);
}

TEST(CacheHydratorTest, MirrorMissThenHit) {
    TempDir dir;
    CacheHydrator hydrator(dir / "cache");
    auto paths = hydrator.Ensure();

    RepositoryRef repository;
    repository.id = "org/app";
    auto miss = hydrator.MirrorFor(paths, repository);
    EXPECT_FALSE(miss.hit);
    EXPECT_EQ(miss.path, paths.git / "org_app");

    fs::create_directories(miss.path / "objects");
    WriteText(miss.path / "HEAD", "ref: refs/heads/main\n");
    EXPECT_TRUE(hydrator.MirrorFor(paths, repository).hit);
}

TEST(CacheHydratorTest, PathTraversalIdsStayInsideGitCache) {
    TempDir dir;
    CacheHydrator hydrator(dir / "cache");
    auto paths = hydrator.Ensure();

    RepositoryRef repository;
    repository.id = "..";
    auto mirror = hydrator.MirrorFor(paths, repository);
    EXPECT_EQ(mirror.path.parent_path(), paths.git);
    EXPECT_NE(mirror.path.filename(), "..");

    repository.id = "";
    EXPECT_THROW(hydrator.MirrorFor(paths, repository), CacheError);
}

TEST(CacheHydratorTest, RepositoryLockSerialisesSameRepository) {
    TempDir dir;
    CacheHydrator hydrator(dir / "cache");

    auto held = hydrator.LockRepository("r1");
    ASSERT_TRUE(held.owns_lock());

    auto other = std::async(std::launch::async, [&hydrator] {
        auto lock = hydrator.LockRepository("r2");
        return lock.owns_lock();
    });
    ASSERT_EQ(other.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(other.get());

    auto same = std::async(std::launch::async, [&hydrator] {
        auto lock = hydrator.LockRepository("r1");
        return lock.owns_lock();
    });
    EXPECT_EQ(same.wait_for(std::chrono::milliseconds(100)), std::future_status::timeout);
    held.unlock();
    ASSERT_EQ(same.wait_for(std::chrono::seconds(5)), std::future_status::ready);
    EXPECT_TRUE(same.get());
}
