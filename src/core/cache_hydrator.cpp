/**
 * @file cache_hydrator.cpp
 * @brief Cache directory hydration
 * @date 2025
 */

#include "overseer/core/cache_hydrator.hpp"
#include "overseer/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace overseer {
namespace core {

namespace fs = std::filesystem;

namespace {

void EnsureDirectory(const fs::path& path) {
    std::error_code ec;
    fs::create_directories(path, ec);
    if (ec) {
        throw CacheError(fmt::format("cannot create cache directory {}: {}",
                                     path.string(), ec.message()));
    }
    if (!fs::is_directory(path, ec)) {
        throw CacheError(fmt::format("cache path is not a directory: {}", path.string()));
    }
}

} // anonymous namespace

CacheHydrator::CacheHydrator(fs::path cache_root)
    : cache_root_(std::move(cache_root)) {
}

CachePaths CacheHydrator::Ensure() const {
    std::error_code ec;
    fs::path root = fs::absolute(cache_root_, ec);
    if (ec) {
        throw CacheError(fmt::format("cannot resolve cache root {}: {}",
                                     cache_root_.string(), ec.message()));
    }
    
    CachePaths paths;
    paths.root = root.lexically_normal();
    paths.git = paths.root / "git";
    paths.npm = paths.root / "npm";
    paths.pip = paths.root / "pip";
    paths.cargo = paths.root / "cargo";
    
    for (const auto* dir : {&paths.root, &paths.git, &paths.npm, &paths.pip, &paths.cargo}) {
        EnsureDirectory(*dir);
    }
    
    spdlog::debug("Cache hydrated: git={} npm={} pip={} cargo={}",
                  paths.git.string(), paths.npm.string(),
                  paths.pip.string(), paths.cargo.string());
    return paths;
}

MirrorInfo CacheHydrator::MirrorFor(const CachePaths& paths, const RepositoryRef& repository) const {
    if (repository.id.empty()) {
        throw CacheError("repository id is empty");
    }
    
    MirrorInfo info;
    info.path = paths.git / utils::StringUtils::SanitizePathComponent(repository.id);
    
    // A bare mirror has HEAD and objects/ at its top level
    std::error_code ec;
    info.hit = fs::is_regular_file(info.path / "HEAD", ec) &&
               fs::is_directory(info.path / "objects", ec);
    return info;
}

std::unique_lock<std::mutex> CacheHydrator::LockRepository(const std::string& repository_id) {
    std::mutex* repository_mutex = nullptr;
    {
        std::lock_guard<std::mutex> guard(locks_mutex_);
        auto& slot = repository_locks_[repository_id];
        if (!slot) {
            slot = std::make_unique<std::mutex>();
        }
        repository_mutex = slot.get();
    }
    return std::unique_lock<std::mutex>(*repository_mutex);
}

} // namespace core
} // namespace overseer
