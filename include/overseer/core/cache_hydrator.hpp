/**
 * @file cache_hydrator.hpp
 * @brief Shared dependency cache directories and per-repository git mirrors
 * 
 * Layout under the cache root (created lazily, never removed):
 * ```
 * <root>/git/<repository id>   bare mirror, one per repository
 * <root>/npm                   npm_config_cache
 * <root>/pip                   PIP_CACHE_DIR
 * <root>/cargo                 CARGO_HOME
 * ```
 * 
 * @date 2025
 */

#pragma once

#include "overseer/core/types.hpp"

#include <string>
#include <map>
#include <mutex>
#include <memory>
#include <filesystem>
#include <stdexcept>

namespace overseer {
namespace core {

/**
 * @class CacheError
 * @brief Cache directory could not be created or accessed
 */
class CacheError : public std::runtime_error {
public:
    explicit CacheError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct CachePaths
 * @brief Absolute paths of the hydrated cache directories
 */
struct CachePaths {
    std::filesystem::path root;
    std::filesystem::path git;
    std::filesystem::path npm;
    std::filesystem::path pip;
    std::filesystem::path cargo;
};

/**
 * @struct MirrorInfo
 * @brief Location of a repository mirror
 */
struct MirrorInfo {
    std::filesystem::path path;   ///< <git>/<sanitised repository id>
    bool hit{false};              ///< Bare mirror already present (incremental fetch)
};

/**
 * @class CacheHydrator
 * @brief Ensures cache directories exist and serialises mirror updates
 * 
 * **Usage Example**:
 * @code
 * CacheHydrator hydrator("/var/cache/overseer");
 * CachePaths paths = hydrator.Ensure();
 * 
 * auto lock = hydrator.LockRepository(repo.id);
 * MirrorInfo mirror = hydrator.MirrorFor(paths, repo);
 * // clone --mirror on miss, remote update on hit, while holding `lock`
 * @endcode
 */
class CacheHydrator {
public:
    explicit CacheHydrator(std::filesystem::path cache_root);
    
    /**
     * @brief Create any missing cache directory
     * 
     * Idempotent; safe before every attempt.
     * 
     * @return Absolute cache paths
     * @throws CacheError on filesystem errors
     */
    CachePaths Ensure() const;
    
    /**
     * @brief Mirror location for a repository
     * @param paths Result of Ensure()
     * @param repository Repository reference (id is the cache key)
     * @return Path and whether a bare mirror already exists there
     * @throws CacheError if the repository id is empty
     */
    MirrorInfo MirrorFor(const CachePaths& paths, const RepositoryRef& repository) const;
    
    /**
     * @brief Exclusive lock for clone/fetch of one repository's mirror
     */
    std::unique_lock<std::mutex> LockRepository(const std::string& repository_id);
    
    const std::filesystem::path& Root() const { return cache_root_; }

private:
    std::filesystem::path cache_root_;
    std::mutex locks_mutex_;
    std::map<std::string, std::unique_ptr<std::mutex>> repository_locks_;
};

} // namespace core
} // namespace overseer
