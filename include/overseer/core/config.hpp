/**
 * @file config.hpp
 * @brief Supervisor configuration structures
 * 
 * Plain structs with in-class defaults. Values come from (lowest to highest
 * precedence) the defaults below, an optional JSON file loaded with
 * LoadConfigFile, and the command line / OVERSEER_* environment variables
 * applied in main. The resulting SupervisorConfig is read-only once the
 * supervisor starts.
 * 
 * **JSON layout** (every key optional):
 * @code
 * {
 *   "api_base": "http://127.0.0.1:8000",
 *   "email": "supervisor@example.com",
 *   "password": "...",
 *   "poll_interval_secs": 5,
 *   "max_concurrency": 2,
 *   "environment_id": "env-1",
 *   "cache_root": "/var/cache/overseer",
 *   "state_dir": "/var/lib/overseer",
 *   "pool": {
 *     "target_size": 2, "max_size": 4, "acquire_policy": "block",
 *     "acquire_timeout_ms": 60000, "snapshot_template": "base",
 *     "replenish_interval_ms": 2000,
 *     "backoff": {"initial_delay_ms": 500, "multiplier": 2.0,
 *                 "max_delay_ms": 30000, "max_retries": 3}
 *   },
 *   "snapshot": {"backend": "hook", "prewarm_hook": "/opt/hooks/prewarm.sh",
 *                "destroy_hook": "/opt/hooks/destroy.sh", "hook_timeout_secs": 300,
 *                "runtime": "docker", "image": "overseer-sandbox:latest"},
 *   "executor": {"workload_command": "make agent", "attempt_timeout_secs": 1800,
 *                "git_timeout_secs": 600, "keep_workspaces": false},
 *   "reporter": {"max_retries": 2, "initial_delay_ms": 500, "max_delay_ms": 10000,
 *                "max_preserved_in_memory": 16}
 * }
 * @endcode
 * 
 * @date 2025
 */

#pragma once

#include "overseer/utils/backoff.hpp"
#include "overseer/utils/container_utils.hpp"

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <filesystem>
#include <stdexcept>

namespace overseer {
namespace core {

/**
 * @class ConfigError
 * @brief Unreadable or malformed configuration
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @enum AcquirePolicy
 * @brief What Acquire does when no sandbox is idle
 */
enum class AcquirePolicy {
    BLOCK,      ///< Wait for a release or a prewarm (default)
    COLD,       ///< Prewarm inline if the hard maximum allows, else wait
    FAIL_FAST   ///< Throw PoolExhaustedError
};

/// "block" | "cold" | "fail-fast"
std::string AcquirePolicyToString(AcquirePolicy policy);
std::optional<AcquirePolicy> AcquirePolicyFromString(const std::string& value);

/**
 * @enum SnapshotBackend
 * @brief Which SnapshotProvider produces sandboxes
 */
enum class SnapshotBackend {
    HOOK,       ///< External prewarm hook
    CONTAINER,  ///< Stopped container from the base image
    GENERATED   ///< No backend, generated identifiers
};

std::string SnapshotBackendToString(SnapshotBackend backend);
std::optional<SnapshotBackend> SnapshotBackendFromString(const std::string& value);

/**
 * @struct PoolConfig
 * @brief Warm pool sizing and prewarm policy
 */
struct PoolConfig {
    std::size_t target_size{1};                        ///< Idle sandboxes to keep ready
    std::size_t max_size{4};                           ///< Hard bound on idle + assigned + warming
    AcquirePolicy acquire_policy{AcquirePolicy::BLOCK};
    std::optional<std::chrono::milliseconds> acquire_timeout;  ///< Bound for blocking acquires
    utils::BackoffPolicy prewarm_backoff;              ///< Retry policy per replenishment pass
    std::optional<std::string> snapshot_template;      ///< Passed to the provider
    std::chrono::milliseconds replenish_interval{2000};  ///< Idle re-check period of the replenisher
};

/**
 * @struct SnapshotConfig
 * @brief Snapshot provider selection and settings
 */
struct SnapshotConfig {
    SnapshotBackend backend{SnapshotBackend::GENERATED};
    std::filesystem::path prewarm_hook;                ///< HOOK: prints one snapshot id
    std::filesystem::path destroy_hook;                ///< HOOK: optional teardown
    std::chrono::seconds hook_timeout{300};
    utils::ContainerRuntime runtime{utils::ContainerRuntime::DOCKER};
    std::string image{"overseer-sandbox:latest"};      ///< CONTAINER: base image
    std::size_t memory_limit_mb{4096};                 ///< CONTAINER: memory limit
    double cpu_limit{2.0};                             ///< CONTAINER: CPU limit
};

/**
 * @struct ControlPlaneConfig
 * @brief Control plane endpoint and service-account credentials
 */
struct ControlPlaneConfig {
    std::string api_base{"http://127.0.0.1:8000"};
    std::string email{"supervisor@example.com"};
    std::string password{"supervisor"};
    std::chrono::seconds request_timeout{30};
    std::string curl_binary{"curl"};
};

/**
 * @struct ExecutorConfig
 * @brief Workload execution settings
 */
struct ExecutorConfig {
    std::optional<std::string> workload_command;       ///< Shell command; unset = built-in workload
    std::chrono::seconds attempt_timeout{1800};        ///< Per-attempt wall-clock deadline
    std::chrono::seconds git_timeout{600};             ///< Per git invocation
    std::chrono::milliseconds observation_interval{200};  ///< Cancellation latency bound
    std::filesystem::path workspace_root;              ///< Empty = <state_dir>/workspaces
    bool keep_workspaces{false};
};

/**
 * @struct ReporterConfig
 * @brief Artifact upload and completion retry settings
 */
struct ReporterConfig {
    utils::BackoffPolicy retry{std::chrono::milliseconds(500), 2.0,
                               std::chrono::milliseconds(10000), 2};
    std::filesystem::path spool_dir;                   ///< Empty = <state_dir>/artifacts
    std::size_t max_preserved_in_memory{16};           ///< Older preserved outputs live only in the spool
};

/**
 * @struct SupervisorConfig
 * @brief Process-wide configuration
 */
struct SupervisorConfig {
    ControlPlaneConfig control_plane;
    PoolConfig pool;
    SnapshotConfig snapshot;
    ExecutorConfig executor;
    ReporterConfig reporter;
    
    std::filesystem::path cache_root{"/var/cache/overseer"};
    std::filesystem::path state_dir{"/var/lib/overseer"};
    std::chrono::seconds poll_interval{5};
    std::size_t max_concurrency{1};
    std::optional<std::string> environment_id;         ///< Only claim tasks for this environment
};

/**
 * @brief Merge a JSON config file into `config`
 * 
 * Keys absent from the file keep their current values.
 * 
 * @param path JSON file
 * @param config Configuration to update
 * @throws ConfigError if the file is unreadable, not JSON, or has wrong types
 */
void LoadConfigFile(const std::filesystem::path& path, SupervisorConfig& config);

/**
 * @brief Clamp values to their minimums (concurrency and poll interval ≥ 1)
 */
void NormalizeConfig(SupervisorConfig& config);

/**
 * @brief Check a configuration for problems
 * @return One message per problem; empty when valid
 */
std::vector<std::string> ValidateConfig(const SupervisorConfig& config);

/**
 * @brief Fill the derived paths (workspace root, spool dir) from state_dir
 */
void ResolveDerivedPaths(SupervisorConfig& config);

} // namespace core
} // namespace overseer
