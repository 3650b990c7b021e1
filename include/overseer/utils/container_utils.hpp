/**
 * @file container_utils.hpp
 * @brief Container runtime driver for warm sandboxes and base images
 * 
 * Thin wrapper over the docker/podman CLI used by the container snapshot
 * backend (create / remove warm containers) and by the sandbox image builder
 * (build base images). All invocations go through utils::RunProcess with an
 * argv vector, never a shell string.
 * 
 * @date 2025
 */

#pragma once

#include <string>
#include <vector>
#include <map>
#include <optional>
#include <filesystem>
#include <chrono>

namespace overseer {
namespace utils {

/**
 * @enum ContainerRuntime
 * @brief Supported container runtime engines
 */
enum class ContainerRuntime {
    DOCKER,   ///< Docker Engine
    PODMAN    ///< Podman (daemonless, docker-compatible CLI)
};

/**
 * @enum NetworkMode
 * @brief Container network isolation modes
 */
enum class NetworkMode {
    NONE,     ///< No network access
    BRIDGE,   ///< Default bridge network
    HOST      ///< Host network
};

/**
 * @struct ContainerConfig
 * @brief Settings for a warm sandbox container
 */
struct ContainerConfig {
    std::string name;                          ///< Container name
    std::string image{"overseer-sandbox:latest"};  ///< Base image reference
    std::string hostname{"sandbox"};           ///< Container hostname
    
    // Resource Limits
    std::size_t memory_limit_mb{4096};         ///< Memory limit
    double cpu_limit{2.0};                     ///< CPU limit (cores)
    int pids_limit{512};                       ///< Process limit
    
    NetworkMode network_mode{NetworkMode::BRIDGE};  ///< Network mode
    
    std::map<std::string, std::string> labels;           ///< Metadata labels
    std::map<std::string, std::string> environment_vars; ///< Environment variables
    std::map<std::filesystem::path, std::filesystem::path> mounts;  ///< host → container bind mounts
    std::vector<std::string> command;          ///< Entrypoint arguments (empty = image default)
};

/**
 * @struct ContainerExecResult
 * @brief Result of a container runtime CLI invocation
 */
struct ContainerExecResult {
    int exit_code{0};              ///< Exit code
    std::string stdout_output;     ///< Standard output
    std::string stderr_output;     ///< Standard error
    std::chrono::milliseconds duration{0};  ///< Execution duration
    bool success{false};           ///< Success flag
};

/**
 * @struct ImageBuildOptions
 * @brief Inputs for building an image from a Dockerfile
 */
struct ImageBuildOptions {
    std::filesystem::path dockerfile;      ///< Dockerfile path
    std::filesystem::path context;         ///< Build context directory
    std::string reference;                 ///< name:tag to produce
    bool pull{true};                       ///< Always pull newer base layers
    std::map<std::string, std::string> build_args;  ///< --build-arg values
    std::chrono::seconds timeout{3600};    ///< Build deadline
};

/**
 * @class ContainerUtils
 * @brief Container lifecycle operations over the runtime CLI
 * 
 * **Usage Example**:
 * @code
 * ContainerUtils utils(ContainerRuntime::DOCKER);
 * 
 * ContainerConfig config;
 * config.name = "overseer-warm-1";
 * config.image = "overseer-sandbox:latest";
 * 
 * std::string id = utils.CreateContainer(config);
 * ...
 * utils.RemoveContainer(id, true);
 * @endcode
 */
class ContainerUtils {
public:
    /**
     * @brief Construct container utilities for a runtime
     * @param runtime Container runtime to use
     * @param binary Explicit CLI path (empty = runtime default on PATH)
     */
    explicit ContainerUtils(ContainerRuntime runtime = ContainerRuntime::DOCKER,
                            std::string binary = "");

    /**
     * @brief Check if container runtime is available
     * @return true if the CLI answers `--version`
     */
    bool IsRuntimeAvailable() const;

    /**
     * @brief Get runtime version string
     * @return Version (x.y.z) or "unknown"
     */
    std::string GetRuntimeVersion() const;

    /**
     * @brief Create (but do not start) a container
     * @param config Container configuration
     * @return Container ID, empty on failure
     */
    std::string CreateContainer(const ContainerConfig& config);

    /**
     * @brief Remove container
     * @param container_id Container ID or name
     * @param force Kill if running
     * @return true if removed
     */
    bool RemoveContainer(const std::string& container_id, bool force = false);

    /**
     * @brief Check if container exists
     * @param container_id Container ID or name
     * @return true if `inspect` succeeds
     */
    bool ContainerExists(const std::string& container_id) const;

    /**
     * @brief Check if an image is present locally
     * @param reference Image reference
     * @return true if present
     */
    bool ImageExists(const std::string& reference) const;

    /**
     * @brief Build an image
     * @param options Build inputs
     * @return CLI result (stdout holds the build log)
     */
    ContainerExecResult BuildImage(const ImageBuildOptions& options);

    /**
     * @brief Runtime CLI binary in use
     */
    const std::string& GetBinary() const { return binary_; }

private:
    std::string binary_;        ///< CLI binary

    ContainerExecResult ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                              std::chrono::seconds timeout = std::chrono::seconds(120)) const;
    std::vector<std::string> BuildCreateCommand(const ContainerConfig& config) const;
    bool ValidateConfig(const ContainerConfig& config) const;
};

} // namespace utils
} // namespace overseer
