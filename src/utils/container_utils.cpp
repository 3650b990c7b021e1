/**
 * @file container_utils.cpp
 * @brief Implementation of the container runtime driver
 * 
 * Every operation is one runtime CLI invocation through RunProcess. Warm
 * sandbox containers are created stopped (`create`, never `run`) so they
 * hold no CPU while idle; the workload later executes against the prepared
 * workspace.
 * 
 * **Container Lifecycle (warm sandbox)**:
 * ```
 * create (warming) -> idle in pool -> assigned -> rm --force (destroyed)
 * ```
 * 
 * @date 2025
 */

#include "overseer/utils/container_utils.hpp"
#include "overseer/utils/process_utils.hpp"
#include "overseer/utils/string_utils.hpp"

#include <spdlog/spdlog.h>

#include <regex>
#include <sstream>
#include <iomanip>

namespace overseer {
namespace utils {

namespace {

std::string DefaultBinary(ContainerRuntime runtime) {
    switch (runtime) {
        case ContainerRuntime::DOCKER: return "docker";
        case ContainerRuntime::PODMAN: return "podman";
    }
    return "docker";
}

std::string NetworkModeToString(NetworkMode mode) {
    switch (mode) {
        case NetworkMode::NONE:   return "none";
        case NetworkMode::BRIDGE: return "bridge";
        case NetworkMode::HOST:   return "host";
    }
    return "none";
}

} // anonymous namespace

// ============================================================================
// RUNTIME DETECTION
// ============================================================================

ContainerUtils::ContainerUtils(ContainerRuntime runtime, std::string binary)
    : binary_(binary.empty() ? DefaultBinary(runtime) : std::move(binary)) {
}

bool ContainerUtils::IsRuntimeAvailable() const {
    if (!FindExecutable(binary_)) {
        spdlog::debug("Container runtime binary not found: {}", binary_);
        return false;
    }
    auto result = ExecuteRuntimeCommand({"--version"}, std::chrono::seconds(15));
    return result.success;
}

std::string ContainerUtils::GetRuntimeVersion() const {
    auto result = ExecuteRuntimeCommand({"--version"}, std::chrono::seconds(15));
    if (!result.success) {
        return "unknown";
    }
    
    std::regex version_regex(R"((\d+\.\d+\.\d+))");
    std::smatch match;
    if (std::regex_search(result.stdout_output, match, version_regex)) {
        return match[1].str();
    }
    return StringUtils::Trim(result.stdout_output);
}

// ============================================================================
// CONTAINER LIFECYCLE
// ============================================================================

std::string ContainerUtils::CreateContainer(const ContainerConfig& config) {
    spdlog::info("Creating container: {}", config.name);
    
    if (!ValidateConfig(config)) {
        spdlog::error("Invalid container configuration");
        return "";
    }
    
    auto result = ExecuteRuntimeCommand(BuildCreateCommand(config));
    if (result.success) {
        std::string container_id = StringUtils::Trim(result.stdout_output);
        if (container_id.empty()) {
            spdlog::error("Runtime returned no container id for {}", config.name);
            return "";
        }
        spdlog::info("Container created: {}", container_id);
        return container_id;
    }
    
    spdlog::error("Failed to create container: {}", StringUtils::Trim(result.stderr_output));
    return "";
}

bool ContainerUtils::RemoveContainer(const std::string& container_id, bool force) {
    spdlog::info("Removing container: {} (force: {})", container_id, force);
    
    std::vector<std::string> args = {"rm"};
    if (force) {
        args.push_back("--force");
    }
    args.push_back(container_id);
    
    auto result = ExecuteRuntimeCommand(args);
    if (result.success) {
        spdlog::debug("Container removed: {}", container_id);
        return true;
    }
    
    spdlog::error("Failed to remove container {}: {}", container_id,
                  StringUtils::Trim(result.stderr_output));
    return false;
}

bool ContainerUtils::ContainerExists(const std::string& container_id) const {
    auto result = ExecuteRuntimeCommand({"container", "inspect", "--format", "{{.Id}}", container_id});
    return result.success;
}

bool ContainerUtils::ImageExists(const std::string& reference) const {
    auto result = ExecuteRuntimeCommand({"image", "inspect", "--format", "{{.Id}}", reference});
    return result.success;
}

// ============================================================================
// IMAGE BUILD
// ============================================================================

ContainerExecResult ContainerUtils::BuildImage(const ImageBuildOptions& options) {
    std::vector<std::string> args = {"build"};
    if (options.pull) {
        args.push_back("--pull");
    }
    for (const auto& [key, value] : options.build_args) {
        args.push_back("--build-arg");
        args.push_back(key + "=" + value);
    }
    args.push_back("-t");
    args.push_back(options.reference);
    args.push_back("-f");
    args.push_back(options.dockerfile.string());
    args.push_back(options.context.string());
    
    spdlog::info("Building image {} from {}", options.reference, options.dockerfile.string());
    return ExecuteRuntimeCommand(args, options.timeout);
}

// ============================================================================
// PRIVATE HELPERS
// ============================================================================

ContainerExecResult ContainerUtils::ExecuteRuntimeCommand(const std::vector<std::string>& args,
                                                          std::chrono::seconds timeout) const {
    ProcessOptions options;
    options.argv.reserve(args.size() + 1);
    options.argv.push_back(binary_);
    options.argv.insert(options.argv.end(), args.begin(), args.end());
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout);
    
    spdlog::debug("Executing: {}", StringUtils::Join(options.argv, " "));
    auto process = RunProcess(options);
    
    ContainerExecResult result;
    result.exit_code = process.exit_code;
    result.stdout_output = std::move(process.stdout_output);
    result.stderr_output = process.started ? std::move(process.stderr_output) : process.error;
    result.duration = process.duration;
    result.success = process.Succeeded();
    return result;
}

std::vector<std::string> ContainerUtils::BuildCreateCommand(const ContainerConfig& config) const {
    std::vector<std::string> args = {"create"};
    
    if (!config.name.empty()) {
        args.push_back("--name");
        args.push_back(config.name);
    }
    
    if (!config.hostname.empty()) {
        args.push_back("--hostname");
        args.push_back(config.hostname);
    }
    
    if (config.memory_limit_mb > 0) {
        args.push_back("--memory");
        args.push_back(std::to_string(config.memory_limit_mb) + "m");
    }
    
    if (config.cpu_limit > 0.0) {
        std::ostringstream cpus;
        cpus << std::fixed << std::setprecision(2) << config.cpu_limit;
        args.push_back("--cpus");
        args.push_back(cpus.str());
    }
    
    if (config.pids_limit > 0) {
        args.push_back("--pids-limit");
        args.push_back(std::to_string(config.pids_limit));
    }
    
    args.push_back("--network");
    args.push_back(NetworkModeToString(config.network_mode));
    
    for (const auto& [key, value] : config.labels) {
        args.push_back("--label");
        args.push_back(key + "=" + value);
    }
    
    for (const auto& [key, value] : config.environment_vars) {
        args.push_back("--env");
        args.push_back(key + "=" + value);
    }
    
    for (const auto& [host, container] : config.mounts) {
        args.push_back("--volume");
        args.push_back(host.string() + ":" + container.string());
    }
    
    args.push_back(config.image);
    args.insert(args.end(), config.command.begin(), config.command.end());
    
    return args;
}

bool ContainerUtils::ValidateConfig(const ContainerConfig& config) const {
    if (config.image.empty()) {
        spdlog::error("Container image not specified");
        return false;
    }
    
    if (config.memory_limit_mb > 0 && config.memory_limit_mb < 128) {
        spdlog::warn("Memory limit very low: {} MB", config.memory_limit_mb);
    }
    
    return true;
}

} // namespace utils
} // namespace overseer
