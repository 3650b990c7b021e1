/**
 * @file config.cpp
 * @brief JSON config loading and validation
 * @date 2025
 */

#include "overseer/core/config.hpp"
#include "overseer/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <fstream>
#include <algorithm>

using json = nlohmann::json;

namespace overseer {
namespace core {

namespace {

// Assign `target` from `node[key]` when present and not null
template <typename T>
void ReadValue(const json& node, const char* key, T& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

// Sizes and counts: JSON integers must not be negative
void ReadCount(const json& node, const char* key, std::size_t& target) {
    auto it = node.find(key);
    if (it == node.end() || it->is_null()) {
        return;
    }
    if (!it->is_number_integer()) {
        throw ConfigError(fmt::format("{} must be a non-negative integer", key));
    }
    if (it->is_number_unsigned()) {
        target = it->get<std::size_t>();
        return;
    }
    auto value = it->get<long long>();
    if (value < 0) {
        throw ConfigError(fmt::format("{} must not be negative (got {})", key, value));
    }
    target = static_cast<std::size_t>(value);
}

template <typename T>
void ReadOptional(const json& node, const char* key, std::optional<T>& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = it->get<T>();
    }
}

void ReadPath(const json& node, const char* key, std::filesystem::path& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = it->get<std::string>();
    }
}

template <typename Duration>
void ReadDuration(const json& node, const char* key, Duration& target) {
    auto it = node.find(key);
    if (it != node.end() && !it->is_null()) {
        target = Duration(it->get<long long>());
    }
}

void ReadBackoff(const json& node, utils::BackoffPolicy& policy) {
    ReadDuration(node, "initial_delay_ms", policy.initial_delay);
    ReadValue(node, "multiplier", policy.multiplier);
    ReadDuration(node, "max_delay_ms", policy.max_delay);
    ReadValue(node, "max_retries", policy.max_retries);
}

void ApplyPool(const json& node, PoolConfig& pool) {
    ReadCount(node, "target_size", pool.target_size);
    ReadCount(node, "max_size", pool.max_size);
    
    if (node.contains("acquire_policy")) {
        auto name = node.at("acquire_policy").get<std::string>();
        auto policy = AcquirePolicyFromString(name);
        if (!policy) {
            throw ConfigError("unknown acquire_policy: " + name);
        }
        pool.acquire_policy = *policy;
    }
    
    if (node.contains("acquire_timeout_ms") && !node.at("acquire_timeout_ms").is_null()) {
        pool.acquire_timeout = std::chrono::milliseconds(node.at("acquire_timeout_ms").get<long long>());
    }
    ReadOptional(node, "snapshot_template", pool.snapshot_template);
    ReadDuration(node, "replenish_interval_ms", pool.replenish_interval);
    
    if (node.contains("backoff")) {
        ReadBackoff(node.at("backoff"), pool.prewarm_backoff);
    }
}

void ApplySnapshot(const json& node, SnapshotConfig& snapshot) {
    if (node.contains("backend")) {
        auto name = node.at("backend").get<std::string>();
        auto backend = SnapshotBackendFromString(name);
        if (!backend) {
            throw ConfigError("unknown snapshot backend: " + name);
        }
        snapshot.backend = *backend;
    }
    ReadPath(node, "prewarm_hook", snapshot.prewarm_hook);
    ReadPath(node, "destroy_hook", snapshot.destroy_hook);
    ReadDuration(node, "hook_timeout_secs", snapshot.hook_timeout);
    
    if (node.contains("runtime")) {
        auto name = utils::StringUtils::ToLower(node.at("runtime").get<std::string>());
        if (name == "docker") {
            snapshot.runtime = utils::ContainerRuntime::DOCKER;
        } else if (name == "podman") {
            snapshot.runtime = utils::ContainerRuntime::PODMAN;
        } else {
            throw ConfigError("unknown container runtime: " + name);
        }
    }
    ReadValue(node, "image", snapshot.image);
    ReadValue(node, "memory_limit_mb", snapshot.memory_limit_mb);
    ReadValue(node, "cpu_limit", snapshot.cpu_limit);
}

void ApplyExecutor(const json& node, ExecutorConfig& executor) {
    ReadOptional(node, "workload_command", executor.workload_command);
    ReadDuration(node, "attempt_timeout_secs", executor.attempt_timeout);
    ReadDuration(node, "git_timeout_secs", executor.git_timeout);
    ReadDuration(node, "observation_interval_ms", executor.observation_interval);
    ReadPath(node, "workspace_root", executor.workspace_root);
    ReadValue(node, "keep_workspaces", executor.keep_workspaces);
}

void ApplyReporter(const json& node, ReporterConfig& reporter) {
    ReadBackoff(node, reporter.retry);
    ReadPath(node, "spool_dir", reporter.spool_dir);
    ReadCount(node, "max_preserved_in_memory", reporter.max_preserved_in_memory);
}

} // anonymous namespace

// ============================================================================
// ENUM CONVERSIONS
// ============================================================================

std::string AcquirePolicyToString(AcquirePolicy policy) {
    switch (policy) {
        case AcquirePolicy::BLOCK:     return "block";
        case AcquirePolicy::COLD:      return "cold";
        case AcquirePolicy::FAIL_FAST: return "fail-fast";
    }
    return "block";
}

std::optional<AcquirePolicy> AcquirePolicyFromString(const std::string& value) {
    auto name = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    if (name == "block") return AcquirePolicy::BLOCK;
    if (name == "cold") return AcquirePolicy::COLD;
    if (name == "fail-fast" || name == "fail_fast") return AcquirePolicy::FAIL_FAST;
    return std::nullopt;
}

std::string SnapshotBackendToString(SnapshotBackend backend) {
    switch (backend) {
        case SnapshotBackend::HOOK:      return "hook";
        case SnapshotBackend::CONTAINER: return "container";
        case SnapshotBackend::GENERATED: return "generated";
    }
    return "generated";
}

std::optional<SnapshotBackend> SnapshotBackendFromString(const std::string& value) {
    auto name = utils::StringUtils::ToLower(utils::StringUtils::Trim(value));
    if (name == "hook") return SnapshotBackend::HOOK;
    if (name == "container") return SnapshotBackend::CONTAINER;
    if (name == "generated") return SnapshotBackend::GENERATED;
    return std::nullopt;
}

// ============================================================================
// LOADING
// ============================================================================

void LoadConfigFile(const std::filesystem::path& path, SupervisorConfig& config) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigError("cannot open config file: " + path.string());
    }
    
    json root;
    try {
        root = json::parse(file);
    } catch (const json::parse_error& e) {
        throw ConfigError(fmt::format("invalid JSON in {}: {}", path.string(), e.what()));
    }
    
    if (!root.is_object()) {
        throw ConfigError("config root must be an object: " + path.string());
    }
    
    try {
        ReadValue(root, "api_base", config.control_plane.api_base);
        ReadValue(root, "email", config.control_plane.email);
        ReadValue(root, "password", config.control_plane.password);
        ReadDuration(root, "request_timeout_secs", config.control_plane.request_timeout);
        ReadValue(root, "curl_binary", config.control_plane.curl_binary);
        
        ReadDuration(root, "poll_interval_secs", config.poll_interval);
        ReadCount(root, "max_concurrency", config.max_concurrency);
        ReadOptional(root, "environment_id", config.environment_id);
        ReadPath(root, "cache_root", config.cache_root);
        ReadPath(root, "state_dir", config.state_dir);
        
        if (root.contains("pool")) ApplyPool(root.at("pool"), config.pool);
        if (root.contains("snapshot")) ApplySnapshot(root.at("snapshot"), config.snapshot);
        if (root.contains("executor")) ApplyExecutor(root.at("executor"), config.executor);
        if (root.contains("reporter")) ApplyReporter(root.at("reporter"), config.reporter);
    } catch (const json::exception& e) {
        throw ConfigError(fmt::format("bad value in {}: {}", path.string(), e.what()));
    }
    
    spdlog::debug("Loaded configuration from {}", path.string());
}

void NormalizeConfig(SupervisorConfig& config) {
    config.max_concurrency = std::max<std::size_t>(config.max_concurrency, 1);
    config.poll_interval = std::max(config.poll_interval, std::chrono::seconds(1));
    config.pool.max_size = std::max<std::size_t>(config.pool.max_size, 1);
}

void ResolveDerivedPaths(SupervisorConfig& config) {
    if (config.executor.workspace_root.empty()) {
        config.executor.workspace_root = config.state_dir / "workspaces";
    }
    if (config.reporter.spool_dir.empty()) {
        config.reporter.spool_dir = config.state_dir / "artifacts";
    }
}

// ============================================================================
// VALIDATION
// ============================================================================

std::vector<std::string> ValidateConfig(const SupervisorConfig& config) {
    std::vector<std::string> problems;
    
    const auto& api_base = config.control_plane.api_base;
    if (!utils::StringUtils::StartsWith(api_base, "http://") &&
        !utils::StringUtils::StartsWith(api_base, "https://")) {
        problems.push_back("api_base must start with http:// or https://: " + api_base);
    }
    if (config.control_plane.email.empty()) {
        problems.push_back("email must not be empty");
    }
    
    if (config.cache_root.empty()) {
        problems.push_back("cache_root must not be empty");
    }
    if (config.state_dir.empty()) {
        problems.push_back("state_dir must not be empty");
    }
    
    if (config.pool.max_size == 0) {
        problems.push_back("pool max_size must be at least 1");
    }
    if (config.pool.target_size > config.pool.max_size) {
        problems.push_back(fmt::format("pool target_size ({}) exceeds max_size ({})",
                                       config.pool.target_size, config.pool.max_size));
    }
    if (config.pool.prewarm_backoff.multiplier < 1.0) {
        problems.push_back("prewarm backoff multiplier must be >= 1");
    }
    if (config.pool.prewarm_backoff.max_retries < 0) {
        problems.push_back("prewarm backoff max_retries must be >= 0");
    }
    if (config.pool.replenish_interval.count() <= 0) {
        problems.push_back("pool replenish_interval must be positive");
    }
    if (config.pool.acquire_timeout && config.pool.acquire_timeout->count() <= 0) {
        problems.push_back("acquire_timeout must be positive");
    }
    
    if (config.snapshot.backend == SnapshotBackend::HOOK && config.snapshot.prewarm_hook.empty()) {
        problems.push_back("snapshot backend 'hook' requires prewarm_hook");
    }
    if (config.snapshot.backend == SnapshotBackend::CONTAINER && config.snapshot.image.empty()) {
        problems.push_back("snapshot backend 'container' requires an image");
    }
    
    if (config.executor.attempt_timeout.count() <= 0) {
        problems.push_back("attempt_timeout must be positive");
    }
    if (config.executor.observation_interval.count() <= 0) {
        problems.push_back("observation_interval must be positive");
    }
    if (config.reporter.retry.max_retries < 0) {
        problems.push_back("reporter max_retries must be >= 0");
    }
    
    return problems;
}

} // namespace core
} // namespace overseer
