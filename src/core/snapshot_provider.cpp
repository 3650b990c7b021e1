/**
 * @file snapshot_provider.cpp
 * @brief Prewarm backend implementations
 * @date 2025
 */

#include "overseer/core/snapshot_provider.hpp"
#include "overseer/utils/process_utils.hpp"
#include "overseer/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace overseer {
namespace core {

using utils::StringUtils;

// ============================================================================
// HOOK PROVIDER
// ============================================================================

HookSnapshotProvider::HookSnapshotProvider(std::filesystem::path prewarm_hook,
                                           std::filesystem::path destroy_hook,
                                           std::chrono::seconds timeout)
    : prewarm_hook_(std::move(prewarm_hook))
    , destroy_hook_(std::move(destroy_hook))
    , timeout_(timeout) {
}

std::string HookSnapshotProvider::ProduceSnapshot(const std::optional<std::string>& snapshot_template) {
    utils::ProcessOptions options;
    options.argv = {prewarm_hook_.string()};
    options.environment["OVERSEER_SNAPSHOT_EVENT"] = "prewarm";
    if (snapshot_template && !snapshot_template->empty()) {
        options.environment["OVERSEER_SNAPSHOT_TEMPLATE"] = *snapshot_template;
    } else {
        options.unset_environment.push_back("OVERSEER_SNAPSHOT_TEMPLATE");
    }
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_);
    options.cancel_flag = &cancelled_;
    
    auto result = utils::RunProcess(options);
    if (!result.started) {
        throw SnapshotError(fmt::format("prewarm hook {} did not start: {}",
                                        prewarm_hook_.string(), result.error));
    }
    if (!result.Succeeded()) {
        throw SnapshotError(fmt::format("prewarm hook {} failed ({}): {}",
                                        prewarm_hook_.string(),
                                        utils::DescribeTermination(result),
                                        StringUtils::Truncate(StringUtils::Trim(result.stderr_output), 512)));
    }
    
    auto lines = StringUtils::SplitLines(result.stdout_output);
    if (lines.size() != 1) {
        throw SnapshotError(fmt::format("prewarm hook {} printed {} lines, expected one snapshot id",
                                        prewarm_hook_.string(), lines.size()));
    }
    
    std::string snapshot_id = StringUtils::Trim(lines.front());
    if (snapshot_id.empty()) {
        throw SnapshotError("prewarm hook printed an empty snapshot id");
    }
    return snapshot_id;
}

void HookSnapshotProvider::Destroy(const std::string& snapshot_id) {
    if (destroy_hook_.empty()) {
        return;
    }
    
    utils::ProcessOptions options;
    options.argv = {destroy_hook_.string()};
    options.environment["OVERSEER_SNAPSHOT_EVENT"] = "destroy";
    options.environment["OVERSEER_SNAPSHOT_ID"] = snapshot_id;
    options.timeout = std::chrono::duration_cast<std::chrono::milliseconds>(timeout_);
    
    auto result = utils::RunProcess(options);
    if (!result.Succeeded()) {
        throw SnapshotError(fmt::format("destroy hook failed for {} ({}): {}", snapshot_id,
                                        result.started ? utils::DescribeTermination(result) : result.error,
                                        StringUtils::Truncate(StringUtils::Trim(result.stderr_output), 512)));
    }
}

// ============================================================================
// CONTAINER PROVIDER
// ============================================================================

ContainerSnapshotProvider::ContainerSnapshotProvider(utils::ContainerUtils containers,
                                                     const SnapshotConfig& config)
    : containers_(std::move(containers))
    , config_(config) {
}

std::string ContainerSnapshotProvider::ProduceSnapshot(const std::optional<std::string>& snapshot_template) {
    utils::ContainerConfig container;
    container.name = "overseer-warm-" + StringUtils::GenerateUUID().substr(0, 8);
    container.image = snapshot_template && !snapshot_template->empty() ? *snapshot_template : config_.image;
    container.memory_limit_mb = config_.memory_limit_mb;
    container.cpu_limit = config_.cpu_limit;
    container.network_mode = utils::NetworkMode::BRIDGE;
    container.labels["overseer.role"] = "warm-sandbox";
    container.command = {"sleep", "infinity"};
    
    std::string container_id = containers_.CreateContainer(container);
    if (container_id.empty()) {
        throw SnapshotError(fmt::format("container runtime could not create {} from {}",
                                        container.name, container.image));
    }
    return container_id;
}

void ContainerSnapshotProvider::Destroy(const std::string& snapshot_id) {
    if (!containers_.ContainerExists(snapshot_id)) {
        spdlog::warn("Warm container {} already gone", snapshot_id);
        return;
    }
    if (!containers_.RemoveContainer(snapshot_id, true)) {
        throw SnapshotError("failed to remove warm container " + snapshot_id);
    }
}

// ============================================================================
// GENERATED PROVIDER
// ============================================================================

std::string GeneratedSnapshotProvider::ProduceSnapshot(const std::optional<std::string>& /*snapshot_template*/) {
    return "snapshot-" + StringUtils::GenerateUUID();
}

void GeneratedSnapshotProvider::Destroy(const std::string& snapshot_id) {
    spdlog::debug("Discarded generated snapshot {}", snapshot_id);
}

// ============================================================================
// FACTORY
// ============================================================================

std::unique_ptr<SnapshotProvider> CreateSnapshotProvider(const SnapshotConfig& config) {
    switch (config.backend) {
        case SnapshotBackend::HOOK:
            return std::make_unique<HookSnapshotProvider>(config.prewarm_hook, config.destroy_hook,
                                                          config.hook_timeout);
        case SnapshotBackend::CONTAINER:
            return std::make_unique<ContainerSnapshotProvider>(
                utils::ContainerUtils(config.runtime), config);
        case SnapshotBackend::GENERATED:
            return std::make_unique<GeneratedSnapshotProvider>();
    }
    throw ConfigError("unknown snapshot backend");
}

} // namespace core
} // namespace overseer
