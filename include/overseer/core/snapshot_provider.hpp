/**
 * @file snapshot_provider.hpp
 * @brief Pluggable prewarm backends for the sandbox pool
 * 
 * The pool only knows the SnapshotProvider interface. A provider turns an
 * optional template reference into a ready sandbox identified by a snapshot
 * id, and tears a sandbox down again when the pool destroys it.
 * 
 * The snapshot id is an opaque token outside the provider. The Executor runs
 * the workload in a host workspace and only records the id (log header,
 * OVERSEER_SNAPSHOT_ID); the pool uses it for exclusivity and lifecycle.
 * 
 * **Backends**:
 * - HookSnapshotProvider: external executable, one id on stdout
 * - ContainerSnapshotProvider: stopped container from the base image
 * - GeneratedSnapshotProvider: no backend, `snapshot-<uuid>`
 * 
 * @date 2025
 */

#pragma once

#include "overseer/core/config.hpp"
#include "overseer/utils/container_utils.hpp"

#include <string>
#include <optional>
#include <memory>
#include <atomic>
#include <stdexcept>
#include <filesystem>

namespace overseer {
namespace core {

/**
 * @class SnapshotError
 * @brief A provider could not produce or destroy a snapshot
 */
class SnapshotError : public std::runtime_error {
public:
    explicit SnapshotError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @class SnapshotProvider
 * @brief Prewarm strategy interface
 */
class SnapshotProvider {
public:
    virtual ~SnapshotProvider() = default;
    
    /**
     * @brief Produce one ready sandbox
     * @param snapshot_template Optional template reference
     * @return Snapshot identifier (non-empty)
     * @throws SnapshotError on failure
     */
    virtual std::string ProduceSnapshot(const std::optional<std::string>& snapshot_template) = 0;
    
    /**
     * @brief Tear down a destroyed sandbox
     * @throws SnapshotError on failure (the pool logs and continues)
     */
    virtual void Destroy(const std::string& snapshot_id) = 0;
    
    /// Short backend name for logs
    virtual std::string Name() const = 0;
    
    /// Interrupt an in-flight ProduceSnapshot (pool shutdown); default no-op
    virtual void Cancel() {}
};

/**
 * @class HookSnapshotProvider
 * @brief Runs an external prewarm hook
 * 
 * The hook receives OVERSEER_SNAPSHOT_EVENT=prewarm and, when a template is
 * configured, OVERSEER_SNAPSHOT_TEMPLATE. It must exit 0 and print exactly
 * one non-empty line: the snapshot id. The optional destroy hook receives
 * OVERSEER_SNAPSHOT_EVENT=destroy and OVERSEER_SNAPSHOT_ID.
 */
class HookSnapshotProvider : public SnapshotProvider {
public:
    HookSnapshotProvider(std::filesystem::path prewarm_hook,
                         std::filesystem::path destroy_hook,
                         std::chrono::seconds timeout);
    
    std::string ProduceSnapshot(const std::optional<std::string>& snapshot_template) override;
    void Destroy(const std::string& snapshot_id) override;
    std::string Name() const override { return "hook"; }
    
    void Cancel() override { cancelled_.store(true); }

private:
    std::filesystem::path prewarm_hook_;
    std::filesystem::path destroy_hook_;
    std::chrono::seconds timeout_;
    std::atomic<bool> cancelled_{false};
};

/**
 * @class ContainerSnapshotProvider
 * @brief Creates stopped warm containers from the sandbox image
 * 
 * The container id is the snapshot id. Containers are created, never
 * started: they reserve the image and resource limits for the lease and
 * are removed when the pool destroys the sandbox. Nothing executes inside
 * them.
 */
class ContainerSnapshotProvider : public SnapshotProvider {
public:
    ContainerSnapshotProvider(utils::ContainerUtils containers, const SnapshotConfig& config);
    
    std::string ProduceSnapshot(const std::optional<std::string>& snapshot_template) override;
    void Destroy(const std::string& snapshot_id) override;
    std::string Name() const override { return "container"; }

private:
    utils::ContainerUtils containers_;
    SnapshotConfig config_;
};

/**
 * @class GeneratedSnapshotProvider
 * @brief Backend-less provider returning `snapshot-<uuid>`
 */
class GeneratedSnapshotProvider : public SnapshotProvider {
public:
    std::string ProduceSnapshot(const std::optional<std::string>& snapshot_template) override;
    void Destroy(const std::string& snapshot_id) override;
    std::string Name() const override { return "generated"; }
};

/**
 * @brief Build the provider selected by `config.backend`
 */
std::unique_ptr<SnapshotProvider> CreateSnapshotProvider(const SnapshotConfig& config);

} // namespace core
} // namespace overseer
