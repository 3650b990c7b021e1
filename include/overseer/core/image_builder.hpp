/**
 * @file image_builder.hpp
 * @brief Offline build of the sandbox base image
 * 
 * Used by `overseer build-image`; not on the attempt hot path. The produced
 * reference is what the container snapshot backend instantiates.
 * 
 * @date 2025
 */

#pragma once

#include "overseer/utils/container_utils.hpp"

#include <string>
#include <chrono>
#include <stdexcept>
#include <filesystem>

namespace overseer {
namespace core {

/**
 * @class ImageBuildError
 * @brief Base image could not be built
 */
class ImageBuildError : public std::runtime_error {
public:
    explicit ImageBuildError(const std::string& message)
        : std::runtime_error(message) {}
};

/**
 * @struct ImageBuildConfig
 * @brief Base image inputs
 */
struct ImageBuildConfig {
    std::filesystem::path dockerfile{"images/sandbox/Dockerfile"};
    std::filesystem::path context;                 ///< Empty = directory of the Dockerfile
    std::string image{"overseer-sandbox"};
    std::string tag{"latest"};
    bool pull{true};
    std::chrono::seconds timeout{3600};
};

/**
 * @class SandboxImageBuilder
 * @brief Builds the base image through the container runtime
 * 
 * **Usage Example**:
 * @code
 * SandboxImageBuilder builder(utils::ContainerUtils(utils::ContainerRuntime::DOCKER));
 * std::string reference = builder.Build(ImageBuildConfig{});
 * @endcode
 */
class SandboxImageBuilder {
public:
    explicit SandboxImageBuilder(utils::ContainerUtils containers);
    
    /**
     * @brief Build the image
     * @return Image reference (image:tag)
     * @throws ImageBuildError if the runtime is missing, the Dockerfile is
     *         absent, or the build fails
     */
    std::string Build(const ImageBuildConfig& config);
    
    /// image:tag
    static std::string Reference(const ImageBuildConfig& config);

private:
    utils::ContainerUtils containers_;
};

} // namespace core
} // namespace overseer
