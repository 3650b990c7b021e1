/**
 * @file image_builder.cpp
 * @brief Sandbox base image build
 * @date 2025
 */

#include "overseer/core/image_builder.hpp"
#include "overseer/utils/string_utils.hpp"

#include <spdlog/spdlog.h>
#include <fmt/format.h>

namespace overseer {
namespace core {

namespace fs = std::filesystem;
using utils::StringUtils;

SandboxImageBuilder::SandboxImageBuilder(utils::ContainerUtils containers)
    : containers_(std::move(containers)) {
}

std::string SandboxImageBuilder::Reference(const ImageBuildConfig& config) {
    return config.image + ":" + (config.tag.empty() ? std::string("latest") : config.tag);
}

std::string SandboxImageBuilder::Build(const ImageBuildConfig& config) {
    if (!containers_.IsRuntimeAvailable()) {
        throw ImageBuildError(fmt::format("container runtime '{}' not found on PATH",
                                          containers_.GetBinary()));
    }
    spdlog::info("Container runtime {} {}", containers_.GetBinary(), containers_.GetRuntimeVersion());
    
    std::error_code ec;
    if (!fs::is_regular_file(config.dockerfile, ec)) {
        throw ImageBuildError("unable to locate Dockerfile at " + config.dockerfile.string());
    }
    
    fs::path context = config.context.empty() ? config.dockerfile.parent_path() : config.context;
    if (context.empty()) {
        context = ".";
    }
    if (!fs::is_directory(context, ec)) {
        throw ImageBuildError("build context is not a directory: " + context.string());
    }
    
    utils::ImageBuildOptions options;
    options.dockerfile = config.dockerfile;
    options.context = context;
    options.reference = Reference(config);
    options.pull = config.pull;
    options.timeout = config.timeout;
    
    auto result = containers_.BuildImage(options);
    if (!result.success) {
        auto tail = StringUtils::Trim(result.stderr_output);
        if (tail.size() > 2000) {
            tail = "..." + tail.substr(tail.size() - 2000);
        }
        throw ImageBuildError(fmt::format("build of {} failed (exit {}): {}",
                                          options.reference, result.exit_code, tail));
    }
    if (!containers_.ImageExists(options.reference)) {
        throw ImageBuildError(fmt::format("build reported success but {} is not in the local image store",
                                          options.reference));
    }
    
    spdlog::info("Built sandbox image {} in {} s", options.reference,
                 std::chrono::duration_cast<std::chrono::seconds>(result.duration).count());
    return options.reference;
}

} // namespace core
} // namespace overseer
