/**
 * @file main.cpp
 * @brief Overseer task-execution supervisor - Command-line interface
 * 
 * Subcommands:
 * - `run`          claim and execute attempts until SIGINT / SIGTERM
 * - `build-image`  build the sandbox base image
 * - `hydrate`      create the cache directories and print their paths
 * 
 * Configuration precedence: built-in defaults < `--config` JSON file <
 * OVERSEER_* environment variables and command-line options.
 * 
 * @date 2025
 */

#include <CLI/CLI.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/basic_file_sink.h>

#include "overseer/api/control_plane_client.hpp"
#include "overseer/api/http_transport.hpp"
#include "overseer/core/cache_hydrator.hpp"
#include "overseer/core/config.hpp"
#include "overseer/core/image_builder.hpp"
#include "overseer/core/snapshot_provider.hpp"
#include "overseer/core/supervisor.hpp"

#include <iostream>
#include <atomic>
#include <thread>
#include <csignal>
#include <functional>
#include <algorithm>
#include <filesystem>
#include <ctime>
#include <pthread.h>

using namespace overseer;

namespace {

constexpr int kExitConfigError = 2;

/*******************************************************************************
 * UI and Display Functions
 ******************************************************************************/

void PrintBanner() {
    std::cout << R"(
╔═══════════════════════════════════════════════════════════════╗
║   OVERSEER  -  warm-pool task execution supervisor            ║
║                              v1.0.0                           ║
╚═══════════════════════════════════════════════════════════════╝
)" << std::endl;
}

void ConfigureLogging(bool verbose, const std::string& level, const std::string& log_file) {
    std::vector<spdlog::sink_ptr> sinks;
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
    if (!log_file.empty()) {
        sinks.push_back(std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false));
    }
    auto logger = std::make_shared<spdlog::logger>("overseer", sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);
    
    if (!level.empty()) {
        spdlog::set_level(spdlog::level::from_str(level));
    } else if (verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] [%t] %v");
    spdlog::flush_on(spdlog::level::warn);
}

/*******************************************************************************
 * Command-line Overrides
 ******************************************************************************/

// Values bound to `run` options; applied only when given on the command
// line or through the environment
struct RunOptions {
    std::string api_base;
    std::string email;
    std::string password;
    int poll_interval_secs{0};
    int max_concurrency{0};
    std::string environment_id;
    std::string cache_root;
    std::string state_dir;
    
    int pool_size{0};
    int pool_max{0};
    std::string acquire_policy;
    int acquire_timeout_secs{0};
    std::string snapshot_backend;
    std::string prewarm_hook;
    std::string destroy_hook;
    std::string snapshot_template;
    std::string container_image;
    
    std::string workload;
    int attempt_timeout_secs{0};
    bool keep_workspaces{false};
    int upload_retries{0};
    
    int warmup_timeout_secs{0};
    bool once{false};
};

template <typename T, typename Apply>
void Override(const CLI::Option* option, const T& value, Apply apply) {
    if (option != nullptr && option->count() > 0) {
        apply(value);
    }
}

/*******************************************************************************
 * Signal Handling
 ******************************************************************************/

// Blocks SIGINT / SIGTERM in every thread and hands them to a watcher that
// calls `on_signal` once
class SignalWatcher {
public:
    explicit SignalWatcher(std::function<void()> on_signal)
        : on_signal_(std::move(on_signal)) {
        sigemptyset(&signals_);
        sigaddset(&signals_, SIGINT);
        sigaddset(&signals_, SIGTERM);
        pthread_sigmask(SIG_BLOCK, &signals_, nullptr);
        thread_ = std::thread([this] { Watch(); });
    }
    
    ~SignalWatcher() {
        done_.store(true);
        if (thread_.joinable()) {
            thread_.join();
        }
    }

private:
    void Watch() {
        timespec timeout{0, 200 * 1000 * 1000};
        while (!done_.load()) {
            int signal = sigtimedwait(&signals_, nullptr, &timeout);
            if (signal > 0) {
                spdlog::info("Received signal {}, shutting down", signal);
                on_signal_();
                return;
            }
        }
    }
    
    sigset_t signals_;
    std::function<void()> on_signal_;
    std::atomic<bool> done_{false};
    std::thread thread_;
};

/*******************************************************************************
 * Subcommands
 ******************************************************************************/

int RunSupervisor(core::SupervisorConfig config, const RunOptions& options) {
    core::NormalizeConfig(config);
    auto problems = core::ValidateConfig(config);
    if (!problems.empty()) {
        for (const auto& problem : problems) {
            spdlog::error("[CONFIG] {}", problem);
        }
        return kExitConfigError;
    }
    
    auto transport = std::make_shared<api::CurlTransport>(config.control_plane.curl_binary);
    auto client = std::make_shared<api::HttpControlPlaneClient>(config.control_plane, transport);
    std::shared_ptr<core::SnapshotProvider> provider = core::CreateSnapshotProvider(config.snapshot);
    spdlog::info("Snapshot backend: {}", provider->Name());
    
    core::Supervisor supervisor(config, client, provider);
    SignalWatcher watcher([&supervisor] { supervisor.Shutdown(); });
    
    supervisor.Start();
    if (options.warmup_timeout_secs > 0) {
        supervisor.WarmUp(std::chrono::seconds(options.warmup_timeout_secs));
    }
    
    if (options.once) {
        std::size_t dispatched = supervisor.Poller().PollOnce();
        spdlog::info("Single poll dispatched {} attempt(s)", dispatched);
        auto drain = std::chrono::duration_cast<std::chrono::milliseconds>(
            config.executor.attempt_timeout + std::chrono::minutes(5));
        supervisor.Poller().Drain(drain);
    } else {
        supervisor.Run();
    }
    
    supervisor.Shutdown();
    
    auto metrics = supervisor.PoolStatus();
    spdlog::info("Pool at exit: idle={} assigned={} destroyed={} prewarm_failures={} last_snapshot={}",
                 metrics.idle, metrics.assigned, metrics.destroyed_total, metrics.prewarm_failures,
                 metrics.last_snapshot.value_or("none"));
    auto preserved = supervisor.Reporter().PreservedAttempts();
    if (!preserved.empty()) {
        spdlog::warn("{} attempt(s) have preserved output under {}", preserved.size(),
                     (config.state_dir / "artifacts").string());
    }
    return 0;
}

int BuildImage(const core::ImageBuildConfig& build, utils::ContainerRuntime runtime) {
    core::SandboxImageBuilder builder{utils::ContainerUtils(runtime)};
    std::string reference = builder.Build(build);
    std::cout << reference << std::endl;
    return 0;
}

int Hydrate(const std::filesystem::path& cache_root, const std::string& repository_id) {
    core::CacheHydrator hydrator(cache_root);
    auto paths = hydrator.Ensure();
    std::cout << "root:  " << paths.root.string() << "\n";
    std::cout << "git:   " << paths.git.string() << "\n";
    std::cout << "npm:   " << paths.npm.string() << "\n";
    std::cout << "pip:   " << paths.pip.string() << "\n";
    std::cout << "cargo: " << paths.cargo.string() << "\n";
    
    if (!repository_id.empty()) {
        core::RepositoryRef repository;
        repository.id = repository_id;
        auto mirror = hydrator.MirrorFor(paths, repository);
        std::cout << "mirror: " << mirror.path.string() << (mirror.hit ? " (hit)" : " (miss)") << "\n";
    }
    return 0;
}

} // anonymous namespace

/*******************************************************************************
 * Main Application Entry Point
 ******************************************************************************/

int main(int argc, char** argv) {
    CLI::App app{"Overseer task-execution supervisor"};
    app.require_subcommand(1);
    
    std::string config_file;
    bool verbose = false;
    std::string log_level;
    std::string log_file;
    
    app.add_option("-c,--config", config_file, "JSON configuration file")
        ->envname("OVERSEER_CONFIG")
        ->check(CLI::ExistingFile);
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", log_level, "Log level (trace, debug, info, warn, error)")
        ->envname("OVERSEER_LOG_LEVEL")
        ->check(CLI::IsMember({"trace", "debug", "info", "warn", "warning", "error", "critical", "off"}));
    app.add_option("--log-file", log_file, "Also write logs to this file")
        ->envname("OVERSEER_LOG_FILE");
    
    // ---- run ---------------------------------------------------------------
    auto* run = app.add_subcommand("run", "Claim and execute attempts until interrupted");
    RunOptions opts;
    
    auto* o_api = run->add_option("--api-base", opts.api_base, "Control plane base URL")->envname("OVERSEER_API_BASE");
    auto* o_email = run->add_option("--email", opts.email, "Service account email")->envname("OVERSEER_EMAIL");
    auto* o_password = run->add_option("--password", opts.password, "Service account password")->envname("OVERSEER_PASSWORD");
    auto* o_poll = run->add_option("--poll-interval", opts.poll_interval_secs, "Seconds between polls")
        ->envname("OVERSEER_POLL_INTERVAL");
    auto* o_concurrency = run->add_option("--max-concurrency", opts.max_concurrency, "Attempts run in parallel")
        ->envname("OVERSEER_MAX_CONCURRENCY");
    auto* o_env = run->add_option("--environment", opts.environment_id, "Only claim tasks of this environment")
        ->envname("OVERSEER_ENVIRONMENT_ID");
    auto* o_cache = run->add_option("--cache-root", opts.cache_root, "Shared dependency cache root")
        ->envname("OVERSEER_CACHE_ROOT");
    auto* o_state = run->add_option("--state-dir", opts.state_dir, "Local state directory")
        ->envname("OVERSEER_STATE_DIR");
    
    auto* o_pool = run->add_option("--pool-size", opts.pool_size, "Idle sandboxes to keep warm")
        ->envname("OVERSEER_POOL_SIZE")->check(CLI::NonNegativeNumber);
    auto* o_pool_max = run->add_option("--pool-max", opts.pool_max, "Hard maximum of sandboxes")
        ->envname("OVERSEER_POOL_MAX")->check(CLI::PositiveNumber);
    auto* o_policy = run->add_option("--acquire-policy", opts.acquire_policy, "block | cold | fail-fast")
        ->envname("OVERSEER_ACQUIRE_POLICY")->check(CLI::IsMember({"block", "cold", "fail-fast"}));
    auto* o_acquire_timeout = run->add_option("--acquire-timeout", opts.acquire_timeout_secs,
                                              "Seconds a blocking acquire may wait")
        ->envname("OVERSEER_ACQUIRE_TIMEOUT")->check(CLI::PositiveNumber);
    auto* o_backend = run->add_option("--snapshot-backend", opts.snapshot_backend, "hook | container | generated")
        ->envname("OVERSEER_SNAPSHOT_BACKEND")->check(CLI::IsMember({"hook", "container", "generated"}));
    auto* o_hook = run->add_option("--prewarm-hook", opts.prewarm_hook, "Executable printing one snapshot id")
        ->envname("OVERSEER_PREWARM_HOOK");
    auto* o_destroy = run->add_option("--destroy-hook", opts.destroy_hook, "Executable tearing a snapshot down")
        ->envname("OVERSEER_DESTROY_HOOK");
    auto* o_template = run->add_option("--snapshot-template", opts.snapshot_template, "Template passed to the provider")
        ->envname("OVERSEER_SNAPSHOT_TEMPLATE");
    auto* o_image = run->add_option("--image", opts.container_image, "Sandbox image for the container backend")
        ->envname("OVERSEER_SANDBOX_IMAGE");
    
    auto* o_workload = run->add_option("--workload", opts.workload, "Shell command run for each attempt")
        ->envname("OVERSEER_WORKLOAD");
    auto* o_attempt_timeout = run->add_option("--attempt-timeout", opts.attempt_timeout_secs,
                                              "Per-attempt deadline in seconds")
        ->envname("OVERSEER_ATTEMPT_TIMEOUT")->check(CLI::PositiveNumber);
    auto* o_keep = run->add_flag("--keep-workspaces", opts.keep_workspaces, "Keep attempt workspaces");
    auto* o_retries = run->add_option("--upload-retries", opts.upload_retries, "Retries after a failed upload")
        ->envname("OVERSEER_UPLOAD_RETRIES")->check(CLI::NonNegativeNumber);
    
    run->add_option("--warmup-timeout", opts.warmup_timeout_secs, "Wait for a warm pool before polling")
        ->default_val(0);
    run->add_flag("--once", opts.once, "Poll once, wait for the dispatched attempts, exit");
    
    // ---- build-image -------------------------------------------------------
    auto* build = app.add_subcommand("build-image", "Build the sandbox base image");
    core::ImageBuildConfig build_config;
    std::string runtime_name = "docker";
    bool no_pull = false;
    std::string dockerfile = build_config.dockerfile.string();
    std::string context;
    
    build->add_option("-f,--dockerfile", dockerfile, "Dockerfile path")->capture_default_str();
    build->add_option("--context", context, "Build context (default: Dockerfile directory)");
    build->add_option("--image", build_config.image, "Image name")
        ->envname("OVERSEER_BASE_IMAGE")->capture_default_str();
    build->add_option("--tag", build_config.tag, "Image tag")
        ->envname("OVERSEER_BASE_TAG")->capture_default_str();
    build->add_option("--runtime", runtime_name, "docker | podman")
        ->check(CLI::IsMember({"docker", "podman"}))->capture_default_str();
    build->add_flag("--no-pull", no_pull, "Do not pull newer base layers");
    
    // ---- hydrate -----------------------------------------------------------
    auto* hydrate = app.add_subcommand("hydrate", "Create cache directories and print their paths");
    std::string hydrate_root = core::SupervisorConfig{}.cache_root.string();
    std::string repository_id;
    hydrate->add_option("--cache-root", hydrate_root, "Cache root")
        ->envname("OVERSEER_CACHE_ROOT")->capture_default_str();
    hydrate->add_option("--repository-id", repository_id, "Also report the mirror of this repository");
    
    CLI11_PARSE(app, argc, argv);
    
    ConfigureLogging(verbose, log_level, log_file);
    
    try {
        if (*run) {
            PrintBanner();
            
            core::SupervisorConfig config;
            if (!config_file.empty()) {
                core::LoadConfigFile(config_file, config);
            }
            
            Override(o_api, opts.api_base, [&](const std::string& v) { config.control_plane.api_base = v; });
            Override(o_email, opts.email, [&](const std::string& v) { config.control_plane.email = v; });
            Override(o_password, opts.password, [&](const std::string& v) { config.control_plane.password = v; });
            Override(o_poll, opts.poll_interval_secs, [&](int v) { config.poll_interval = std::chrono::seconds(v); });
            Override(o_concurrency, opts.max_concurrency, [&](int v) {
                config.max_concurrency = static_cast<std::size_t>(std::max(v, 1));
            });
            Override(o_env, opts.environment_id, [&](const std::string& v) {
                config.environment_id = v.empty() ? std::nullopt : std::optional<std::string>(v);
            });
            Override(o_cache, opts.cache_root, [&](const std::string& v) { config.cache_root = v; });
            Override(o_state, opts.state_dir, [&](const std::string& v) { config.state_dir = v; });
            
            Override(o_pool, opts.pool_size, [&](int v) { config.pool.target_size = static_cast<std::size_t>(v); });
            Override(o_pool_max, opts.pool_max, [&](int v) { config.pool.max_size = static_cast<std::size_t>(v); });
            Override(o_policy, opts.acquire_policy, [&](const std::string& v) {
                config.pool.acquire_policy = core::AcquirePolicyFromString(v).value_or(core::AcquirePolicy::BLOCK);
            });
            Override(o_acquire_timeout, opts.acquire_timeout_secs, [&](int v) {
                config.pool.acquire_timeout = std::chrono::seconds(v);
            });
            Override(o_backend, opts.snapshot_backend, [&](const std::string& v) {
                config.snapshot.backend = core::SnapshotBackendFromString(v).value_or(core::SnapshotBackend::GENERATED);
            });
            Override(o_hook, opts.prewarm_hook, [&](const std::string& v) {
                config.snapshot.prewarm_hook = v;
                if (o_backend->count() == 0) {
                    config.snapshot.backend = core::SnapshotBackend::HOOK;
                }
            });
            Override(o_destroy, opts.destroy_hook, [&](const std::string& v) { config.snapshot.destroy_hook = v; });
            Override(o_template, opts.snapshot_template, [&](const std::string& v) {
                config.pool.snapshot_template = v.empty() ? std::nullopt : std::optional<std::string>(v);
            });
            Override(o_image, opts.container_image, [&](const std::string& v) { config.snapshot.image = v; });
            
            Override(o_workload, opts.workload, [&](const std::string& v) {
                config.executor.workload_command = v.empty() ? std::nullopt : std::optional<std::string>(v);
            });
            Override(o_attempt_timeout, opts.attempt_timeout_secs, [&](int v) {
                config.executor.attempt_timeout = std::chrono::seconds(v);
            });
            Override(o_keep, opts.keep_workspaces, [&](bool v) { config.executor.keep_workspaces = v; });
            Override(o_retries, opts.upload_retries, [&](int v) { config.reporter.retry.max_retries = v; });
            
            return RunSupervisor(config, opts);
        }
        
        if (*build) {
            build_config.dockerfile = dockerfile;
            build_config.context = context;
            build_config.pull = !no_pull;
            auto runtime = runtime_name == "podman" ? utils::ContainerRuntime::PODMAN
                                                    : utils::ContainerRuntime::DOCKER;
            return BuildImage(build_config, runtime);
        }
        
        if (*hydrate) {
            return Hydrate(hydrate_root, repository_id);
        }
        
        return 0;
        
    } catch (const core::ConfigError& e) {
        spdlog::error("[CONFIG] {}", e.what());
        return kExitConfigError;
    } catch (const core::ImageBuildError& e) {
        spdlog::error("[BUILD] {}", e.what());
        return 1;
    } catch (const core::CacheError& e) {
        spdlog::error("[CACHE] {}", e.what());
        return 1;
    } catch (const std::filesystem::filesystem_error& e) {
        spdlog::error("[ERROR] Filesystem error: {}", e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("[ERROR] Fatal error: {}", e.what());
        return 1;
    }
}
