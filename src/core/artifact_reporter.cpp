/**
 * @file artifact_reporter.cpp
 * @brief Artifact upload, completion and local preservation
 * @date 2025
 */

#include "overseer/core/artifact_reporter.hpp"
#include "overseer/utils/hash_utils.hpp"
#include "overseer/utils/string_utils.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <fmt/format.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <set>
#include <thread>

using json = nlohmann::json;

namespace overseer {
namespace core {

namespace fs = std::filesystem;
using utils::HashUtils;
using utils::StringUtils;

namespace {

void WriteFile(const fs::path& path, const std::string& content) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("cannot open " + path.string());
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        throw std::runtime_error("cannot write " + path.string());
    }
}

std::string ReadFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw std::runtime_error("cannot open " + path.string());
    }
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

json ArtifactEntry(const std::string& kind, const std::string& file, const std::string& content,
                   const std::string& sha256, const std::optional<std::string>& uploaded_id) {
    return {
        {"kind", kind},
        {"file", file},
        {"bytes", content.size()},
        {"sha256", sha256},
        {"artifact_id", uploaded_id ? json(*uploaded_id) : json(nullptr)}
    };
}

} // anonymous namespace

ArtifactReporter::ArtifactReporter(ReporterConfig config, std::shared_ptr<api::ControlPlaneClient> client)
    : config_(std::move(config))
    , client_(std::move(client))
    , sleeper_([](std::chrono::milliseconds delay) { std::this_thread::sleep_for(delay); }) {
}

// ============================================================================
// REPORTING
// ============================================================================

ReportResult ArtifactReporter::Report(const std::string& attempt_id, const AttemptOutcome& outcome) {
    ReportResult result;
    result.status = outcome.status;
    result.reason = outcome.reason;
    
    // Uploaded content is JSON text; the digest covers exactly what is sent
    const std::string diff_text = StringUtils::SanitizeUtf8(outcome.diff);
    const std::string log_text = StringUtils::SanitizeUtf8(outcome.log);
    if (diff_text != outcome.diff || log_text != outcome.log) {
        spdlog::warn("Attempt {} output is not valid UTF-8; malformed bytes uploaded as U+FFFD", attempt_id);
    }
    const std::string diff_sha = HashUtils::ComputeSHA256(diff_text);
    const std::string log_sha = HashUtils::ComputeSHA256(log_text);
    
    bool uploaded = WithRetry("upload diff for attempt " + attempt_id, [&] {
        result.diff_artifact_id = client_->UploadArtifact({attempt_id, "diff", diff_text, diff_sha});
    });
    uploaded = WithRetry("upload log for attempt " + attempt_id, [&] {
        result.log_artifact_id = client_->UploadArtifact({attempt_id, "log", log_text, log_sha});
    }) && uploaded;
    
    if (!uploaded) {
        spdlog::error("Artifact upload for attempt {} exhausted, reporting {}", attempt_id,
                      FailureReasonToString(FailureReason::ARTIFACT_UPLOAD_FAILED));
        result.status = AttemptStatus::FAILED;
        result.reason = FailureReason::ARTIFACT_UPLOAD_FAILED;
    }
    
    api::CompletionReport report;
    report.status = result.status;
    report.reason = result.status == AttemptStatus::FAILED ? result.reason : std::nullopt;
    report.diff_artifact_id = result.diff_artifact_id;
    report.log_artifact_id = result.log_artifact_id;
    result.completed = Complete(attempt_id, report);
    
    if (!uploaded || !result.completed) {
        Preserve(attempt_id, outcome, result);
        result.preserved = true;
    }
    return result;
}

ReportResult ArtifactReporter::ReportFailure(const std::string& attempt_id, FailureReason reason) {
    ReportResult result;
    result.status = AttemptStatus::FAILED;
    result.reason = reason;
    
    api::CompletionReport report;
    report.status = AttemptStatus::FAILED;
    report.reason = reason;
    result.completed = Complete(attempt_id, report);
    return result;
}

bool ArtifactReporter::Complete(const std::string& attempt_id, const api::CompletionReport& report) {
    bool completed = WithRetry("complete attempt " + attempt_id, [&] {
        client_->CompleteAttempt(attempt_id, report);
    });
    if (completed) {
        spdlog::info("Reported attempt {} as {}{}", attempt_id, AttemptStatusToString(report.status),
                     report.reason ? " (" + FailureReasonToString(*report.reason) + ")" : std::string());
    } else {
        spdlog::error("Could not report completion of attempt {}", attempt_id);
    }
    return completed;
}

bool ArtifactReporter::WithRetry(const std::string& what, const std::function<void()>& call) {
    const auto& policy = config_.retry;
    const int tries = std::max(policy.max_retries, 0) + 1;
    
    for (int attempt = 0; attempt < tries; ++attempt) {
        try {
            call();
            return true;
        } catch (const api::ControlPlaneError& e) {
            if (!e.IsTransient()) {
                spdlog::error("{}: permanent failure: {}", what, e.what());
                return false;
            }
            spdlog::warn("{}: try {}/{} failed: {}", what, attempt + 1, tries, e.what());
        } catch (const std::exception& e) {
            spdlog::error("{}: failed: {}", what, e.what());
            return false;
        }
        if (attempt + 1 < tries) {
            sleeper_(policy.DelayFor(attempt));
        }
    }
    return false;
}

// ============================================================================
// PRESERVATION
// ============================================================================

void ArtifactReporter::Preserve(const std::string& attempt_id, const AttemptOutcome& outcome,
                                const ReportResult& result) {
    PreservedArtifacts kept;
    kept.attempt_id = attempt_id;
    kept.diff = outcome.diff;
    kept.log = outcome.log;
    kept.diff_sha256 = HashUtils::ComputeSHA256(outcome.diff);
    kept.log_sha256 = HashUtils::ComputeSHA256(outcome.log);
    kept.preserved_at = std::chrono::system_clock::now();
    
    fs::path directory = config_.spool_dir / StringUtils::SanitizePathComponent(attempt_id);
    try {
        fs::create_directories(directory);
        WriteFile(directory / "diff.patch", kept.diff);
        WriteFile(directory / "log.txt", kept.log);
        
        json manifest = {
            {"attempt_id", attempt_id},
            {"status", AttemptStatusToString(result.status)},
            {"reason", result.reason ? json(FailureReasonToString(*result.reason)) : json(nullptr)},
            {"completed", result.completed},
            {"preserved_at", StringUtils::FormatTimestamp(kept.preserved_at)},
            {"preserved_at_unix", std::chrono::duration_cast<std::chrono::seconds>(
                kept.preserved_at.time_since_epoch()).count()},
            {"artifacts", json::array({
                ArtifactEntry("diff", "diff.patch", kept.diff, kept.diff_sha256, result.diff_artifact_id),
                ArtifactEntry("log", "log.txt", kept.log, kept.log_sha256, result.log_artifact_id)
            })}
        };
        WriteFile(directory / "manifest.json", manifest.dump(2) + "\n");
        kept.directory = directory;
        spdlog::warn("Preserved output of attempt {} in {}", attempt_id, directory.string());
    } catch (const std::exception& e) {
        spdlog::error("Spooling output of attempt {} failed ({}); kept in memory only", attempt_id, e.what());
    }
    
    std::lock_guard<std::mutex> lock(preserved_mutex_);
    preserved_order_.erase(std::remove(preserved_order_.begin(), preserved_order_.end(), attempt_id),
                           preserved_order_.end());
    preserved_order_.push_back(attempt_id);
    preserved_[attempt_id] = std::move(kept);
    EvictSpooledLocked();
}

void ArtifactReporter::EvictSpooledLocked() {
    // Output that never reached the spool stays in memory regardless of the cap
    auto it = preserved_order_.begin();
    while (preserved_.size() > config_.max_preserved_in_memory && it != preserved_order_.end()) {
        auto entry = preserved_.find(*it);
        if (entry != preserved_.end() && !entry->second.directory.empty()) {
            spdlog::debug("Dropping in-memory copy of attempt {}, spooled at {}",
                          *it, entry->second.directory.string());
            preserved_.erase(entry);
            it = preserved_order_.erase(it);
        } else {
            ++it;
        }
    }
}

std::optional<PreservedArtifacts> ArtifactReporter::Preserved(const std::string& attempt_id) const {
    {
        std::lock_guard<std::mutex> lock(preserved_mutex_);
        auto it = preserved_.find(attempt_id);
        if (it != preserved_.end()) {
            return it->second;
        }
    }
    return LoadSpooled(config_.spool_dir / StringUtils::SanitizePathComponent(attempt_id));
}

std::optional<PreservedArtifacts> ArtifactReporter::LoadSpooled(const fs::path& directory) const {
    std::error_code ec;
    const fs::path manifest_path = directory / "manifest.json";
    if (!fs::is_regular_file(manifest_path, ec)) {
        return std::nullopt;
    }
    
    try {
        json manifest = json::parse(ReadFile(manifest_path));
        
        PreservedArtifacts kept;
        kept.attempt_id = manifest.at("attempt_id").get<std::string>();
        kept.directory = directory;
        kept.preserved_at = std::chrono::system_clock::time_point(
            std::chrono::seconds(manifest.value("preserved_at_unix", 0LL)));
        
        for (const auto& artifact : manifest.at("artifacts")) {
            const fs::path file = directory / artifact.at("file").get<std::string>();
            const std::string sha256 = artifact.at("sha256").get<std::string>();
            if (!HashUtils::VerifySHA256(file, sha256)) {
                spdlog::error("Spooled {} does not match its manifest digest", file.string());
                return std::nullopt;
            }
            
            const std::string kind = artifact.at("kind").get<std::string>();
            if (kind == "diff") {
                kept.diff = ReadFile(file);
                kept.diff_sha256 = sha256;
            } else if (kind == "log") {
                kept.log = ReadFile(file);
                kept.log_sha256 = sha256;
            }
        }
        return kept;
    } catch (const json::exception& e) {
        spdlog::error("Unreadable manifest {}: {}", manifest_path.string(), e.what());
    } catch (const std::runtime_error& e) {
        spdlog::error("Cannot load spooled output from {}: {}", directory.string(), e.what());
    }
    return std::nullopt;
}

std::vector<std::string> ArtifactReporter::PreservedAttempts() const {
    std::set<std::string> ids;
    {
        std::lock_guard<std::mutex> lock(preserved_mutex_);
        for (const auto& entry : preserved_) {
            ids.insert(entry.first);
        }
    }
    
    std::error_code ec;
    if (!config_.spool_dir.empty() && fs::is_directory(config_.spool_dir, ec)) {
        for (fs::directory_iterator it(config_.spool_dir, ec), end; !ec && it != end; it.increment(ec)) {
            const fs::path manifest_path = it->path() / "manifest.json";
            std::error_code file_ec;
            if (!fs::is_regular_file(manifest_path, file_ec)) {
                continue;
            }
            try {
                ids.insert(json::parse(ReadFile(manifest_path)).at("attempt_id").get<std::string>());
            } catch (const json::exception& e) {
                spdlog::warn("Skipping unreadable manifest {}: {}", manifest_path.string(), e.what());
            } catch (const std::runtime_error& e) {
                spdlog::warn("Skipping {}: {}", manifest_path.string(), e.what());
            }
        }
    }
    return std::vector<std::string>(ids.begin(), ids.end());
}

std::size_t ArtifactReporter::InMemoryCount() const {
    std::lock_guard<std::mutex> lock(preserved_mutex_);
    return preserved_.size();
}

} // namespace core
} // namespace overseer
