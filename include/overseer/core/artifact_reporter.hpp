/**
 * @file artifact_reporter.hpp
 * @brief Artifact upload and attempt completion reporting
 * 
 * Uploads the diff and log of a finished attempt, then reports the terminal
 * status. Transient control plane failures (transport, 5xx, 429) are retried
 * with the configured backoff; 4xx failures are permanent. When uploads fail
 * the attempt is reported `failed / artifact_upload_failed` and the text is
 * preserved: spooled to
 * `<spool_dir>/<attempt id>/{diff.patch, log.txt, manifest.json}` and kept
 * in memory for the most recent `max_preserved_in_memory` attempts. Older
 * entries are read back from the spool, verified against the manifest
 * digests. Output that could not be spooled is never dropped from memory.
 * 
 * Uploaded text is made valid UTF-8 first (malformed bytes become U+FFFD);
 * the spool keeps the raw bytes.
 * 
 * @date 2025
 */

#pragma once

#include "overseer/core/types.hpp"
#include "overseer/core/config.hpp"
#include "overseer/api/control_plane_client.hpp"

#include <string>
#include <vector>
#include <map>
#include <deque>
#include <mutex>
#include <memory>
#include <optional>
#include <functional>
#include <filesystem>

namespace overseer {
namespace core {

/**
 * @struct PreservedArtifacts
 * @brief Attempt output kept locally after a reporting failure
 */
struct PreservedArtifacts {
    std::string attempt_id;
    std::string diff;
    std::string log;
    std::string diff_sha256;
    std::string log_sha256;
    std::filesystem::path directory;    ///< Spool directory (empty if spooling failed)
    std::chrono::system_clock::time_point preserved_at;
};

/**
 * @struct ReportResult
 * @brief What was reported for an attempt
 */
struct ReportResult {
    AttemptStatus status{AttemptStatus::FAILED};   ///< Status sent to the control plane
    std::optional<FailureReason> reason;           ///< Reason sent with a failure
    std::optional<std::string> diff_artifact_id;
    std::optional<std::string> log_artifact_id;
    bool completed{false};                         ///< Completion call accepted
    bool preserved{false};                         ///< Output kept locally
};

/**
 * @class ArtifactReporter
 * @brief Uploads artifacts and reports terminal attempt states
 * 
 * **Usage Example**:
 * @code
 * ArtifactReporter reporter(config.reporter, client);
 * ReportResult result = reporter.Report(attempt_id, outcome);
 * if (result.preserved) {
 *     auto kept = reporter.Preserved(attempt_id);
 * }
 * @endcode
 */
class ArtifactReporter {
public:
    using Sleeper = std::function<void(std::chrono::milliseconds)>;
    
    ArtifactReporter(ReporterConfig config, std::shared_ptr<api::ControlPlaneClient> client);
    
    /**
     * @brief Upload artifacts and report completion
     * 
     * Upload and completion errors, of any kind, become a failed report
     * with the output preserved; they are not rethrown.
     */
    ReportResult Report(const std::string& attempt_id, const AttemptOutcome& outcome);
    
    /**
     * @brief Report a failure that produced no artifacts (no uploads)
     */
    ReportResult ReportFailure(const std::string& attempt_id, FailureReason reason);
    
    /// Output preserved for an attempt (memory first, then the spool), if any
    std::optional<PreservedArtifacts> Preserved(const std::string& attempt_id) const;
    
    /// Attempt ids with preserved output, in memory or spooled
    std::vector<std::string> PreservedAttempts() const;
    
    /// Preserved outputs currently held in memory
    std::size_t InMemoryCount() const;
    
    /// Replace the backoff sleep (tests)
    void SetSleeper(Sleeper sleeper) { sleeper_ = std::move(sleeper); }

private:
    /// Run `call` with retries; false when a permanent error or exhaustion stops it
    bool WithRetry(const std::string& what, const std::function<void()>& call);
    bool Complete(const std::string& attempt_id, const api::CompletionReport& report);
    void Preserve(const std::string& attempt_id, const AttemptOutcome& outcome,
                  const ReportResult& result);
    void EvictSpooledLocked();
    std::optional<PreservedArtifacts> LoadSpooled(const std::filesystem::path& directory) const;
    
    ReporterConfig config_;
    std::shared_ptr<api::ControlPlaneClient> client_;
    Sleeper sleeper_;
    
    mutable std::mutex preserved_mutex_;
    std::map<std::string, PreservedArtifacts> preserved_;
    std::deque<std::string> preserved_order_;       ///< Oldest first
};

} // namespace core
} // namespace overseer
