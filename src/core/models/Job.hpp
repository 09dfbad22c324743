// Takeout Importer - Job Model
// Persisted record of one import run

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>
#include <unordered_set>
#include <nlohmann/json.hpp>

namespace takeout {

using json = nlohmann::json;

//=============================================================================
// Job status
//=============================================================================

enum class JobStatus {
    Idle,
    Downloading,
    Uploading,
    Complete,
    Error,
    Cancelled
};

std::string jobStatusToString(JobStatus status);
std::optional<JobStatus> stringToJobStatus(const std::string& str);

/**
 * Whether the coordinator may move a job from one status to another.
 * Error and Cancelled resume into either working phase.
 */
bool canTransition(JobStatus from, JobStatus to);

//=============================================================================
// File unit
//=============================================================================

/**
 * One source archive and its download progress
 */
struct FileUnit {
    std::string sourceId;         // Identifier in the remote store
    std::string name;             // Display name, also the local file name
    int64_t expectedSize{0};      // 0 if the store did not report a size
    bool downloaded{false};
    std::string localPath;
    int64_t bytesTransferred{0};
    std::string checksum;         // MD5 reported by the store, may be empty

    json toJson() const;
    static FileUnit fromJson(const json& j);
};

//=============================================================================
// Upload ledger
//=============================================================================

/**
 * Tracks which archive entries have reached the destination.
 *
 * completedEntries always equals the number of completed keys; a key is
 * inserted at most once and never removed.
 */
class UploadLedger {
public:
    /**
     * Composite key identifying an entry inside a downloaded archive
     */
    static std::string entryKey(const std::string& archivePath, const std::string& entryName);

    int64_t totalEntries() const { return m_totalEntries; }
    int64_t completedEntries() const { return m_completedEntries; }
    const std::vector<std::string>& completedKeys() const { return m_completedKeys; }
    const std::vector<std::string>& countedArchives() const { return m_countedArchives; }
    const std::vector<std::string>& finishedArchives() const { return m_finishedArchives; }

    bool isCompleted(const std::string& key) const;
    bool isCounted(const std::string& archivePath) const;
    bool isFinished(const std::string& archivePath) const;

    /**
     * Record a completed entry
     * @return false if the key was already recorded
     */
    bool markCompleted(const std::string& key);

    /**
     * Add an archive's eligible entry count to the total, once per archive
     * @return false if the archive was already counted
     */
    bool markCounted(const std::string& archivePath, int64_t eligibleEntries);

    /**
     * Flag an archive whose every eligible entry is completed
     */
    void markFinished(const std::string& archivePath);

    json toJson() const;
    static UploadLedger fromJson(const json& j);

private:
    int64_t m_totalEntries{0};
    int64_t m_completedEntries{0};
    std::vector<std::string> m_completedKeys;
    std::vector<std::string> m_countedArchives;
    std::vector<std::string> m_finishedArchives;

    std::unordered_set<std::string> m_completedIndex;
    std::unordered_set<std::string> m_countedIndex;
    std::unordered_set<std::string> m_finishedIndex;
};

//=============================================================================
// Job
//=============================================================================

/**
 * Root of all persisted state for one import run
 */
struct Job {
    std::string id;
    std::string serverUrl;
    JobStatus status{JobStatus::Idle};
    std::vector<FileUnit> files;
    std::optional<UploadLedger> uploadProgress;
    std::string lastError;
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point updatedAt;

    /**
     * Create a fresh idle job with a new identifier
     */
    static Job create();

    /**
     * Append a file to the selection
     * @return false if a file with the same source id is already tracked
     */
    bool addFile(const std::string& sourceId, const std::string& name,
                 int64_t expectedSize, const std::string& checksum = "");

    bool allDownloaded() const;

    // Progress in percent (0-100)
    double downloadPercent() const;
    double uploadPercent() const;

    /**
     * Working or interrupted job that a rerun picks up in place
     */
    bool isResumable() const;

    json toJson() const;

    /**
     * Parse a persisted job
     * @throws nlohmann::json::exception or std::invalid_argument on malformed input
     */
    static Job fromJson(const json& j);
};

} // namespace takeout
