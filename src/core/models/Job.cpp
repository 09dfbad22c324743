/**
 * Job.cpp
 *
 * Job model helpers and JSON serialization.
 * Every field except id and status is optional on read so that records
 * written by older builds keep loading.
 */

#include "Job.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <stdexcept>

namespace takeout {

using utils::StringUtils;

std::string jobStatusToString(JobStatus status) {
    switch (status) {
        case JobStatus::Idle: return "idle";
        case JobStatus::Downloading: return "downloading";
        case JobStatus::Uploading: return "uploading";
        case JobStatus::Complete: return "complete";
        case JobStatus::Error: return "error";
        case JobStatus::Cancelled: return "cancelled";
        default: return "idle";
    }
}

std::optional<JobStatus> stringToJobStatus(const std::string& str) {
    if (str == "idle") return JobStatus::Idle;
    if (str == "downloading") return JobStatus::Downloading;
    if (str == "uploading") return JobStatus::Uploading;
    if (str == "complete") return JobStatus::Complete;
    if (str == "error") return JobStatus::Error;
    if (str == "cancelled") return JobStatus::Cancelled;
    return std::nullopt;
}

bool canTransition(JobStatus from, JobStatus to) {
    if (from == to) return true;

    switch (from) {
        case JobStatus::Idle:
            return to == JobStatus::Downloading;
        case JobStatus::Downloading:
            return to == JobStatus::Uploading || to == JobStatus::Error || to == JobStatus::Cancelled;
        case JobStatus::Uploading:
            return to == JobStatus::Complete || to == JobStatus::Error || to == JobStatus::Cancelled;
        case JobStatus::Error:
        case JobStatus::Cancelled:
            return to == JobStatus::Downloading || to == JobStatus::Uploading;
        case JobStatus::Complete:
        default:
            return false;
    }
}

// -- Timestamps --

namespace {

json timeToJson(std::chrono::system_clock::time_point time) {
    return StringUtils::toIso8601(time);
}

std::chrono::system_clock::time_point timeFromJson(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) {
        return std::chrono::system_clock::now();
    }
    auto parsed = StringUtils::parseIso8601(j[key].get<std::string>());
    if (!parsed) {
        throw std::invalid_argument(std::string("invalid timestamp in field '") + key + "'");
    }
    return *parsed;
}

std::vector<std::string> stringList(const json& j, const char* key) {
    if (!j.contains(key) || j[key].is_null()) return {};
    return j[key].get<std::vector<std::string>>();
}

} // namespace

// -- FileUnit --

json FileUnit::toJson() const {
    json j = {
        {"sourceId", sourceId},
        {"name", name},
        {"expectedSize", expectedSize},
        {"downloaded", downloaded},
        {"bytesTransferred", bytesTransferred}
    };
    if (!localPath.empty()) j["localPath"] = localPath;
    if (!checksum.empty()) j["checksum"] = checksum;
    return j;
}

FileUnit FileUnit::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("file entry is not an object");
    }

    FileUnit file;
    file.sourceId = j.at("sourceId").get<std::string>();
    file.name = j.value("name", "");
    file.expectedSize = j.value("expectedSize", static_cast<int64_t>(0));
    file.downloaded = j.value("downloaded", false);
    file.localPath = j.value("localPath", "");
    file.bytesTransferred = j.value("bytesTransferred", static_cast<int64_t>(0));
    file.checksum = j.value("checksum", "");

    if (file.expectedSize < 0 || file.bytesTransferred < 0) {
        throw std::invalid_argument("negative byte count for " + file.sourceId);
    }
    return file;
}

// -- UploadLedger --

std::string UploadLedger::entryKey(const std::string& archivePath, const std::string& entryName) {
    // Keys are persisted as JSON strings, which must be valid UTF-8
    return StringUtils::sanitizeUtf8(archivePath + ":" + entryName);
}

bool UploadLedger::isCompleted(const std::string& key) const {
    return m_completedIndex.find(key) != m_completedIndex.end();
}

bool UploadLedger::isCounted(const std::string& archivePath) const {
    return m_countedIndex.find(archivePath) != m_countedIndex.end();
}

bool UploadLedger::isFinished(const std::string& archivePath) const {
    return m_finishedIndex.find(archivePath) != m_finishedIndex.end();
}

bool UploadLedger::markCompleted(const std::string& key) {
    if (!m_completedIndex.insert(key).second) {
        return false;
    }
    m_completedKeys.push_back(key);
    ++m_completedEntries;
    return true;
}

bool UploadLedger::markCounted(const std::string& archivePath, int64_t eligibleEntries) {
    if (!m_countedIndex.insert(archivePath).second) {
        return false;
    }
    m_countedArchives.push_back(archivePath);
    m_totalEntries += eligibleEntries;
    return true;
}

void UploadLedger::markFinished(const std::string& archivePath) {
    if (m_finishedIndex.insert(archivePath).second) {
        m_finishedArchives.push_back(archivePath);
    }
}

json UploadLedger::toJson() const {
    return {
        {"totalEntries", m_totalEntries},
        {"completedEntries", m_completedEntries},
        {"completedKeys", m_completedKeys},
        {"countedArchives", m_countedArchives},
        {"finishedArchives", m_finishedArchives}
    };
}

UploadLedger UploadLedger::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("upload progress is not an object");
    }

    UploadLedger ledger;
    for (const auto& key : stringList(j, "completedKeys")) {
        ledger.markCompleted(key);
    }
    for (const auto& archive : stringList(j, "finishedArchives")) {
        ledger.markFinished(archive);
    }
    for (const auto& archive : stringList(j, "countedArchives")) {
        ledger.m_countedIndex.insert(archive);
        ledger.m_countedArchives.push_back(archive);
    }

    // Keys are authoritative for the completed count; the total is taken as stored
    ledger.m_totalEntries = j.value("totalEntries", static_cast<int64_t>(0));
    if (ledger.m_totalEntries < ledger.m_completedEntries) {
        ledger.m_totalEntries = ledger.m_completedEntries;
    }
    return ledger;
}

// -- Job --

Job Job::create() {
    Job job;
    job.id = StringUtils::generateUUID();
    job.status = JobStatus::Idle;
    job.createdAt = std::chrono::system_clock::now();
    job.updatedAt = job.createdAt;
    return job;
}

bool Job::addFile(const std::string& sourceId, const std::string& name,
                  int64_t expectedSize, const std::string& checksum) {
    for (const auto& f : files) {
        if (f.sourceId == sourceId) {
            return false;
        }
    }

    FileUnit file;
    file.sourceId = sourceId;
    file.name = name;
    file.expectedSize = expectedSize > 0 ? expectedSize : 0;
    file.checksum = checksum;
    files.push_back(std::move(file));
    return true;
}

bool Job::allDownloaded() const {
    for (const auto& f : files) {
        if (!f.downloaded) return false;
    }
    return true;
}

double Job::downloadPercent() const {
    int64_t totalBytes = 0;
    int64_t doneBytes = 0;
    for (const auto& f : files) {
        totalBytes += f.expectedSize;
        doneBytes += f.downloaded ? f.expectedSize : f.bytesTransferred;
    }
    if (totalBytes == 0) return 0.0;
    return static_cast<double>(doneBytes) / static_cast<double>(totalBytes) * 100.0;
}

double Job::uploadPercent() const {
    if (!uploadProgress || uploadProgress->totalEntries() == 0) return 0.0;
    return static_cast<double>(uploadProgress->completedEntries()) /
           static_cast<double>(uploadProgress->totalEntries()) * 100.0;
}

bool Job::isResumable() const {
    return status == JobStatus::Downloading || status == JobStatus::Uploading ||
           status == JobStatus::Error || status == JobStatus::Cancelled;
}

json Job::toJson() const {
    json filesArray = json::array();
    for (const auto& f : files) {
        filesArray.push_back(f.toJson());
    }

    json j = {
        {"id", id},
        {"status", jobStatusToString(status)},
        {"files", filesArray},
        {"createdAt", timeToJson(createdAt)},
        {"updatedAt", timeToJson(updatedAt)}
    };
    if (!serverUrl.empty()) j["serverUrl"] = serverUrl;
    if (uploadProgress) j["uploadProgress"] = uploadProgress->toJson();
    if (!lastError.empty()) j["lastError"] = lastError;
    return j;
}

Job Job::fromJson(const json& j) {
    if (!j.is_object()) {
        throw std::invalid_argument("job record is not an object");
    }

    Job job;
    job.id = j.at("id").get<std::string>();
    if (job.id.empty()) {
        throw std::invalid_argument("job record has an empty id");
    }

    std::string statusName = j.at("status").get<std::string>();
    auto status = stringToJobStatus(statusName);
    if (!status) {
        throw std::invalid_argument("unknown job status '" + statusName + "'");
    }
    job.status = *status;

    job.serverUrl = j.value("serverUrl", "");
    job.lastError = j.value("lastError", "");

    if (j.contains("files") && !j["files"].is_null()) {
        if (!j["files"].is_array()) {
            throw std::invalid_argument("'files' is not an array");
        }
        for (const auto& f : j["files"]) {
            FileUnit file = FileUnit::fromJson(f);
            bool duplicate = std::any_of(job.files.begin(), job.files.end(),
                [&file](const FileUnit& existing) { return existing.sourceId == file.sourceId; });
            if (!duplicate) {
                job.files.push_back(std::move(file));
            }
        }
    }

    if (j.contains("uploadProgress") && !j["uploadProgress"].is_null()) {
        job.uploadProgress = UploadLedger::fromJson(j["uploadProgress"]);
    }

    job.createdAt = timeFromJson(j, "createdAt");
    job.updatedAt = timeFromJson(j, "updatedAt");
    return job;
}

} // namespace takeout
