/**
 * ArchiveImporter.cpp
 */

#include "ArchiveImporter.hpp"
#include "MediaFilter.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <filesystem>
#include <vector>

namespace takeout::core::importer {

using utils::HashUtils;
using utils::StringUtils;

ArchiveImporter::ArchiveImporter(ingest::IngestClient& client, state::CheckpointStore& store)
    : m_client(client)
    , m_store(store)
{
    int interval = Config::instance().get<int>("uploads.checkpointInterval", 100);
    m_checkpointInterval = interval > 0 ? interval : 100;
    m_maxEntrySize = Config::instance().get<int64_t>("uploads.maxEntrySize", int64_t{4} << 30);
}

TransferOutcome ArchiveImporter::importAll(const CancellationToken& cancel, Job& job,
                                           transfer::ProgressSink& progress) {
    m_stats = ImportStats{};
    m_sinceCheckpoint = 0;

    if (!job.uploadProgress) {
        job.uploadProgress.emplace();
    }

    for (const auto& file : job.files) {
        if (!file.downloaded || file.localPath.empty()) {
            continue;
        }
        if (!MediaFilter::isArchive(file.localPath)) {
            TAKEOUT_LOG_DEBUG("Skipping non-archive {}", file.name);
            continue;
        }
        if (job.uploadProgress->isFinished(file.localPath)) {
            TAKEOUT_LOG_DEBUG("Archive already processed: {}", file.name);
            continue;
        }

        if (importArchive(cancel, job, file, progress) == TransferOutcome::Cancelled) {
            return TransferOutcome::Cancelled;
        }
    }

    TAKEOUT_LOG_INFO("Upload finished: {} uploaded, {} duplicates, {} failed, {} already done",
                     m_stats.uploaded, m_stats.duplicates, m_stats.failed, m_stats.skipped);
    return TransferOutcome::Completed;
}

TransferOutcome ArchiveImporter::importArchive(const CancellationToken& cancel, Job& job,
                                               const FileUnit& file, transfer::ProgressSink& progress) {
    auto& ledger = *job.uploadProgress;
    const std::string& archivePath = file.localPath;

    archive::ZipArchive zip;
    zip.open(archivePath);

    std::vector<archive::ZipEntry> eligible;
    for (auto& entry : zip.entries()) {
        if (!entry.isDirectory && MediaFilter::isMedia(entry.name)) {
            eligible.push_back(std::move(entry));
        }
    }

    if (ledger.markCounted(archivePath, static_cast<int64_t>(eligible.size()))) {
        TAKEOUT_LOG_INFO("Processing {}: {} media entries", file.name, eligible.size());
    } else {
        TAKEOUT_LOG_INFO("Resuming {}", file.name);
    }

    bool allCompleted = true;

    for (const auto& entry : eligible) {
        if (cancel.isCancelled()) {
            TAKEOUT_LOG_INFO("Upload paused in {}", file.name);
            return TransferOutcome::Cancelled;
        }

        std::string key = UploadLedger::entryKey(archivePath, entry.name);
        if (ledger.isCompleted(key)) {
            ++m_stats.skipped;
            continue;
        }

        if (!uploadEntry(zip, entry)) {
            allCompleted = false;
            publish(job, entry.name, progress);
            continue;
        }

        ledger.markCompleted(key);
        publish(job, entry.name, progress);

        if (++m_sinceCheckpoint >= m_checkpointInterval) {
            m_store.save(job);
            m_sinceCheckpoint = 0;
            TAKEOUT_LOG_DEBUG("Checkpoint at {} completed entries", ledger.completedEntries());
        }
    }

    if (allCompleted) {
        ledger.markFinished(archivePath);
    } else {
        TAKEOUT_LOG_WARN("{} has entries that failed to upload; it will be revisited on the next run", file.name);
    }

    m_store.save(job);
    m_sinceCheckpoint = 0;
    return TransferOutcome::Completed;
}

bool ArchiveImporter::uploadEntry(const archive::ZipArchive& zip, const archive::ZipEntry& entry) {
    if (m_maxEntrySize > 0 && entry.size > static_cast<uint64_t>(m_maxEntrySize)) {
        TAKEOUT_LOG_WARN("Skipping {}: {} exceeds the {} entry limit", entry.name,
                         StringUtils::formatBytes(static_cast<int64_t>(entry.size)), StringUtils::formatBytes(m_maxEntrySize));
        ++m_stats.failed;
        return false;
    }

    std::vector<uint8_t> content;
    try {
        content = zip.read(entry);
    } catch (const TransferError& e) {
        TAKEOUT_LOG_WARN("Skipping unreadable entry {}: {}", entry.name, e.what());
        ++m_stats.failed;
        return false;
    }

    ingest::AssetUpload asset;
    asset.filename = std::filesystem::path(entry.name).filename().string();
    asset.content = &content;
    asset.createdAt = entry.modifiedAt.value_or(std::chrono::system_clock::now());
    asset.modifiedAt = asset.createdAt;
    asset.externalId = "import-" + HashUtils::sha1Bytes(content);

    ingest::UploadResult result = m_client.uploadAsset(asset);

    switch (result.status) {
        case ingest::UploadStatus::Created:
            ++m_stats.uploaded;
            TAKEOUT_LOG_DEBUG("Uploaded {}", entry.name);
            return true;
        case ingest::UploadStatus::Duplicate:
            ++m_stats.duplicates;
            TAKEOUT_LOG_DEBUG("Already on server: {}", entry.name);
            return true;
        case ingest::UploadStatus::Failed:
        default:
            ++m_stats.failed;
            TAKEOUT_LOG_WARN("Failed to upload {} [{}]: {}", entry.name,
                             errorKindToString(ErrorKind::EntryUpload), result.message);
            return false;
    }
}

void ArchiveImporter::publish(const Job& job, const std::string& itemName,
                              transfer::ProgressSink& progress) const {
    transfer::ProgressEvent event;
    event.phase = transfer::ProgressPhase::Uploading;
    event.completedCount = job.uploadProgress->completedEntries();
    event.totalCount = job.uploadProgress->totalEntries();
    event.currentItemName = itemName;
    progress.publish(event);
}

} // namespace takeout::core::importer
