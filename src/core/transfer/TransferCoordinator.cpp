/**
 * TransferCoordinator.cpp
 */

#include "TransferCoordinator.hpp"
#include "../Logger.hpp"

#include <map>
#include <stdexcept>

namespace takeout::core::transfer {

TransferCoordinator::TransferCoordinator(
    source::SourceStoreClient& source,
    ingest::IngestClient& ingest,
    state::CheckpointStore& store,
    const std::filesystem::path& downloadDir,
    ProgressSink& progress
)
    : m_store(store)
    , m_progress(progress)
    , m_downloader(source, downloadDir)
    , m_importer(ingest, store)
{
    m_downloader.setProgressCallback([this](const FileUnit& file) {
        publishFileEvent(file);
    });
}

bool TransferCoordinator::loadExisting() {
    m_job = m_store.load();
    if (m_job) {
        TAKEOUT_LOG_INFO("Loaded job {} ({}, {} files)", m_job->id,
                         jobStatusToString(m_job->status), m_job->files.size());
    }
    return m_job.has_value();
}

void TransferCoordinator::begin(const std::vector<source::ArchiveInfo>& selection,
                                const std::string& serverUrl) {
    Job job = Job::create();
    job.serverUrl = serverUrl;
    std::map<std::filesystem::path, std::string> localPaths;
    for (const auto& archive : selection) {
        // Files are stored under their display name; a second file with the same
        // local name would be appended to, or mistaken for, the first one
        auto path = m_downloader.localPathFor(archive.name);
        auto existing = localPaths.find(path);
        if (existing != localPaths.end() && existing->second != archive.id) {
            TAKEOUT_LOG_WARN("Skipping {} ({}): its local file {} is already used by {}",
                             archive.name, archive.id, path.string(), existing->second);
            continue;
        }
        if (!job.addFile(archive.id, archive.name, archive.size, archive.md5Checksum)) {
            TAKEOUT_LOG_WARN("Ignoring duplicate selection of {}", archive.name);
            continue;
        }
        localPaths.emplace(path, archive.id);
    }

    m_job = std::move(job);
    m_store.save(*m_job);
    TAKEOUT_LOG_INFO("Created job {} with {} files", m_job->id, m_job->files.size());
}

const Job& TransferCoordinator::job() const {
    if (!m_job) {
        throw std::logic_error("No job loaded");
    }
    return *m_job;
}

void TransferCoordinator::reset() {
    m_store.clear();
    m_job.reset();
    TAKEOUT_LOG_INFO("Job state cleared");
}

JobStatus TransferCoordinator::run(const CancellationToken& cancel) {
    if (!m_job) {
        throw std::logic_error("No job loaded");
    }

    if (m_job->status == JobStatus::Complete) {
        TAKEOUT_LOG_INFO("Job {} is already complete", m_job->id);
        return JobStatus::Complete;
    }

    try {
        // Downloads are all done once a job has left idle with every file flagged
        bool downloadsDone = m_job->status != JobStatus::Idle && m_job->allDownloaded();
        if (!downloadsDone) {
            JobStatus status = runDownloads(cancel);
            if (status != JobStatus::Uploading) {
                return status;
            }
        }
        return runUploads(cancel);

    } catch (const TransferError& e) {
        TAKEOUT_LOG_ERROR("Job {} failed [{}]: {}", m_job->id, errorKindToString(e.kind()), e.what());
        return fail(e.what());
    } catch (const std::filesystem::filesystem_error& e) {
        TAKEOUT_LOG_ERROR("Job {} failed on the file system: {}", m_job->id, e.what());
        return fail(e.what());
    }
}

JobStatus TransferCoordinator::runDownloads(const CancellationToken& cancel) {
    transition(JobStatus::Downloading);
    m_store.save(*m_job);

    for (auto& file : m_job->files) {
        if (file.downloaded) {
            continue;
        }

        publishFileEvent(file);
        if (m_downloader.downloadFile(cancel, file) == TransferOutcome::Cancelled) {
            return pause();
        }
        m_store.save(*m_job);
    }

    transition(JobStatus::Uploading);
    m_store.save(*m_job);
    return JobStatus::Uploading;
}

JobStatus TransferCoordinator::runUploads(const CancellationToken& cancel) {
    transition(JobStatus::Uploading);
    m_store.save(*m_job);

    if (m_importer.importAll(cancel, *m_job, m_progress) == TransferOutcome::Cancelled) {
        return pause();
    }

    transition(JobStatus::Complete);
    m_job->lastError.clear();
    m_store.save(*m_job);

    ProgressEvent event;
    event.phase = ProgressPhase::Complete;
    if (m_job->uploadProgress) {
        event.completedCount = m_job->uploadProgress->completedEntries();
        event.totalCount = m_job->uploadProgress->totalEntries();
    }
    m_progress.publish(event);

    TAKEOUT_LOG_INFO("Job {} complete", m_job->id);
    return JobStatus::Complete;
}

void TransferCoordinator::transition(JobStatus to) {
    if (!canTransition(m_job->status, to)) {
        throw std::logic_error("Invalid job transition " + jobStatusToString(m_job->status) +
                               " -> " + jobStatusToString(to));
    }
    if (m_job->status != to) {
        TAKEOUT_LOG_DEBUG("Job {}: {} -> {}", m_job->id, jobStatusToString(m_job->status),
                          jobStatusToString(to));
        m_job->status = to;
    }
}

JobStatus TransferCoordinator::pause() {
    transition(JobStatus::Cancelled);
    m_store.save(*m_job);
    TAKEOUT_LOG_INFO("Job {} paused", m_job->id);
    return JobStatus::Cancelled;
}

JobStatus TransferCoordinator::fail(const std::string& message) {
    m_job->lastError = message;
    if (canTransition(m_job->status, JobStatus::Error)) {
        m_job->status = JobStatus::Error;
    }

    try {
        m_store.save(*m_job);
    } catch (const TransferError& e) {
        TAKEOUT_LOG_CRITICAL("Cannot persist error state of job {}: {}", m_job->id, e.what());
        throw;
    }
    return m_job->status;
}

void TransferCoordinator::publishFileEvent(const FileUnit& file) {
    int64_t done = 0;
    for (const auto& f : m_job->files) {
        if (f.downloaded) ++done;
    }

    ProgressEvent event;
    event.phase = ProgressPhase::Downloading;
    event.completedCount = done;
    event.totalCount = static_cast<int64_t>(m_job->files.size());
    event.currentItemName = file.name;
    event.bytesDone = file.bytesTransferred;
    event.bytesTotal = file.expectedSize;
    m_progress.publish(event);
}

} // namespace takeout::core::transfer
