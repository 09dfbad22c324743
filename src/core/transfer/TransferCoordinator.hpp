#pragma once

/**
 * TransferCoordinator.hpp
 *
 * Drives a job through download-all-then-upload-all and owns its
 * state transitions and persistence.
 */

#include "../models/Job.hpp"
#include "../CancellationToken.hpp"
#include "../TransferError.hpp"
#include "../source/SourceStore.hpp"
#include "../ingest/IngestClient.hpp"
#include "../state/CheckpointStore.hpp"
#include "../downloader/RangeDownloader.hpp"
#include "../importer/ArchiveImporter.hpp"
#include "ProgressSink.hpp"

#include <filesystem>
#include <optional>
#include <vector>

namespace takeout::core::transfer {

/**
 * TransferCoordinator - Job state machine
 *
 * idle -> downloading -> uploading -> complete, with error and cancelled
 * reachable from either working state. A job persisted in any working or
 * interrupted state is resumed in place.
 *
 * The coordinator is the only writer of the job and the single place
 * where fatal errors are caught and recorded.
 */
class TransferCoordinator {
public:
    TransferCoordinator(
        source::SourceStoreClient& source,
        ingest::IngestClient& ingest,
        state::CheckpointStore& store,
        const std::filesystem::path& downloadDir,
        ProgressSink& progress
    );

    TransferCoordinator(const TransferCoordinator&) = delete;
    TransferCoordinator& operator=(const TransferCoordinator&) = delete;

    /**
     * Adopt the persisted job, if any
     * @return true if a job record was found
     * @throws TransferError(CorruptCheckpoint) if the record is unreadable
     */
    bool loadExisting();

    /**
     * Start a new job from a file selection and persist it
     * @param selection Archives in the order they should be processed
     * @param serverUrl Destination recorded on the job
     */
    void begin(const std::vector<source::ArchiveInfo>& selection, const std::string& serverUrl = "");

    /**
     * Run the job until it completes, fails or is cancelled.
     * The final state is persisted before returning.
     * @return Final status (Complete, Error or Cancelled)
     * @throws TransferError(TransientIO) only if the error state itself cannot be persisted
     * @throws std::logic_error if no job is loaded
     */
    JobStatus run(const CancellationToken& cancel);

    /**
     * Delete the job record and forget the in-memory job
     */
    void reset();

    bool hasJob() const { return m_job.has_value(); }
    const Job& job() const;

    downloader::RangeDownloader& downloader() { return m_downloader; }
    importer::ArchiveImporter& importer() { return m_importer; }

private:
    JobStatus runDownloads(const CancellationToken& cancel);
    JobStatus runUploads(const CancellationToken& cancel);

    void transition(JobStatus to);
    JobStatus pause();
    JobStatus fail(const std::string& message);
    void publishFileEvent(const FileUnit& file);

    state::CheckpointStore& m_store;
    ProgressSink& m_progress;
    downloader::RangeDownloader m_downloader;
    importer::ArchiveImporter m_importer;

    std::optional<Job> m_job;
};

} // namespace takeout::core::transfer
