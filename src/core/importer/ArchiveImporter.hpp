#pragma once

/**
 * ArchiveImporter.hpp
 * 
 * Extracts media from downloaded archives and uploads each entry
 * to the ingestion service, recording completion in the job's ledger.
 */

#include "../models/Job.hpp"
#include "../CancellationToken.hpp"
#include "../TransferError.hpp"
#include "../ingest/IngestClient.hpp"
#include "../state/CheckpointStore.hpp"
#include "../transfer/ProgressSink.hpp"
#include "../archive/ZipArchive.hpp"

#include <cstdint>

namespace takeout::core::importer {

/**
 * Counters for one importAll call
 */
struct ImportStats {
    int64_t uploaded{0};
    int64_t duplicates{0};
    int64_t failed{0};
    int64_t skipped{0};      // Already in the ledger
};

/**
 * ArchiveImporter - Per-entry checkpointed upload
 * 
 * Entries already present in the ledger are skipped, so a rerun after
 * any interruption uploads only what is missing. The job is saved
 * every checkpointInterval completed entries and after each archive.
 */
class ArchiveImporter {
public:
    ArchiveImporter(ingest::IngestClient& client, state::CheckpointStore& store);
    
    /**
     * Upload every eligible entry of every downloaded archive
     * @param cancel Checked before each entry
     * @param job Job whose ledger is updated in place
     * @param progress Receives one event per processed entry
     * @return Completed, or Cancelled with the ledger matching uploaded entries
     * @throws TransferError(TransientIO) if an archive cannot be opened or
     *         a checkpoint cannot be written
     */
    TransferOutcome importAll(const CancellationToken& cancel, Job& job,
                              transfer::ProgressSink& progress);
    
    void setCheckpointInterval(int entries) { m_checkpointInterval = entries > 0 ? entries : 1; }
    int checkpointInterval() const { return m_checkpointInterval; }
    
    /**
     * Entries recorded as larger than this are not loaded and count as failed
     */
    void setMaxEntrySize(int64_t bytes) { m_maxEntrySize = bytes; }
    
    const ImportStats& stats() const { return m_stats; }

private:
    TransferOutcome importArchive(const CancellationToken& cancel, Job& job,
                                  const FileUnit& file, transfer::ProgressSink& progress);
    
    /**
     * Upload one entry
     * @return true if the ledger may record the entry
     */
    bool uploadEntry(const archive::ZipArchive& zip, const archive::ZipEntry& entry);
    
    void publish(const Job& job, const std::string& itemName, transfer::ProgressSink& progress) const;
    
    ingest::IngestClient& m_client;
    state::CheckpointStore& m_store;
    
    int m_checkpointInterval;
    int64_t m_maxEntrySize;
    int m_sinceCheckpoint{0};
    ImportStats m_stats;
};

} // namespace takeout::core::importer
