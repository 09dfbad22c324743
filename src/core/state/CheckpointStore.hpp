#pragma once

/**
 * CheckpointStore.hpp
 * 
 * Durable persistence of the job record as a single JSON document.
 */

#include "../models/Job.hpp"

#include <filesystem>
#include <optional>

namespace takeout::core::state {

/**
 * CheckpointStore - crash-safe job persistence
 * 
 * - save() replaces the record atomically (temp file + rename)
 * - load() distinguishes "no record" from "unreadable record"
 * - the containing directory is created with owner-only permissions
 */
class CheckpointStore {
public:
    /**
     * Constructor
     * @param recordPath Location of the job record
     */
    explicit CheckpointStore(std::filesystem::path recordPath);
    
    virtual ~CheckpointStore() = default;
    
    /**
     * Load the persisted job
     * @return Job, or std::nullopt if no record exists
     * @throws TransferError(CorruptCheckpoint) if the record cannot be parsed
     */
    std::optional<Job> load() const;
    
    /**
     * Persist the job, refreshing its updatedAt timestamp
     * @throws TransferError(TransientIO) on write failure
     */
    virtual void save(Job& job);
    
    /**
     * Delete the record; a missing record is not an error
     * @throws TransferError(TransientIO) on failure
     */
    void clear();
    
    const std::filesystem::path& path() const { return m_path; }
    
    /**
     * Number of successful saves since construction
     */
    size_t saveCount() const { return m_saveCount; }

private:
    std::filesystem::path m_path;
    size_t m_saveCount{0};
};

} // namespace takeout::core::state
