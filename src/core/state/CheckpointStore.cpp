/**
 * CheckpointStore.cpp
 * 
 * Job record persistence.
 */

#include "CheckpointStore.hpp"
#include "../Logger.hpp"
#include "../TransferError.hpp"
#include "../../utils/FileUtils.hpp"

#include <nlohmann/json.hpp>
#include <system_error>

namespace takeout::core::state {

using json = nlohmann::json;

CheckpointStore::CheckpointStore(std::filesystem::path recordPath)
    : m_path(std::move(recordPath)) {
}

std::optional<Job> CheckpointStore::load() const {
    std::error_code ec;
    if (!std::filesystem::exists(m_path, ec)) {
        if (ec) {
            throw TransferError(ErrorKind::CorruptCheckpoint,
                "Cannot inspect checkpoint " + m_path.string() + ": " + ec.message());
        }
        return std::nullopt;
    }
    
    auto content = utils::FileUtils::readFile(m_path, ec);
    if (!content) {
        throw TransferError(ErrorKind::CorruptCheckpoint,
            "Cannot read checkpoint " + m_path.string() + ": " + ec.message());
    }
    
    try {
        Job job = Job::fromJson(json::parse(*content));
        TAKEOUT_LOG_DEBUG("Loaded checkpoint {} (status: {}, {} files)",
            job.id, jobStatusToString(job.status), job.files.size());
        return job;
    } catch (const json::exception& e) {
        throw TransferError(ErrorKind::CorruptCheckpoint,
            "Malformed checkpoint " + m_path.string() + ": " + e.what());
    } catch (const std::invalid_argument& e) {
        throw TransferError(ErrorKind::CorruptCheckpoint,
            "Malformed checkpoint " + m_path.string() + ": " + e.what());
    }
}

void CheckpointStore::save(Job& job) {
    job.updatedAt = std::chrono::system_clock::now();
    
    std::error_code ec;
    if (m_path.has_parent_path() &&
        !utils::FileUtils::createPrivateDirectory(m_path.parent_path(), ec)) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot create checkpoint directory " + m_path.parent_path().string() + ": " + ec.message());
    }
    
    std::string document;
    try {
        document = job.toJson().dump(2, ' ', false, json::error_handler_t::replace);
    } catch (const json::exception& e) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot serialise checkpoint " + m_path.string() + ": " + e.what());
    }
    if (!utils::FileUtils::writeFileAtomic(m_path, document, ec, 0600)) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot write checkpoint " + m_path.string() + ": " + ec.message());
    }
    
    ++m_saveCount;
    TAKEOUT_LOG_DEBUG("Checkpoint saved ({} bytes, status: {})",
        document.size(), jobStatusToString(job.status));
}

void CheckpointStore::clear() {
    std::error_code ec;
    std::filesystem::remove(m_path, ec);
    if (ec) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot remove checkpoint " + m_path.string() + ": " + ec.message());
    }
    TAKEOUT_LOG_INFO("Checkpoint cleared");
}

} // namespace takeout::core::state
