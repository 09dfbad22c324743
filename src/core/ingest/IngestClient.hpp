#pragma once

/**
 * IngestClient.hpp
 * 
 * Contract of the remote ingestion service that receives media assets.
 */

#include <string>
#include <vector>
#include <chrono>
#include <cstdint>

namespace takeout::core::ingest {

/**
 * One media item to upload
 */
struct AssetUpload {
    std::string filename;
    const std::vector<uint8_t>* content{nullptr};
    std::chrono::system_clock::time_point createdAt;
    std::chrono::system_clock::time_point modifiedAt;
    std::string externalId;     // Stable content-derived id, used by the service for deduplication
};

enum class UploadStatus {
    Created,
    Duplicate,      // Asset already present at the destination
    Failed
};

struct UploadResult {
    UploadStatus status{UploadStatus::Failed};
    int statusCode{0};
    std::string message;
    
    bool isSuccess() const {
        return status == UploadStatus::Created || status == UploadStatus::Duplicate;
    }
};

class IngestClient {
public:
    virtual ~IngestClient() = default;
    
    /**
     * Upload one asset. Transport errors are reported as Failed, not thrown.
     */
    virtual UploadResult uploadAsset(const AssetUpload& asset) = 0;
};

} // namespace takeout::core::ingest
