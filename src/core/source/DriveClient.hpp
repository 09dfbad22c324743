#pragma once

/**
 * DriveClient.hpp
 * 
 * Google Drive v3 implementation of the source store contract.
 */

#include "SourceStore.hpp"

#include <string>
#include <optional>

namespace takeout::core::source {

/**
 * Parsed Content-Range header ("bytes 120-299/300", "bytes *\/300")
 */
struct ContentRange {
    int64_t start{-1};
    int64_t end{-1};
    int64_t total{-1};
};

/**
 * DriveClient - Archive listing and ranged media reads
 * 
 * The bearer token is supplied by the caller; token refresh is not
 * handled here.
 */
class DriveClient : public SourceStoreClient {
public:
    /**
     * Constructor, reads endpoint, query and timeouts from Config
     * @param accessToken OAuth bearer token
     */
    explicit DriveClient(std::string accessToken);
    
    std::vector<ArchiveInfo> listEligibleArchives() override;
    
    FetchResult fetchRange(const std::string& id, int64_t startByte,
                           const RangeHandlers& handlers) override;
    
    static std::optional<ContentRange> parseContentRange(const std::string& value);
    
    /**
     * Map an HTTP status to a range classification
     */
    static RangeStatus classify(int statusCode);

private:
    std::string m_accessToken;
    std::string m_baseUrl;
    std::string m_query;
    int m_connectTimeoutMs;
    int m_lowSpeedSeconds;
};

} // namespace takeout::core::source
