#pragma once

/**
 * ImmichClient.hpp
 * 
 * Immich server implementation of the ingestion contract.
 */

#include "IngestClient.hpp"

#include <string>

namespace takeout::core::ingest {

/**
 * ImmichClient - Multipart asset upload authenticated by API key
 */
class ImmichClient : public IngestClient {
public:
    /**
     * Constructor, reads the timeout and device id from Config
     * @param serverUrl Base URL of the server, without the /api suffix
     * @param apiKey Credential sent as x-api-key
     */
    ImmichClient(std::string serverUrl, std::string apiKey);
    
    UploadResult uploadAsset(const AssetUpload& asset) override;
    
    /**
     * Check that the server is reachable
     * @return Empty string on success, otherwise the reason
     */
    std::string ping();
    
    /**
     * Classify a server reply to an upload
     */
    static UploadResult interpretResponse(int statusCode, const std::string& body);

private:
    std::string m_serverUrl;
    std::string m_apiKey;
    int m_timeoutMs;
    std::string m_deviceId;
};

} // namespace takeout::core::ingest
