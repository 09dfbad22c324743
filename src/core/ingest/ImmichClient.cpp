/**
 * ImmichClient.cpp
 */

#include "ImmichClient.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <filesystem>

namespace takeout::core::ingest {

using json = nlohmann::json;
using utils::HttpClient;
using utils::StringUtils;

ImmichClient::ImmichClient(std::string serverUrl, std::string apiKey)
    : m_serverUrl(std::move(serverUrl))
    , m_apiKey(std::move(apiKey))
{
    auto& config = Config::instance();
    m_timeoutMs = config.get<int>("uploads.timeout", 300000);
    m_deviceId = config.get<std::string>("uploads.deviceId", "takeout-importer");
    
    while (!m_serverUrl.empty() && m_serverUrl.back() == '/') {
        m_serverUrl.pop_back();
    }
}

UploadResult ImmichClient::uploadAsset(const AssetUpload& asset) {
    if (!asset.content) {
        return UploadResult{UploadStatus::Failed, 0, "no content"};
    }
    
    const char* begin = reinterpret_cast<const char*>(asset.content->data());
    const char* end = begin + asset.content->size();
    
    cpr::Multipart multipart{
        {"assetData", cpr::Buffer{begin, end, std::filesystem::path(asset.filename)}},
        {"deviceAssetId", asset.externalId},
        {"deviceId", m_deviceId},
        {"fileCreatedAt", StringUtils::toIso8601(asset.createdAt)},
        {"fileModifiedAt", StringUtils::toIso8601(asset.modifiedAt)}
    };
    
    cpr::Response response = cpr::Post(
        cpr::Url{HttpClient::joinUrl(m_serverUrl, "api/assets")},
        cpr::Header{{"x-api-key", m_apiKey}, {"Accept", "application/json"}},
        multipart,
        cpr::Timeout{m_timeoutMs},
        cpr::UserAgent{"TakeoutImporter/1.0"}
    );
    
    if (response.error) {
        return UploadResult{UploadStatus::Failed, 0, response.error.message};
    }
    
    return interpretResponse(static_cast<int>(response.status_code), response.text);
}

UploadResult ImmichClient::interpretResponse(int statusCode, const std::string& body) {
    UploadResult result;
    result.statusCode = statusCode;
    
    json parsed = json::parse(body, nullptr, false);
    std::string status;
    std::string message;
    if (parsed.is_object()) {
        if (parsed.contains("status") && parsed["status"].is_string()) {
            status = parsed["status"].get<std::string>();
        }
        if (parsed.contains("message")) {
            const auto& m = parsed["message"];
            message = m.is_string() ? m.get<std::string>() : m.dump();
        }
    }
    
    if (status == "duplicate" || StringUtils::contains(StringUtils::toLower(message), "duplicate")) {
        result.status = UploadStatus::Duplicate;
        result.message = message;
        return result;
    }
    
    if (statusCode == 200 || statusCode == 201) {
        result.status = UploadStatus::Created;
        return result;
    }
    
    result.status = UploadStatus::Failed;
    result.message = "HTTP " + std::to_string(statusCode) +
        (message.empty() ? std::string() : ": " + message);
    return result;
}

std::string ImmichClient::ping() {
    utils::HttpOptions options;
    options.headers["x-api-key"] = m_apiKey;
    options.headers["Accept"] = "application/json";
    
    auto response = HttpClient::instance().get(HttpClient::joinUrl(m_serverUrl, "api/server/ping"), options);
    if (!response.error.empty()) {
        return response.error;
    }
    if (!response.isSuccess()) {
        return "HTTP " + std::to_string(response.statusCode);
    }
    
    json parsed = json::parse(response.body, nullptr, false);
    if (!parsed.is_object() || parsed.value("res", "") != "pong") {
        return "unexpected ping response";
    }
    
    TAKEOUT_LOG_DEBUG("Server {} reachable", m_serverUrl);
    return "";
}

} // namespace takeout::core::ingest
