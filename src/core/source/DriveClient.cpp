/**
 * DriveClient.cpp
 */

#include "DriveClient.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../TransferError.hpp"
#include "../../utils/HttpClient.hpp"
#include "../../utils/StringUtils.hpp"

#include <cpr/cpr.h>
#include <nlohmann/json.hpp>

#include <string_view>

namespace takeout::core::source {

using json = nlohmann::json;
using utils::HttpClient;
using utils::StringUtils;

namespace {

int64_t parseSize(const json& file) {
    if (!file.contains("size")) return 0;
    const auto& size = file["size"];
    // Drive encodes int64 fields as strings
    if (size.is_string()) {
        try {
            return std::stoll(size.get<std::string>());
        } catch (const std::exception&) {
            return 0;
        }
    }
    return size.is_number_integer() ? size.get<int64_t>() : 0;
}

} // namespace

DriveClient::DriveClient(std::string accessToken)
    : m_accessToken(std::move(accessToken))
{
    auto& config = Config::instance();
    m_baseUrl = config.get<std::string>("source.baseUrl", "https://www.googleapis.com/drive/v3");
    m_query = config.get<std::string>("source.query",
        "name contains 'takeout' and mimeType = 'application/zip' and trashed = false");
    m_connectTimeoutMs = config.get<int>("downloads.connectTimeout", 30000);
    m_lowSpeedSeconds = config.get<int>("downloads.lowSpeedTimeout", 60);
}

std::vector<ArchiveInfo> DriveClient::listEligibleArchives() {
    std::vector<ArchiveInfo> archives;
    std::string pageToken;
    
    utils::HttpOptions options;
    options.headers["Authorization"] = "Bearer " + m_accessToken;
    options.connectTimeoutMs = m_connectTimeoutMs;
    
    do {
        std::map<std::string, std::string> params = {
            {"q", m_query},
            {"fields", "nextPageToken, files(id, name, size, md5Checksum)"},
            {"pageSize", "100"},
            {"orderBy", "name"}
        };
        if (!pageToken.empty()) {
            params["pageToken"] = pageToken;
        }
        
        auto response = HttpClient::instance().get(HttpClient::joinUrl(m_baseUrl, "files"), params, options);
        if (!response.error.empty()) {
            throw TransferError(ErrorKind::TransientIO, "Drive listing failed: " + response.error);
        }
        if (response.isUnauthorized()) {
            throw TransferError(ErrorKind::TransientIO, "Drive rejected the access token");
        }
        if (!response.isSuccess()) {
            throw TransferError(ErrorKind::TransientIO,
                "Drive listing failed: HTTP " + std::to_string(response.statusCode));
        }
        
        json page;
        try {
            page = json::parse(response.body);
        } catch (const json::exception& e) {
            throw TransferError(ErrorKind::ProtocolViolation,
                std::string("Malformed Drive listing: ") + e.what());
        }
        
        for (const auto& file : page.value("files", json::array())) {
            ArchiveInfo info;
            info.id = file.value("id", "");
            info.name = file.value("name", "");
            info.size = parseSize(file);
            info.md5Checksum = file.value("md5Checksum", "");
            
            std::string lower = StringUtils::toLower(info.name);
            if (info.id.empty() || !StringUtils::endsWith(lower, ".zip") ||
                !StringUtils::contains(lower, "takeout")) {
                continue;
            }
            archives.push_back(std::move(info));
        }
        
        pageToken = page.value("nextPageToken", "");
    } while (!pageToken.empty());
    
    TAKEOUT_LOG_INFO("Found {} takeout archives", archives.size());
    return archives;
}

FetchResult DriveClient::fetchRange(const std::string& id, int64_t startByte,
                                    const RangeHandlers& handlers) {
    FetchResult result;
    
    cpr::Header headers{{"Authorization", "Bearer " + m_accessToken}};
    if (startByte > 0) {
        headers["Range"] = "bytes=" + std::to_string(startByte) + "-";
    }
    
    int statusCode = 0;
    std::string contentRange;
    bool responseSeen = false;
    bool aborted = false;
    
    auto deliverResponse = [&]() -> bool {
        responseSeen = true;
        RangeResponse response;
        response.statusCode = statusCode;
        response.status = classify(statusCode);
        if (auto range = parseContentRange(contentRange)) {
            response.rangeStart = range->start;
            response.totalSize = range->total;
        }
        return handlers.onResponse(response);
    };
    
    // Redirects and interim responses each start with a new status line
    cpr::HeaderCallback headerCallback{[&](std::string_view header, intptr_t) -> bool {
        std::string line = StringUtils::trim(std::string(header));
        if (StringUtils::startsWith(line, "HTTP/")) {
            auto parts = StringUtils::split(line, ' ');
            statusCode = parts.size() > 1 ? StringUtils::parseInt(parts[1]).value_or(0) : 0;
            contentRange.clear();
        } else if (StringUtils::startsWith(StringUtils::toLower(line), "content-range:")) {
            contentRange = StringUtils::trim(line.substr(std::string("content-range:").size()));
        }
        return true;
    }};
    
    cpr::WriteCallback writeCallback{[&](std::string_view data, intptr_t) -> bool {
        if (!responseSeen && !deliverResponse()) {
            aborted = true;
            return false;
        }
        if (!handlers.onData(data.data(), data.size())) {
            aborted = true;
            return false;
        }
        return true;
    }};
    
    std::string url = HttpClient::joinUrl(m_baseUrl, "files/" + HttpClient::urlEncode(id));
    
    cpr::Response response = cpr::Get(
        cpr::Url{url},
        cpr::Parameters{{"alt", "media"}},
        headers,
        cpr::ConnectTimeout{m_connectTimeoutMs},
        cpr::LowSpeed{1, m_lowSpeedSeconds},
        cpr::UserAgent{"TakeoutImporter/1.0"},
        headerCallback,
        writeCallback
    );
    
    // Empty bodies never reach the write callback
    if (!responseSeen && !aborted && statusCode != 0) {
        if (!deliverResponse()) {
            aborted = true;
        }
    }
    
    result.statusCode = statusCode != 0 ? statusCode : static_cast<int>(response.status_code);
    result.aborted = aborted;
    result.transportOk = !aborted && !response.error;
    if (response.error && !aborted) {
        result.error = response.error.message;
    }
    
    TAKEOUT_LOG_DEBUG("Fetch {} from byte {}: HTTP {}{}", id, startByte, result.statusCode,
                      result.transportOk ? "" : " (incomplete)");
    return result;
}

std::optional<ContentRange> DriveClient::parseContentRange(const std::string& value) {
    std::string v = StringUtils::trim(value);
    if (!StringUtils::startsWith(v, "bytes ")) {
        return std::nullopt;
    }
    v = v.substr(6);
    
    auto slash = v.find('/');
    if (slash == std::string::npos) {
        return std::nullopt;
    }
    
    ContentRange range;
    std::string span = v.substr(0, slash);
    std::string total = v.substr(slash + 1);
    
    try {
        if (total != "*") {
            range.total = std::stoll(total);
        }
        if (span != "*") {
            auto dash = span.find('-');
            if (dash == std::string::npos) {
                return std::nullopt;
            }
            range.start = std::stoll(span.substr(0, dash));
            range.end = std::stoll(span.substr(dash + 1));
        }
    } catch (const std::exception&) {
        return std::nullopt;
    }
    return range;
}

RangeStatus DriveClient::classify(int statusCode) {
    switch (statusCode) {
        case 200: return RangeStatus::Full;
        case 206: return RangeStatus::Partial;
        default:  return RangeStatus::Other;
    }
}

} // namespace takeout::core::source
