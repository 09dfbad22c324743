// Takeout Importer - HTTP Client
// Small request/response client for the non-streaming calls

#pragma once

#include <string>
#include <map>
#include <cstdint>

namespace takeout::utils {

/**
 * @brief HTTP response structure
 */
struct HttpResponse {
    int statusCode{0};
    std::string body;
    std::string error;          // Transport error, empty if a response arrived
    
    bool isSuccess() const {
        return statusCode >= 200 && statusCode < 300;
    }
    
    bool isUnauthorized() const { return statusCode == 401; }
};

/**
 * @brief HTTP request options
 */
struct HttpOptions {
    std::map<std::string, std::string> headers;
    int timeoutMs{30000};
    int connectTimeoutMs{10000};
    std::string userAgent{"TakeoutImporter/1.0"};
};

/**
 * @brief Blocking HTTP client over cpr
 */
class HttpClient {
public:
    HttpClient() = default;
    
    HttpClient(const HttpClient&) = delete;
    HttpClient& operator=(const HttpClient&) = delete;
    
    // Singleton instance
    static HttpClient& instance();
    
    HttpResponse get(const std::string& url, const HttpOptions& options = {});
    HttpResponse get(const std::string& url, const std::map<std::string, std::string>& params,
                     const HttpOptions& options = {});
    
    // URL utilities
    static std::string urlEncode(const std::string& str);
    
    /**
     * Join a base URL and a path without doubling the separator
     */
    static std::string joinUrl(const std::string& base, const std::string& path);
};

} // namespace takeout::utils
