/**
 * HttpClient.cpp
 * 
 * HTTP client implementation using cpr (which wraps libcurl).
 */

#include "HttpClient.hpp"

#include <cpr/cpr.h>
#include <curl/curl.h>

namespace takeout::utils {

HttpClient& HttpClient::instance() {
    static HttpClient inst;
    return inst;
}

HttpResponse HttpClient::get(const std::string& url, const HttpOptions& options) {
    return get(url, {}, options);
}

HttpResponse HttpClient::get(const std::string& url, const std::map<std::string, std::string>& params,
                             const HttpOptions& options) {
    HttpResponse result;
    
    cpr::Header headers;
    for (const auto& [key, value] : options.headers) headers[key] = value;
    
    cpr::Parameters parameters;
    for (const auto& [key, value] : params) {
        parameters.Add({key, value});
    }
    
    std::string ua = options.userAgent.empty() ? "TakeoutImporter/1.0" : options.userAgent;
    
    cpr::Response response = cpr::Get(
        cpr::Url{url},
        headers,
        parameters,
        cpr::Timeout{options.timeoutMs},
        cpr::ConnectTimeout{options.connectTimeoutMs},
        cpr::UserAgent{ua}
    );
    
    result.statusCode = static_cast<int>(response.status_code);
    result.body = response.text;
    if (response.error) {
        result.error = response.error.message;
    }
    
    return result;
}

std::string HttpClient::urlEncode(const std::string& str) {
    CURL* curl = curl_easy_init();
    if (!curl) return str;
    char* output = curl_easy_escape(curl, str.c_str(), static_cast<int>(str.size()));
    std::string result = output ? output : str;
    curl_free(output);
    curl_easy_cleanup(curl);
    return result;
}

std::string HttpClient::joinUrl(const std::string& base, const std::string& path) {
    if (base.empty()) return path;
    if (path.empty()) return base;
    
    bool baseSlash = base.back() == '/';
    bool pathSlash = path.front() == '/';
    if (baseSlash && pathSlash) return base + path.substr(1);
    if (!baseSlash && !pathSlash) return base + "/" + path;
    return base + path;
}

} // namespace takeout::utils
