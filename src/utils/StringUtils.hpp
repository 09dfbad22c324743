// Takeout Importer - String Utilities
// String manipulation and formatting

#pragma once

#include <string>
#include <vector>
#include <chrono>
#include <optional>
#include <cstdint>

namespace takeout::utils {

/**
 * @brief String manipulation utilities
 */
class StringUtils {
public:
    // Trimming
    static std::string trim(const std::string& str);
    
    // Case conversion
    static std::string toLower(const std::string& str);
    
    // Splitting
    static std::vector<std::string> split(const std::string& str, char delimiter);
    
    // Search
    static bool contains(const std::string& str, const std::string& substr);
    static bool startsWith(const std::string& str, const std::string& prefix);
    static bool endsWith(const std::string& str, const std::string& suffix);
    
    // Formatting
    static std::string formatBytes(int64_t bytes);
    static std::string formatPercentage(double value, int precision = 1);
    
    // RFC 3339 timestamps in UTC, e.g. 2024-05-01T12:30:00Z
    static std::string toIso8601(std::chrono::system_clock::time_point time);
    static std::optional<std::chrono::system_clock::time_point> parseIso8601(const std::string& str);
    
    // Encoding
    static std::string hexEncode(const unsigned char* data, size_t size);
    
    // UUID
    static std::string generateUUID();
    
    // File names
    static std::string sanitizeFileName(const std::string& name);
    
    // Replace bytes that are not well-formed UTF-8 with U+FFFD
    static std::string sanitizeUtf8(const std::string& str);
    
    // Parsing
    static std::optional<int> parseInt(const std::string& str);
    
    // Truncation
    static std::string truncate(const std::string& str, size_t maxLength, const std::string& suffix = "...");
};

} // namespace takeout::utils
