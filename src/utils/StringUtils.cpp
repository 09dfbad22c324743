/**
 * StringUtils.cpp
 * 
 * String manipulation and formatting utilities.
 */

#include "StringUtils.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace takeout::utils {

// -- Trimming --

std::string StringUtils::trim(const std::string& str) {
    auto start = str.find_first_not_of(" \t\n\r\f\v");
    if (start == std::string::npos) return "";
    auto end = str.find_last_not_of(" \t\n\r\f\v");
    return str.substr(start, end - start + 1);
}

// -- Case conversion --

std::string StringUtils::toLower(const std::string& str) {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

// -- Split/Join --

std::vector<std::string> StringUtils::split(const std::string& str, char delimiter) {
    std::vector<std::string> parts;
    std::istringstream iss(str);
    std::string part;
    while (std::getline(iss, part, delimiter)) parts.push_back(part);
    return parts;
}

// -- Search --

bool StringUtils::contains(const std::string& str, const std::string& substr) {
    return str.find(substr) != std::string::npos;
}

bool StringUtils::startsWith(const std::string& str, const std::string& prefix) {
    return str.size() >= prefix.size() && str.compare(0, prefix.size(), prefix) == 0;
}

bool StringUtils::endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() && str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

// -- Formatting --

std::string StringUtils::formatBytes(int64_t bytes) {
    const char* units[] = {"B", "KB", "MB", "GB", "TB"};
    double size = static_cast<double>(bytes);
    int unit = 0;
    while (size >= 1024.0 && unit < 4) { size /= 1024.0; ++unit; }
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(unit == 0 ? 0 : 1) << size << " " << units[unit];
    return oss.str();
}

std::string StringUtils::formatPercentage(double value, int precision) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(precision) << value << "%";
    return oss.str();
}

std::string StringUtils::toIso8601(std::chrono::system_clock::time_point time) {
    auto tt = std::chrono::system_clock::to_time_t(time);
    std::tm tm{};
#ifdef _WIN32
    gmtime_s(&tm, &tt);
#else
    gmtime_r(&tt, &tm);
#endif
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%SZ");
    return oss.str();
}

std::optional<std::chrono::system_clock::time_point> StringUtils::parseIso8601(const std::string& str) {
    std::tm tm{};
    std::istringstream iss(str);
    iss >> std::get_time(&tm, "%Y-%m-%dT%H:%M:%S");
    if (iss.fail()) return std::nullopt;
    
    // Skip fractional seconds, then read the zone designator
    if (iss.peek() == '.') {
        iss.get();
        while (std::isdigit(iss.peek())) iss.get();
    }
    
    long offsetSeconds = 0;
    int next = iss.peek();
    if (next == 'Z' || next == 'z') {
        iss.get();
    } else if (next == '+' || next == '-') {
        char sign = static_cast<char>(iss.get());
        int hours = 0, minutes = 0;
        char colon = 0;
        iss >> hours >> colon >> minutes;
        if (iss.fail() || colon != ':') return std::nullopt;
        offsetSeconds = (hours * 3600L + minutes * 60L) * (sign == '-' ? -1 : 1);
    } else if (next != std::char_traits<char>::eof()) {
        return std::nullopt;
    }
    
#ifdef _WIN32
    std::time_t tt = _mkgmtime(&tm);
#else
    std::time_t tt = timegm(&tm);
#endif
    if (tt == static_cast<std::time_t>(-1)) return std::nullopt;
    return std::chrono::system_clock::from_time_t(tt - offsetSeconds);
}

// -- Encoding --

std::string StringUtils::hexEncode(const unsigned char* data, size_t size) {
    std::ostringstream oss;
    for (size_t i = 0; i < size; ++i) {
        oss << std::hex << std::setfill('0') << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

// -- UUID --

std::string StringUtils::generateUUID() {
    static std::random_device rd;
    static std::mt19937 gen(rd());
    static std::uniform_int_distribution<> dis(0, 15);
    static const char hex[] = "0123456789abcdef";

    std::string uuid(36, '-');
    for (int i = 0; i < 36; ++i) {
        if (i == 8 || i == 13 || i == 18 || i == 23) continue;
        uuid[i] = hex[dis(gen)];
    }
    uuid[14] = '4'; // version 4
    uuid[19] = hex[(dis(gen) & 0x3) | 0x8]; // variant
    return uuid;
}

// -- File names --

std::string StringUtils::sanitizeFileName(const std::string& name) {
    std::string result;
    result.reserve(name.size());
    for (char c : name) {
        switch (c) {
            case '/': case '\\': case ':': case '*': case '?':
            case '"': case '<': case '>': case '|':
                result += '_';
                break;
            default:
                result += (static_cast<unsigned char>(c) < 0x20) ? '_' : c;
        }
    }
    if (result.empty() || result == "." || result == "..") {
        result = "unnamed";
    }
    return result;
}

std::string StringUtils::sanitizeUtf8(const std::string& str) {
    static const char replacement[] = "\xEF\xBF\xBD";

    std::string result;
    result.reserve(str.size());
    size_t i = 0;
    while (i < str.size()) {
        auto lead = static_cast<unsigned char>(str[i]);
        size_t length = 0;
        uint32_t min = 0;
        uint32_t cp = 0;
        if (lead < 0x80) {
            result += str[i++];
            continue;
        } else if ((lead & 0xE0) == 0xC0) {
            length = 2; min = 0x80; cp = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3; min = 0x800; cp = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4; min = 0x10000; cp = lead & 0x07;
        }

        bool valid = length > 0 && i + length <= str.size();
        for (size_t k = 1; valid && k < length; ++k) {
            auto cont = static_cast<unsigned char>(str[i + k]);
            if ((cont & 0xC0) != 0x80) {
                valid = false;
            } else {
                cp = (cp << 6) | (cont & 0x3F);
            }
        }
        // Overlong forms, surrogates and values past U+10FFFF
        if (valid && (cp < min || cp > 0x10FFFF || (cp >= 0xD800 && cp <= 0xDFFF))) {
            valid = false;
        }

        if (valid) {
            result.append(str, i, length);
            i += length;
        } else {
            result += replacement;
            ++i;
        }
    }
    return result;
}

// -- Parsing --

std::optional<int> StringUtils::parseInt(const std::string& str) {
    std::string trimmed = trim(str);
    int value = 0;
    auto [ptr, ec] = std::from_chars(trimmed.data(), trimmed.data() + trimmed.size(), value);
    if (ec != std::errc() || ptr != trimmed.data() + trimmed.size() || trimmed.empty()) {
        return std::nullopt;
    }
    return value;
}

// -- Truncation --

std::string StringUtils::truncate(const std::string& str, size_t maxLength, const std::string& suffix) {
    if (str.size() <= maxLength) return str;
    if (maxLength <= suffix.size()) return str.substr(0, maxLength);
    return str.substr(0, maxLength - suffix.size()) + suffix;
}

} // namespace takeout::utils
