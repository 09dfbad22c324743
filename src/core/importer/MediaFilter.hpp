#pragma once

/**
 * MediaFilter.hpp
 * 
 * Classification of archives and archive members by file extension.
 */

#include "../../utils/StringUtils.hpp"

#include <string>
#include <unordered_set>
#include <filesystem>

namespace takeout::core::importer {

class MediaFilter {
public:
    /**
     * Raster, video and camera raw formats accepted by the destination.
     * Metadata sidecars (.json), thumbnails and HTML indexes are excluded.
     */
    static const std::unordered_set<std::string>& mediaExtensions() {
        static const std::unordered_set<std::string> extensions = {
            ".jpg", ".jpeg", ".png", ".gif", ".webp", ".heic", ".heif", ".avif",
            ".mp4", ".mov", ".avi", ".mkv", ".webm", ".m4v", ".3gp",
            ".raw", ".cr2", ".nef", ".arw", ".dng", ".orf", ".rw2"
        };
        return extensions;
    }
    
    static bool isMedia(const std::string& entryName) {
        if (entryName.empty() || entryName.back() == '/') {
            return false;
        }
        return mediaExtensions().count(extensionOf(entryName)) > 0;
    }
    
    static bool isArchive(const std::string& fileName) {
        return extensionOf(fileName) == ".zip";
    }

private:
    static std::string extensionOf(const std::string& name) {
        return utils::StringUtils::toLower(std::filesystem::path(name).extension().string());
    }
};

} // namespace takeout::core::importer
