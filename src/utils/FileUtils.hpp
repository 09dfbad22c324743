// Takeout Importer - File Utilities
// File system operations used by the checkpoint and download paths

#pragma once

#include <string>
#include <filesystem>
#include <optional>
#include <cstdint>
#include <system_error>

namespace fs = std::filesystem;

namespace takeout::utils {

/**
 * @brief File and directory utilities
 */
class FileUtils {
public:
    // Directory operations
    static bool createPrivateDirectory(const fs::path& path, std::error_code& ec);
    
    /**
     * Physical length of a file, 0 if it does not exist
     * @throws std::filesystem::filesystem_error if the file exists but cannot be inspected
     */
    static int64_t physicalSize(const fs::path& path);
    
    // Read/Write operations
    static std::optional<std::string> readFile(const fs::path& path, std::error_code& ec);
    
    /**
     * Replace a file's contents atomically: the data goes to a temporary
     * file in the same directory, is flushed to disk, then renamed over
     * the target. Readers observe either the old or the new contents.
     * @param mode POSIX permission bits of the new file
     */
    static bool writeFileAtomic(const fs::path& path, const std::string& content,
                                std::error_code& ec, unsigned mode = 0600);
};

/**
 * @brief RAII advisory file lock
 */
class FileLock {
public:
    FileLock(const fs::path& path);
    ~FileLock();
    
    FileLock(const FileLock&) = delete;
    FileLock& operator=(const FileLock&) = delete;
    
    bool isLocked() const { return m_locked; }
    void unlock();

private:
    fs::path m_path;
    bool m_locked{false};
    
#ifdef _WIN32
    void* m_handle{nullptr};
#else
    int m_fd{-1};
#endif
};

} // namespace takeout::utils
