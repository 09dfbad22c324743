#pragma once

/**
 * ZipArchive.hpp
 * 
 * Read-only access to a zip archive through libzip.
 */

#include "../TransferError.hpp"

#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <filesystem>
#include <cstdint>

struct zip;

namespace takeout::core::archive {

/**
 * Central directory entry
 */
struct ZipEntry {
    uint64_t index{0};
    std::string name;
    uint64_t size{0};           // Uncompressed size
    std::optional<std::chrono::system_clock::time_point> modifiedAt;
    bool isDirectory{false};
};

/**
 * ZipArchive - RAII wrapper over a libzip handle
 */
class ZipArchive {
public:
    ZipArchive() = default;
    ~ZipArchive();
    
    ZipArchive(const ZipArchive&) = delete;
    ZipArchive& operator=(const ZipArchive&) = delete;
    ZipArchive(ZipArchive&& other) noexcept;
    ZipArchive& operator=(ZipArchive&& other) noexcept;
    
    /**
     * Open an archive for reading
     * @throws TransferError(TransientIO) if the file is missing or not a zip
     */
    void open(const std::filesystem::path& path);
    
    void close();
    
    bool isOpen() const { return m_archive != nullptr; }
    const std::filesystem::path& path() const { return m_path; }
    
    /**
     * Entries in central directory order
     */
    std::vector<ZipEntry> entries() const;
    
    /**
     * Read the full contents of an entry
     * @throws TransferError(TransientIO) on read or CRC failure
     */
    std::vector<uint8_t> read(const ZipEntry& entry) const;

private:
    struct zip* m_archive{nullptr};
    std::filesystem::path m_path;
};

} // namespace takeout::core::archive
