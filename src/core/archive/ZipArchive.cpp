/**
 * ZipArchive.cpp
 */

#include "ZipArchive.hpp"
#include "../Logger.hpp"

#include <zip.h>

#include <new>
#include <stdexcept>

namespace takeout::core::archive {

namespace {

std::string openErrorMessage(int code) {
    zip_error_t error;
    zip_error_init_with_code(&error, code);
    std::string message = zip_error_strerror(&error);
    zip_error_fini(&error);
    return message;
}

} // namespace

ZipArchive::~ZipArchive() {
    close();
}

ZipArchive::ZipArchive(ZipArchive&& other) noexcept
    : m_archive(other.m_archive)
    , m_path(std::move(other.m_path))
{
    other.m_archive = nullptr;
}

ZipArchive& ZipArchive::operator=(ZipArchive&& other) noexcept {
    if (this != &other) {
        close();
        m_archive = other.m_archive;
        m_path = std::move(other.m_path);
        other.m_archive = nullptr;
    }
    return *this;
}

void ZipArchive::open(const std::filesystem::path& path) {
    close();
    
    int err = 0;
    zip_t* archive = zip_open(path.string().c_str(), ZIP_RDONLY, &err);
    if (!archive) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot open archive " + path.string() + ": " + openErrorMessage(err));
    }
    
    m_archive = archive;
    m_path = path;
}

void ZipArchive::close() {
    if (m_archive) {
        // Read-only handle, nothing to write back
        zip_discard(m_archive);
        m_archive = nullptr;
    }
}

std::vector<ZipEntry> ZipArchive::entries() const {
    std::vector<ZipEntry> result;
    if (!m_archive) {
        return result;
    }
    
    zip_int64_t count = zip_get_num_entries(m_archive, 0);
    result.reserve(count > 0 ? static_cast<size_t>(count) : 0);
    
    for (zip_int64_t i = 0; i < count; ++i) {
        zip_stat_t stat;
        zip_stat_init(&stat);
        if (zip_stat_index(m_archive, static_cast<zip_uint64_t>(i), 0, &stat) != 0) {
            TAKEOUT_LOG_WARN("Cannot stat entry {} of {}: {}", i, m_path.string(),
                             zip_strerror(m_archive));
            continue;
        }
        
        ZipEntry entry;
        entry.index = static_cast<uint64_t>(i);
        if (stat.valid & ZIP_STAT_NAME) {
            entry.name = stat.name;
        }
        if (stat.valid & ZIP_STAT_SIZE) {
            entry.size = stat.size;
        }
        if ((stat.valid & ZIP_STAT_MTIME) && stat.mtime > 0) {
            entry.modifiedAt = std::chrono::system_clock::from_time_t(stat.mtime);
        }
        entry.isDirectory = !entry.name.empty() && entry.name.back() == '/';
        result.push_back(std::move(entry));
    }
    
    return result;
}

std::vector<uint8_t> ZipArchive::read(const ZipEntry& entry) const {
    if (!m_archive) {
        throw TransferError(ErrorKind::TransientIO, "Archive is not open");
    }
    
    // The recorded size of a damaged entry can be anything
    std::vector<uint8_t> content;
    try {
        content.resize(static_cast<size_t>(entry.size));
    } catch (const std::length_error&) {
        throw TransferError(ErrorKind::TransientIO,
            "Entry " + entry.name + " is too large to load (" + std::to_string(entry.size) + " bytes)");
    } catch (const std::bad_alloc&) {
        throw TransferError(ErrorKind::TransientIO,
            "Out of memory loading entry " + entry.name + " (" + std::to_string(entry.size) + " bytes)");
    }
    
    zip_file_t* file = zip_fopen_index(m_archive, entry.index, 0);
    if (!file) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot open entry " + entry.name + ": " + zip_strerror(m_archive));
    }
    
    zip_int64_t total = 0;
    while (total < static_cast<zip_int64_t>(content.size())) {
        zip_int64_t n = zip_fread(file, content.data() + total, content.size() - static_cast<size_t>(total));
        if (n <= 0) {
            break;
        }
        total += n;
    }
    
    // A trailing read reports CRC mismatches once the whole entry has been inflated
    char extra;
    zip_int64_t tail = zip_fread(file, &extra, 1);
    std::string fileError = zip_file_strerror(file);
    zip_fclose(file);
    
    if (tail < 0 || total != static_cast<zip_int64_t>(content.size())) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot read entry " + entry.name + " of " + m_path.string() + ": " + fileError);
    }
    if (tail > 0) {
        throw TransferError(ErrorKind::TransientIO,
            "Entry " + entry.name + " is larger than its recorded size");
    }
    
    return content;
}

} // namespace takeout::core::archive
