/**
 * FileUtils.cpp
 * 
 * File system operations used by the checkpoint and download paths.
 */

#include "FileUtils.hpp"

#include <fstream>
#include <sstream>
#include <cerrno>

#ifdef _WIN32
#include <windows.h>
#else
#include <fcntl.h>
#include <unistd.h>
#include <sys/file.h>
#include <sys/stat.h>
#endif

namespace takeout::utils {

// -- Directory operations --

bool FileUtils::createPrivateDirectory(const fs::path& path, std::error_code& ec) {
    ec.clear();
    if (!fs::exists(path, ec)) {
        if (ec) return false;
        fs::create_directories(path, ec);
        if (ec) return false;
    }
    fs::permissions(path, fs::perms::owner_all, fs::perm_options::replace, ec);
    return !ec;
}

// -- File operations --

int64_t FileUtils::physicalSize(const fs::path& path) {
    std::error_code ec;
    auto status = fs::status(path, ec);
    if (ec || !fs::exists(status)) {
        if (ec && ec != std::errc::no_such_file_or_directory) {
            throw fs::filesystem_error("cannot stat file", path, ec);
        }
        return 0;
    }
    return static_cast<int64_t>(fs::file_size(path));
}

// -- Read/Write --

std::optional<std::string> FileUtils::readFile(const fs::path& path, std::error_code& ec) {
    ec.clear();
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        ec = std::error_code(errno ? errno : ENOENT, std::generic_category());
        return std::nullopt;
    }
    std::ostringstream oss;
    oss << file.rdbuf();
    if (file.bad()) {
        ec = std::make_error_code(std::errc::io_error);
        return std::nullopt;
    }
    return oss.str();
}

bool FileUtils::writeFileAtomic(const fs::path& path, const std::string& content,
                                std::error_code& ec, unsigned mode) {
    ec.clear();
    fs::path tempPath = path;
    tempPath += ".tmp";

#ifdef _WIN32
    (void)mode;
    {
        std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
        if (!file.is_open()) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        file.write(content.data(), static_cast<std::streamsize>(content.size()));
        file.flush();
        if (!file) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
    }
#else
    int fd = ::open(tempPath.c_str(), O_CREAT | O_WRONLY | O_TRUNC | O_CLOEXEC, static_cast<mode_t>(mode));
    if (fd < 0) {
        ec = std::error_code(errno, std::generic_category());
        return false;
    }
    
    const char* data = content.data();
    size_t remaining = content.size();
    while (remaining > 0) {
        ssize_t written = ::write(fd, data, remaining);
        if (written < 0) {
            if (errno == EINTR) continue;
            ec = std::error_code(errno, std::generic_category());
            ::close(fd);
            ::unlink(tempPath.c_str());
            return false;
        }
        data += written;
        remaining -= static_cast<size_t>(written);
    }
    
    // umask may have narrowed the creation mode; fchmod sets it exactly
    if (::fchmod(fd, static_cast<mode_t>(mode)) != 0 || ::fsync(fd) != 0) {
        ec = std::error_code(errno, std::generic_category());
        ::close(fd);
        ::unlink(tempPath.c_str());
        return false;
    }
    if (::close(fd) != 0) {
        ec = std::error_code(errno, std::generic_category());
        ::unlink(tempPath.c_str());
        return false;
    }
#endif

    fs::rename(tempPath, path, ec);
    if (ec) {
        std::error_code ignored;
        fs::remove(tempPath, ignored);
        return false;
    }

#ifndef _WIN32
    // Persist the rename itself
    fs::path dir = path.has_parent_path() ? path.parent_path() : fs::path(".");
    int dirFd = ::open(dir.c_str(), O_RDONLY | O_DIRECTORY | O_CLOEXEC);
    if (dirFd >= 0) {
        ::fsync(dirFd);
        ::close(dirFd);
    }
#endif
    return true;
}

// -- FileLock --

FileLock::FileLock(const fs::path& path) : m_path(path) {
#ifdef _WIN32
    m_handle = CreateFileA(path.string().c_str(), GENERIC_WRITE, 0, nullptr, OPEN_ALWAYS, FILE_ATTRIBUTE_NORMAL, nullptr);
    m_locked = (m_handle != INVALID_HANDLE_VALUE);
    if (!m_locked) m_handle = nullptr;
#else
    m_fd = ::open(path.c_str(), O_CREAT | O_WRONLY | O_CLOEXEC, 0600);
    if (m_fd >= 0) {
        m_locked = flock(m_fd, LOCK_EX | LOCK_NB) == 0;
        if (!m_locked) {
            ::close(m_fd);
            m_fd = -1;
        }
    }
#endif
}

FileLock::~FileLock() { unlock(); }

void FileLock::unlock() {
    if (!m_locked) return;
#ifdef _WIN32
    if (m_handle) { CloseHandle(m_handle); m_handle = nullptr; }
#else
    if (m_fd >= 0) { flock(m_fd, LOCK_UN); ::close(m_fd); m_fd = -1; }
#endif
    m_locked = false;
}

} // namespace takeout::utils
