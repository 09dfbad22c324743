/**
 * RangeDownloader.cpp
 */

#include "RangeDownloader.hpp"
#include "../Config.hpp"
#include "../Logger.hpp"
#include "../../utils/FileUtils.hpp"
#include "../../utils/HashUtils.hpp"
#include "../../utils/StringUtils.hpp"

#include <algorithm>
#include <fstream>
#include <vector>
#include <optional>

namespace takeout::core::downloader {

using utils::FileUtils;
using utils::HashUtils;
using utils::StringUtils;

namespace {

/**
 * Problem with a response head, if any
 */
struct ResponseProblem {
    ErrorKind kind;
    std::string message;
};

std::optional<ResponseProblem> checkResponse(const source::RangeResponse& response, int64_t offset) {
    using source::RangeStatus;

    if (response.status == RangeStatus::Full) {
        if (offset > 0) {
            return ResponseProblem{ErrorKind::ProtocolViolation,
                "server ignored the range request at offset " + std::to_string(offset) +
                " and restarted from byte 0"};
        }
        return std::nullopt;
    }

    if (response.status == RangeStatus::Partial) {
        if (response.rangeStart < 0) {
            return ResponseProblem{ErrorKind::ProtocolViolation,
                "partial response without a Content-Range header"};
        }
        if (response.rangeStart != offset) {
            return ResponseProblem{ErrorKind::ProtocolViolation,
                "partial response starts at byte " + std::to_string(response.rangeStart) +
                ", expected " + std::to_string(offset)};
        }
        return std::nullopt;
    }

    if (response.statusCode == 416) {
        return ResponseProblem{ErrorKind::ProtocolViolation,
            "range starting at byte " + std::to_string(offset) + " not satisfiable (server reports " +
            (response.totalSize >= 0 ? std::to_string(response.totalSize) : std::string("unknown")) +
            " bytes)"};
    }

    if (response.statusCode >= 200 && response.statusCode < 400) {
        return ResponseProblem{ErrorKind::ProtocolViolation,
            "unexpected HTTP " + std::to_string(response.statusCode) + " for a ranged read"};
    }
    return ResponseProblem{ErrorKind::TransientIO, "HTTP " + std::to_string(response.statusCode)};
}

} // namespace

RangeDownloader::RangeDownloader(source::SourceStoreClient& source, std::filesystem::path downloadDir)
    : m_source(source)
    , m_downloadDir(std::move(downloadDir))
{
    auto& config = Config::instance();
    int chunkSize = config.get<int>("downloads.chunkSize", 32768);
    m_chunkSize = chunkSize > 0 ? static_cast<size_t>(chunkSize) : 32768;
    m_verifyChecksums = config.get<bool>("downloads.verifyChecksums", true);
}

std::filesystem::path RangeDownloader::localPathFor(const std::string& name) const {
    return m_downloadDir / StringUtils::sanitizeFileName(name);
}

int64_t RangeDownloader::measure(const std::filesystem::path& path) const {
    try {
        return FileUtils::physicalSize(path);
    } catch (const std::filesystem::filesystem_error& e) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot inspect " + path.string() + ": " + e.what());
    }
}

TransferOutcome RangeDownloader::downloadFile(const CancellationToken& cancel, FileUnit& file) {
    if (file.downloaded) {
        TAKEOUT_LOG_DEBUG("Already downloaded: {}", file.name);
        return TransferOutcome::Completed;
    }

    std::error_code ec;
    std::filesystem::create_directories(m_downloadDir, ec);
    if (ec) {
        throw TransferError(ErrorKind::TransientIO,
            "Cannot create download directory " + m_downloadDir.string() + ": " + ec.message());
    }

    const std::filesystem::path target = localPathFor(file.name);
    file.localPath = target.string();

    const int64_t offset = measure(target);
    if (offset < file.bytesTransferred) {
        TAKEOUT_LOG_WARN("Local copy of {} is shorter than recorded ({} < {}), resuming from disk",
                         file.name, offset, file.bytesTransferred);
    }
    file.bytesTransferred = offset;

    // A crash between the last write and the completion flag leaves a full file behind
    if (file.expectedSize > 0 && offset >= file.expectedSize) {
        if (offset > file.expectedSize) {
            TAKEOUT_LOG_WARN("Local copy of {} is larger than expected ({} > {})",
                             file.name, offset, file.expectedSize);
        }
        file.bytesTransferred = file.expectedSize;
        TAKEOUT_LOG_INFO("Found complete local copy of {}", file.name);
        finish(file, target);
        return TransferOutcome::Completed;
    }

    if (cancel.isCancelled()) {
        return TransferOutcome::Cancelled;
    }

    if (offset > 0) {
        TAKEOUT_LOG_INFO("Resuming {} at {} of {}", file.name,
                         StringUtils::formatBytes(offset),
                         StringUtils::formatBytes(file.expectedSize));
    } else {
        TAKEOUT_LOG_INFO("Downloading {} ({})", file.name, StringUtils::formatBytes(file.expectedSize));
    }

    std::ofstream out;
    std::vector<char> pending;
    pending.reserve(m_chunkSize);

    std::optional<ResponseProblem> problem;
    bool cancelled = false;
    bool alreadyComplete = false;

    // Write one buffered chunk and account for it
    auto writePending = [&]() -> bool {
        if (pending.empty()) {
            return true;
        }
        out.write(pending.data(), static_cast<std::streamsize>(pending.size()));
        out.flush();
        if (!out) {
            problem = ResponseProblem{ErrorKind::TransientIO, "write to " + target.string() + " failed"};
            return false;
        }
        file.bytesTransferred += static_cast<int64_t>(pending.size());
        pending.clear();
        return true;
    };

    source::RangeHandlers handlers;
    handlers.onResponse = [&](const source::RangeResponse& response) -> bool {
        // Range starting at the end of an object of unknown size
        if (response.statusCode == 416 && offset > 0 && file.expectedSize <= 0 &&
            response.totalSize == offset) {
            alreadyComplete = true;
            return false;
        }

        problem = checkResponse(response, offset);
        if (problem) {
            return false;
        }

        auto mode = std::ios::binary | (offset > 0 ? std::ios::app : std::ios::trunc);
        out.open(target, mode);
        if (!out.is_open()) {
            problem = ResponseProblem{ErrorKind::TransientIO, "cannot open " + target.string() + " for writing"};
            return false;
        }
        return true;
    };

    handlers.onData = [&](const char* data, size_t size) -> bool {
        if (cancel.isCancelled()) {
            cancelled = true;
            return false;
        }

        int64_t received = file.bytesTransferred + static_cast<int64_t>(pending.size() + size);
        if (file.expectedSize > 0 && received > file.expectedSize) {
            problem = ResponseProblem{ErrorKind::ProtocolViolation,
                "server sent more than the expected " + std::to_string(file.expectedSize) + " bytes"};
            pending.clear();
            return false;
        }

        while (size > 0) {
            size_t take = std::min(size, m_chunkSize - pending.size());
            pending.insert(pending.end(), data, data + take);
            data += take;
            size -= take;

            if (pending.size() == m_chunkSize) {
                if (!writePending()) {
                    return false;
                }
                reportProgress(file, false);
            }
        }
        return true;
    };

    source::FetchResult result = m_source.fetchRange(file.sourceId, offset, handlers);

    // Bytes received before an interruption are valid and kept for the next resume
    if (out.is_open()) {
        if (!problem) {
            writePending();
        }
        out.close();
    }

    std::error_code sizeEc;
    auto physical = std::filesystem::exists(target, sizeEc) ? std::filesystem::file_size(target, sizeEc) : 0;
    if (!sizeEc) {
        file.bytesTransferred = static_cast<int64_t>(physical);
    }

    if (problem) {
        TAKEOUT_LOG_ERROR("Download of {} failed: {}", file.name, problem->message);
        throw TransferError(problem->kind, "Download of " + file.name + " failed: " + problem->message);
    }

    if (cancelled) {
        TAKEOUT_LOG_INFO("Download of {} paused at {}", file.name, StringUtils::formatBytes(file.bytesTransferred));
        reportProgress(file, true);
        return TransferOutcome::Cancelled;
    }

    if (alreadyComplete) {
        TAKEOUT_LOG_INFO("Server reports {} already complete at {} bytes", file.name, offset);
        finish(file, target);
        return TransferOutcome::Completed;
    }

    if (!result.transportOk) {
        std::string reason = result.error.empty() ? "transfer interrupted" : result.error;
        TAKEOUT_LOG_ERROR("Download of {} interrupted at {} bytes: {}", file.name, file.bytesTransferred, reason);
        throw TransferError(ErrorKind::TransientIO, "Download of " + file.name + " failed: " + reason);
    }

    if (file.expectedSize > 0 && file.bytesTransferred < file.expectedSize) {
        throw TransferError(ErrorKind::TransientIO,
            "Download of " + file.name + " ended early at " + std::to_string(file.bytesTransferred) +
            " of " + std::to_string(file.expectedSize) + " bytes");
    }

    finish(file, target);
    return TransferOutcome::Completed;
}

void RangeDownloader::finish(FileUnit& file, const std::filesystem::path& path) {
    if (m_verifyChecksums && !file.checksum.empty()) {
        std::string actual = HashUtils::md5File(path.string());
        if (actual.empty()) {
            throw TransferError(ErrorKind::TransientIO, "Cannot read " + path.string() + " for verification");
        }

        if (StringUtils::toLower(actual) != StringUtils::toLower(file.checksum)) {
            std::error_code ec;
            std::filesystem::remove(path, ec);
            file.bytesTransferred = 0;
            TAKEOUT_LOG_ERROR("Checksum mismatch for {}: expected {}, got {}; local copy discarded",
                              file.name, file.checksum, actual);
            throw TransferError(ErrorKind::ProtocolViolation, "Checksum mismatch for " + file.name);
        }
        TAKEOUT_LOG_DEBUG("Checksum verified for {}", file.name);
    }

    file.downloaded = true;
    reportProgress(file, true);
    TAKEOUT_LOG_INFO("Downloaded {} ({})", file.name, StringUtils::formatBytes(file.bytesTransferred));
}

void RangeDownloader::reportProgress(const FileUnit& file, bool force) {
    if (!m_progressCallback) {
        return;
    }

    auto now = std::chrono::steady_clock::now();
    if (!force && now - m_lastReport < m_progressInterval) {
        return;
    }
    m_lastReport = now;
    m_progressCallback(file);
}

} // namespace takeout::core::downloader
