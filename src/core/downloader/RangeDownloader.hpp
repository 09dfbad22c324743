#pragma once

/**
 * RangeDownloader.hpp
 *
 * Resumable download of one source archive into the local download directory.
 */

#include "../models/Job.hpp"
#include "../CancellationToken.hpp"
#include "../TransferError.hpp"
#include "../source/SourceStore.hpp"

#include <filesystem>
#include <functional>
#include <chrono>

namespace takeout::core::downloader {

/**
 * Byte progress callback, invoked with the file being downloaded
 */
using ByteProgressCallback = std::function<void(const FileUnit& file)>;

/**
 * RangeDownloader - Range-resumable single file download
 *
 * The local file's physical length is the resume offset; the in-memory
 * bytesTransferred counter is re-measured from disk on every call.
 * Bytes are written in fixed-size chunks and the counter is advanced
 * after each chunk reaches the file.
 */
class RangeDownloader {
public:
    /**
     * Constructor
     * @param source Remote store client
     * @param downloadDir Directory holding the local copies
     */
    RangeDownloader(source::SourceStoreClient& source, std::filesystem::path downloadDir);

    /**
     * Download or resume one file
     * @param cancel Checked before each chunk
     * @param file Unit to download; progress fields are updated in place
     * @return Completed, or Cancelled with the partial file left in place
     * @throws TransferError TransientIO on network/disk failure,
     *         ProtocolViolation on an unacceptable response or checksum mismatch
     */
    TransferOutcome downloadFile(const CancellationToken& cancel, FileUnit& file);

    /**
     * Deterministic local path for a display name
     */
    std::filesystem::path localPathFor(const std::string& name) const;

    void setProgressCallback(ByteProgressCallback callback) { m_progressCallback = std::move(callback); }
    void setChunkSize(size_t bytes) { m_chunkSize = bytes > 0 ? bytes : 1; }
    void setVerifyChecksums(bool verify) { m_verifyChecksums = verify; }
    void setProgressInterval(std::chrono::milliseconds interval) { m_progressInterval = interval; }

    size_t chunkSize() const { return m_chunkSize; }

private:
    /**
     * Physical length of the local file, 0 if missing
     */
    int64_t measure(const std::filesystem::path& path) const;

    /**
     * Verify the checksum if one is known, then flag the file complete
     */
    void finish(FileUnit& file, const std::filesystem::path& path);

    void reportProgress(const FileUnit& file, bool force);

    source::SourceStoreClient& m_source;
    std::filesystem::path m_downloadDir;

    size_t m_chunkSize;
    bool m_verifyChecksums;
    ByteProgressCallback m_progressCallback;
    std::chrono::milliseconds m_progressInterval{250};
    std::chrono::steady_clock::time_point m_lastReport{};
};

} // namespace takeout::core::downloader
