#pragma once

// Shared fixtures for the test suite: temporary directories, zip
// builders and in-memory source/ingest services.

#include "core/CancellationToken.hpp"
#include "core/TransferError.hpp"
#include "core/source/SourceStore.hpp"
#include "core/ingest/IngestClient.hpp"
#include "core/state/CheckpointStore.hpp"
#include "utils/HashUtils.hpp"

#include <zip.h>

#include <algorithm>
#include <atomic>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <random>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace takeout::test {

namespace fs = std::filesystem;

/**
 * Unique directory under the system temp dir, removed on destruction
 */
class TempDir {
public:
    TempDir() {
        std::random_device rd;
        std::ostringstream name;
        name << "takeout-test-" << std::hex << rd() << rd();
        m_path = fs::temp_directory_path() / name.str();
        fs::create_directories(m_path);
    }

    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }
    fs::path operator/(const std::string& name) const { return m_path / name; }

private:
    fs::path m_path;
};

inline std::string readAll(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    std::ostringstream oss;
    oss << file.rdbuf();
    return oss.str();
}

inline void writeAll(const fs::path& path, const std::string& content) {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    file.write(content.data(), static_cast<std::streamsize>(content.size()));
}

/**
 * Deterministic pseudo-random payload
 */
inline std::string makePayload(size_t size, unsigned seed = 7) {
    std::mt19937 gen(seed);
    std::string data(size, '\0');
    for (auto& c : data) {
        c = static_cast<char>(gen() & 0xff);
    }
    return data;
}

using ZipEntries = std::vector<std::pair<std::string, std::string>>;

/**
 * Write a zip archive; names ending in '/' become directory entries
 */
inline void writeZip(const fs::path& path, const ZipEntries& entries) {
    int err = 0;
    zip_t* archive = zip_open(path.string().c_str(), ZIP_CREATE | ZIP_TRUNCATE, &err);
    if (!archive) {
        throw std::runtime_error("cannot create " + path.string());
    }

    for (const auto& [name, content] : entries) {
        if (!name.empty() && name.back() == '/') {
            if (zip_dir_add(archive, name.c_str(), ZIP_FL_ENC_UTF_8) < 0) {
                zip_discard(archive);
                throw std::runtime_error("cannot add directory " + name);
            }
            continue;
        }

        // The buffer must stay valid until zip_close; entries outlives the archive handle
        zip_source_t* source = zip_source_buffer(archive, content.data(), content.size(), 0);
        if (!source) {
            zip_discard(archive);
            throw std::runtime_error("cannot create source for " + name);
        }
        if (zip_file_add(archive, name.c_str(), source, ZIP_FL_OVERWRITE | ZIP_FL_ENC_UTF_8) < 0) {
            zip_source_free(source);
            zip_discard(archive);
            throw std::runtime_error("cannot add " + name);
        }
    }

    if (zip_close(archive) != 0) {
        std::string message = zip_strerror(archive);
        zip_discard(archive);
        throw std::runtime_error("cannot write " + path.string() + ": " + message);
    }
}

/**
 * Archive with `media` photos and `sidecars` JSON metadata files
 */
inline ZipEntries takeoutEntries(int media, int sidecars, const std::string& album = "Album") {
    ZipEntries entries;
    entries.emplace_back("Takeout/", "");
    entries.emplace_back("Takeout/Google Photos/", "");
    for (int i = 0; i < media; ++i) {
        std::string name = "Takeout/Google Photos/" + album + "/IMG_" + std::to_string(1000 + i) + ".jpg";
        entries.emplace_back(name, album + " photo " + std::to_string(i));
    }
    for (int i = 0; i < sidecars; ++i) {
        std::string name = "Takeout/Google Photos/" + album + "/IMG_" + std::to_string(1000 + i) + ".jpg.json";
        entries.emplace_back(name, "{\"title\": \"IMG_" + std::to_string(1000 + i) + "\"}");
    }
    return entries;
}

/**
 * In-memory object store honouring byte ranges
 */
class FakeSourceStore : public core::source::SourceStoreClient {
public:
    void addObject(const std::string& id, const std::string& name, std::string content) {
        m_names[id] = name;
        m_objects[id] = std::move(content);
    }

    std::vector<core::source::ArchiveInfo> listEligibleArchives() override {
        std::vector<core::source::ArchiveInfo> result;
        for (const auto& [id, content] : m_objects) {
            result.push_back({id, m_names[id], static_cast<int64_t>(content.size()),
                              utils::HashUtils::md5String(content)});
        }
        return result;
    }

    core::source::FetchResult fetchRange(const std::string& id, int64_t startByte,
                                         const core::source::RangeHandlers& handlers) override {
        using core::source::RangeStatus;

        ++fetchCount;
        requestedOffsets.push_back(startByte);

        core::source::FetchResult result;
        core::source::RangeResponse response;

        auto it = m_objects.find(id);
        if (it == m_objects.end()) {
            response.statusCode = 404;
            handlers.onResponse(response);
            result.statusCode = 404;
            result.transportOk = true;
            return result;
        }

        const std::string& data = it->second;
        const auto size = static_cast<int64_t>(data.size());
        int64_t begin = 0;

        if (startByte > 0 && !ignoreRange) {
            if (startByte >= size || rangeNotSatisfiableTotal) {
                response.statusCode = 416;
                response.totalSize = rangeNotSatisfiableTotal.value_or(size);
                handlers.onResponse(response);
                result.statusCode = 416;
                result.transportOk = true;
                return result;
            }
            response.status = RangeStatus::Partial;
            response.statusCode = 206;
            response.rangeStart = startByte;
            response.totalSize = size;
            begin = startByte;
        } else {
            response.status = RangeStatus::Full;
            response.statusCode = 200;
        }
        if (rangeStartOverride) {
            response.rangeStart = *rangeStartOverride;
        }

        result.statusCode = response.statusCode;
        if (!handlers.onResponse(response)) {
            result.aborted = true;
            return result;
        }

        int64_t delivered = 0;
        int64_t pos = begin;
        while (pos < size) {
            if (failAfterBytes && delivered >= *failAfterBytes) {
                failAfterBytes.reset();
                result.error = "connection reset by peer";
                return result;
            }

            int64_t n = std::min<int64_t>(deliverySize, size - pos);
            if (failAfterBytes) {
                n = std::min<int64_t>(n, *failAfterBytes - delivered);
            }
            if (!handlers.onData(data.data() + pos, static_cast<size_t>(n))) {
                result.aborted = true;
                return result;
            }
            pos += n;
            delivered += n;

            if (cancelAfterBytes && delivered >= *cancelAfterBytes && cancelToken) {
                cancelAfterBytes.reset();
                cancelToken->cancel();
            }
        }

        if (extraBytes > 0) {
            std::string tail(static_cast<size_t>(extraBytes), 'x');
            if (!handlers.onData(tail.data(), tail.size())) {
                result.aborted = true;
                return result;
            }
        }

        result.transportOk = true;
        return result;
    }

    // Behaviour switches
    bool ignoreRange{false};                    // Answer every request with 200 from byte 0
    std::optional<int64_t> rangeStartOverride;  // Misreport the Content-Range start
    std::optional<int64_t> rangeNotSatisfiableTotal;  // Answer ranged reads with 416 and this length
    std::optional<int64_t> failAfterBytes;      // One-shot connection drop
    std::optional<int64_t> cancelAfterBytes;    // One-shot cancellation trigger
    std::optional<core::CancellationToken> cancelToken;
    int64_t deliverySize{4096};
    int64_t extraBytes{0};                      // Trailing bytes beyond the object

    // Observations
    int fetchCount{0};
    std::vector<int64_t> requestedOffsets;

private:
    std::map<std::string, std::string> m_objects;
    std::map<std::string, std::string> m_names;
};

/**
 * In-memory ingestion service with content-based duplicate detection
 */
class FakeIngestClient : public core::ingest::IngestClient {
public:
    core::ingest::UploadResult uploadAsset(const core::ingest::AssetUpload& asset) override {
        using core::ingest::UploadStatus;

        ++callCount;
        uploadedNames.push_back(asset.filename);
        lastUpload = asset;
        lastContent = asset.content ? *asset.content : std::vector<uint8_t>{};

        core::ingest::UploadResult result;
        if (failingNames.count(asset.filename) > 0) {
            result.status = UploadStatus::Failed;
            result.statusCode = 500;
            result.message = "rejected";
            maybeCancel();
            return result;
        }

        if (!stored.insert(asset.externalId).second) {
            ++duplicateCount;
            result.status = UploadStatus::Duplicate;
            result.statusCode = 200;
            maybeCancel();
            return result;
        }

        ++createdCount;
        result.status = UploadStatus::Created;
        result.statusCode = 201;
        maybeCancel();
        return result;
    }

    std::set<std::string> failingNames;
    std::set<std::string> stored;               // External ids present on the server
    std::optional<int> cancelAfterCalls;
    std::optional<core::CancellationToken> cancelToken;

    int callCount{0};
    int createdCount{0};
    int duplicateCount{0};
    std::vector<std::string> uploadedNames;
    core::ingest::AssetUpload lastUpload;
    std::vector<uint8_t> lastContent;

private:
    void maybeCancel() {
        if (cancelAfterCalls && callCount >= *cancelAfterCalls && cancelToken) {
            cancelAfterCalls.reset();
            cancelToken->cancel();
        }
    }
};

/**
 * Checkpoint store whose writes start failing after a number of saves
 */
class FailingCheckpointStore : public core::state::CheckpointStore {
public:
    FailingCheckpointStore(fs::path path, size_t allowedSaves)
        : CheckpointStore(std::move(path)), m_allowed(allowedSaves) {}

    void save(Job& job) override {
        if (m_attempts++ >= m_allowed) {
            throw core::TransferError(core::ErrorKind::TransientIO, "disk full");
        }
        CheckpointStore::save(job);
    }

private:
    size_t m_allowed;
    size_t m_attempts{0};
};

} // namespace takeout::test
