#pragma once

/**
 * SourceStore.hpp
 * 
 * Contract of the remote object store that holds the source archives.
 * Credentials are owned by the concrete client.
 */

#include <string>
#include <vector>
#include <functional>
#include <cstdint>

namespace takeout::core::source {

/**
 * Archive listed by the store
 */
struct ArchiveInfo {
    std::string id;
    std::string name;
    int64_t size{0};            // 0 if unknown
    std::string md5Checksum;    // May be empty
};

/**
 * Classification of the response to a ranged read
 */
enum class RangeStatus {
    Full,       // 200, whole object from byte 0
    Partial,    // 206, object from the requested offset
    Other
};

/**
 * Response head, delivered before the first body byte
 */
struct RangeResponse {
    RangeStatus status{RangeStatus::Other};
    int statusCode{0};
    int64_t rangeStart{-1};     // From Content-Range, -1 if absent
    int64_t totalSize{-1};      // From Content-Range, -1 if absent
};

/**
 * Streaming callbacks for fetchRange. Returning false from either aborts the transfer.
 */
struct RangeHandlers {
    std::function<bool(const RangeResponse& response)> onResponse;
    std::function<bool(const char* data, size_t size)> onData;
};

/**
 * Transport-level result of fetchRange
 */
struct FetchResult {
    bool transportOk{false};    // Body received to the end
    bool aborted{false};        // A handler returned false
    int statusCode{0};
    std::string error;
};

class SourceStoreClient {
public:
    virtual ~SourceStoreClient() = default;
    
    /**
     * List archives eligible for import
     */
    virtual std::vector<ArchiveInfo> listEligibleArchives() = 0;
    
    /**
     * Read an object starting at startByte. No Range header is sent when
     * startByte is 0. handlers.onResponse is invoked exactly once before any data.
     */
    virtual FetchResult fetchRange(const std::string& id, int64_t startByte,
                                   const RangeHandlers& handlers) = 0;
};

} // namespace takeout::core::source
