#pragma once

/**
 * TransferError.hpp
 * 
 * Exception type raised by the transfer pipeline for fatal failures.
 * Cancellation is not an error and is never reported through this type.
 */

#include <stdexcept>
#include <string>

namespace takeout::core {

/**
 * Failure classification
 */
enum class ErrorKind {
    TransientIO,        // Network or disk failure, safe to resume on next run
    ProtocolViolation,  // Unexpected response shape from the source store
    EntryUpload,        // Destination rejected a single media item
    CorruptCheckpoint   // On-disk job record could not be read
};

inline const char* errorKindToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::TransientIO:       return "transient-io";
        case ErrorKind::ProtocolViolation: return "protocol-violation";
        case ErrorKind::EntryUpload:       return "entry-upload";
        case ErrorKind::CorruptCheckpoint: return "corrupt-checkpoint";
        default:                           return "unknown";
    }
}

class TransferError : public std::runtime_error {
public:
    TransferError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), m_kind(kind) {}
    
    ErrorKind kind() const { return m_kind; }

private:
    ErrorKind m_kind;
};

/**
 * Result of a worker operation that did not fail
 */
enum class TransferOutcome {
    Completed,
    Cancelled
};

} // namespace takeout::core
