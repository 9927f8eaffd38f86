#pragma once

#include "dfm/core/result.hpp"

#include <string>

namespace dfm {

/**
 * @brief Failure taxonomy shared by the sync layer
 *
 * Only Transient errors are retried (range fetch attempts). Everything
 * else is terminal for the file being synchronized.
 */
enum class ErrorKind {
    Transient,     ///< Network error or unexpected HTTP status on a range request
    LocalIo,       ///< Permission, disk full, rename failure on the local side
    Metadata,      ///< Remote item not found or unreadable
    Checkpoint,    ///< Sidecar persistence failure (never escalated)
    InvalidItem,   ///< Remote item is neither a file nor a directory
    Verification,  ///< Staging artifact missing, empty or of the wrong size
    Config,        ///< Rejected options or arguments
    InvalidState   ///< Operation not allowed in the current session state
};

struct SyncError {
    ErrorKind kind = ErrorKind::Transient;
    std::string message;

    bool retryable() const noexcept { return kind == ErrorKind::Transient; }
};

inline const char* to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Transient: return "transient";
        case ErrorKind::LocalIo: return "local_io";
        case ErrorKind::Metadata: return "metadata";
        case ErrorKind::Checkpoint: return "checkpoint";
        case ErrorKind::InvalidItem: return "invalid_item";
        case ErrorKind::Verification: return "verification";
        case ErrorKind::Config: return "config";
        case ErrorKind::InvalidState: return "invalid_state";
    }
    return "unknown";
}

inline SyncError make_error(ErrorKind kind, std::string message) {
    return SyncError{kind, std::move(message)};
}

template<typename T>
Result<T, SyncError> Fail(ErrorKind kind, std::string message) {
    return Err<T>(make_error(kind, std::move(message)));
}

} // namespace dfm
