#pragma once

#include "dfm/core/error.hpp"
#include "dfm/core/hash.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dfm::sync {

/**
 * @brief Inclusive byte range [start, end]
 */
struct ChunkRange {
    std::uint64_t start = 0;
    std::uint64_t end = 0;

    [[nodiscard]] std::uint64_t size() const noexcept { return end - start + 1; }

    bool operator==(const ChunkRange& other) const noexcept {
        return start == other.start && end == other.end;
    }
    bool operator!=(const ChunkRange& other) const noexcept { return !(*this == other); }
};

/// Window digest -> position of a window with that content (last one seen)
using ChunkMap = std::unordered_map<hash::ChunkDigest, ChunkRange, hash::ChunkDigestHash>;

/// Sorted, merged, non-overlapping ranges to download; empty means no byte differs
using DiffPlan = std::vector<ChunkRange>;

enum class TransferStatus {
    Completed,
    Failed
};

inline const char* to_string(TransferStatus status) {
    return status == TransferStatus::Completed ? "completed" : "failed";
}

/**
 * @brief Result of one file attempt, recorded in the run report
 */
struct TransferOutcome {
    std::string path;                 ///< Destination path
    std::uint64_t declared_size = 0;
    std::uint64_t bytes_transferred = 0;
    std::string checksum;             ///< SHA-256 hex, empty on failure
    TransferStatus status = TransferStatus::Failed;
    std::size_t changed_range_count = 0;
    std::optional<std::string> error;
};

/**
 * @brief Progress marker persisted beside a destination file
 */
struct CheckpointState {
    std::filesystem::path destination_path;
    std::uint64_t last_committed_offset = 0;
};

/**
 * @brief Why a single range could not be fetched
 */
struct TransferFailure {
    ChunkRange range;
    SyncError last_error;
    int attempts = 0;
};

enum class FileState {
    Open,
    Diffed,
    Unchanged,
    Staging,
    Verified,
    Committed,
    Failed
};

inline const char* to_string(FileState state) {
    switch (state) {
        case FileState::Open: return "open";
        case FileState::Diffed: return "diffed";
        case FileState::Unchanged: return "unchanged";
        case FileState::Staging: return "staging";
        case FileState::Verified: return "verified";
        case FileState::Committed: return "committed";
        case FileState::Failed: return "failed";
    }
    return "unknown";
}

} // namespace dfm::sync
