/**
 * @file events.hpp
 * @brief Events emitted by the sync engine
 *
 * NAMING CONVENTION:
 * Events are past-tense or descriptive facts about a transition. Each one
 * is rendered by LoggerComponent as a flat record whose "event" field is
 * its kEventName.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace dfm::events {

// ════════════════════════════════════════════════════════
// Walk / listing events
// ════════════════════════════════════════════════════════

struct ListingContentsEvent {
    std::string path;
    std::size_t item_count = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "listing_contents";
};

struct EmptyDirectoryEvent {
    std::string path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "empty_directory";
};

/**
 * @brief One entry of a `list` command
 */
struct ItemInfoEvent {
    std::string name;
    std::string path;
    std::string kind;        // "file", "directory" or "unsupported"
    std::uint64_t size = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "item_info";
};

/**
 * @brief A remote item that is neither a file nor a directory was skipped
 */
struct InvalidItemEvent {
    std::string name;
    std::string path;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "invalid_item";
};

/**
 * @brief A destination path was already being synchronized in this run
 */
struct DuplicateSkippedEvent {
    std::string path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "duplicate_skipped";
};

// ════════════════════════════════════════════════════════
// Per-file transfer events
// ════════════════════════════════════════════════════════

struct DownloadStartedEvent {
    std::string file;
    std::string path;
    std::uint64_t declared_size = 0;
    std::size_t changed_ranges = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "download_started";
};

struct FileUnchangedEvent {
    std::string file;
    std::string path;
    std::string checksum;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "file_unchanged";
};

/**
 * @brief A checkpoint from an earlier attempt exists for this destination
 *
 * Advisory only: staging still applies every range of the plan.
 */
struct ResumeHintEvent {
    std::string path;
    std::uint64_t offset = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "resume_hint";
};

struct TransferProgressEvent {
    std::string path;
    std::uint64_t range_start = 0;
    std::uint64_t range_end = 0;
    std::uint64_t bytes_written = 0;  // within the current range
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "transfer_progress";
};

struct DownloadSuccessEvent {
    std::string file;
    std::string path;
    std::uint64_t bytes_transferred = 0;
    std::size_t changed_ranges = 0;
    std::string checksum;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "download_success";
};

struct DownloadFailedEvent {
    std::string file;
    std::string path;
    std::string error;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "download_failed";
};

/**
 * @brief The staging file failed verification before commit
 */
struct InvalidTempFileEvent {
    std::string path;
    std::string reason;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "invalid_temp_file";
};

// ════════════════════════════════════════════════════════
// Run events
// ════════════════════════════════════════════════════════

struct DownloadCompletedEvent {
    std::string report_path;
    std::size_t total_files = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::uint64_t total_bytes_transferred = 0;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};

    static constexpr const char* kEventName = "download_completed";
};

} // namespace dfm::events
