#pragma once

#include "dfm/core/error.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace dfm {

/**
 * @brief Tunables for one synchronization run
 */
struct SyncOptions {
    static constexpr std::size_t kDefaultChunkSize = 1024 * 1024;
    static constexpr std::size_t kMaxWorkers = 1024;

    std::size_t chunk_size = kDefaultChunkSize;
    std::size_t max_workers = 4;
    int max_retries = 3;
    std::chrono::milliseconds request_timeout{30000};
    std::chrono::milliseconds backoff_unit{1000};  ///< attempt n waits 2^n units
    std::string report_name = "sync_report.json";
};

dfm::Result<void, SyncError> validate_options(const SyncOptions& options);

enum class Command {
    Sync,
    List,
    Serve,
    Help
};

struct CliConfig {
    Command command = Command::Help;
    std::string remote_url;     ///< Base URL of the remote store (http://host:port)
    std::string remote_path;
    std::filesystem::path local_path{"."};
    std::filesystem::path serve_root;
    std::string bind_address = "0.0.0.0";
    std::uint16_t port = 8080;
    std::optional<std::filesystem::path> log_file;
    std::optional<std::filesystem::path> config_file;
    bool verbose = false;
    SyncOptions sync;
};

/**
 * @brief Parse `dfmirror <command> ...` arguments
 *
 * Falls back to DFM_REMOTE_URL for the remote base URL. When --config is
 * given the file is applied first and explicit flags override it.
 */
dfm::Result<CliConfig, SyncError> parse_arguments(int argc, char* argv[]);

/// Apply SyncOptions fields found in a JSON document
dfm::Result<void, SyncError> apply_config_file(const std::filesystem::path& path, SyncOptions& options);

std::string usage();

} // namespace dfm
