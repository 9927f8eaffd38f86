#pragma once

#include "dfm/core/result.hpp"
#include "dfm/sync/types.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <mutex>
#include <string>
#include <vector>

namespace dfm::sync {

struct RunSummary {
    std::size_t total_files = 0;
    std::size_t successful = 0;
    std::size_t failed = 0;
    std::uint64_t total_bytes_transferred = 0;
    std::size_t total_changed_chunks = 0;
    std::string timestamp;  ///< local time, "%Y-%m-%d %H:%M:%S"
};

/**
 * @brief Outcomes collected over one run
 *
 * THREAD SAFE: record() may be called concurrently from workers.
 */
class RunReport {
public:
    RunReport() = default;
    RunReport(const RunReport& other);
    RunReport& operator=(const RunReport& other);

    void record(TransferOutcome outcome);

    [[nodiscard]] std::vector<TransferOutcome> outcomes() const;
    [[nodiscard]] RunSummary summary() const;

    /// {"summary": {...}, "details": [...]}
    [[nodiscard]] nlohmann::json to_json() const;

    dfm::Result<void, SyncError> write(const std::filesystem::path& path) const;

private:
    mutable std::mutex mutex_;
    std::vector<TransferOutcome> outcomes_;
};

nlohmann::json to_json(const TransferOutcome& outcome);

} // namespace dfm::sync
