#pragma once

#include "dfm/core/config.hpp"
#include "dfm/core/result.hpp"
#include "dfm/events/event_bus.hpp"
#include "dfm/remote/remote_item.hpp"
#include "dfm/sync/checkpoint.hpp"
#include "dfm/sync/chunk_indexer.hpp"
#include "dfm/sync/range_fetcher.hpp"
#include "dfm/sync/types.hpp"

#include <filesystem>
#include <optional>
#include <string>

namespace dfm::sync {

/**
 * @brief Collaborators shared by every session of one run
 */
struct SyncContext {
    remote::RemoteStore& store;
    RangeFetcher& fetcher;
    events::EventBus& bus;
    SyncOptions options;
};

/**
 * @brief Synchronizes one remote file onto one destination path
 *
 * OPEN → DIFFED → (UNCHANGED | STAGING) → VERIFIED → COMMITTED, with
 * FAILED reachable from any non-terminal state. Each step may be driven
 * individually; run() drives them all and always yields an outcome.
 *
 * The destination is only ever replaced by a rename of the verified
 * staging file (`<name>.temp`). On failure the staging file is removed and
 * the checkpoint sidecar is left for a later attempt.
 */
class FileSyncSession {
public:
    static constexpr const char* kStagingSuffix = ".temp";

    FileSyncSession(SyncContext& context, remote::RemoteFile file, std::filesystem::path destination);
    ~FileSyncSession();

    FileSyncSession(const FileSyncSession&) = delete;
    FileSyncSession& operator=(const FileSyncSession&) = delete;

    [[nodiscard]] FileState state() const noexcept { return state_; }
    [[nodiscard]] const DiffPlan& plan() const noexcept { return plan_; }
    [[nodiscard]] std::uint64_t declared_size() const noexcept { return declared_size_; }
    [[nodiscard]] const std::filesystem::path& destination() const noexcept { return destination_; }
    [[nodiscard]] const std::filesystem::path& staging_path() const noexcept { return staging_path_; }

    [[nodiscard]] static std::filesystem::path staging_path_for(const std::filesystem::path& destination);

    dfm::Result<void, SyncError> open();
    dfm::Result<void, SyncError> compute_plan();
    dfm::Result<void, SyncError> stage();
    dfm::Result<void, SyncError> verify();
    dfm::Result<void, SyncError> commit();

    /// Drive every remaining step; never throws, failures end up in the outcome
    TransferOutcome run();

    /// Clean up staging, record error and move to FAILED
    void abort(const SyncError& error);

    TransferOutcome outcome() const;

private:
    dfm::Result<void, SyncError> transition_to(FileState next);
    dfm::Result<void, SyncError> require(FileState expected, const char* step) const;

    // abort() and return the error, for step bodies
    dfm::Result<void, SyncError> fail(SyncError error);

    dfm::Result<void, SyncError> prepare_staging_file();
    void remove_staging_file() const;

    SyncContext& context_;
    remote::RemoteFile file_;
    std::filesystem::path destination_;
    std::filesystem::path staging_path_;
    TransferCheckpoint checkpoint_;

    FileState state_ = FileState::Open;
    std::optional<remote::RemoteResponse> response_;
    std::uint64_t declared_size_ = 0;
    DiffPlan plan_;
    std::uint64_t bytes_transferred_ = 0;
    std::string checksum_;
    std::optional<SyncError> error_;
};

} // namespace dfm::sync
