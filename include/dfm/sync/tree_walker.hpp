/**
 * @file tree_walker.hpp
 * @brief Mirrors a remote tree onto a local directory
 *
 * WHY: A run is a walk, not a single transfer. Directories are recreated
 * locally and their children fanned out to one shared WorkerPool; files
 * are handed to a FileSyncSession each. A failing file never stops its
 * siblings; it only shows up as a failed outcome in the run report.
 *
 * EXAMPLE:
 * TreeWalker walker(store, bus, options);
 * auto report = walker.run("datasets/2024", "/srv/mirror");
 */

#pragma once

#include "dfm/core/config.hpp"
#include "dfm/core/result.hpp"
#include "dfm/events/event_bus.hpp"
#include "dfm/network/http_client.hpp"
#include "dfm/remote/remote_item.hpp"
#include "dfm/sync/active_path_set.hpp"
#include "dfm/sync/file_session.hpp"
#include "dfm/sync/range_fetcher.hpp"
#include "dfm/sync/run_report.hpp"
#include "dfm/sync/worker_pool.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace dfm::sync {

class TreeWalker {
public:
    TreeWalker(remote::RemoteStore& store, events::EventBus& bus, SyncOptions options);

    TreeWalker(const TreeWalker&) = delete;
    TreeWalker& operator=(const TreeWalker&) = delete;

    /**
     * @brief Resolve remote_path, mirror it under local_root and write the report
     *
     * A directory root is mirrored into local_root itself; a file root lands
     * at local_root/<name>. Fails only when the root cannot be resolved or
     * local_root cannot be created; per-file failures are in the report.
     */
    dfm::Result<RunReport, SyncError> run(const std::string& remote_path,
                                          const std::filesystem::path& local_root);

    /**
     * @brief Mirror an already-resolved item onto local_path
     *
     * local_path is the item's own destination (the directory itself, or
     * the file itself). Blocks until the whole subtree is done.
     */
    RunReport sync(const remote::RemoteItem& item, const std::filesystem::path& local_path);

    [[nodiscard]] const SyncOptions& options() const noexcept { return options_; }

private:
    // State shared by every task of one sync() call
    struct Walk {
        WorkerPool pool;
        ActivePathSet active;
        RunReport report;

        explicit Walk(std::size_t width) : pool(width) {}
    };

    void dispatch(Walk& walk, const remote::RemoteItem& item, const std::filesystem::path& local_path);
    void sync_file(Walk& walk, const remote::RemoteFile& file, const std::filesystem::path& local_path);
    void sync_directory(Walk& walk, const remote::RemoteDirectory& directory,
                        const std::filesystem::path& local_path);

    void record_failure(Walk& walk, const std::filesystem::path& local_path, std::uint64_t declared_size,
                        const SyncError& error);

    remote::RemoteStore& store_;
    events::EventBus& bus_;
    SyncOptions options_;
    network::HttpClient client_;
    RangeFetcher fetcher_;
    SyncContext context_;
};

/**
 * @brief Describe a remote item without transferring anything
 *
 * A directory yields one entry per child (listing_contents or
 * empty_directory is emitted first); a file or unsupported item yields
 * itself. Every entry is also announced as an item_info event.
 */
dfm::Result<std::vector<remote::RemoteItem>, SyncError> list_remote(remote::RemoteStore& store,
                                                                    events::EventBus& bus,
                                                                    const std::string& remote_path);

/// "file", "directory" or "unsupported"
const char* item_kind(const remote::RemoteItem& item);

} // namespace dfm::sync
