#include "dfm/sync/tree_walker.hpp"
#include "dfm/events/events.hpp"

#include <spdlog/spdlog.h>

#include <exception>
#include <system_error>
#include <type_traits>
#include <utility>

namespace dfm::sync {

namespace fs = std::filesystem;

namespace {

template<typename>
inline constexpr bool always_false = false;

} // namespace

const char* item_kind(const remote::RemoteItem& item) {
    return std::visit([](const auto& value) -> const char* {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, remote::RemoteFile>) {
            return "file";
        } else if constexpr (std::is_same_v<T, remote::RemoteDirectory>) {
            return "directory";
        } else {
            return "unsupported";
        }
    }, item);
}

TreeWalker::TreeWalker(remote::RemoteStore& store, events::EventBus& bus, SyncOptions options)
    : store_(store)
    , bus_(bus)
    , options_(std::move(options))
    , client_(options_.request_timeout)
    , fetcher_(client_, options_.backoff_unit)
    , context_{store_, fetcher_, bus_, options_} {
}

dfm::Result<RunReport, SyncError> TreeWalker::run(const std::string& remote_path, const fs::path& local_root) {
    std::error_code ec;
    fs::create_directories(local_root, ec);
    if (ec) {
        return Fail<RunReport>(ErrorKind::LocalIo,
                               "Failed to create " + local_root.string() + ": " + ec.message());
    }

    auto resolved = store_.resolve(remote_path);
    if (resolved.is_error()) {
        spdlog::error("Cannot resolve remote path '{}': {}", remote_path, resolved.error().message);
        return Err<RunReport>(resolved.error());
    }
    const auto& root = resolved.value();

    fs::path target = local_root;
    if (std::holds_alternative<remote::RemoteFile>(root)) {
        target /= remote::item_name(root);
    }

    spdlog::info("Synchronizing '{}' into {}", remote_path, target.string());
    RunReport report = sync(root, target);

    const fs::path report_path = local_root / options_.report_name;
    if (auto written = report.write(report_path); written.is_error()) {
        spdlog::error("{}", written.error().message);
        return Err<RunReport>(written.error());
    }

    const auto summary = report.summary();
    bus_.emit(events::DownloadCompletedEvent{report_path.string(), summary.total_files, summary.successful,
                                             summary.failed, summary.total_bytes_transferred});
    return dfm::Ok(std::move(report));
}

RunReport TreeWalker::sync(const remote::RemoteItem& item, const fs::path& local_path) {
    Walk walk(options_.max_workers);
    dispatch(walk, item, local_path);
    return walk.report;
}

void TreeWalker::dispatch(Walk& walk, const remote::RemoteItem& item, const fs::path& local_path) {
    std::visit([&](const auto& value) {
        using T = std::decay_t<decltype(value)>;
        if constexpr (std::is_same_v<T, remote::RemoteFile>) {
            sync_file(walk, value, local_path);
        } else if constexpr (std::is_same_v<T, remote::RemoteDirectory>) {
            sync_directory(walk, value, local_path);
        } else if constexpr (std::is_same_v<T, remote::UnsupportedItem>) {
            bus_.emit(events::InvalidItemEvent{value.name, value.path, value.reason});
        } else {
            static_assert(always_false<T>, "unhandled remote item kind");
        }
    }, item);
}

void TreeWalker::sync_file(Walk& walk, const remote::RemoteFile& file, const fs::path& local_path) {
    ActivePathGuard guard(walk.active, local_path);
    if (!guard.acquired()) {
        bus_.emit(events::DuplicateSkippedEvent{local_path.string()});
        return;
    }

    FileSyncSession session(context_, file, local_path);
    try {
        walk.report.record(session.run());
    } catch (const std::exception& e) {
        spdlog::error("Unexpected failure synchronizing {}: {}", local_path.string(), e.what());
        session.abort(make_error(ErrorKind::LocalIo, e.what()));
        walk.report.record(session.outcome());
    }
}

void TreeWalker::sync_directory(Walk& walk, const remote::RemoteDirectory& directory,
                                const fs::path& local_path) {
    std::error_code ec;
    fs::create_directories(local_path, ec);
    if (ec) {
        record_failure(walk, local_path, 0,
                       make_error(ErrorKind::LocalIo,
                                  "Failed to create " + local_path.string() + ": " + ec.message()));
        return;
    }

    auto listed = store_.list_children(directory);
    if (listed.is_error()) {
        record_failure(walk, local_path, 0, listed.error());
        return;
    }
    const auto& children = listed.value();

    if (children.empty()) {
        bus_.emit(events::EmptyDirectoryEvent{directory.path});
        return;
    }
    bus_.emit(events::ListingContentsEvent{directory.path, children.size()});

    TaskGroup group;
    for (const auto& name : children) {
        walk.pool.submit(group, [this, &walk, &directory, name, child_local = local_path / name] {
            auto child = store_.child(directory, name);
            if (child.is_error()) {
                record_failure(walk, child_local, 0, child.error());
                return;
            }
            dispatch(walk, child.value(), child_local);
        });
    }
    walk.pool.wait(group);
}

void TreeWalker::record_failure(Walk& walk, const fs::path& local_path, std::uint64_t declared_size,
                                const SyncError& error) {
    spdlog::error("{}: {}", local_path.string(), error.message);

    TransferOutcome outcome;
    outcome.path = local_path.string();
    outcome.declared_size = declared_size;
    outcome.status = TransferStatus::Failed;
    outcome.error = std::string(to_string(error.kind)) + ": " + error.message;
    walk.report.record(std::move(outcome));
}

dfm::Result<std::vector<remote::RemoteItem>, SyncError> list_remote(remote::RemoteStore& store,
                                                                    events::EventBus& bus,
                                                                    const std::string& remote_path) {
    auto resolved = store.resolve(remote_path);
    if (resolved.is_error()) {
        return Err<std::vector<remote::RemoteItem>>(resolved.error());
    }

    std::vector<remote::RemoteItem> entries;
    const auto* directory = std::get_if<remote::RemoteDirectory>(&resolved.value());
    if (directory == nullptr) {
        entries.push_back(resolved.value());
    } else {
        auto listed = store.list_children(*directory);
        if (listed.is_error()) {
            return Err<std::vector<remote::RemoteItem>>(listed.error());
        }
        if (listed.value().empty()) {
            bus.emit(events::EmptyDirectoryEvent{directory->path});
        } else {
            bus.emit(events::ListingContentsEvent{directory->path, listed.value().size()});
        }
        for (const auto& name : listed.value()) {
            auto child = store.child(*directory, name);
            if (child.is_error()) {
                spdlog::warn("Skipping {}: {}", remote::join_remote_path(directory->path, name),
                             child.error().message);
                continue;
            }
            entries.push_back(std::move(child.value()));
        }
    }

    for (const auto& entry : entries) {
        std::uint64_t size = 0;
        if (const auto* file = std::get_if<remote::RemoteFile>(&entry)) {
            size = file->declared_size;
        }
        bus.emit(events::ItemInfoEvent{remote::item_name(entry), remote::item_path(entry), item_kind(entry), size});
    }
    return dfm::Ok(std::move(entries));
}

} // namespace dfm::sync
