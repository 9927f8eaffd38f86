#pragma once

#include "dfm/core/result.hpp"
#include "dfm/remote/remote_item.hpp"
#include "dfm/sync/types.hpp"

#include <cstddef>
#include <filesystem>

namespace dfm::sync {

/**
 * @brief Fixed-window content indexer
 *
 * Both sides are cut into windows of chunk_size bytes starting at offset 0
 * (the last window may be short). A remote window whose digest does not
 * appear anywhere in the local map is reported as changed. Windows are
 * compared by content only, so an insertion or deletion shifts every later
 * window and they all show up as changed.
 */
class ChunkIndexer {
public:
    explicit ChunkIndexer(std::size_t chunk_size);

    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }

    /**
     * @brief Index a local file
     *
     * A missing or empty file yields an empty map.
     */
    dfm::Result<ChunkMap, SyncError> index_local(const std::filesystem::path& path) const;

    /**
     * @brief Compute the ranges of the remote content that must be fetched
     *
     * Scans at most declared_size bytes of source. The read position of
     * source is restored afterwards so it can be reused.
     */
    dfm::Result<DiffPlan, SyncError> diff(remote::ByteSource& source,
                                          std::uint64_t declared_size,
                                          const ChunkMap& local_map) const;

    /// Sort by start and coalesce ranges where next.start <= prev.end + 1
    static DiffPlan merge_ranges(DiffPlan ranges);

private:
    std::size_t chunk_size_;
};

} // namespace dfm::sync
