#include "dfm/sync/chunk_indexer.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <system_error>
#include <vector>

namespace dfm::sync {
namespace fs = std::filesystem;

namespace {

// Fill buffer up to want bytes; short only at end of stream
dfm::Result<std::size_t, SyncError> read_window(remote::ByteSource& source, std::uint8_t* buffer, std::size_t want) {
    std::size_t filled = 0;
    while (filled < want) {
        auto n = source.read(buffer + filled, want - filled);
        if (n.is_error()) {
            return Err<std::size_t>(n.error());
        }
        if (n.value() == 0) {
            break;
        }
        filled += n.value();
    }
    return Ok(filled);
}

} // namespace

ChunkIndexer::ChunkIndexer(std::size_t chunk_size)
    : chunk_size_(chunk_size == 0 ? 1 : chunk_size) {
}

dfm::Result<ChunkMap, SyncError> ChunkIndexer::index_local(const fs::path& path) const {
    ChunkMap map;

    std::error_code ec;
    if (!fs::is_regular_file(path, ec) || fs::file_size(path, ec) == 0 || ec) {
        return Ok(std::move(map));
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Fail<ChunkMap>(ErrorKind::LocalIo, "Failed to open for indexing: " + path.string());
    }

    std::vector<std::uint8_t> buffer(chunk_size_);
    std::uint64_t offset = 0;
    while (input) {
        input.read(reinterpret_cast<char*>(buffer.data()), static_cast<std::streamsize>(buffer.size()));
        const auto bytes_read = static_cast<std::size_t>(input.gcount());
        if (bytes_read == 0) {
            break;
        }
        map[hash::digest_window(buffer.data(), bytes_read)] = ChunkRange{offset, offset + bytes_read - 1};
        offset += bytes_read;
    }

    if (input.bad()) {
        return Fail<ChunkMap>(ErrorKind::LocalIo, "Read error while indexing: " + path.string());
    }

    spdlog::debug("Indexed {} ({} bytes, {} distinct windows)", path.string(), offset, map.size());
    return Ok(std::move(map));
}

dfm::Result<DiffPlan, SyncError> ChunkIndexer::diff(remote::ByteSource& source,
                                                    std::uint64_t declared_size,
                                                    const ChunkMap& local_map) const {
    if (declared_size == 0) {
        return Ok(DiffPlan{});
    }
    if (local_map.empty()) {
        return Ok(DiffPlan{ChunkRange{0, declared_size - 1}});
    }

    // Windows are aligned to offset 0 whatever the caller has already read
    const std::uint64_t origin = source.tell();
    if (auto rewound = source.seek(0); rewound.is_error()) {
        return Err<DiffPlan>(rewound.error());
    }

    DiffPlan candidates;
    std::vector<std::uint8_t> buffer(chunk_size_);
    std::uint64_t offset = 0;

    while (offset < declared_size) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size_, declared_size - offset));
        auto filled = read_window(source, buffer.data(), want);
        if (filled.is_error()) {
            return Err<DiffPlan>(filled.error());
        }
        const std::size_t got = filled.value();
        if (got == 0) {
            break;
        }

        if (local_map.find(hash::digest_window(buffer.data(), got)) == local_map.end()) {
            candidates.push_back(ChunkRange{offset, offset + got - 1});
        }
        offset += got;
    }

    if (offset < declared_size) {
        // Remote stream ended early; everything past it must still be fetched
        candidates.push_back(ChunkRange{offset, declared_size - 1});
    }

    auto restored = source.seek(origin);
    if (restored.is_error()) {
        return Err<DiffPlan>(restored.error());
    }

    return Ok(merge_ranges(std::move(candidates)));
}

DiffPlan ChunkIndexer::merge_ranges(DiffPlan ranges) {
    if (ranges.empty()) {
        return ranges;
    }

    std::sort(ranges.begin(), ranges.end(), [](const ChunkRange& a, const ChunkRange& b) {
        return a.start < b.start;
    });

    DiffPlan merged;
    merged.push_back(ranges.front());
    for (std::size_t i = 1; i < ranges.size(); ++i) {
        ChunkRange& last = merged.back();
        const ChunkRange& next = ranges[i];
        if (next.start <= last.end + 1) {
            last.end = std::max(last.end, next.end);
        } else {
            merged.push_back(next);
        }
    }
    return merged;
}

} // namespace dfm::sync
