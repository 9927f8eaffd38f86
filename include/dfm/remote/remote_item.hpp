#pragma once

#include "dfm/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace dfm::remote {

struct RemoteFile {
    std::string name;
    std::string path;            ///< Store-relative path, '/'-separated
    std::uint64_t declared_size = 0;
    std::string url;             ///< Stable URL accepting Range requests
};

struct RemoteDirectory {
    std::string name;
    std::string path;
    std::vector<std::string> children;  ///< Child names in listing order
};

/**
 * @brief An item that is neither a file nor a directory (link, package, ...)
 */
struct UnsupportedItem {
    std::string name;
    std::string path;
    std::string reason;
};

/**
 * @brief Remote item, classified once when it is first resolved
 */
using RemoteItem = std::variant<RemoteFile, RemoteDirectory, UnsupportedItem>;

inline const std::string& item_name(const RemoteItem& item) {
    return std::visit([](const auto& value) -> const std::string& { return value.name; }, item);
}

inline const std::string& item_path(const RemoteItem& item) {
    return std::visit([](const auto& value) -> const std::string& { return value.path; }, item);
}

/**
 * @brief Seekable cursor over remote bytes
 *
 * read() returns 0 at end of stream. seek() may be cheap (deferred until
 * the next read) or may reopen the underlying transfer.
 */
class ByteSource {
public:
    virtual ~ByteSource() = default;

    virtual Result<std::size_t, SyncError> read(std::uint8_t* buffer, std::size_t max_size) = 0;
    virtual std::uint64_t tell() const = 0;
    virtual Result<void, SyncError> seek(std::uint64_t position) = 0;
};

/**
 * @brief A file opened for streaming
 */
struct RemoteResponse {
    std::uint64_t content_length = 0;
    std::string url;
    std::unique_ptr<ByteSource> raw;
};

/**
 * @brief Navigable remote store, already authenticated
 *
 * Errors are Metadata (absent, malformed) or Transient (network). Callers
 * never retry these calls.
 */
class RemoteStore {
public:
    virtual ~RemoteStore() = default;

    virtual Result<RemoteItem, SyncError> resolve(const std::string& path) = 0;

    virtual Result<std::vector<std::string>, SyncError> list_children(const RemoteDirectory& directory) = 0;

    virtual Result<RemoteItem, SyncError> child(const RemoteDirectory& directory, const std::string& name) = 0;

    virtual Result<RemoteResponse, SyncError> open(const RemoteFile& file) = 0;
};

/// Join two store-relative paths with a single '/'
std::string join_remote_path(const std::string& parent, const std::string& name);

} // namespace dfm::remote
