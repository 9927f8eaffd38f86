#pragma once

#include "dfm/network/http_client.hpp"
#include "dfm/remote/remote_item.hpp"

#include <chrono>
#include <memory>
#include <string>

namespace dfm::remote {

/**
 * @brief ByteSource over a streamed HTTP body
 *
 * A seek only records the new position; the next read reopens the body
 * with `Range: bytes=<pos>-`.
 */
class HttpByteSource : public ByteSource {
public:
    HttpByteSource(network::HttpClient& client, std::string url,
                   std::unique_ptr<network::HttpResponseStream> stream);

    Result<std::size_t, SyncError> read(std::uint8_t* buffer, std::size_t max_size) override;
    std::uint64_t tell() const override { return position_; }
    Result<void, SyncError> seek(std::uint64_t position) override;

private:
    Result<void, SyncError> reopen();

    network::HttpClient& client_;
    std::string url_;
    std::unique_ptr<network::HttpResponseStream> stream_;
    std::uint64_t position_ = 0;
    bool at_end_ = false;
};

/**
 * @brief RemoteStore speaking the dfmirror store protocol
 *
 * Metadata: GET <base>/api/item?path=<p>
 * Content:  GET <base>/files/<p> (Range capable)
 */
class HttpRemoteStore : public RemoteStore {
public:
    HttpRemoteStore(std::string base_url, std::chrono::milliseconds timeout);

    Result<RemoteItem, SyncError> resolve(const std::string& path) override;
    Result<std::vector<std::string>, SyncError> list_children(const RemoteDirectory& directory) override;
    Result<RemoteItem, SyncError> child(const RemoteDirectory& directory, const std::string& name) override;
    Result<RemoteResponse, SyncError> open(const RemoteFile& file) override;

    const std::string& base_url() const { return base_url_; }

private:
    std::string base_url_;
    network::HttpClient client_;
};

/// Parse one /api/item document; exposed for tests
Result<RemoteItem, SyncError> parse_item_document(const std::string& body, const std::string& base_url);

} // namespace dfm::remote
