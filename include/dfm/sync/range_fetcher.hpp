#pragma once

#include "dfm/core/result.hpp"
#include "dfm/network/http_client.hpp"
#include "dfm/sync/types.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <fstream>
#include <functional>
#include <string>

namespace dfm::sync {

/**
 * @brief Destination for fetched bytes, addressed by absolute file offset
 */
class RangeSink {
public:
    virtual ~RangeSink() = default;

    /// Errors must be LocalIo; they stop the fetch without retrying
    virtual dfm::Result<void, SyncError> write_at(std::uint64_t offset, const std::uint8_t* data,
                                                  std::size_t size) = 0;
};

/**
 * @brief RangeSink writing into an existing, pre-sized file
 */
class FileRangeSink : public RangeSink {
public:
    explicit FileRangeSink(std::filesystem::path path);

    [[nodiscard]] bool is_open() const { return static_cast<bool>(file_); }

    dfm::Result<void, SyncError> write_at(std::uint64_t offset, const std::uint8_t* data,
                                          std::size_t size) override;

    dfm::Result<void, SyncError> flush();

    void close() { file_.close(); }

private:
    std::filesystem::path path_;
    std::fstream file_;
};

/// Called with the range being fetched and the bytes written to it so far
using ProgressCallback = std::function<void(const ChunkRange&, std::uint64_t)>;

/**
 * @brief Fetches one inclusive byte range with bounded retries
 *
 * Each attempt sends `Range: bytes=start-end` and streams the body in
 * bounded buffers to the sink at offset start. A 206 is written as-is; a
 * plain 200 is accepted by discarding the first start bytes. Any other
 * status, a network error or a short body fails the attempt. After failed
 * attempt n the fetcher sleeps 2^n backoff units before trying again.
 */
class RangeFetcher {
public:
    static constexpr std::size_t kBufferSize = 64 * 1024;

    RangeFetcher(network::HttpClient& client, std::chrono::milliseconds backoff_unit);

    /**
     * @return Bytes written to the sink on success
     */
    dfm::Result<std::uint64_t, TransferFailure> fetch(const std::string& url,
                                                      const ChunkRange& range,
                                                      RangeSink& sink,
                                                      int retry_budget,
                                                      const ProgressCallback& progress = {}) const;

private:
    dfm::Result<std::uint64_t, SyncError> attempt(const std::string& url,
                                                  const ChunkRange& range,
                                                  RangeSink& sink,
                                                  const ProgressCallback& progress) const;

    [[nodiscard]] std::chrono::milliseconds backoff_for(int attempt) const noexcept;

    network::HttpClient& client_;
    std::chrono::milliseconds backoff_unit_;
};

} // namespace dfm::sync
