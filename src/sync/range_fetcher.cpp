#include "dfm/sync/range_fetcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <thread>
#include <vector>

namespace dfm::sync {

FileRangeSink::FileRangeSink(std::filesystem::path path)
    : path_(std::move(path))
    , file_(path_, std::ios::in | std::ios::out | std::ios::binary) {
}

dfm::Result<void, SyncError> FileRangeSink::write_at(std::uint64_t offset, const std::uint8_t* data,
                                                     std::size_t size) {
    if (!file_) {
        return Fail<void>(ErrorKind::LocalIo, "Staging file not writable: " + path_.string());
    }
    file_.seekp(static_cast<std::streamoff>(offset));
    file_.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    if (!file_) {
        return Fail<void>(ErrorKind::LocalIo, "Failed to write " + std::to_string(size) + " bytes at offset " +
                                                  std::to_string(offset) + " of " + path_.string());
    }
    return dfm::Ok();
}

dfm::Result<void, SyncError> FileRangeSink::flush() {
    file_.flush();
    if (!file_) {
        return Fail<void>(ErrorKind::LocalIo, "Failed to flush " + path_.string());
    }
    return dfm::Ok();
}

RangeFetcher::RangeFetcher(network::HttpClient& client, std::chrono::milliseconds backoff_unit)
    : client_(client)
    , backoff_unit_(backoff_unit) {
}

std::chrono::milliseconds RangeFetcher::backoff_for(int attempt) const noexcept {
    const int exponent = std::min(attempt, 16);
    return backoff_unit_ * (std::int64_t{1} << exponent);
}

dfm::Result<std::uint64_t, TransferFailure> RangeFetcher::fetch(const std::string& url,
                                                                const ChunkRange& range,
                                                                RangeSink& sink,
                                                                int retry_budget,
                                                                const ProgressCallback& progress) const {
    const int budget = std::max(retry_budget, 1);
    SyncError last_error = make_error(ErrorKind::Transient, "no attempt made");

    for (int n = 1; n <= budget; ++n) {
        auto result = attempt(url, range, sink, progress);
        if (result.is_ok()) {
            return Ok(result.value());
        }

        last_error = result.error();
        if (!last_error.retryable()) {
            spdlog::warn("Range {}-{} of {} failed with a non-retryable error: {}",
                         range.start, range.end, url, last_error.message);
            return Err<std::uint64_t>(TransferFailure{range, last_error, n});
        }

        if (n < budget) {
            const auto delay = backoff_for(n);
            spdlog::warn("Range {}-{} of {} failed (attempt {}/{}): {}; retrying in {} ms",
                         range.start, range.end, url, n, budget, last_error.message, delay.count());
            std::this_thread::sleep_for(delay);
        } else {
            spdlog::warn("Range {}-{} of {} failed (attempt {}/{}): {}",
                         range.start, range.end, url, n, budget, last_error.message);
        }
    }

    return Err<std::uint64_t>(TransferFailure{range, last_error, budget});
}

dfm::Result<std::uint64_t, SyncError> RangeFetcher::attempt(const std::string& url,
                                                            const ChunkRange& range,
                                                            RangeSink& sink,
                                                            const ProgressCallback& progress) const {
    network::HeaderMap headers;
    headers["Range"] = "bytes=" + std::to_string(range.start) + "-" + std::to_string(range.end);

    auto response = client_.get(url, headers);
    if (response.is_error()) {
        return Fail<std::uint64_t>(ErrorKind::Transient, response.error());
    }
    auto& stream = *response.value();

    std::uint64_t to_skip = 0;
    if (stream.status_code() == 206) {
        const std::string content_range = stream.header("Content-Range");
        const std::string expected_prefix = "bytes " + std::to_string(range.start) + "-";
        if (!content_range.empty() && content_range.compare(0, expected_prefix.size(), expected_prefix) != 0) {
            return Fail<std::uint64_t>(ErrorKind::Transient, "Server returned a different range: " + content_range);
        }
    } else if (stream.status_code() == 200) {
        to_skip = range.start;
    } else {
        return Fail<std::uint64_t>(ErrorKind::Transient,
                                   "Unexpected HTTP status " + std::to_string(stream.status_code()));
    }

    std::vector<std::uint8_t> buffer(kBufferSize);
    const std::uint64_t wanted = range.size();
    std::uint64_t written = 0;

    while (written < wanted) {
        std::size_t request = buffer.size();
        if (to_skip == 0) {
            request = static_cast<std::size_t>(std::min<std::uint64_t>(request, wanted - written));
        } else {
            request = static_cast<std::size_t>(std::min<std::uint64_t>(request, to_skip));
        }

        auto n = stream.read(buffer.data(), request);
        if (n.is_error()) {
            return Fail<std::uint64_t>(ErrorKind::Transient, n.error());
        }
        if (n.value() == 0) {
            return Fail<std::uint64_t>(ErrorKind::Transient,
                                       "Body ended after " + std::to_string(written) + " of " +
                                           std::to_string(wanted) + " bytes");
        }

        if (to_skip > 0) {
            to_skip -= n.value();
            continue;
        }

        auto stored = sink.write_at(range.start + written, buffer.data(), n.value());
        if (stored.is_error()) {
            return Err<std::uint64_t>(stored.error());
        }
        written += n.value();
        if (progress) {
            progress(range, written);
        }
    }

    return Ok(written);
}

} // namespace dfm::sync
