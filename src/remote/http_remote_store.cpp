#include "dfm/remote/http_remote_store.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <vector>

namespace dfm::remote {

using nlohmann::json;

std::string join_remote_path(const std::string& parent, const std::string& name) {
    std::string base = parent;
    while (!base.empty() && base.back() == '/') {
        base.pop_back();
    }
    if (base.empty()) {
        return name;
    }
    return base + "/" + name;
}

Result<RemoteItem, SyncError> parse_item_document(const std::string& body, const std::string& base_url) {
    const json doc = json::parse(body, nullptr, false);
    if (doc.is_discarded() || !doc.is_object()) {
        return Fail<RemoteItem>(ErrorKind::Metadata, "Malformed item document");
    }

    try {
        const auto name = doc.at("name").get<std::string>();
        const auto path = doc.at("path").get<std::string>();
        const auto kind = doc.at("kind").get<std::string>();

        if (kind == "file") {
            RemoteFile file;
            file.name = name;
            file.path = path;
            file.declared_size = doc.at("size").get<std::uint64_t>();
            file.url = network::resolve_url(base_url, doc.at("url").get<std::string>());
            return Ok(RemoteItem{file});
        }
        if (kind == "directory") {
            RemoteDirectory directory;
            directory.name = name;
            directory.path = path;
            directory.children = doc.value("children", std::vector<std::string>{});
            return Ok(RemoteItem{directory});
        }
        return Ok(RemoteItem{UnsupportedItem{name, path, "unsupported kind '" + kind + "'"}});
    } catch (const json::exception& e) {
        return Fail<RemoteItem>(ErrorKind::Metadata, std::string("Malformed item document: ") + e.what());
    }
}

// ──────────────────────────────────────────────────────────
// HttpByteSource
// ──────────────────────────────────────────────────────────

HttpByteSource::HttpByteSource(network::HttpClient& client, std::string url,
                               std::unique_ptr<network::HttpResponseStream> stream)
    : client_(client)
    , url_(std::move(url))
    , stream_(std::move(stream)) {
}

Result<std::size_t, SyncError> HttpByteSource::read(std::uint8_t* buffer, std::size_t max_size) {
    if (at_end_) {
        return Ok(std::size_t{0});
    }
    if (!stream_) {
        auto reopened = reopen();
        if (reopened.is_error()) {
            return Err<std::size_t>(reopened.error());
        }
        if (at_end_) {
            return Ok(std::size_t{0});
        }
    }

    auto n = stream_->read(buffer, max_size);
    if (n.is_error()) {
        return Fail<std::size_t>(ErrorKind::Transient, "Read from " + url_ + " failed: " + n.error());
    }
    position_ += n.value();
    return Ok(n.value());
}

Result<void, SyncError> HttpByteSource::seek(std::uint64_t position) {
    if (stream_ && position == position_) {
        return Ok();
    }
    stream_.reset();
    at_end_ = false;
    position_ = position;
    return Ok();
}

Result<void, SyncError> HttpByteSource::reopen() {
    network::HeaderMap headers;
    if (position_ > 0) {
        headers["Range"] = "bytes=" + std::to_string(position_) + "-";
    }

    auto response = client_.get(url_, headers);
    if (response.is_error()) {
        return Fail<void>(ErrorKind::Transient, "Reopen of " + url_ + " failed: " + response.error());
    }

    auto stream = std::move(response.value());
    const int status = stream->status_code();
    if (status == 416) {
        at_end_ = true;
        return Ok();
    }
    if (status == 200 && position_ > 0) {
        // Range ignored by the server; discard the prefix
        std::vector<std::uint8_t> discard(64 * 1024);
        std::uint64_t skipped = 0;
        while (skipped < position_) {
            const auto want = static_cast<std::size_t>(
                std::min<std::uint64_t>(discard.size(), position_ - skipped));
            auto n = stream->read(discard.data(), want);
            if (n.is_error()) {
                return Fail<void>(ErrorKind::Transient, "Skipping to offset failed: " + n.error());
            }
            if (n.value() == 0) {
                at_end_ = true;
                return Ok();
            }
            skipped += n.value();
        }
    } else if (status != 200 && status != 206) {
        return Fail<void>(ErrorKind::Transient,
                          "Unexpected status " + std::to_string(status) + " reopening " + url_);
    }

    spdlog::debug("Reopened {} at offset {}", url_, position_);
    stream_ = std::move(stream);
    return Ok();
}

// ──────────────────────────────────────────────────────────
// HttpRemoteStore
// ──────────────────────────────────────────────────────────

HttpRemoteStore::HttpRemoteStore(std::string base_url, std::chrono::milliseconds timeout)
    : base_url_(std::move(base_url))
    , client_(timeout) {
    while (!base_url_.empty() && base_url_.back() == '/') {
        base_url_.pop_back();
    }
}

Result<RemoteItem, SyncError> HttpRemoteStore::resolve(const std::string& path) {
    const std::string url = base_url_ + "/api/item?path=" + network::percent_encode(path, true);
    auto response = client_.fetch_all(url);
    if (response.is_error()) {
        return Fail<RemoteItem>(ErrorKind::Transient, "Metadata request for '" + path + "' failed: " +
                                                          response.error());
    }

    const auto& text = response.value();
    if (text.status_code == 404) {
        return Fail<RemoteItem>(ErrorKind::Metadata, "Remote item not found: " + path);
    }
    if (text.status_code != 200) {
        const json doc = json::parse(text.body, nullptr, false);
        std::string detail = "status " + std::to_string(text.status_code);
        if (doc.is_object() && doc.contains("error") && doc["error"].is_string()) {
            detail += ": " + doc["error"].get<std::string>();
        }
        return Fail<RemoteItem>(ErrorKind::Metadata, "Cannot resolve '" + path + "' (" + detail + ")");
    }
    return parse_item_document(text.body, base_url_);
}

Result<std::vector<std::string>, SyncError> HttpRemoteStore::list_children(const RemoteDirectory& directory) {
    // The directory document already carries its listing
    return Ok(directory.children);
}

Result<RemoteItem, SyncError> HttpRemoteStore::child(const RemoteDirectory& directory, const std::string& name) {
    return resolve(join_remote_path(directory.path, name));
}

Result<RemoteResponse, SyncError> HttpRemoteStore::open(const RemoteFile& file) {
    auto response = client_.get(file.url);
    if (response.is_error()) {
        return Fail<RemoteResponse>(ErrorKind::Transient, "Open of " + file.url + " failed: " + response.error());
    }

    auto stream = std::move(response.value());
    if (stream->status_code() == 404) {
        return Fail<RemoteResponse>(ErrorKind::Metadata, "Remote file vanished: " + file.path);
    }
    if (stream->status_code() != 200) {
        return Fail<RemoteResponse>(ErrorKind::Transient,
                                    "Unexpected status " + std::to_string(stream->status_code()) +
                                        " opening " + file.url);
    }

    RemoteResponse opened;
    opened.content_length = stream->content_length().value_or(file.declared_size);
    opened.url = file.url;
    opened.raw = std::make_unique<HttpByteSource>(client_, file.url, std::move(stream));
    return Ok(std::move(opened));
}

} // namespace dfm::remote
