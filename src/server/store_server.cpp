#include "dfm/server/store_server.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <vector>

namespace dfm::server {

namespace fs = std::filesystem;
using nlohmann::json;
using network::HttpContext;
using network::HttpResponse;
using network::HttpStatus;
using network::json_error;

namespace {

std::string normalize_relative(std::string relative) {
    while (!relative.empty() && relative.front() == '/') {
        relative.erase(relative.begin());
    }
    while (!relative.empty() && relative.back() == '/') {
        relative.pop_back();
    }
    return relative;
}

bool parse_number(const std::string& text, std::uint64_t& out) {
    if (text.empty() || text.size() > 19 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    out = std::stoull(text);
    return true;
}

} // namespace

std::optional<ByteRangeRequest> parse_range_header(const std::string& value) {
    const std::string prefix = "bytes=";
    if (value.compare(0, prefix.size(), prefix) != 0) {
        return std::nullopt;
    }
    const std::string byte_range = value.substr(prefix.size());
    if (byte_range.find(',') != std::string::npos) {
        return std::nullopt;
    }
    const auto dash = byte_range.find('-');
    if (dash == std::string::npos) {
        return std::nullopt;
    }

    ByteRangeRequest range;
    const std::string first = byte_range.substr(0, dash);
    const std::string last = byte_range.substr(dash + 1);
    std::uint64_t number = 0;
    if (!first.empty()) {
        if (!parse_number(first, number)) {
            return std::nullopt;
        }
        range.first = number;
    }
    if (!last.empty()) {
        if (!parse_number(last, number)) {
            return std::nullopt;
        }
        range.last = number;
    }
    if (!range.first && !range.last) {
        return std::nullopt;
    }
    if (range.first && range.last && *range.last < *range.first) {
        return std::nullopt;
    }
    return range;
}

StoreServer::StoreServer(fs::path root, const std::string& bind_address, std::uint16_t port)
    : root_(std::move(root))
    , bind_address_(bind_address) {
    server_ = std::make_unique<network::HttpServerAsio>(io_context_, bind_address, port);
    server_->set_handler([this](const network::HttpRequest& request) {
        return router_.handle_request(request);
    });
    register_routes();
    spdlog::info("Serving {} at {}", root_.string(), base_url());
}

StoreServer::~StoreServer() {
    stop();
}

void StoreServer::register_routes() {
    router_.get("/api/item", [this](const HttpContext& ctx) { return handle_item(ctx); });
    router_.get("/files/*", [this](const HttpContext& ctx) { return handle_file(ctx); });
    router_.head("/files/*", [this](const HttpContext& ctx) { return handle_file(ctx); });
}

void StoreServer::start() {
    thread_ = std::thread([this]() { io_context_.run(); });
}

void StoreServer::run() {
    boost::asio::signal_set signals(io_context_, SIGINT, SIGTERM);
    signals.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (!ec) {
            spdlog::info("Received signal {}, shutting down", signal_number);
            server_->stop();
            io_context_.stop();
        }
    });
    io_context_.run();
}

void StoreServer::stop() {
    io_context_.stop();
    if (thread_.joinable()) {
        thread_.join();
    }
}

std::string StoreServer::base_url() const {
    const std::string host = (bind_address_ == "0.0.0.0" || bind_address_.empty()) ? "127.0.0.1" : bind_address_;
    return "http://" + host + ":" + std::to_string(port());
}

std::optional<fs::path> StoreServer::resolve_local(const std::string& relative) const {
    const std::string normalized = normalize_relative(relative);
    fs::path local = root_;
    if (normalized.empty()) {
        return local;
    }
    for (const auto& part : fs::path(normalized)) {
        const std::string segment = part.string();
        if (segment == ".." || segment == "." || part.has_root_path()) {
            return std::nullopt;
        }
        local /= part;
    }
    return local;
}

HttpResponse StoreServer::handle_item(const HttpContext& ctx) const {
    const std::string relative = normalize_relative(ctx.request.query_param("path"));
    const auto local = resolve_local(relative);
    if (!local) {
        return json_error(HttpStatus::BAD_REQUEST, "Path escapes the store root: " + relative);
    }

    std::error_code ec;
    const auto status = fs::status(*local, ec);
    if (ec || !fs::exists(status)) {
        return json_error(HttpStatus::NOT_FOUND, "No such item: " + relative);
    }

    json doc;
    doc["name"] = relative.empty() ? root_.filename().string() : fs::path(relative).filename().string();
    doc["path"] = relative;

    if (fs::is_directory(status)) {
        std::vector<std::string> children;
        for (fs::directory_iterator it(*local, ec), end; !ec && it != end; it.increment(ec)) {
            children.push_back(it->path().filename().string());
        }
        if (ec) {
            return json_error(HttpStatus::INTERNAL_SERVER_ERROR, "Cannot list " + relative + ": " + ec.message());
        }
        std::sort(children.begin(), children.end());
        doc["kind"] = "directory";
        doc["size"] = 0;
        doc["children"] = children;
    } else if (fs::is_regular_file(status)) {
        const auto size = fs::file_size(*local, ec);
        if (ec) {
            return json_error(HttpStatus::INTERNAL_SERVER_ERROR, "Cannot stat " + relative + ": " + ec.message());
        }
        doc["kind"] = "file";
        doc["size"] = static_cast<std::uint64_t>(size);
        doc["url"] = "/files/" + network::percent_encode(relative, true);
    } else {
        doc["kind"] = "other";
        doc["size"] = 0;
    }

    HttpResponse response(HttpStatus::OK);
    response.set_body(doc.dump());
    response.set_header("Content-Type", "application/json");
    return response;
}

HttpResponse StoreServer::handle_file(const HttpContext& ctx) const {
    const std::string relative = ctx.get_param("wildcard");
    const auto local = resolve_local(relative);
    if (!local) {
        return json_error(HttpStatus::BAD_REQUEST, "Path escapes the store root: " + relative);
    }

    std::error_code ec;
    if (!fs::is_regular_file(*local, ec)) {
        return json_error(HttpStatus::NOT_FOUND, "No such file: " + relative);
    }
    const std::uint64_t size = fs::file_size(*local, ec);
    if (ec) {
        return json_error(HttpStatus::INTERNAL_SERVER_ERROR, "Cannot stat " + relative + ": " + ec.message());
    }

    std::uint64_t first = 0;
    std::uint64_t length = size;
    bool partial = false;

    const std::string range_header = ctx.request.get_header("Range");
    if (!range_header.empty()) {
        const auto range = parse_range_header(range_header);
        if (range) {
            if (range->first) {
                first = *range->first;
                const std::uint64_t last = range->last ? std::min(*range->last, size == 0 ? 0 : size - 1)
                                                       : (size == 0 ? 0 : size - 1);
                if (first >= size) {
                    HttpResponse response = json_error(HttpStatus::RANGE_NOT_SATISFIABLE, "Range not satisfiable");
                    response.set_header("Content-Range", "bytes */" + std::to_string(size));
                    return response;
                }
                length = last - first + 1;
            } else {
                // Suffix range: last N bytes
                const std::uint64_t suffix = std::min(*range->last, size);
                if (suffix == 0) {
                    HttpResponse response = json_error(HttpStatus::RANGE_NOT_SATISFIABLE, "Range not satisfiable");
                    response.set_header("Content-Range", "bytes */" + std::to_string(size));
                    return response;
                }
                first = size - suffix;
                length = suffix;
            }
            partial = true;
        }
    }

    HttpResponse response(partial ? HttpStatus::PARTIAL_CONTENT : HttpStatus::OK);
    response.set_header("Content-Type", "application/octet-stream");
    response.set_header("Accept-Ranges", "bytes");
    if (partial) {
        response.set_header("Content-Range", "bytes " + std::to_string(first) + "-" +
                                                 std::to_string(first + length - 1) + "/" + std::to_string(size));
    }
    response.set_file_body(network::FileBody{*local, first, length});
    return response;
}

} // namespace dfm::server
