#pragma once

#include "dfm/network/http_router.hpp"
#include "dfm/network/http_server_asio.hpp"

#include <boost/asio.hpp>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <thread>

namespace dfm::server {

/**
 * @brief Serves a local directory tree over the store protocol
 *
 * Routes:
 * - GET  /api/item?path=<p>  item metadata (file, directory or other)
 * - GET  /files/<p>          content, honoring a single Range
 * - HEAD /files/<p>          headers only
 *
 * The listening socket is bound in the constructor, so port() is valid
 * before start(). Middleware must be registered through router() before
 * start() or run().
 */
class StoreServer {
public:
    StoreServer(std::filesystem::path root, const std::string& bind_address = "0.0.0.0",
                std::uint16_t port = 8080);
    ~StoreServer();

    StoreServer(const StoreServer&) = delete;
    StoreServer& operator=(const StoreServer&) = delete;

    network::HttpRouter& router() { return router_; }

    /// Run the event loop on a background thread
    void start();

    /// Run the event loop on the calling thread until stop() or SIGINT/SIGTERM
    void run();

    void stop();

    std::uint16_t port() const { return server_->get_port(); }

    /// URL clients should use; a wildcard bind address maps to loopback
    std::string base_url() const;

    const std::filesystem::path& root() const { return root_; }

private:
    void register_routes();

    network::HttpResponse handle_item(const network::HttpContext& ctx) const;
    network::HttpResponse handle_file(const network::HttpContext& ctx) const;

    /// Map a store-relative path to a file under root; nullopt if it escapes root
    std::optional<std::filesystem::path> resolve_local(const std::string& relative) const;

    std::filesystem::path root_;
    std::string bind_address_;
    network::HttpRouter router_;
    boost::asio::io_context io_context_;
    std::unique_ptr<network::HttpServerAsio> server_;
    std::thread thread_;
};

/**
 * @brief Parsed `Range: bytes=...` header
 */
struct ByteRangeRequest {
    std::optional<std::uint64_t> first;
    std::optional<std::uint64_t> last;   ///< when first is empty, a suffix length
};

/// Parse a single-range header; multiple ranges and other units yield nullopt
std::optional<ByteRangeRequest> parse_range_header(const std::string& value);

} // namespace dfm::server
