#pragma once

#include "dfm/network/http_parser.hpp"
#include "dfm/network/http_types.hpp"

#include <boost/asio.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <array>
#include <fstream>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace dfm::network {

namespace asio = boost::asio;
using tcp = asio::ip::tcp;

using HttpRequestHandler = std::function<HttpResponse(const HttpRequest&)>;

/**
 * @brief Per-connection handler for async HTTP requests
 *
 * Each accepted connection gets its own HttpConnection object that manages
 * the async I/O for that connection. Uses enable_shared_from_this to keep
 * the connection alive while async operations are pending.
 *
 * Lifecycle:
 * 1. Created when connection is accepted
 * 2. start() begins async read operation
 * 3. The response head is written, then a FileBody (if any) in pieces
 * 4. Destroyed when the last pending operation completes
 */
class HttpConnection : public std::enable_shared_from_this<HttpConnection> {
public:
    static constexpr size_t kFileChunkSize = 64 * 1024;

    HttpConnection(tcp::socket socket, HttpRequestHandler handler);

    void start();

private:
    void do_read();
    void do_write(HttpResponse response);
    void write_file_chunk();
    void finish();
    void handle_error(const std::string& message);

    tcp::socket socket_;
    HttpRequestHandler handler_;
    HttpParser parser_;
    std::array<char, 8192> buffer_;

    // State of a streamed FileBody
    std::ifstream file_;
    uint64_t file_remaining_ = 0;
    std::vector<char> file_chunk_;
};

/**
 * @brief Event-driven HTTP server using Boost.Asio
 *
 * Thread safety:
 * - The handler may be called from any thread running the io_context
 * - stop() must be called from the io_context or before it is destroyed
 *
 * Usage:
 * ```cpp
 * asio::io_context io_context;
 * HttpServerAsio server(io_context, "127.0.0.1", 0);  // 0 = ephemeral port
 * server.set_handler([](const HttpRequest& req) { ... });
 * io_context.run();  // Blocks here, running event loop
 * ```
 */
class HttpServerAsio {
public:
    /**
     * @param io_context Boost.Asio event loop (must outlive this server)
     * @param bind_address IPv4 address to listen on
     * @param port Port to listen on, or 0 to let the OS pick one
     * @throws boost::system::system_error if the address cannot be bound
     */
    HttpServerAsio(asio::io_context& io_context, const std::string& bind_address, uint16_t port);

    void set_handler(HttpRequestHandler handler);

    /// Actual listening port (resolved when 0 was requested)
    uint16_t get_port() const { return port_; }

    /// Stop accepting new connections
    void stop();

private:
    void do_accept();

    tcp::acceptor acceptor_;
    HttpRequestHandler handler_;
    uint16_t port_;
};

} // namespace dfm::network
