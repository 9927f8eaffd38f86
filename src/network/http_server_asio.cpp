#include "dfm/network/http_server_asio.hpp"
#include "dfm/network/http_router.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>

namespace dfm::network {

// ──────────────────────────────────────────────────────────
// HttpConnection Implementation
// ──────────────────────────────────────────────────────────

HttpConnection::HttpConnection(tcp::socket socket, HttpRequestHandler handler)
    : socket_(std::move(socket))
    , handler_(std::move(handler))
    , parser_() {
}

void HttpConnection::start() {
    do_read();
}

void HttpConnection::do_read() {
    auto self = shared_from_this();

    socket_.async_read_some(
        asio::buffer(buffer_),
        [this, self](boost::system::error_code ec, size_t bytes_transferred) {
            if (ec) {
                if (ec != asio::error::operation_aborted && ec != asio::error::eof) {
                    spdlog::debug("Read error: {}", ec.message());
                }
                return;
            }

            auto parse_result = parser_.parse(buffer_.data(), bytes_transferred);
            if (parse_result.is_error()) {
                handle_error("Parse error: " + parse_result.error());
                return;
            }

            if (!parse_result.value()) {
                do_read();
                return;
            }

            HttpRequest request = parser_.get_request();
            spdlog::debug("{} {}", HttpMethodUtils::to_string(request.method), request.url);

            HttpResponse response;
            try {
                response = handler_(request);
            } catch (const std::exception& e) {
                spdlog::error("Handler threw exception: {}", e.what());
                response = json_error(HttpStatus::INTERNAL_SERVER_ERROR, "Internal server error");
            }
            if (request.method == HttpMethod::HEAD) {
                response.omit_body = true;
            }
            do_write(std::move(response));
        });
}

void HttpConnection::do_write(HttpResponse response) {
    auto self = shared_from_this();

    response.set_header("Connection", "close");
    if (response.file_body && !response.omit_body && response.file_body->length > 0) {
        file_.open(response.file_body->path, std::ios::binary);
        if (file_) {
            file_.seekg(static_cast<std::streamoff>(response.file_body->offset));
        }
        if (!file_) {
            spdlog::error("Failed to open {} for streaming", response.file_body->path.string());
            response = json_error(HttpStatus::INTERNAL_SERVER_ERROR, "Failed to read file");
            response.set_header("Connection", "close");
        } else {
            file_remaining_ = response.file_body->length;
        }
    }

    auto data_ptr = std::make_shared<std::vector<uint8_t>>(response.serialize());

    asio::async_write(
        socket_,
        asio::buffer(*data_ptr),
        [this, self, data_ptr](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error: {}", ec.message());
                }
                return;
            }
            if (file_remaining_ > 0) {
                write_file_chunk();
            } else {
                finish();
            }
        });
}

void HttpConnection::write_file_chunk() {
    auto self = shared_from_this();

    const auto want = static_cast<size_t>(std::min<uint64_t>(kFileChunkSize, file_remaining_));
    file_chunk_.resize(want);
    file_.read(file_chunk_.data(), static_cast<std::streamsize>(want));
    const auto got = static_cast<size_t>(file_.gcount());
    if (got == 0) {
        // File shrank while being served; the client sees a short body
        spdlog::warn("File ended with {} bytes left to stream", file_remaining_);
        finish();
        return;
    }
    file_remaining_ -= got;

    asio::async_write(
        socket_,
        asio::buffer(file_chunk_.data(), got),
        [this, self](boost::system::error_code ec, size_t) {
            if (ec) {
                if (ec != asio::error::operation_aborted) {
                    spdlog::debug("Write error while streaming: {}", ec.message());
                }
                return;
            }
            if (file_remaining_ > 0) {
                write_file_chunk();
            } else {
                finish();
            }
        });
}

void HttpConnection::finish() {
    boost::system::error_code shutdown_ec;
    socket_.shutdown(tcp::socket::shutdown_both, shutdown_ec);
}

void HttpConnection::handle_error(const std::string& message) {
    spdlog::warn("Connection error: {}", message);
    do_write(json_error(HttpStatus::BAD_REQUEST, message));
}

// ──────────────────────────────────────────────────────────
// HttpServerAsio Implementation
// ──────────────────────────────────────────────────────────

HttpServerAsio::HttpServerAsio(asio::io_context& io_context, const std::string& bind_address, uint16_t port)
    : acceptor_(io_context, tcp::endpoint(asio::ip::make_address(bind_address), port))
    , port_(acceptor_.local_endpoint().port()) {
    spdlog::info("HTTP server (Asio event-driven) listening on {}:{}", bind_address, port_);
    do_accept();
}

void HttpServerAsio::set_handler(HttpRequestHandler handler) {
    handler_ = std::move(handler);
}

void HttpServerAsio::stop() {
    boost::system::error_code ec;
    acceptor_.close(ec);
}

void HttpServerAsio::do_accept() {
    acceptor_.async_accept(
        [this](boost::system::error_code ec, tcp::socket socket) {
            if (ec == asio::error::operation_aborted || !acceptor_.is_open()) {
                return;
            }
            if (!ec) {
                std::make_shared<HttpConnection>(std::move(socket), handler_)->start();
            } else {
                spdlog::error("Accept error: {}", ec.message());
            }
            do_accept();
        });
}

} // namespace dfm::network
