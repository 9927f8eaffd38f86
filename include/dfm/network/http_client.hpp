#pragma once

#include "dfm/core/result.hpp"
#include "dfm/network/http_parser.hpp"
#include "dfm/network/http_types.hpp"
#include "dfm/network/socket.hpp"
#include "dfm/network/url.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace dfm::network {

using HeaderMap = std::unordered_map<std::string, std::string>;

/**
 * @brief Body of one HTTP response, read incrementally from its connection
 *
 * Reads are bounded by Content-Length when the server sent one; otherwise
 * the body ends when the server closes the connection.
 */
class HttpResponseStream {
public:
    HttpResponseStream(Socket socket, HttpResponseHead head, std::vector<uint8_t> initial_body,
                       bool head_only);

    int status_code() const { return head_.status_code; }
    const HttpResponseHead& head() const { return head_; }
    std::string header(const std::string& name) const { return head_.get_header(name); }

    std::optional<uint64_t> content_length() const { return content_length_; }

    /// Returns 0 at the end of the body
    Result<size_t> read(uint8_t* buffer, size_t max_size);

    uint64_t bytes_read() const { return bytes_read_; }

private:
    Socket socket_;
    HttpResponseHead head_;
    std::vector<uint8_t> pending_;
    size_t pending_pos_ = 0;
    std::optional<uint64_t> content_length_;
    uint64_t bytes_read_ = 0;
    bool finished_ = false;
};

struct HttpTextResponse {
    int status_code = 0;
    std::string body;
};

/**
 * @brief Blocking HTTP/1.1 client, one connection per request
 *
 * Every request carries `Connection: close`. The timeout applies to the
 * connect and to each individual send/receive call.
 */
class HttpClient {
public:
    explicit HttpClient(std::chrono::milliseconds timeout);

    Result<std::unique_ptr<HttpResponseStream>> send(HttpMethod method, const Url& url,
                                                     const HeaderMap& headers = {});

    Result<std::unique_ptr<HttpResponseStream>> get(const std::string& url, const HeaderMap& headers = {});

    /// GET and buffer the whole body; fails when it exceeds max_body
    Result<HttpTextResponse> fetch_all(const std::string& url, size_t max_body = 8 * 1024 * 1024);

    std::chrono::milliseconds timeout() const { return timeout_; }

private:
    std::chrono::milliseconds timeout_;
};

} // namespace dfm::network
