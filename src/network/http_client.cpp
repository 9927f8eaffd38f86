#include "dfm/network/http_client.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cstring>

namespace dfm::network {

HttpResponseStream::HttpResponseStream(Socket socket, HttpResponseHead head,
                                       std::vector<uint8_t> initial_body, bool head_only)
    : socket_(std::move(socket))
    , head_(std::move(head))
    , pending_(std::move(initial_body)) {
    size_t length = 0;
    if (detail::parse_length(head_.get_header("Content-Length"), length)) {
        content_length_ = static_cast<uint64_t>(length);
    }
    if (head_only || head_.status_code == 204 || head_.status_code == 304) {
        finished_ = true;
        pending_.clear();
    }
}

Result<size_t> HttpResponseStream::read(uint8_t* buffer, size_t max_size) {
    if (finished_ || max_size == 0) {
        return Ok(size_t{0});
    }

    size_t allowed = max_size;
    if (content_length_) {
        const uint64_t remaining = *content_length_ - bytes_read_;
        if (remaining == 0) {
            finished_ = true;
            socket_.close();
            return Ok(size_t{0});
        }
        allowed = static_cast<size_t>(std::min<uint64_t>(allowed, remaining));
    }

    size_t produced = 0;
    if (pending_pos_ < pending_.size()) {
        produced = std::min(allowed, pending_.size() - pending_pos_);
        std::memcpy(buffer, pending_.data() + pending_pos_, produced);
        pending_pos_ += produced;
    } else {
        auto received = socket_.receive(buffer, allowed);
        if (received.is_error()) {
            return Err<size_t>(received.error());
        }
        produced = received.value();
        if (produced == 0) {
            finished_ = true;
            socket_.close();
            if (content_length_ && bytes_read_ < *content_length_) {
                return Err<size_t>("Connection closed after " + std::to_string(bytes_read_) + " of " +
                                   std::to_string(*content_length_) + " body bytes");
            }
            return Ok(size_t{0});
        }
    }

    bytes_read_ += produced;
    return Ok(produced);
}

HttpClient::HttpClient(std::chrono::milliseconds timeout)
    : timeout_(timeout) {
}

Result<std::unique_ptr<HttpResponseStream>> HttpClient::send(HttpMethod method, const Url& url,
                                                             const HeaderMap& headers) {
    using StreamPtr = std::unique_ptr<HttpResponseStream>;

    Socket socket;
    auto connected = socket.connect(url.host, url.port, timeout_);
    if (connected.is_error()) {
        return Err<StreamPtr>(connected.error());
    }

    HttpRequest request;
    request.method = method;
    request.url = url.target;
    request.headers = headers;
    request.headers["Host"] = url.port == 80 ? url.host : url.host + ":" + std::to_string(url.port);
    request.headers["Connection"] = "close";
    request.headers["User-Agent"] = "dfmirror";

    const auto wire = request.serialize();
    auto sent = socket.send_all(wire.data(), wire.size());
    if (sent.is_error()) {
        return Err<StreamPtr>(sent.error());
    }
    spdlog::debug("{} {}", HttpMethodUtils::to_string(method), url.to_string());

    HttpResponseParser parser;
    std::vector<uint8_t> buffer(8192);
    while (!parser.is_complete()) {
        auto received = socket.receive(buffer.data(), buffer.size());
        if (received.is_error()) {
            return Err<StreamPtr>(received.error());
        }
        if (received.value() == 0) {
            return Err<StreamPtr>(std::string("Connection closed before response headers"));
        }

        size_t consumed = 0;
        auto parsed = parser.parse(reinterpret_cast<const char*>(buffer.data()), received.value(), consumed);
        if (parsed.is_error()) {
            return Err<StreamPtr>(parsed.error());
        }
        if (parsed.value()) {
            if (header_name_equals(parser.head().get_header("Transfer-Encoding"), "chunked")) {
                return Err<StreamPtr>(std::string("Chunked transfer encoding is not supported"));
            }
            std::vector<uint8_t> rest(buffer.begin() + static_cast<std::ptrdiff_t>(consumed),
                                      buffer.begin() + static_cast<std::ptrdiff_t>(received.value()));
            return Ok(std::make_unique<HttpResponseStream>(std::move(socket), parser.head(), std::move(rest),
                                                           method == HttpMethod::HEAD));
        }
    }
    return Err<StreamPtr>(std::string("Incomplete response"));
}

Result<std::unique_ptr<HttpResponseStream>> HttpClient::get(const std::string& url, const HeaderMap& headers) {
    auto parsed = Url::parse(url);
    if (parsed.is_error()) {
        return Err<std::unique_ptr<HttpResponseStream>>(parsed.error());
    }
    return send(HttpMethod::GET, parsed.value(), headers);
}

Result<HttpTextResponse> HttpClient::fetch_all(const std::string& url, size_t max_body) {
    auto response = get(url);
    if (response.is_error()) {
        return Err<HttpTextResponse>(response.error());
    }

    auto& stream = *response.value();
    HttpTextResponse text;
    text.status_code = stream.status_code();

    std::vector<uint8_t> buffer(16 * 1024);
    while (true) {
        auto n = stream.read(buffer.data(), buffer.size());
        if (n.is_error()) {
            return Err<HttpTextResponse>(n.error());
        }
        if (n.value() == 0) {
            break;
        }
        text.body.append(reinterpret_cast<const char*>(buffer.data()), n.value());
        if (text.body.size() > max_body) {
            return Err<HttpTextResponse>("Response body exceeds " + std::to_string(max_body) + " bytes");
        }
    }
    return Ok(text);
}

} // namespace dfm::network
