#pragma once

#include "dfm/core/result.hpp"
#include "dfm/network/http_types.hpp"
#include "dfm/network/url.hpp"

#include <cctype>
#include <string>

namespace dfm::network {

namespace detail {

inline bool parse_length(const std::string& text, size_t& out) {
    if (text.empty() || text.size() > 19 || text.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    out = static_cast<size_t>(std::stoull(text));
    return true;
}

} // namespace detail

/**
 * @brief State machine states for HTTP request parsing
 *
 * HTTP Request Format:
 * METHOD SP URL SP VERSION CRLF    <- Request line
 * Header-Name: Header-Value CRLF   <- Headers (multiple)
 * CRLF                             <- Empty line
 * [Body]                           <- Optional body
 */
enum class ParseState {
    METHOD,
    URL,
    VERSION,
    HEADER_NAME,
    HEADER_VALUE,
    BODY,
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP request parser
 *
 * Data can be fed chunk by chunk as it arrives from the socket. Once the
 * request line is read the target is split into a decoded path and query
 * parameters.
 */
class HttpParser {
public:
    HttpParser() { reset(); }

    /**
     * @brief Feed bytes to the parser
     * @return true once a full request has been parsed, false if more data is needed
     */
    Result<bool> parse(const char* data, size_t len) {
        for (size_t i = 0; i < len; ++i) {
            char c = data[i];

            if (c == '\n') {
                line_++;
            }

            bool ok = true;
            switch (state_) {
                case ParseState::METHOD: ok = parse_method(c); break;
                case ParseState::URL: ok = parse_url(c); break;
                case ParseState::VERSION: ok = parse_version(c); break;
                case ParseState::HEADER_NAME: ok = parse_header_name(c); break;
                case ParseState::HEADER_VALUE: ok = parse_header_value(c); break;
                case ParseState::BODY: parse_body(c); break;
                case ParseState::COMPLETE: return Ok(true);
                case ParseState::PARSE_ERROR: return Err<bool>(std::string("Parser in error state"));
            }

            if (!ok) {
                state_ = ParseState::PARSE_ERROR;
                return Err<bool>("Malformed HTTP request at line " + std::to_string(line_));
            }

            if (state_ == ParseState::COMPLETE) {
                return Ok(true);
            }
        }
        return Ok(false);
    }

    HttpRequest get_request() const {
        return request_;
    }

    bool is_complete() const {
        return state_ == ParseState::COMPLETE;
    }

    void reset() {
        state_ = ParseState::METHOD;
        request_ = HttpRequest();
        buffer_.clear();
        current_header_name_.clear();
        expected_body_length_ = 0;
        line_ = 1;
        last_char_was_cr_ = false;
    }

private:
    ParseState state_;
    HttpRequest request_;
    std::string buffer_;
    std::string current_header_name_;
    size_t expected_body_length_;
    size_t line_;
    bool last_char_was_cr_;

    bool parse_method(char c) {
        if (c == ' ') {
            if (buffer_.empty()) {
                return false;
            }
            request_.method = HttpMethodUtils::from_string(buffer_);
            if (request_.method == HttpMethod::UNKNOWN) {
                return false;
            }
            buffer_.clear();
            state_ = ParseState::URL;
            return true;
        }

        if (!std::isupper(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_url(char c) {
        if (c == ' ') {
            if (buffer_.empty() || buffer_.front() != '/') {
                return false;
            }
            request_.url = buffer_;
            split_target();
            buffer_.clear();
            state_ = ParseState::VERSION;
            return true;
        }

        if (!std::isprint(static_cast<unsigned char>(c))) {
            return false;
        }
        buffer_ += c;
        return true;
    }

    void split_target() {
        const auto question = request_.url.find('?');
        request_.path = percent_decode(request_.url.substr(0, question));
        if (question == std::string::npos) {
            return;
        }

        const std::string query = request_.url.substr(question + 1);
        size_t start = 0;
        while (start <= query.size()) {
            auto amp = query.find('&', start);
            if (amp == std::string::npos) {
                amp = query.size();
            }
            const std::string pair = query.substr(start, amp - start);
            if (!pair.empty()) {
                const auto eq = pair.find('=');
                const std::string key = percent_decode(pair.substr(0, eq));
                const std::string value = eq == std::string::npos ? "" : percent_decode(pair.substr(eq + 1));
                request_.query[key] = value;
            }
            start = amp + 1;
        }
    }

    bool parse_version(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            if (buffer_ == "HTTP/1.1") {
                request_.version = HttpVersion::HTTP_1_1;
            } else if (buffer_ == "HTTP/1.0") {
                request_.version = HttpVersion::HTTP_1_0;
            } else {
                return false;
            }
            buffer_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    bool parse_header_name(char c) {
        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            // Empty line - headers complete
            last_char_was_cr_ = false;

            const std::string content_length = request_.get_header("Content-Length");
            if (!content_length.empty()) {
                if (!detail::parse_length(content_length, expected_body_length_)) {
                    return false;
                }
                if (expected_body_length_ > 0) {
                    request_.body.reserve(expected_body_length_);
                    state_ = ParseState::BODY;
                    return true;
                }
            }

            state_ = ParseState::COMPLETE;
            return true;
        }

        last_char_was_cr_ = false;

        if (c == ':') {
            if (buffer_.empty()) {
                return false;
            }
            current_header_name_ = buffer_;
            buffer_.clear();
            state_ = ParseState::HEADER_VALUE;
            return true;
        }

        if (!std::isalnum(static_cast<unsigned char>(c)) && c != '-') {
            return false;
        }
        buffer_ += c;
        return true;
    }

    bool parse_header_value(char c) {
        if (buffer_.empty() && c == ' ') {
            return true;
        }

        if (c == '\r') {
            last_char_was_cr_ = true;
            return true;
        }

        if (c == '\n' && last_char_was_cr_) {
            request_.headers[current_header_name_] = buffer_;
            buffer_.clear();
            current_header_name_.clear();
            last_char_was_cr_ = false;
            state_ = ParseState::HEADER_NAME;
            return true;
        }

        last_char_was_cr_ = false;
        buffer_ += c;
        return true;
    }

    void parse_body(char c) {
        request_.body.push_back(static_cast<uint8_t>(c));
        if (request_.body.size() >= expected_body_length_) {
            state_ = ParseState::COMPLETE;
        }
    }
};

/**
 * @brief Response head as seen by the client
 */
struct HttpResponseHead {
    int status_code = 0;
    std::string reason_phrase;
    std::unordered_map<std::string, std::string> headers;

    std::string get_header(const std::string& name) const {
        return find_header(headers, name);
    }
};

/**
 * @brief Incremental parser for a response status line and headers
 *
 * The body is not consumed: parse() reports how many input bytes belonged
 * to the head so the caller can hand the remainder to its body reader.
 */
class HttpResponseParser {
public:
    static constexpr size_t kMaxHeadSize = 64 * 1024;

    Result<bool> parse(const char* data, size_t len, size_t& consumed) {
        consumed = 0;
        while (consumed < len) {
            if (complete_) {
                return Ok(true);
            }
            const char c = data[consumed++];
            if (++head_size_ > kMaxHeadSize) {
                return Err<bool>(std::string("Response head too large"));
            }

            if (c != '\n') {
                line_ += c;
                continue;
            }
            if (!line_.empty() && line_.back() == '\r') {
                line_.pop_back();
            }

            auto handled = status_seen_ ? handle_header_line() : handle_status_line();
            line_.clear();
            if (handled.is_error()) {
                return Err<bool>(handled.error());
            }
        }
        return Ok(complete_);
    }

    bool is_complete() const { return complete_; }

    const HttpResponseHead& head() const { return head_; }

private:
    Result<void> handle_status_line() {
        // HTTP/1.1 206 Partial Content
        if (line_.compare(0, 5, "HTTP/") != 0) {
            return Err<void>("Malformed status line: " + line_);
        }
        const auto first_space = line_.find(' ');
        if (first_space == std::string::npos || first_space + 4 > line_.size()) {
            return Err<void>("Malformed status line: " + line_);
        }
        const std::string code = line_.substr(first_space + 1, 3);
        if (code.find_first_not_of("0123456789") != std::string::npos) {
            return Err<void>("Malformed status code: " + line_);
        }
        head_.status_code = std::stoi(code);
        if (line_.size() > first_space + 5) {
            head_.reason_phrase = line_.substr(first_space + 5);
        }
        status_seen_ = true;
        return Ok();
    }

    Result<void> handle_header_line() {
        if (line_.empty()) {
            complete_ = true;
            return Ok();
        }
        const auto colon = line_.find(':');
        if (colon == std::string::npos || colon == 0) {
            return Err<void>("Malformed header line: " + line_);
        }
        std::string value = line_.substr(colon + 1);
        const auto first = value.find_first_not_of(" \t");
        value = first == std::string::npos ? "" : value.substr(first);
        head_.headers[line_.substr(0, colon)] = value;
        return Ok();
    }

    HttpResponseHead head_;
    std::string line_;
    size_t head_size_ = 0;
    bool status_seen_ = false;
    bool complete_ = false;
};

} // namespace dfm::network
