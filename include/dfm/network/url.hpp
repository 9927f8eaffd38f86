#pragma once

#include "dfm/core/result.hpp"

#include <cstdint>
#include <string>

namespace dfm::network {

/**
 * @brief Minimal http:// URL split into the parts a client request needs
 *
 * Only plain HTTP is supported. The target keeps its query string and is
 * sent verbatim on the request line.
 */
struct Url {
    std::string scheme = "http";
    std::string host;
    std::uint16_t port = 80;
    std::string target = "/";

    static Result<Url> parse(const std::string& text);

    /// "http://host:port", used to resolve server-relative URLs
    std::string origin() const;

    std::string to_string() const { return origin() + target; }
};

/**
 * @brief Percent-encode a string for use in a URL
 *
 * Unreserved characters are kept. '/' is kept when keep_slash is true so
 * remote paths stay readable in the request target.
 */
std::string percent_encode(const std::string& text, bool keep_slash = true);

/// Decode %XX escapes; '+' is left alone. Malformed escapes are copied through.
std::string percent_decode(const std::string& text);

/// Join a base URL and a server-relative target ("/files/a"); absolute URLs are returned as-is
std::string resolve_url(const std::string& base, const std::string& reference);

} // namespace dfm::network
