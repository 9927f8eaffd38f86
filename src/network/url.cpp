#include "dfm/network/url.hpp"

#include <cctype>

namespace dfm::network {

Result<Url> Url::parse(const std::string& text) {
    const std::string prefix = "http://";
    if (text.compare(0, prefix.size(), prefix) != 0) {
        return Err<Url>(std::string("Only http:// URLs are supported: ") + text);
    }

    Url url;
    const std::string rest = text.substr(prefix.size());
    const auto slash = rest.find('/');
    const std::string authority = slash == std::string::npos ? rest : rest.substr(0, slash);
    url.target = slash == std::string::npos ? "/" : rest.substr(slash);

    if (authority.empty()) {
        return Err<Url>(std::string("URL has no host: ") + text);
    }

    const auto colon = authority.rfind(':');
    if (colon == std::string::npos) {
        url.host = authority;
    } else {
        url.host = authority.substr(0, colon);
        const std::string port_text = authority.substr(colon + 1);
        if (port_text.empty() || port_text.find_first_not_of("0123456789") != std::string::npos ||
            port_text.size() > 5) {
            return Err<Url>(std::string("Invalid port in URL: ") + text);
        }
        const unsigned long port = std::stoul(port_text);
        if (port == 0 || port > 65535) {
            return Err<Url>(std::string("Port out of range in URL: ") + text);
        }
        url.port = static_cast<std::uint16_t>(port);
    }

    if (url.host.empty()) {
        return Err<Url>(std::string("URL has no host: ") + text);
    }
    return Ok(url);
}

std::string Url::origin() const {
    std::string result = scheme + "://" + host;
    if (port != 80) {
        result += ":" + std::to_string(port);
    }
    return result;
}

std::string percent_encode(const std::string& text, bool keep_slash) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    out.reserve(text.size());
    for (unsigned char c : text) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' || (keep_slash && c == '/')) {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string percent_decode(const std::string& text) {
    std::string out;
    out.reserve(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        if (text[i] == '%' && i + 2 < text.size()) {
            const int high = hex_value(text[i + 1]);
            const int low = hex_value(text[i + 2]);
            if (high >= 0 && low >= 0) {
                out += static_cast<char>((high << 4) | low);
                i += 2;
                continue;
            }
        }
        out += text[i];
    }
    return out;
}

std::string resolve_url(const std::string& base, const std::string& reference) {
    if (reference.compare(0, 7, "http://") == 0) {
        return reference;
    }
    std::string trimmed = base;
    while (!trimmed.empty() && trimmed.back() == '/') {
        trimmed.pop_back();
    }
    if (reference.empty() || reference.front() != '/') {
        return trimmed + "/" + reference;
    }
    return trimmed + reference;
}

} // namespace dfm::network
