#include "tusup/network/url.hpp"

#include <algorithm>
#include <cctype>

namespace tusup {
namespace network {

namespace {

std::string to_lower(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// Splits "host[:port]" and validates the port.
Result<void> parse_authority(const std::string& authority, Url& url) {
    if (authority.empty()) {
        return Err<void>(decode_error("URL has an empty authority"));
    }

    std::string host_part = authority;
    const auto at = host_part.rfind('@');
    if (at != std::string::npos) {
        host_part = host_part.substr(at + 1);
    }

    const auto colon = host_part.rfind(':');
    const auto bracket = host_part.rfind(']');
    if (colon != std::string::npos && (bracket == std::string::npos || colon > bracket)) {
        const std::string port_text = host_part.substr(colon + 1);
        host_part = host_part.substr(0, colon);
        if (!port_text.empty()) {
            if (!std::all_of(port_text.begin(), port_text.end(),
                             [](unsigned char c) { return std::isdigit(c); }) ||
                port_text.size() > 5) {
                return Err<void>(decode_error("Invalid port in URL: " + port_text));
            }
            const unsigned long port = std::stoul(port_text);
            if (port == 0 || port > 65535) {
                return Err<void>(decode_error("Port out of range in URL: " + port_text));
            }
            url.port = static_cast<uint16_t>(port);
        }
    }

    if (host_part.empty()) {
        return Err<void>(decode_error("URL has an empty host"));
    }
    url.host = to_lower(host_part);
    return Ok();
}

} // namespace

Result<Url> Url::parse(const std::string& text) {
    Url url;
    std::string rest = text;

    // scheme ":" only counts if it precedes any '/', '?' or '#'
    const auto colon = rest.find(':');
    const auto first_delim = rest.find_first_of("/?#");
    if (colon != std::string::npos && colon > 0 &&
        (first_delim == std::string::npos || colon < first_delim) &&
        std::isalpha(static_cast<unsigned char>(rest[0])) &&
        std::all_of(rest.begin(), rest.begin() + static_cast<std::ptrdiff_t>(colon), is_scheme_char)) {
        url.scheme = to_lower(rest.substr(0, colon));
        rest = rest.substr(colon + 1);
    }

    if (rest.rfind("//", 0) == 0) {
        rest = rest.substr(2);
        const auto end = rest.find_first_of("/?#");
        const std::string authority = rest.substr(0, end);
        rest = end == std::string::npos ? std::string() : rest.substr(end);
        auto authority_result = parse_authority(authority, url);
        if (authority_result.is_error()) {
            return Err<Url>(authority_result.error());
        }
    } else if (url.has_scheme()) {
        return Err<Url>(decode_error("URL with scheme but no authority: " + text));
    }

    const auto fragment = rest.find('#');
    if (fragment != std::string::npos) {
        rest = rest.substr(0, fragment);
    }

    if (rest.empty() || rest[0] == '?') {
        rest = "/" + rest;
    } else if (rest[0] != '/') {
        rest = "/" + rest;
    }
    url.target = rest;
    return Ok(url);
}

uint16_t Url::effective_port() const {
    if (port != 0) {
        return port;
    }
    return is_secure() ? 443 : 80;
}

std::string Url::authority() const {
    if (port == 0) {
        return host;
    }
    return host + ":" + std::to_string(port);
}

std::string Url::to_string() const {
    std::string out;
    if (has_scheme()) {
        out += scheme + ":";
    }
    if (has_host()) {
        out += "//" + authority();
    }
    out += target;
    return out;
}

Result<Url> normalize_upload_url(const std::string& raw, const Url& base) {
    std::string text = raw;
    const auto comma = text.find(',');
    if (comma != std::string::npos) {
        text = text.substr(0, comma);
    }

    auto parsed = Url::parse(text);
    if (parsed.is_error()) {
        return parsed;
    }

    Url url = parsed.take_value();
    if (!url.has_host()) {
        url.host = base.host;
        url.port = base.port;
    }
    if (!url.has_scheme()) {
        url.scheme = base.scheme;
    }
    return Ok(url);
}

} // namespace network
} // namespace tusup
