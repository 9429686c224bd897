#pragma once

#include "tusup/core/result.hpp"

#include <cstdint>
#include <string>

namespace tusup {
namespace network {

/**
 * @brief Minimal absolute-or-relative URL model
 *
 * Only the pieces an HTTP/1.1 client needs are kept: scheme, host, optional
 * explicit port and the request target (path plus query). A URL without a
 * host is relative ("path-only"); a URL without a scheme is scheme-relative.
 *
 * Examples:
 *   "https://api.vimeo.com/me/videos"  -> scheme=https host=api.vimeo.com port=0 target=/me/videos
 *   "https://host:443/api"             -> port=443 (kept explicit when serialized)
 *   "/files/1"                         -> scheme="" host="" target=/files/1
 */
struct Url {
    std::string scheme;   // lower-case, empty when absent
    std::string host;     // empty when absent
    uint16_t port = 0;    // 0 means "not given in the URL"
    std::string target;   // path + query, always starts with '/' once parsed

    static Result<Url> parse(const std::string& text);

    bool has_host() const { return !host.empty(); }
    bool has_scheme() const { return !scheme.empty(); }
    bool is_secure() const { return scheme == "https"; }

    /// Port to connect to: explicit port, else the scheme default.
    uint16_t effective_port() const;

    /// Value for the Host header (port appended only when explicit).
    std::string authority() const;

    std::string to_string() const;

    bool operator==(const Url& other) const {
        return scheme == other.scheme && host == other.host &&
               port == other.port && target == other.target;
    }
    bool operator!=(const Url& other) const { return !(*this == other); }
};

/**
 * @brief Turn a server-returned upload location into a usable URL
 *
 * Anything after the first comma is dropped (servers may return a list of
 * alternates). A missing host inherits host and port from @p base; a missing
 * scheme inherits the scheme of @p base.
 */
Result<Url> normalize_upload_url(const std::string& raw, const Url& base);

} // namespace network
} // namespace tusup
