#pragma once

#include "tusup/network/url.hpp"

#include <cstdint>
#include <cstring>  // For _stricmp on Windows, strcasecmp on Unix
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

// For strcasecmp on Unix/Linux
#ifndef _WIN32
#include <strings.h>
#endif

namespace tusup {
namespace network {

/**
 * @brief HTTP request methods used by the upload client
 *
 * POST creates the upload, HEAD queries the offset, PATCH submits chunks,
 * GET/PUT/DELETE drive the follow-up video API calls.
 */
enum class HttpMethod {
    GET,
    POST,
    PUT,
    PATCH,
    DELETE_METHOD,  // Renamed to avoid Windows macro conflict
    HEAD
};

/**
 * @brief Header storage with case-insensitive lookup
 *
 * HTTP headers are case-insensitive per RFC 7230, but we store them as the
 * sender wrote them. Lookups compare names without regard to case.
 */
class HeaderMap {
public:
    using Storage = std::unordered_map<std::string, std::string>;

    HeaderMap() = default;
    HeaderMap(std::initializer_list<Storage::value_type> init) : headers_(init) {}

    /// Replaces any existing header with the same name (ignoring case).
    void set(const std::string& name, const std::string& value) {
        erase(name);
        headers_[name] = value;
    }

    /// Appends to an existing header as a comma-separated list (RFC 7230 3.2.2).
    void append(const std::string& name, const std::string& value) {
        for (auto& [key, existing] : headers_) {
            if (equals_ignore_case(key, name)) {
                existing += ", " + value;
                return;
            }
        }
        headers_[name] = value;
    }

    std::optional<std::string> get(const std::string& name) const {
        for (const auto& [key, value] : headers_) {
            if (equals_ignore_case(key, name)) {
                return value;
            }
        }
        return std::nullopt;
    }

    bool contains(const std::string& name) const { return get(name).has_value(); }

    void erase(const std::string& name) {
        for (auto it = headers_.begin(); it != headers_.end();) {
            if (equals_ignore_case(it->first, name)) {
                it = headers_.erase(it);
            } else {
                ++it;
            }
        }
    }

    std::size_t size() const { return headers_.size(); }
    bool empty() const { return headers_.empty(); }

    Storage::const_iterator begin() const { return headers_.begin(); }
    Storage::const_iterator end() const { return headers_.end(); }

private:
    // Cross-platform case-insensitive string comparison
    static bool equals_ignore_case(const std::string& a, const std::string& b) {
#ifdef _WIN32
        return _stricmp(a.c_str(), b.c_str()) == 0;
#else
        return strcasecmp(a.c_str(), b.c_str()) == 0;
#endif
    }

    Storage headers_;
};

/**
 * @brief Outgoing HTTP request
 *
 * Body is a byte vector because chunk submissions carry raw file data.
 */
struct HttpRequest {
    HttpMethod method = HttpMethod::GET;
    Url url;
    HeaderMap headers;
    std::vector<uint8_t> body;

    void set_body(const std::string& content) {
        body.assign(content.begin(), content.end());
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }

    /**
     * @brief Serialize to HTTP/1.1 wire format
     *
     * Host, Content-Length and Connection are filled in here; callers only
     * set application headers.
     */
    std::vector<uint8_t> serialize() const;
};

/**
 * @brief Incoming HTTP response
 */
struct HttpResponse {
    int status_code = 0;
    std::string reason_phrase;
    HeaderMap headers;
    std::vector<uint8_t> body;

    bool is_success() const { return status_code >= 200 && status_code < 300; }

    std::optional<std::string> header(const std::string& name) const {
        return headers.get(name);
    }

    std::string body_as_string() const {
        return std::string(body.begin(), body.end());
    }
};

/**
 * @brief Helper functions for HTTP method conversions
 */
class HttpMethodUtils {
public:
    static std::string to_string(HttpMethod method) {
        switch (method) {
            case HttpMethod::GET: return "GET";
            case HttpMethod::POST: return "POST";
            case HttpMethod::PUT: return "PUT";
            case HttpMethod::PATCH: return "PATCH";
            case HttpMethod::DELETE_METHOD: return "DELETE";
            case HttpMethod::HEAD: return "HEAD";
        }
        return "GET";
    }
};

} // namespace network
} // namespace tusup
