#pragma once

#include "tusup/core/result.hpp"
#include "tusup/network/http_types.hpp"

#include <cstddef>
#include <string>

namespace tusup {
namespace network {

/**
 * @brief State machine states for HTTP response parsing
 *
 * Response format:
 * VERSION SP STATUS SP REASON CRLF   <- Status line
 * Header-Name: Header-Value CRLF     <- Headers (multiple)
 * CRLF                               <- Empty line
 * [Body]                             <- Content-Length, chunked, or until close
 */
enum class ResponseParseState {
    VERSION,
    STATUS_CODE,
    REASON,
    HEADER_NAME,
    HEADER_VALUE,
    BODY_FIXED,        // Content-Length bytes
    CHUNK_SIZE,        // Hex size line of a chunked body
    CHUNK_DATA,
    CHUNK_DATA_END,    // CRLF after chunk data
    CHUNK_TRAILER,     // Trailer section after the last chunk
    BODY_UNTIL_CLOSE,  // No framing; body ends when the peer closes
    COMPLETE,
    PARSE_ERROR
};

/**
 * @brief Incremental HTTP/1.x response parser
 *
 * Feed bytes as they arrive from the socket. parse() returns true once a full
 * response is available. When the connection reaches EOF call finish(): it
 * completes responses whose body is delimited by connection close and reports
 * truncation for everything else.
 *
 * Usage:
 * ```cpp
 * HttpResponseParser parser;
 * parser.expect_no_body(request.method == HttpMethod::HEAD);
 * while (!done) {
 *     auto n = socket.read_some(buffer);
 *     auto result = parser.parse(buffer.data(), n);
 *     if (result.is_error()) { ... }
 *     done = result.value();
 * }
 * HttpResponse response = parser.get_response();
 * ```
 */
class HttpResponseParser {
public:
    HttpResponseParser() { reset(); }

    /// Responses to HEAD requests carry headers only, whatever Content-Length says.
    void expect_no_body(bool value) { no_body_expected_ = value; }

    Result<bool> parse(const char* data, std::size_t len);

    /// Signal end of stream.
    Result<bool> finish();

    HttpResponse get_response() const { return response_; }

    bool is_complete() const { return state_ == ResponseParseState::COMPLETE; }

    ResponseParseState state() const { return state_; }

    void reset();

private:
    bool parse_version(char c);
    bool parse_status_code(char c);
    bool parse_reason(char c);
    bool parse_header_name(char c);
    bool parse_header_value(char c);
    bool parse_chunk_size(char c);
    bool parse_chunk_data_end(char c);
    bool parse_chunk_trailer(char c);

    bool begin_body();
    bool response_has_no_body() const;

    Result<bool> fail(const std::string& what) const;

    ResponseParseState state_;
    HttpResponse response_;
    std::string buffer_;                // Current token
    std::string current_header_name_;
    std::size_t body_remaining_;        // Bytes left in fixed body or current chunk
    std::size_t line_;                  // For error reporting
    bool last_char_was_cr_;
    bool no_body_expected_ = false;
};

} // namespace network
} // namespace tusup
