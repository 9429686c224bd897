#include "tusup/network/http_response_parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstring>

namespace tusup {
namespace network {

namespace {

bool is_token_char(char c) {
    if (std::isalnum(static_cast<unsigned char>(c))) {
        return true;
    }
    return c != '\0' && std::strchr("!#$%&'*+-.^_`|~", c) != nullptr;
}

std::string trim(const std::string& value) {
    const auto first = value.find_first_not_of(" \t");
    if (first == std::string::npos) {
        return {};
    }
    const auto last = value.find_last_not_of(" \t");
    return value.substr(first, last - first + 1);
}

bool contains_ignore_case(const std::string& haystack, const std::string& needle) {
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b) {
                              return std::tolower(static_cast<unsigned char>(a)) ==
                                     std::tolower(static_cast<unsigned char>(b));
                          });
    return it != haystack.end();
}

} // namespace

void HttpResponseParser::reset() {
    state_ = ResponseParseState::VERSION;
    response_ = HttpResponse();
    buffer_.clear();
    current_header_name_.clear();
    body_remaining_ = 0;
    line_ = 1;
    last_char_was_cr_ = false;
}

Result<bool> HttpResponseParser::fail(const std::string& what) const {
    return Err<bool>(decode_error("Failed to parse " + what + " at line " + std::to_string(line_)));
}

Result<bool> HttpResponseParser::parse(const char* data, std::size_t len) {
    std::size_t i = 0;
    while (i < len) {
        switch (state_) {
            case ResponseParseState::BODY_FIXED:
            case ResponseParseState::CHUNK_DATA: {
                const std::size_t n = std::min(body_remaining_, len - i);
                response_.body.insert(response_.body.end(), data + i, data + i + n);
                i += n;
                body_remaining_ -= n;
                if (body_remaining_ == 0) {
                    state_ = state_ == ResponseParseState::BODY_FIXED
                                 ? ResponseParseState::COMPLETE
                                 : ResponseParseState::CHUNK_DATA_END;
                }
                break;
            }

            case ResponseParseState::BODY_UNTIL_CLOSE:
                response_.body.insert(response_.body.end(), data + i, data + len);
                i = len;
                break;

            case ResponseParseState::COMPLETE:
                // Bytes past the end of the response are ignored; we never pipeline
                return Ok(true);

            case ResponseParseState::PARSE_ERROR:
                return Err<bool>(decode_error("Parser in error state"));

            default: {
                const char c = data[i++];
                if (c == '\n') {
                    line_++;
                }

                bool ok = true;
                const char* what = "";
                switch (state_) {
                    case ResponseParseState::VERSION: ok = parse_version(c); what = "HTTP version"; break;
                    case ResponseParseState::STATUS_CODE: ok = parse_status_code(c); what = "status code"; break;
                    case ResponseParseState::REASON: ok = parse_reason(c); what = "reason phrase"; break;
                    case ResponseParseState::HEADER_NAME: ok = parse_header_name(c); what = "header name"; break;
                    case ResponseParseState::HEADER_VALUE: ok = parse_header_value(c); what = "header value"; break;
                    case ResponseParseState::CHUNK_SIZE: ok = parse_chunk_size(c); what = "chunk size"; break;
                    case ResponseParseState::CHUNK_DATA_END: ok = parse_chunk_data_end(c); what = "chunk terminator"; break;
                    case ResponseParseState::CHUNK_TRAILER: ok = parse_chunk_trailer(c); what = "chunk trailer"; break;
                    default: break;
                }
                if (!ok) {
                    state_ = ResponseParseState::PARSE_ERROR;
                    return fail(what);
                }
                break;
            }
        }

        if (state_ == ResponseParseState::COMPLETE) {
            return Ok(true);
        }
    }

    return Ok(state_ == ResponseParseState::COMPLETE);
}

Result<bool> HttpResponseParser::finish() {
    if (state_ == ResponseParseState::COMPLETE) {
        return Ok(true);
    }
    if (state_ == ResponseParseState::BODY_UNTIL_CLOSE) {
        state_ = ResponseParseState::COMPLETE;
        return Ok(true);
    }
    if (state_ == ResponseParseState::VERSION && buffer_.empty()) {
        return Err<bool>(transport_error("Connection closed before a response was received"));
    }
    return Err<bool>(transport_error("Connection closed with a truncated response"));
}

bool HttpResponseParser::parse_version(char c) {
    if (c == ' ') {
        if (buffer_ != "HTTP/1.1" && buffer_ != "HTTP/1.0") {
            return false;
        }
        buffer_.clear();
        state_ = ResponseParseState::STATUS_CODE;
        return true;
    }
    if (buffer_.size() >= 8 || !std::isprint(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_status_code(char c) {
    if (c == ' ' || c == '\r') {
        if (buffer_.size() != 3) {
            return false;
        }
        response_.status_code = std::stoi(buffer_);
        buffer_.clear();
        last_char_was_cr_ = (c == '\r');
        state_ = ResponseParseState::REASON;
        return true;
    }
    if (!std::isdigit(static_cast<unsigned char>(c))) {
        return false;
    }
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_reason(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        response_.reason_phrase = buffer_;
        buffer_.clear();
        last_char_was_cr_ = false;
        state_ = ResponseParseState::HEADER_NAME;
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_header_name(char c) {
    // Empty line ends the header block
    if (c == '\r' && buffer_.empty()) {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        return begin_body();
    }

    last_char_was_cr_ = false;

    if (c == ':') {
        if (buffer_.empty()) {
            return false;
        }
        current_header_name_ = buffer_;
        buffer_.clear();
        state_ = ResponseParseState::HEADER_VALUE;
        return true;
    }

    if (!is_token_char(c)) {
        return false;
    }

    buffer_ += c;
    return true;
}

bool HttpResponseParser::parse_header_value(char c) {
    // Skip leading whitespace after colon
    if (buffer_.empty() && (c == ' ' || c == '\t')) {
        return true;
    }

    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        response_.headers.append(current_header_name_, trim(buffer_));
        buffer_.clear();
        current_header_name_.clear();
        last_char_was_cr_ = false;
        state_ = ResponseParseState::HEADER_NAME;
        return true;
    }

    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

bool HttpResponseParser::begin_body() {
    // Interim 1xx responses are skipped; the final response follows
    if (response_.status_code >= 100 && response_.status_code < 200) {
        const bool no_body = no_body_expected_;
        reset();
        no_body_expected_ = no_body;
        return true;
    }

    if (response_has_no_body()) {
        state_ = ResponseParseState::COMPLETE;
        return true;
    }

    const auto transfer_encoding = response_.headers.get("Transfer-Encoding");
    if (transfer_encoding && contains_ignore_case(*transfer_encoding, "chunked")) {
        state_ = ResponseParseState::CHUNK_SIZE;
        return true;
    }

    const auto content_length = response_.headers.get("Content-Length");
    if (content_length) {
        const std::string value = trim(*content_length);
        if (value.empty() || value.size() > 18 ||
            !std::all_of(value.begin(), value.end(),
                         [](unsigned char ch) { return std::isdigit(ch); })) {
            return false;
        }
        body_remaining_ = static_cast<std::size_t>(std::stoull(value));
        if (body_remaining_ == 0) {
            state_ = ResponseParseState::COMPLETE;
            return true;
        }
        response_.body.reserve(body_remaining_);
        state_ = ResponseParseState::BODY_FIXED;
        return true;
    }

    state_ = ResponseParseState::BODY_UNTIL_CLOSE;
    return true;
}

bool HttpResponseParser::response_has_no_body() const {
    return no_body_expected_ || response_.status_code == 204 || response_.status_code == 304;
}

bool HttpResponseParser::parse_chunk_size(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }

    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        std::string size_text = buffer_.substr(0, buffer_.find(';'));
        size_text = trim(size_text);
        buffer_.clear();
        if (size_text.empty() || size_text.size() > 15 ||
            !std::all_of(size_text.begin(), size_text.end(),
                         [](unsigned char ch) { return std::isxdigit(ch); })) {
            return false;
        }
        body_remaining_ = static_cast<std::size_t>(std::stoull(size_text, nullptr, 16));
        state_ = body_remaining_ == 0 ? ResponseParseState::CHUNK_TRAILER
                                      : ResponseParseState::CHUNK_DATA;
        return true;
    }

    last_char_was_cr_ = false;
    buffer_ += c;
    return buffer_.size() <= 256;
}

bool HttpResponseParser::parse_chunk_data_end(char c) {
    if (c == '\r' && !last_char_was_cr_) {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        state_ = ResponseParseState::CHUNK_SIZE;
        return true;
    }
    return false;
}

bool HttpResponseParser::parse_chunk_trailer(char c) {
    if (c == '\r') {
        last_char_was_cr_ = true;
        return true;
    }
    if (c == '\n' && last_char_was_cr_) {
        last_char_was_cr_ = false;
        if (buffer_.empty()) {
            state_ = ResponseParseState::COMPLETE;
        }
        // Trailer fields are not used by this client
        buffer_.clear();
        return true;
    }
    last_char_was_cr_ = false;
    buffer_ += c;
    return true;
}

} // namespace network
} // namespace tusup
