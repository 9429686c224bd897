#pragma once

#include <optional>
#include <string>

namespace tusup {

enum class ErrorKind {
    Protocol,      // Server broke the status/header contract
    Transport,     // Connection, TLS or socket failure
    Decode,        // Malformed JSON or HTTP framing
    Io,            // Local file access
    Cancelled,     // Request abandoned through its cancellation token
    Timeout,       // Bounded wait exhausted
    InvalidState   // Operation not allowed in the current session state
};

/**
 * @brief Error value carried by every Result in the library
 *
 * Protocol errors embed the offending HTTP status code when there was one.
 * Errors coming from collaborators (transport, decoding, file access) keep
 * the collaborator's message unchanged.
 */
struct UploadError {
    ErrorKind kind = ErrorKind::Protocol;
    std::optional<int> status_code;
    std::string message;

    bool is_protocol_error() const noexcept { return kind == ErrorKind::Protocol; }
    bool is_cancelled() const noexcept { return kind == ErrorKind::Cancelled; }

    std::string describe() const;
};

UploadError protocol_error(std::string message, std::optional<int> status_code = std::nullopt);
UploadError transport_error(std::string message);
UploadError decode_error(std::string message);
UploadError io_error(std::string message);
UploadError cancelled_error(std::string message);
UploadError timeout_error(std::string message);
UploadError invalid_state_error(std::string message);

const char* error_kind_name(ErrorKind kind) noexcept;

} // namespace tusup
