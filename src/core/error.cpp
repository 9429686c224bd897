#include "tusup/core/error.hpp"

#include <sstream>

namespace tusup {

namespace {

UploadError make_error(ErrorKind kind, std::string message, std::optional<int> status_code = std::nullopt) {
    UploadError error;
    error.kind = kind;
    error.status_code = status_code;
    error.message = std::move(message);
    return error;
}

} // namespace

std::string UploadError::describe() const {
    std::ostringstream oss;
    oss << error_kind_name(kind) << ": " << message;
    return oss.str();
}

UploadError protocol_error(std::string message, std::optional<int> status_code) {
    return make_error(ErrorKind::Protocol, std::move(message), status_code);
}

UploadError transport_error(std::string message) {
    return make_error(ErrorKind::Transport, std::move(message));
}

UploadError decode_error(std::string message) {
    return make_error(ErrorKind::Decode, std::move(message));
}

UploadError io_error(std::string message) {
    return make_error(ErrorKind::Io, std::move(message));
}

UploadError cancelled_error(std::string message) {
    return make_error(ErrorKind::Cancelled, std::move(message));
}

UploadError timeout_error(std::string message) {
    return make_error(ErrorKind::Timeout, std::move(message));
}

UploadError invalid_state_error(std::string message) {
    return make_error(ErrorKind::InvalidState, std::move(message));
}

const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Protocol: return "ProtocolError";
        case ErrorKind::Transport: return "TransportError";
        case ErrorKind::Decode: return "DecodeError";
        case ErrorKind::Io: return "IoError";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::Timeout: return "Timeout";
        case ErrorKind::InvalidState: return "InvalidState";
    }
    return "Unknown";
}

} // namespace tusup
