#include "tusup/upload/offset.hpp"
#include "tusup/upload/protocol.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>

namespace tusup::upload {

std::optional<std::uint64_t> parse_offset(const std::optional<std::string>& value) {
    if (!value || value->empty()) {
        return std::nullopt;
    }

    std::string text = *value;
    const auto comma = text.find(',');
    if (comma != std::string::npos) {
        text = text.substr(0, comma);
    }

    // Up to 19 digits always fits in 64 bits
    if (text.empty() || text.size() > 19 ||
        !std::all_of(text.begin(), text.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return std::nullopt;
    }
    return static_cast<std::uint64_t>(std::stoull(text));
}

OffsetReconciler::OffsetReconciler(network::HttpClient& http, std::string accept_media_type)
    : http_(http), accept_media_type_(std::move(accept_media_type)) {}

Result<std::uint64_t> OffsetReconciler::query(const network::Url& upload_url,
                                              const network::CancellationToken& token) const {
    network::HttpRequest request;
    request.method = network::HttpMethod::HEAD;
    request.url = upload_url;
    request.headers.set(protocol::kTusResumableHeader, protocol::kTusVersion);
    request.headers.set(protocol::kAcceptHeader, accept_media_type_);

    auto sent = http_.send(request, token);
    if (sent.is_error()) {
        return Err<std::uint64_t>(sent.error());
    }
    const auto& response = sent.value();

    if (!response.is_success()) {
        return Err<std::uint64_t>(protocol_error(
            "unexpected status code (" + std::to_string(response.status_code) + ") while resuming upload",
            response.status_code));
    }

    const auto offset = parse_offset(response.header(protocol::kUploadOffsetHeader));
    if (!offset) {
        return Err<std::uint64_t>(protocol_error(
            "missing upload offset in response for resuming upload", response.status_code));
    }

    spdlog::debug("Server reports offset {} for {}", *offset, upload_url.to_string());
    return Ok<std::uint64_t>(*offset);
}

Result<std::uint64_t> OffsetReconciler::confirm(const network::HttpResponse& response,
                                                std::uint64_t expected) {
    if (!response.is_success()) {
        return Err<std::uint64_t>(protocol_error(
            "unexpected status code (" + std::to_string(response.status_code) + ") while uploading chunk",
            response.status_code));
    }

    const auto server_offset = parse_offset(response.header(protocol::kUploadOffsetHeader));
    if (!server_offset) {
        return Err<std::uint64_t>(protocol_error(
            "response to PATCH request contains no or invalid Upload-Offset header",
            response.status_code));
    }

    if (*server_offset != expected) {
        return Err<std::uint64_t>(protocol_error(
            "response contains different Upload-Offset value (" + std::to_string(*server_offset) +
            ") than expected (" + std::to_string(expected) + ")",
            response.status_code));
    }
    return Ok<std::uint64_t>(*server_offset);
}

} // namespace tusup::upload
