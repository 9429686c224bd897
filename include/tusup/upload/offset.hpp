#pragma once

#include "tusup/core/result.hpp"
#include "tusup/network/cancellation.hpp"
#include "tusup/network/http_client.hpp"

#include <cstdint>
#include <optional>
#include <string>

namespace tusup::upload {

/**
 * @brief Parse an Upload-Offset header value
 *
 * Only the first element of a comma-separated list counts. Empty or
 * non-numeric input yields std::nullopt, which is distinct from offset 0.
 *
 * "1234" -> 1234, "1234,5678" -> 1234, "" -> nullopt, "abc" -> nullopt
 */
std::optional<std::uint64_t> parse_offset(const std::optional<std::string>& value);

/**
 * @brief Keeps the client's idea of the upload offset tied to the server's
 *
 * The server-reported offset is authoritative. query() asks for it before a
 * transfer starts; confirm() checks the offset echoed after every chunk.
 */
class OffsetReconciler {
public:
    OffsetReconciler(network::HttpClient& http, std::string accept_media_type);

    /// HEAD the upload URL and return the server's offset.
    Result<std::uint64_t> query(const network::Url& upload_url,
                                const network::CancellationToken& token) const;

    /**
     * Validate a chunk submission response: 2xx status and an Upload-Offset
     * equal to @p expected. Anything else is a protocol error.
     */
    static Result<std::uint64_t> confirm(const network::HttpResponse& response,
                                         std::uint64_t expected);

private:
    network::HttpClient& http_;
    std::string accept_media_type_;
};

} // namespace tusup::upload
