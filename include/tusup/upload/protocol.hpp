#pragma once

namespace tusup::upload::protocol {

constexpr const char* kTusVersion = "1.0.0";

constexpr const char* kTusResumableHeader = "Tus-Resumable";
constexpr const char* kUploadOffsetHeader = "Upload-Offset";
constexpr const char* kContentTypeHeader = "Content-Type";
constexpr const char* kAcceptHeader = "Accept";
constexpr const char* kAuthorizationHeader = "Authorization";

constexpr const char* kOffsetOctetStream = "application/offset+octet-stream";
constexpr const char* kJsonContentType = "application/json";

// Versioned vendor media type pinned on offset queries and chunk submissions
constexpr const char* kDefaultAcceptMediaType = "application/vnd.vimeo.*+json;version=3.4";

} // namespace tusup::upload::protocol
