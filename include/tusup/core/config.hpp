#pragma once

#include "tusup/core/result.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>

namespace tusup {

/**
 * @brief Settings shared by the upload client and the command line tool
 *
 * JSON keys match the member names, durations are given in seconds:
 * {
 *   "creation_endpoint": "https://api.vimeo.com/me/videos",
 *   "api_base": "https://api.vimeo.com",
 *   "access_token": "...",
 *   "default_chunk_size": 1048576,
 *   "poll_interval_seconds": 10,
 *   "poll_max_attempts": 60,
 *   "request_timeout_seconds": 60,
 *   "store_path": "uploads.json",
 *   "folder_id": ""
 * }
 */
struct ClientConfig {
    std::string creation_endpoint = "https://api.vimeo.com/me/videos";
    std::string api_base = "https://api.vimeo.com";
    std::string access_token;
    std::string accept_media_type = "application/vnd.vimeo.*+json;version=3.4";
    std::size_t default_chunk_size = 1024 * 1024;  // 1 MiB
    std::chrono::seconds poll_interval{10};
    std::size_t poll_max_attempts = 60;
    std::chrono::seconds request_timeout{60};
    bool verify_tls = true;
    std::filesystem::path store_path;              // Empty disables resuming
    std::string folder_id;                         // Empty skips the move
};

constexpr const char* kAccessTokenEnv = "TUSUP_ACCESS_TOKEN";

/// Parse a JSON document; missing keys keep their defaults, unknown keys are ignored.
Result<ClientConfig> parse_config(const std::string& json_text);

Result<ClientConfig> load_config(const std::filesystem::path& path);

/// Fill access_token from TUSUP_ACCESS_TOKEN when it is still empty.
void apply_environment(ClientConfig& config);

/// Report the first setting that makes the configuration unusable.
Result<void> validate_config(const ClientConfig& config);

} // namespace tusup
