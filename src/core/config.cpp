#include "tusup/core/config.hpp"
#include "tusup/network/url.hpp"

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <fstream>
#include <sstream>

namespace tusup {
using json = nlohmann::json;

Result<ClientConfig> parse_config(const std::string& json_text) {
    auto document = json::parse(json_text, nullptr, false);
    if (document.is_discarded()) {
        return Err<ClientConfig>(decode_error("Configuration is not valid JSON"));
    }
    if (!document.is_object()) {
        return Err<ClientConfig>(decode_error("Configuration must be a JSON object"));
    }

    ClientConfig config;
    try {
        config.creation_endpoint = document.value("creation_endpoint", config.creation_endpoint);
        config.api_base = document.value("api_base", config.api_base);
        config.access_token = document.value("access_token", config.access_token);
        config.accept_media_type = document.value("accept_media_type", config.accept_media_type);
        config.default_chunk_size = document.value("default_chunk_size", config.default_chunk_size);
        config.poll_interval = std::chrono::seconds(
            document.value("poll_interval_seconds", static_cast<long long>(config.poll_interval.count())));
        config.poll_max_attempts = document.value("poll_max_attempts", config.poll_max_attempts);
        config.request_timeout = std::chrono::seconds(
            document.value("request_timeout_seconds", static_cast<long long>(config.request_timeout.count())));
        config.verify_tls = document.value("verify_tls", config.verify_tls);
        config.store_path = document.value("store_path", config.store_path.string());
        config.folder_id = document.value("folder_id", config.folder_id);
    } catch (const json::type_error& e) {
        return Err<ClientConfig>(decode_error(std::string("Invalid configuration value: ") + e.what()));
    }

    return Ok(config);
}

Result<ClientConfig> load_config(const std::filesystem::path& path) {
    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<ClientConfig>(io_error("Failed to open configuration file: " + path.string()));
    }
    std::ostringstream content;
    content << input.rdbuf();
    return parse_config(content.str());
}

void apply_environment(ClientConfig& config) {
    if (!config.access_token.empty()) {
        return;
    }
    if (const char* token = std::getenv(kAccessTokenEnv)) {
        config.access_token = token;
    }
}

Result<void> validate_config(const ClientConfig& config) {
    auto endpoint = network::Url::parse(config.creation_endpoint);
    if (endpoint.is_error() || !endpoint.value().has_host()) {
        return Err<void>(invalid_state_error("creation_endpoint must be an absolute URL"));
    }
    auto api_base = network::Url::parse(config.api_base);
    if (api_base.is_error() || !api_base.value().has_host()) {
        return Err<void>(invalid_state_error("api_base must be an absolute URL"));
    }
    if (config.access_token.empty()) {
        return Err<void>(invalid_state_error(std::string("access_token is required (or set ") +
                                             kAccessTokenEnv + ")"));
    }
    if (config.default_chunk_size == 0) {
        return Err<void>(invalid_state_error("default_chunk_size must be > 0"));
    }
    return Ok();
}

} // namespace tusup
