#include "tusup/upload/video_api.hpp"
#include "tusup/upload/protocol.hpp"

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <thread>

namespace tusup::upload {
using json = nlohmann::json;

namespace {

bool accepted(int status_code) {
    return (status_code >= 200 && status_code < 300) || status_code == 404;
}

std::string join_path(const std::string& base, const std::string& path) {
    if (base.empty() || base == "/") {
        return path;
    }
    if (base.back() == '/') {
        return base.substr(0, base.size() - 1) + path;
    }
    return base + path;
}

} // namespace

std::string CreationDetails::resource_id() const {
    const auto slash = uri.rfind('/');
    if (slash == std::string::npos) {
        return uri;
    }
    return uri.substr(slash + 1);
}

Result<CreationDetails> CreationDetails::from_response(const network::HttpResponse& response) {
    CreationDetails details;
    details.status_code = response.status_code;
    details.raw_body = response.body_as_string();

    auto body = json::parse(details.raw_body, nullptr, false);
    if (body.is_discarded()) {
        return Err<CreationDetails>(decode_error("Creation response is not valid JSON"));
    }
    if (!body.is_object()) {
        return Err<CreationDetails>(decode_error("Creation response is not a JSON object"));
    }

    if (body.contains("uri") && body["uri"].is_string()) {
        details.uri = body["uri"].get<std::string>();
    }
    if (body.contains("upload") && body["upload"].is_object()) {
        const auto& upload = body["upload"];
        if (upload.contains("upload_link") && upload["upload_link"].is_string()) {
            details.upload_link = upload["upload_link"].get<std::string>();
        }
    }
    return Ok(details);
}

Sleeper thread_sleeper() {
    return [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); };
}

VideoApi::VideoApi(network::HttpClient& http,
                   network::Url api_base,
                   std::string access_token,
                   Sleeper sleeper)
    : http_(http),
      api_base_(std::move(api_base)),
      access_token_(std::move(access_token)),
      sleeper_(std::move(sleeper)) {}

network::HttpRequest VideoApi::make_request(network::HttpMethod method, const std::string& path) const {
    network::HttpRequest request;
    request.method = method;
    request.url = api_base_;
    request.url.target = join_path(api_base_.target, path);
    request.headers.set(protocol::kAuthorizationHeader, "Bearer " + access_token_);
    return request;
}

Result<network::HttpResponse> VideoApi::send_accepting_404(network::HttpRequest request, const char* action) {
    auto sent = http_.send(request, network::CancellationToken{});
    if (sent.is_error()) {
        return sent;
    }
    const int status = sent.value().status_code;
    if (!accepted(status)) {
        return Err<network::HttpResponse>(protocol_error(
            "unexpected status code (" + std::to_string(status) + ") while " + action, status));
    }
    return sent;
}

Result<void> VideoApi::delete_video(const CreationDetails& details) {
    const std::string id = details.resource_id();
    if (id.empty()) {
        return Err<void>(protocol_error("creation response has no video uri"));
    }

    auto sent = send_accepting_404(make_request(network::HttpMethod::DELETE_METHOD, "/videos/" + id),
                                   "deleting video");
    if (sent.is_error()) {
        return Err<void>(sent.error());
    }
    spdlog::info("Deleted video {} (status {})", id, sent.value().status_code);
    return Ok();
}

Result<bool> VideoApi::move_to_folder(const std::optional<CreationDetails>& details,
                                      const std::string& folder_id) {
    if (!details) {
        return Ok(false);
    }
    const std::string id = details->resource_id();
    if (id.empty()) {
        return Err<bool>(protocol_error("creation response has no video uri"));
    }

    auto sent = send_accepting_404(
        make_request(network::HttpMethod::PUT, "/me/projects/" + folder_id + "/videos/" + id),
        "moving video");
    if (sent.is_error()) {
        return Err<bool>(sent.error());
    }
    spdlog::info("Moved video {} to folder {}", id, folder_id);
    return Ok(true);
}

Result<std::optional<std::string>> VideoApi::playback_link(const std::optional<CreationDetails>& details,
                                                           const PollPolicy& policy) {
    using Link = std::optional<std::string>;
    if (!details) {
        return Ok(Link{});
    }
    const std::string id = details->resource_id();
    if (id.empty()) {
        return Err<Link>(protocol_error("creation response has no video uri"));
    }

    const std::size_t max_attempts = policy.max_attempts == 0 ? 1 : policy.max_attempts;
    for (std::size_t attempt = 1; attempt <= max_attempts; ++attempt) {
        auto sent = send_accepting_404(make_request(network::HttpMethod::GET, "/videos/" + id),
                                       "retrieving video url");
        if (sent.is_error()) {
            return Err<Link>(sent.error());
        }

        auto body = json::parse(sent.value().body_as_string(), nullptr, false);
        if (body.is_discarded()) {
            return Err<Link>(decode_error("Video status response is not valid JSON"));
        }

        const std::string status = body.is_object() ? body.value("status", std::string{}) : std::string{};
        if (status == "available") {
            processing_.store(false);
            if (body.contains("files") && body["files"].is_array()) {
                for (const auto& file : body["files"]) {
                    if (file.is_object() && file.value("quality", std::string{}) == "hls" &&
                        file.contains("link") && file["link"].is_string()) {
                        return Ok(Link{file["link"].get<std::string>()});
                    }
                }
            }
            spdlog::warn("Video {} is available but has no HLS file", id);
            return Ok(Link{});
        }

        processing_.store(true);
        spdlog::debug("Video {} is {} (attempt {}/{})", id, status.empty() ? "unknown" : status,
                      attempt, max_attempts);
        if (attempt < max_attempts) {
            sleeper_(policy.interval);
        }
    }

    return Err<Link>(timeout_error("Video " + id + " was not available after " +
                                   std::to_string(max_attempts) + " status checks"));
}

} // namespace tusup::upload
