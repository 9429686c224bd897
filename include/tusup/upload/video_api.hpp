#pragma once

#include "tusup/core/result.hpp"
#include "tusup/network/http_client.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <optional>
#include <string>

namespace tusup::upload {

/**
 * @brief What the creation endpoint told us about the new video
 *
 * Expected body: {"uri": "/videos/123", "upload": {"upload_link": "https://..."}}
 */
struct CreationDetails {
    int status_code = 0;
    std::string uri;
    std::string upload_link;
    std::string raw_body;

    /// Substring of uri after its last '/'.
    std::string resource_id() const;

    /**
     * Decode a creation response. Only JSON problems are reported here;
     * the status code and a missing upload link are judged by the caller.
     */
    static Result<CreationDetails> from_response(const network::HttpResponse& response);
};

struct PollPolicy {
    std::chrono::milliseconds interval{std::chrono::seconds(10)};
    std::size_t max_attempts = 60;
};

using Sleeper = std::function<void(std::chrono::milliseconds)>;

/// Sleeper backed by std::this_thread::sleep_for.
Sleeper thread_sleeper();

/**
 * @brief Follow-up calls against the video API once an upload exists
 *
 * Delete, move and status calls accept 2xx and 404 responses; any other
 * status is a protocol error.
 */
class VideoApi {
public:
    VideoApi(network::HttpClient& http,
             network::Url api_base,
             std::string access_token,
             Sleeper sleeper = thread_sleeper());

    /// DELETE /videos/{id}
    Result<void> delete_video(const CreationDetails& details);

    /// PUT /me/projects/{folder}/videos/{id}; false when there is nothing to move.
    Result<bool> move_to_folder(const std::optional<CreationDetails>& details,
                                const std::string& folder_id);

    /**
     * @brief Wait for transcoding and return the HLS playback link
     *
     * Polls GET /videos/{id} until its status is "available", sleeping
     * policy.interval between attempts and giving up with a Timeout error
     * after policy.max_attempts. Returns nullopt when there are no details
     * or no file with quality "hls".
     */
    Result<std::optional<std::string>> playback_link(const std::optional<CreationDetails>& details,
                                                     const PollPolicy& policy);

    bool is_processing() const noexcept { return processing_.load(); }
    void clear_processing() noexcept { processing_.store(false); }

private:
    network::HttpRequest make_request(network::HttpMethod method, const std::string& path) const;
    Result<network::HttpResponse> send_accepting_404(network::HttpRequest request, const char* action);

    network::HttpClient& http_;
    network::Url api_base_;
    std::string access_token_;
    Sleeper sleeper_;
    std::atomic<bool> processing_{false};
};

} // namespace tusup::upload
