#pragma once

#include "tusup/core/result.hpp"
#include "tusup/network/cancellation.hpp"
#include "tusup/network/http_client.hpp"
#include "tusup/upload/file_source.hpp"
#include "tusup/upload/fingerprint.hpp"
#include "tusup/upload/offset.hpp"
#include "tusup/upload/protocol.hpp"
#include "tusup/upload/session.hpp"
#include "tusup/upload/session_store.hpp"
#include "tusup/upload/video_api.hpp"

#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace tusup::upload {

using ProgressCallback = std::function<void(double percent)>;
using CompleteCallback = std::function<void()>;

struct TusClientOptions {
    network::Url creation_endpoint;
    network::Url api_base;
    std::string access_token;
    network::HeaderMap creation_headers;     // Sent with the creation request only
    std::string creation_body = "{}";        // JSON text for the creation request
    std::size_t max_chunk_size = 1024 * 1024;
    std::string accept_media_type = protocol::kDefaultAcceptMediaType;
    FingerprintFn fingerprint = generate_fingerprint;
    Sleeper sleeper = thread_sleeper();
};

/**
 * @brief Creates or resumes one file upload and streams it in chunks
 *
 * upload() looks for a stored upload URL under the file's fingerprint and
 * otherwise creates a new upload. The server's offset is then fetched and
 * chunks are PATCHed from there; every response must echo exactly the offset
 * the client expects, or the transfer stops with a protocol error. The
 * client's offset only ever moves to values the server confirmed, so
 * upload() can be called again after a failure.
 *
 * pause() may be called from another thread while upload() runs. It
 * abandons the in-flight chunk, deletes the remote video and resets the
 * client completely: the fingerprint is forgotten too, so a paused upload
 * cannot be resumed through this object.
 */
class TusClient {
public:
    TusClient(TusClientOptions options,
              const FileSource& file,
              network::HttpClient& http,
              SessionStore* store = nullptr);

    TusClient(const TusClient&) = delete;
    TusClient& operator=(const TusClient&) = delete;

    bool resuming_enabled() const noexcept { return store_ != nullptr; }

    /// Adopt a stored upload URL; false when there is nothing to resume.
    Result<bool> resume();

    /// Create a new upload on the server and remember its URL.
    Result<void> create();

    Result<void> upload(ProgressCallback on_progress = {}, CompleteCallback on_complete = {});

    /// Abandon the upload; a failed remote delete is logged, not returned.
    Result<void> pause();

    std::string fingerprint() const;
    std::optional<network::Url> upload_url() const;
    std::optional<std::uint64_t> offset() const;
    std::optional<std::uint64_t> file_size() const;
    std::size_t chunk_size() const;
    UploadState state() const;
    UploadPhase phase() const;
    std::optional<CreationDetails> creation_details() const;
    bool is_video_processing() const noexcept { return video_api_.is_processing(); }

    Result<bool> move_to_folder(const std::string& folder_id);
    Result<std::optional<std::string>> playback_link(const PollPolicy& policy);
    Result<void> delete_remote();

private:
    Result<std::uint64_t> measure_file();
    Result<network::CancellationToken> fresh_token(std::uint64_t generation);
    void discard_late_creation(const Result<network::HttpResponse>& sent);
    bool superseded(std::uint64_t generation) const;
    Result<void> fail(const UploadError& error, std::uint64_t generation);
    Result<void> complete(std::uint64_t generation, const CompleteCallback& on_complete);
    network::HttpRequest make_chunk_request(const network::Url& upload_url, std::uint64_t offset,
                                            std::vector<std::uint8_t> chunk) const;

    TusClientOptions options_;
    const FileSource& file_;
    network::HttpClient& http_;
    SessionStore* store_;
    VideoApi video_api_;
    OffsetReconciler reconciler_;

    mutable std::mutex mutex_;
    UploadSession session_;
    std::optional<CreationDetails> details_;
    network::CancellationToken in_flight_;
    std::atomic<std::uint64_t> generation_{0};  // Bumped by pause(); stale work compares against it
    std::atomic<bool> paused_{false};
};

} // namespace tusup::upload
