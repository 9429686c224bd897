#include "tusup/upload/tus_client.hpp"
#include "tusup/upload/protocol.hpp"

#include <spdlog/spdlog.h>

namespace tusup::upload {

TusClient::TusClient(TusClientOptions options,
                     const FileSource& file,
                     network::HttpClient& http,
                     SessionStore* store)
    : options_(std::move(options)),
      file_(file),
      http_(http),
      store_(store),
      video_api_(http, options_.api_base, options_.access_token, options_.sleeper),
      reconciler_(http, options_.accept_media_type),
      session_(options_.fingerprint ? options_.fingerprint(file.path()) : generate_fingerprint(file.path())) {
    session_.set_chunk_size(options_.max_chunk_size);
}

std::string TusClient::fingerprint() const {
    std::lock_guard lock(mutex_);
    return session_.fingerprint();
}

std::optional<network::Url> TusClient::upload_url() const {
    std::lock_guard lock(mutex_);
    return session_.upload_url();
}

std::optional<std::uint64_t> TusClient::offset() const {
    std::lock_guard lock(mutex_);
    return session_.offset();
}

std::optional<std::uint64_t> TusClient::file_size() const {
    std::lock_guard lock(mutex_);
    return session_.file_size();
}

std::size_t TusClient::chunk_size() const {
    std::lock_guard lock(mutex_);
    return session_.chunk_size();
}

UploadState TusClient::state() const {
    std::lock_guard lock(mutex_);
    return session_.state();
}

UploadPhase TusClient::phase() const {
    std::lock_guard lock(mutex_);
    return session_.phase();
}

std::optional<CreationDetails> TusClient::creation_details() const {
    std::lock_guard lock(mutex_);
    return details_;
}

Result<std::uint64_t> TusClient::measure_file() {
    auto size = file_.length();
    if (size.is_error()) {
        return size;
    }
    std::lock_guard lock(mutex_);
    session_.set_file_size(size.value());
    return size;
}

Result<network::CancellationToken> TusClient::fresh_token(std::uint64_t generation) {
    std::lock_guard lock(mutex_);
    // pause() cancels in_flight_ under this lock, so a request either gets a
    // token pause() will see or is refused here
    if (superseded(generation)) {
        return Err<network::CancellationToken>(cancelled_error("Upload paused before sending request"));
    }
    in_flight_ = network::CancellationToken{};
    return Ok(in_flight_);
}

void TusClient::discard_late_creation(const Result<network::HttpResponse>& sent) {
    if (sent.is_error() || (!sent.value().is_success() && sent.value().status_code != 404)) {
        return;
    }
    auto details = CreationDetails::from_response(sent.value());
    if (details.is_error() || details.value().uri.empty()) {
        return;
    }
    spdlog::info("Deleting video {} created after the upload was paused", details.value().uri);
    auto deleted = video_api_.delete_video(details.value());
    if (deleted.is_error()) {
        spdlog::warn("Could not delete video created after pause: {}", deleted.error().describe());
    }
}

bool TusClient::superseded(std::uint64_t generation) const {
    return paused_.load() || generation != generation_;
}

Result<bool> TusClient::resume() {
    auto size = measure_file();
    if (size.is_error()) {
        return Err<bool>(size.error());
    }
    paused_.store(false);

    std::string fingerprint;
    {
        std::lock_guard lock(mutex_);
        if (!resuming_enabled() || session_.fingerprint().empty()) {
            return Ok(false);
        }
        if (session_.chunk_size() == 0) {
            session_.set_chunk_size(options_.max_chunk_size);
        }
        if (auto moved = session_.transition_to(state::Resuming{}); moved.is_error()) {
            return Err<bool>(moved.error());
        }
        fingerprint = session_.fingerprint();
    }

    auto stored = store_->get(fingerprint);
    if (stored.is_error()) {
        std::lock_guard lock(mutex_);
        (void)session_.mark_failed(stored.error().message);
        return Err<bool>(stored.error());
    }
    if (!stored.value()) {
        return Ok(false);
    }

    const network::Url url = *stored.value();
    std::lock_guard lock(mutex_);
    if (auto moved = session_.transition_to(state::OffsetSync{url}); moved.is_error()) {
        return Err<bool>(moved.error());
    }
    spdlog::info("Resuming upload of {} at {}", file_.path(), url.to_string());
    return Ok(true);
}

Result<void> TusClient::create() {
    auto size = measure_file();
    if (size.is_error()) {
        return Err<void>(size.error());
    }

    std::uint64_t generation = 0;
    {
        std::lock_guard lock(mutex_);
        // Chunk granularity follows the file: a tenth of it per request
        std::size_t chunk = static_cast<std::size_t>(size.value() / 10);
        if (chunk == 0) {
            chunk = options_.max_chunk_size;
        }
        session_.set_chunk_size(chunk);
        if (auto moved = session_.transition_to(state::Creating{}); moved.is_error()) {
            return moved;
        }
        generation = generation_;
    }

    network::HttpRequest request;
    request.method = network::HttpMethod::POST;
    request.url = options_.creation_endpoint;
    request.headers = options_.creation_headers;
    request.headers.set(protocol::kAuthorizationHeader, "Bearer " + options_.access_token);
    if (!request.headers.contains(protocol::kContentTypeHeader)) {
        request.headers.set(protocol::kContentTypeHeader, protocol::kJsonContentType);
    }
    request.set_body(options_.creation_body);

    auto token = fresh_token(generation);
    if (token.is_error()) {
        return Err<void>(token.error());
    }
    auto sent = http_.send(request, token.value());
    if (superseded(generation)) {
        discard_late_creation(sent);
        return Err<void>(cancelled_error("Upload paused while creating it"));
    }
    if (sent.is_error()) {
        return fail(sent.error(), generation);
    }

    const auto& response = sent.value();
    if (!response.is_success() && response.status_code != 404) {
        return fail(protocol_error("unexpected status code (" + std::to_string(response.status_code) +
                                   ") while creating upload", response.status_code),
                    generation);
    }

    auto details = CreationDetails::from_response(response);
    if (details.is_error()) {
        return fail(details.error(), generation);
    }
    if (details.value().upload_link.empty()) {
        return fail(protocol_error("missing upload Uri in response for creating upload",
                                   response.status_code),
                    generation);
    }

    auto url = network::normalize_upload_url(details.value().upload_link, options_.creation_endpoint);
    if (url.is_error()) {
        return fail(url.error(), generation);
    }

    std::string fingerprint;
    {
        std::lock_guard lock(mutex_);
        if (superseded(generation)) {
            return Err<void>(cancelled_error("Upload paused while creating it"));
        }
        details_ = details.take_value();
        if (auto moved = session_.transition_to(state::OffsetSync{url.value()}); moved.is_error()) {
            return moved;
        }
        fingerprint = session_.fingerprint();
    }

    spdlog::info("Created upload for {} at {}", file_.path(), url.value().to_string());

    if (store_ && !fingerprint.empty()) {
        auto stored = store_->set(fingerprint, url.value());
        if (stored.is_error()) {
            // Resuming later will not be possible, the upload itself is unaffected
            spdlog::warn("Could not remember upload URL for {}: {}", fingerprint, stored.error().message);
        }
    }
    return Ok();
}

Result<void> TusClient::upload(ProgressCallback on_progress, CompleteCallback on_complete) {
    auto resumed = resume();
    if (resumed.is_error()) {
        return Err<void>(resumed.error());
    }
    if (!resumed.value()) {
        auto created = create();
        if (created.is_error()) {
            if (paused_.load()) {
                return Ok();
            }
            return created;
        }
    }

    std::uint64_t generation = 0;
    network::Url url;
    std::uint64_t total = 0;
    std::size_t chunk_size = 0;
    {
        std::lock_guard lock(mutex_);
        generation = generation_;
        if (superseded(generation)) {
            return Ok();
        }
        const auto current_url = session_.upload_url();
        if (!current_url || !session_.file_size()) {
            return Err<void>(invalid_state_error("No upload URL after create-or-resume"));
        }
        url = *current_url;
        total = *session_.file_size();
        chunk_size = session_.chunk_size();
    }

    auto query_token = fresh_token(generation);
    if (query_token.is_error()) {
        return Ok();
    }
    auto server_offset = reconciler_.query(url, query_token.value());
    if (superseded(generation)) {
        return Ok();
    }
    if (server_offset.is_error()) {
        return fail(server_offset.error(), generation);
    }

    std::uint64_t offset = server_offset.value();
    if (offset > total) {
        return fail(protocol_error("server reports offset " + std::to_string(offset) +
                                   " beyond file size " + std::to_string(total)),
                    generation);
    }

    {
        std::lock_guard lock(mutex_);
        if (superseded(generation)) {
            return Ok();
        }
        if (auto moved = session_.transition_to(state::Transferring{url, offset}); moved.is_error()) {
            (void)session_.mark_failed(moved.error().message);
            return moved;
        }
    }

    spdlog::info("Uploading {} ({} bytes) from offset {} in chunks of {} bytes",
                 file_.path(), total, offset, chunk_size);

    if (offset == total) {
        return complete(generation, on_complete);
    }

    ChunkReader reader(file_, chunk_size);
    while (!paused_.load() && offset < total) {
        auto chunk = reader.read(offset, total);
        if (chunk.is_error()) {
            return fail(chunk.error(), generation);
        }
        if (chunk.value().empty()) {
            return fail(io_error("No data available at offset " + std::to_string(offset) +
                                 " of " + file_.path()),
                        generation);
        }

        const std::uint64_t expected = offset + chunk.value().size();
        const auto request = make_chunk_request(url, offset, chunk.take_value());

        auto token = fresh_token(generation);
        if (token.is_error()) {
            return Ok();
        }
        auto sent = http_.send(request, token.value());
        // A paused upload discards whatever came back for the abandoned chunk
        if (superseded(generation)) {
            return Ok();
        }
        if (sent.is_error()) {
            return fail(sent.error(), generation);
        }

        auto confirmed = OffsetReconciler::confirm(sent.value(), expected);
        if (confirmed.is_error()) {
            return fail(confirmed.error(), generation);
        }
        offset = confirmed.value();

        {
            std::lock_guard lock(mutex_);
            if (superseded(generation)) {
                return Ok();
            }
            if (auto moved = session_.transition_to(state::Transferring{url, offset}); moved.is_error()) {
                (void)session_.mark_failed(moved.error().message);
                return moved;
            }
        }
        spdlog::debug("Server confirmed {}/{} bytes", offset, total);

        if (on_progress) {
            on_progress(static_cast<double>(offset) / static_cast<double>(total) * 100.0);
        }

        if (offset == total) {
            return complete(generation, on_complete);
        }
    }

    return Ok();
}

network::HttpRequest TusClient::make_chunk_request(const network::Url& upload_url,
                                                   std::uint64_t offset,
                                                   std::vector<std::uint8_t> chunk) const {
    network::HttpRequest request;
    request.method = network::HttpMethod::PATCH;
    request.url = upload_url;
    request.headers.set(protocol::kTusResumableHeader, protocol::kTusVersion);
    request.headers.set(protocol::kUploadOffsetHeader, std::to_string(offset));
    request.headers.set(protocol::kContentTypeHeader, protocol::kOffsetOctetStream);
    request.headers.set(protocol::kAcceptHeader, options_.accept_media_type);
    request.body = std::move(chunk);
    return request;
}

Result<void> TusClient::complete(std::uint64_t generation, const CompleteCallback& on_complete) {
    std::string fingerprint;
    {
        std::lock_guard lock(mutex_);
        if (superseded(generation)) {
            return Ok();
        }
        if (auto moved = session_.transition_to(state::Completed{}); moved.is_error()) {
            return moved;
        }
        fingerprint = session_.fingerprint();
    }

    spdlog::info("Upload of {} completed", file_.path());

    if (store_ && !fingerprint.empty()) {
        auto removed = store_->remove(fingerprint);
        if (removed.is_error()) {
            spdlog::warn("Could not forget upload URL for {}: {}", fingerprint, removed.error().message);
        }
    }
    if (on_complete) {
        on_complete();
    }
    return Ok();
}

Result<void> TusClient::fail(const UploadError& error, std::uint64_t generation) {
    std::lock_guard lock(mutex_);
    if (superseded(generation)) {
        return Ok();
    }
    (void)session_.mark_failed(error.message);
    spdlog::debug("Upload of {} failed: {}", file_.path(), error.describe());
    return Err<void>(error);
}

Result<void> TusClient::pause() {
    paused_.store(true);

    std::optional<CreationDetails> details;
    {
        std::lock_guard lock(mutex_);
        in_flight_.cancel();
        details = details_;
    }

    if (details) {
        auto deleted = video_api_.delete_video(*details);
        if (deleted.is_error()) {
            spdlog::warn("Could not delete paused upload: {}", deleted.error().describe());
        }
    }

    {
        std::lock_guard lock(mutex_);
        ++generation_;
        session_.reset_to_paused();
        details_.reset();
        in_flight_ = network::CancellationToken{};
        video_api_.clear_processing();
    }
    spdlog::info("Upload of {} paused and discarded", file_.path());
    return Ok();
}

Result<bool> TusClient::move_to_folder(const std::string& folder_id) {
    return video_api_.move_to_folder(creation_details(), folder_id);
}

Result<std::optional<std::string>> TusClient::playback_link(const PollPolicy& policy) {
    return video_api_.playback_link(creation_details(), policy);
}

Result<void> TusClient::delete_remote() {
    const auto details = creation_details();
    if (!details) {
        return Err<void>(invalid_state_error("No created upload to delete"));
    }
    return video_api_.delete_video(*details);
}

} // namespace tusup::upload
