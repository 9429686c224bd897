#pragma once

#include "tusup/core/result.hpp"
#include "tusup/network/url.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace tusup::upload {

namespace state {

struct Idle {};
struct Creating {};
struct Resuming {};

struct OffsetSync {
    network::Url upload_url;
};

struct Transferring {
    network::Url upload_url;
    std::uint64_t offset = 0;  ///< Last offset confirmed by the server
};

struct Paused {};

/// All bytes confirmed; the upload URL is dropped with the finished session.
struct Completed {};

/// Transfer stopped on an error; URL and offset are kept so upload() can retry.
struct Failed {
    std::optional<network::Url> upload_url;
    std::optional<std::uint64_t> offset;
    std::string last_error;
};

} // namespace state

using UploadState = std::variant<state::Idle,
                                 state::Creating,
                                 state::Resuming,
                                 state::OffsetSync,
                                 state::Transferring,
                                 state::Paused,
                                 state::Completed,
                                 state::Failed>;

enum class UploadPhase {
    Idle,
    Creating,
    Resuming,
    OffsetSync,
    Transferring,
    Paused,
    Completed,
    Failed
};

UploadPhase phase_of(const UploadState& state) noexcept;
const char* phase_name(UploadPhase phase) noexcept;

/**
 * @brief Per-file upload state with validated transitions
 *
 * Idle -> Creating|Resuming -> OffsetSync -> Transferring -> Completed.
 * Paused and Failed are reachable from every active state; a new upload may
 * start again from Paused, Failed or Completed. States that need an upload
 * URL carry it, so "transferring without a URL" cannot be expressed.
 */
class UploadSession {
public:
    explicit UploadSession(std::string fingerprint);

    [[nodiscard]] const std::string& fingerprint() const noexcept { return fingerprint_; }
    [[nodiscard]] const UploadState& state() const noexcept { return state_; }
    [[nodiscard]] UploadPhase phase() const noexcept { return phase_of(state_); }

    [[nodiscard]] std::optional<network::Url> upload_url() const;
    [[nodiscard]] std::optional<std::uint64_t> offset() const;

    [[nodiscard]] std::optional<std::uint64_t> file_size() const noexcept { return file_size_; }
    void set_file_size(std::uint64_t size) { file_size_ = size; }

    [[nodiscard]] std::size_t chunk_size() const noexcept { return chunk_size_; }
    void set_chunk_size(std::size_t size) { chunk_size_ = size; }

    Result<void> transition_to(UploadState next);
    Result<void> mark_failed(std::string error_message);

    /// Forget everything, fingerprint included, and land in Paused.
    void reset_to_paused();

private:
    [[nodiscard]] bool can_transition(UploadPhase target) const noexcept;

    std::string fingerprint_;
    UploadState state_{state::Idle{}};
    std::optional<std::uint64_t> file_size_;
    std::size_t chunk_size_ = 0;
};

} // namespace tusup::upload
