#include "tusup/upload/session.hpp"

#include <algorithm>
#include <type_traits>
#include <unordered_map>
#include <vector>

namespace tusup::upload {
namespace {

bool is_progressive(UploadPhase current, UploadPhase target) {
    static const std::unordered_map<UploadPhase, std::vector<UploadPhase>> transitions {
        {UploadPhase::Idle, {UploadPhase::Creating, UploadPhase::Resuming}},
        {UploadPhase::Resuming, {UploadPhase::Creating, UploadPhase::OffsetSync}},
        {UploadPhase::Creating, {UploadPhase::OffsetSync}},
        {UploadPhase::OffsetSync, {UploadPhase::Transferring, UploadPhase::Creating, UploadPhase::Resuming}},
        {UploadPhase::Transferring, {UploadPhase::Transferring, UploadPhase::Completed}},
        {UploadPhase::Paused, {UploadPhase::Creating, UploadPhase::Resuming}},
        {UploadPhase::Completed, {UploadPhase::Creating, UploadPhase::Resuming}},
        {UploadPhase::Failed, {UploadPhase::Creating, UploadPhase::Resuming}},
    };

    if (target == UploadPhase::Paused) {
        return true;
    }
    if (target == UploadPhase::Failed) {
        return current != UploadPhase::Paused && current != UploadPhase::Completed;
    }

    const auto it = transitions.find(current);
    if (it == transitions.end()) {
        return false;
    }
    const auto& allowed_list = it->second;
    return std::find(allowed_list.begin(), allowed_list.end(), target) != allowed_list.end();
}

} // namespace

UploadPhase phase_of(const UploadState& state) noexcept {
    return std::visit([](const auto& s) -> UploadPhase {
        using S = std::decay_t<decltype(s)>;
        if constexpr (std::is_same_v<S, state::Idle>) return UploadPhase::Idle;
        else if constexpr (std::is_same_v<S, state::Creating>) return UploadPhase::Creating;
        else if constexpr (std::is_same_v<S, state::Resuming>) return UploadPhase::Resuming;
        else if constexpr (std::is_same_v<S, state::OffsetSync>) return UploadPhase::OffsetSync;
        else if constexpr (std::is_same_v<S, state::Transferring>) return UploadPhase::Transferring;
        else if constexpr (std::is_same_v<S, state::Paused>) return UploadPhase::Paused;
        else if constexpr (std::is_same_v<S, state::Completed>) return UploadPhase::Completed;
        else return UploadPhase::Failed;
    }, state);
}

const char* phase_name(UploadPhase phase) noexcept {
    switch (phase) {
        case UploadPhase::Idle: return "Idle";
        case UploadPhase::Creating: return "Creating";
        case UploadPhase::Resuming: return "Resuming";
        case UploadPhase::OffsetSync: return "OffsetSync";
        case UploadPhase::Transferring: return "Transferring";
        case UploadPhase::Paused: return "Paused";
        case UploadPhase::Completed: return "Completed";
        case UploadPhase::Failed: return "Failed";
    }
    return "Unknown";
}

UploadSession::UploadSession(std::string fingerprint)
    : fingerprint_(std::move(fingerprint)) {}

std::optional<network::Url> UploadSession::upload_url() const {
    if (const auto* sync = std::get_if<state::OffsetSync>(&state_)) {
        return sync->upload_url;
    }
    if (const auto* transferring = std::get_if<state::Transferring>(&state_)) {
        return transferring->upload_url;
    }
    if (const auto* failed = std::get_if<state::Failed>(&state_)) {
        return failed->upload_url;
    }
    return std::nullopt;
}

std::optional<std::uint64_t> UploadSession::offset() const {
    if (const auto* transferring = std::get_if<state::Transferring>(&state_)) {
        return transferring->offset;
    }
    if (const auto* failed = std::get_if<state::Failed>(&state_)) {
        return failed->offset;
    }
    return std::nullopt;
}

Result<void> UploadSession::transition_to(UploadState next) {
    const UploadPhase target = phase_of(next);
    if (!can_transition(target)) {
        return Err<void>(invalid_state_error(std::string("Illegal upload state transition ") +
                                             phase_name(phase()) + " -> " + phase_name(target)));
    }

    if (const auto* transferring = std::get_if<state::Transferring>(&next)) {
        if (file_size_ && transferring->offset > *file_size_) {
            return Err<void>(invalid_state_error("Offset " + std::to_string(transferring->offset) +
                                                 " is beyond the file size " +
                                                 std::to_string(*file_size_)));
        }
    }

    state_ = std::move(next);
    return Ok();
}

Result<void> UploadSession::mark_failed(std::string error_message) {
    state::Failed failed;
    failed.upload_url = upload_url();
    failed.offset = offset();
    failed.last_error = std::move(error_message);
    return transition_to(std::move(failed));
}

void UploadSession::reset_to_paused() {
    fingerprint_.clear();
    file_size_.reset();
    chunk_size_ = 0;
    state_ = state::Paused{};
}

bool UploadSession::can_transition(UploadPhase target) const noexcept {
    if (phase() == target) {
        return true;
    }
    return is_progressive(phase(), target);
}

} // namespace tusup::upload
