#pragma once

#include <atomic>
#include <memory>

namespace tusup {
namespace network {

/**
 * @brief Shared flag used to abandon an in-flight request
 *
 * Cancelling is best effort: the transport stops waiting and drops the
 * connection, but the server may already have applied the request.
 * Copies share the same flag.
 */
class CancellationToken {
public:
    CancellationToken() : cancelled_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() noexcept { cancelled_->store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept { return cancelled_->load(std::memory_order_acquire); }

private:
    std::shared_ptr<std::atomic<bool>> cancelled_;
};

} // namespace network
} // namespace tusup
