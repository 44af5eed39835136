#pragma once

#include <atomic>
#include <memory>

namespace dsync {

/**
 * @brief Shared cancellation flag
 *
 * Copies observe the same flag, so a signal handler or another thread can
 * cancel while the engine polls between states and upload chunks.
 */
class CancellationToken {
public:
    CancellationToken() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() const noexcept { flag_->store(true, std::memory_order_release); }

    [[nodiscard]] bool is_cancelled() const noexcept {
        return flag_->load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

} // namespace dsync
