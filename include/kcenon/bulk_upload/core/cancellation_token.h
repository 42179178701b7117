/**
 * @file cancellation_token.h
 * @brief Run-scoped cooperative cancellation flag
 */

#ifndef KCENON_BULK_UPLOAD_CORE_CANCELLATION_TOKEN_H
#define KCENON_BULK_UPLOAD_CORE_CANCELLATION_TOKEN_H

#include <atomic>

namespace kcenon::bulk_upload {

/**
 * @brief Cooperative cancellation signal shared by one run
 *
 * The engine owns a token, resets it when a run starts and hands it by
 * reference to the scheduler and every upload task. Tasks observe it at
 * their checkpoints; nothing in flight is interrupted.
 */
class cancellation_token {
public:
    cancellation_token() = default;

    cancellation_token(const cancellation_token&) = delete;
    cancellation_token& operator=(const cancellation_token&) = delete;

    /**
     * @brief Request cancellation
     * @return true if this call set the flag, false if it was already set
     */
    auto cancel() noexcept -> bool {
        return !cancelled_.exchange(true, std::memory_order_acq_rel);
    }

    [[nodiscard]] auto is_cancelled() const noexcept -> bool {
        return cancelled_.load(std::memory_order_acquire);
    }

    /**
     * @brief Clear the flag at the start of a new run
     */
    void reset() noexcept { cancelled_.store(false, std::memory_order_release); }

private:
    std::atomic<bool> cancelled_{false};
};

}  // namespace kcenon::bulk_upload

#endif  // KCENON_BULK_UPLOAD_CORE_CANCELLATION_TOKEN_H
