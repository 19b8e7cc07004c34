#pragma once

#include <atomic>

namespace querydesk {

/**
 * @brief Cancellation signal shared between a caller and a running operation.
 *
 * Checked by the execution engine before each statement and while a
 * statement is in flight; checked by the AI client between stream chunks.
 */
class CancelToken {
public:
    void cancel() noexcept { canceled_.store(true, std::memory_order_release); }
    void reset() noexcept { canceled_.store(false, std::memory_order_release); }

    [[nodiscard]] bool is_canceled() const noexcept {
        return canceled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> canceled_{false};
};

} // namespace querydesk
