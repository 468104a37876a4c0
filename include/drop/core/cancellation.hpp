#pragma once

#include <atomic>

namespace drop {

/**
 * @brief Cooperative cancellation flag shared between a session and its loops
 *
 * Set once, never cleared. Long-running loops check it at their poll points.
 */
class CancellationToken {
public:
    void cancel() noexcept { cancelled_.store(true, std::memory_order_release); }

    bool is_cancelled() const noexcept { return cancelled_.load(std::memory_order_acquire); }

private:
    std::atomic<bool> cancelled_{false};
};

} // namespace drop
