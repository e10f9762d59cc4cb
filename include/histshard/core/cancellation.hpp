// include/histshard/core/cancellation.hpp
#pragma once

#include <atomic>

namespace histshard {

/**
 * @brief Cooperative cancellation flag shared between a caller and a running query
 *
 * Operations take a `const CancellationToken*`; nullptr means the query cannot be cancelled.
 */
class CancellationToken {
public:
    void cancel() noexcept {
        cancelled_.store(true, std::memory_order_release);
    }

    bool is_cancelled() const noexcept {
        return cancelled_.load(std::memory_order_acquire);
    }

private:
    std::atomic<bool> cancelled_{false};
};

inline bool is_cancelled(const CancellationToken* token) noexcept {
    return token != nullptr && token->is_cancelled();
}

}  // namespace histshard
