#pragma once

#include <chrono>
#include <cstdint>

namespace toolrelay {

// ============================================================================
// Retry Policy Configuration
// ============================================================================

struct RetryPolicy {
    // Delay before the first retry
    std::chrono::milliseconds initial_delay{1000};

    // Maximum delay between retries
    std::chrono::milliseconds max_delay{60000};

    // Multiplier for exponential backoff
    double multiplier{2.0};

    // 1s, 2s, 4s ... capped at 60s
    static RetryPolicy reconnect() {
        return {std::chrono::milliseconds(1000), std::chrono::milliseconds(60000), 2.0};
    }
};

// ============================================================================
// Retry State
// ============================================================================

/**
 * Tracks consecutive failures of one operation. Retries never run out;
 * callers decide when to stop.
 *
 * next_delay() returns delay(n) for the n-th consecutive failure:
 *   delay(n) = min(max_delay, initial_delay * multiplier^(n-1))
 * reset() is called after a success, so the next failure waits initial_delay again.
 */
class RetryState {
public:
    explicit RetryState(const RetryPolicy& policy = RetryPolicy::reconnect())
        : policy_(policy), current_delay_(policy.initial_delay) {}

    void reset() {
        attempt_ = 0;
        current_delay_ = policy_.initial_delay;
    }

    // Number of delays handed out since the last reset
    uint32_t attempt() const { return attempt_; }

    std::chrono::milliseconds next_delay() {
        auto delay = current_delay_;

        ++attempt_;
        if (current_delay_ < policy_.max_delay) {
            current_delay_ = std::chrono::milliseconds(
                static_cast<int64_t>(current_delay_.count() * policy_.multiplier));
            if (current_delay_ > policy_.max_delay) {
                current_delay_ = policy_.max_delay;
            }
        }

        return delay;
    }

private:
    RetryPolicy policy_;
    uint32_t attempt_ = 0;
    std::chrono::milliseconds current_delay_;
};

} // namespace toolrelay
