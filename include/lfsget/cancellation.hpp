#pragma once

#include <atomic>
#include <chrono>

namespace lfsget {

// Shared stop flag. cancel() is async-signal-safe so a SIGINT handler can
// trip it; workers poll is_cancelled() between chunks and entries.
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
    void reset() { cancelled_.store(false, std::memory_order_relaxed); }
    bool is_cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

    // Sleep for `duration`, waking early on cancellation.
    // Returns false if the token was cancelled.
    bool sleep_for(std::chrono::milliseconds duration) const;

private:
    std::atomic<bool> cancelled_{false};

    static_assert(std::atomic<bool>::is_always_lock_free,
                  "cancellation flag must be lock-free to be set from a signal handler");
};

// Token that is never cancelled, for callers that do not need cancellation
const CancellationToken& never_cancelled();

} // namespace lfsget
