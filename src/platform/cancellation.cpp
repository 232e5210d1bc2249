#include "lfsget/cancellation.hpp"

#include <algorithm>
#include <thread>

namespace lfsget {

bool CancellationToken::sleep_for(std::chrono::milliseconds duration) const {
    // Poll in short slices so a signal cuts a long retry delay short
    constexpr std::chrono::milliseconds slice{100};
    auto deadline = std::chrono::steady_clock::now() + duration;
    while (!is_cancelled()) {
        auto now = std::chrono::steady_clock::now();
        if (now >= deadline) return true;
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now);
        std::this_thread::sleep_for(std::min(remaining, slice));
    }
    return false;
}

const CancellationToken& never_cancelled() {
    static const CancellationToken token;
    return token;
}

} // namespace lfsget
