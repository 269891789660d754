#pragma once

#include <atomic>
#include <cstdint>

namespace stepwise::debug {

/// Process-wide monotonic counter stamped on every memoized condition result.
///
/// Any breakpoint or condition edit bumps it, which makes every older
/// memo stale at once without touching the memo tables.
class generation {
public:
    [[nodiscard]] static uint64_t current() noexcept {
        return counter().load(std::memory_order_acquire);
    }

    /// Advance and return the new value
    static uint64_t bump() noexcept {
        return counter().fetch_add(1, std::memory_order_acq_rel) + 1;
    }

    [[nodiscard]] static bool is_current(uint64_t stamp) noexcept {
        return stamp == current();
    }

private:
    static std::atomic<uint64_t>& counter() noexcept {
        static std::atomic<uint64_t> value{1};
        return value;
    }
};

} // namespace stepwise::debug
