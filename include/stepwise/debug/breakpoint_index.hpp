#pragma once

#include <stepwise/log/macros.hpp>
#include <atomic>
#include <cstdint>
#include <functional>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace stepwise::debug {

/// Hash that accepts std::string and std::string_view alike,
/// so lookups from the hook never build a std::string
struct string_hash {
    using is_transparent = void;

    size_t operator()(std::string_view s) const noexcept {
        return std::hash<std::string_view>{}(s);
    }
};

struct source_line {
    std::string source;
    uint32_t line = 0;
};

/// Read-optimized projection of the installed breakpoints: source -> lines.
///
/// Only presence is stored. The breakpoints themselves (conditions, hit
/// counts) live in the execution_manager, which rebuilds this index on
/// every mutation.
class breakpoint_index {
public:
    breakpoint_index() = default;

    breakpoint_index(const breakpoint_index&) = delete;
    breakpoint_index& operator=(const breakpoint_index&) = delete;

    /// True iff (source, line) is in the installed set. Never allocates and
    /// never takes the writer side of the lock.
    [[nodiscard]] bool might_break_at(std::string_view source, uint32_t line) const noexcept {
        if (!active_.load(std::memory_order_relaxed)) [[likely]] {
            return false;
        }
        std::shared_lock lock(mutex_);
        auto it = lines_.find(source);
        return it != lines_.end() && it->second.contains(line);
    }

    /// Replace the whole set
    void update_breakpoints(const std::vector<source_line>& locations) {
        map_type rebuilt;
        for (const auto& loc : locations) {
            auto it = rebuilt.find(std::string_view(loc.source));
            if (it == rebuilt.end()) {
                it = rebuilt.emplace(loc.source, std::unordered_set<uint32_t>{}).first;
            }
            it->second.insert(loc.line);
        }

        size_t count = locations.size();
        {
            std::unique_lock lock(mutex_);
            lines_.swap(rebuilt);
            active_.store(count != 0, std::memory_order_release);
        }
        STEPWISE_LOG_DEBUG("breakpoint index rebuilt: {} locations", count);
    }

    void clear() {
        std::unique_lock lock(mutex_);
        lines_.clear();
        active_.store(false, std::memory_order_release);
    }

    [[nodiscard]] bool is_active() const noexcept {
        return active_.load(std::memory_order_acquire);
    }

    [[nodiscard]] size_t source_count() const {
        std::shared_lock lock(mutex_);
        return lines_.size();
    }

    [[nodiscard]] std::vector<uint32_t> lines_for(std::string_view source) const {
        std::shared_lock lock(mutex_);
        auto it = lines_.find(source);
        if (it == lines_.end()) return {};
        return std::vector<uint32_t>(it->second.begin(), it->second.end());
    }

private:
    using map_type = std::unordered_map<std::string, std::unordered_set<uint32_t>,
                                        string_hash, std::equal_to<>>;

    std::atomic<bool> active_{false};
    mutable std::shared_mutex mutex_;
    map_type lines_;
};

} // namespace stepwise::debug
