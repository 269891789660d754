#pragma once

#include "breakpoint_index.hpp"
#include "expression.hpp"
#include "generation.hpp"
#include <array>
#include <atomic>
#include <cstdint>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <unordered_map>

namespace stepwise::debug {

/// Memoized guard result and the generation it was computed in
struct cached_condition {
    bool result = false;
    uint64_t generation = 0;
};

/// Compiled breakpoint guards and their memoized results, keyed by (source, line).
///
/// Entries are spread over independently locked shards so lookups for
/// different locations do not contend. set/remove bump the global
/// generation, which retires every memo without clearing anything.
///
/// has_condition() is lock-free unless the location's shard holds a guard;
/// only then does it take that shard's shared lock.
class condition_cache {
public:
    static constexpr size_t shard_count = 16;

    condition_cache() = default;

    condition_cache(const condition_cache&) = delete;
    condition_cache& operator=(const condition_cache&) = delete;

    [[nodiscard]] bool has_condition(std::string_view source, uint32_t line) const {
        if (!might_have_condition(source, line)) {
            return false;
        }
        return get_condition(source, line) != nullptr;
    }

    /// Lock-free pre-check: false means (source, line) certainly has no guard
    [[nodiscard]] bool might_have_condition(std::string_view source, uint32_t line) const noexcept {
        if (conditions_.load(std::memory_order_acquire) == 0) {
            return false;
        }
        return shard_for(source, line).guards.load(std::memory_order_acquire) != 0;
    }

    [[nodiscard]] compiled_expression_ptr get_condition(std::string_view source, uint32_t line) const {
        const auto& s = shard_for(source, line);
        std::shared_lock lock(s.mutex);
        if (auto* e = find(s, source, line)) {
            return e->condition;
        }
        return nullptr;
    }

    void set_condition(std::string_view source, uint32_t line, compiled_expression_ptr condition) {
        auto& s = shard_for(source, line);
        {
            std::unique_lock lock(s.mutex);
            auto& e = s.entries[std::string(source)][line];
            if (!e.condition && condition) {
                s.guards.fetch_add(1, std::memory_order_release);
                conditions_.fetch_add(1, std::memory_order_release);
            } else if (e.condition && !condition) {
                s.guards.fetch_sub(1, std::memory_order_release);
                conditions_.fetch_sub(1, std::memory_order_release);
            }
            e.condition = std::move(condition);
            e.memo.reset();
        }
        generation::bump();
    }

    /// Returns false if there was nothing at (source, line)
    bool remove_condition(std::string_view source, uint32_t line) {
        bool removed = false;
        auto& s = shard_for(source, line);
        {
            std::unique_lock lock(s.mutex);
            auto it = s.entries.find(source);
            if (it != s.entries.end()) {
                auto lit = it->second.find(line);
                if (lit != it->second.end()) {
                    if (lit->second.condition) {
                        s.guards.fetch_sub(1, std::memory_order_release);
                        conditions_.fetch_sub(1, std::memory_order_release);
                    }
                    it->second.erase(lit);
                    removed = true;
                    if (it->second.empty()) {
                        s.entries.erase(it);
                    }
                }
            }
        }
        generation::bump();
        return removed;
    }

    /// Remember a guard outcome, stamped with the current generation
    void cache_condition_result(std::string_view source, uint32_t line, bool result) {
        auto& s = shard_for(source, line);
        std::unique_lock lock(s.mutex);
        s.entries[std::string(source)][line].memo = cached_condition{result, generation::current()};
    }

    /// Memo as stored, stale or not
    [[nodiscard]] std::optional<cached_condition> get_cached_condition(std::string_view source,
                                                                       uint32_t line) const {
        const auto& s = shard_for(source, line);
        std::shared_lock lock(s.mutex);
        if (auto* e = find(s, source, line)) {
            return e->memo;
        }
        return std::nullopt;
    }

    /// Memo only if it belongs to the current generation
    [[nodiscard]] std::optional<bool> lookup_fresh(std::string_view source, uint32_t line) const {
        auto memo = get_cached_condition(source, line);
        if (memo && generation::is_current(memo->generation)) {
            return memo->result;
        }
        return std::nullopt;
    }

    /// Retire all memos (guest state changed). Idempotent in effect.
    void invalidate() noexcept {
        generation::bump();
    }

    void clear() {
        for (auto& s : shards_) {
            std::unique_lock lock(s.mutex);
            s.entries.clear();
            s.guards.store(0, std::memory_order_release);
        }
        conditions_.store(0, std::memory_order_release);
        generation::bump();
    }

    [[nodiscard]] size_t condition_count() const noexcept {
        return conditions_.load(std::memory_order_relaxed);
    }

private:
    struct entry {
        compiled_expression_ptr condition;
        std::optional<cached_condition> memo;
    };

    struct shard {
        mutable std::shared_mutex mutex;
        /// Entries in this shard holding a guard
        std::atomic<uint32_t> guards{0};
        std::unordered_map<std::string, std::unordered_map<uint32_t, entry>,
                           string_hash, std::equal_to<>> entries;
    };

    static size_t shard_index(std::string_view source, uint32_t line) noexcept {
        return (string_hash{}(source) ^ (static_cast<size_t>(line) * 0x9E3779B97F4A7C15ULL)) % shard_count;
    }

    shard& shard_for(std::string_view source, uint32_t line) noexcept {
        return shards_[shard_index(source, line)];
    }

    const shard& shard_for(std::string_view source, uint32_t line) const noexcept {
        return shards_[shard_index(source, line)];
    }

    static const entry* find(const shard& s, std::string_view source, uint32_t line) {
        auto it = s.entries.find(source);
        if (it == s.entries.end()) return nullptr;
        auto lit = it->second.find(line);
        return lit == it->second.end() ? nullptr : &lit->second;
    }

    std::array<shard, shard_count> shards_;
    std::atomic<size_t> conditions_{0};
};

} // namespace stepwise::debug
