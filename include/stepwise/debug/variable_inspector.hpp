#pragma once

#include "error.hpp"
#include "script_debugger.hpp"
#include "types.hpp"
#include <stepwise/log/macros.hpp>
#include <stepwise/runtime/block_on.hpp>
#include <algorithm>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace stepwise::debug {

struct variable_inspector_options {
    /// Cached values kept before the oldest quarter is evicted
    size_t max_cached_variables = 1000;
    /// Bound on the one batched read per inspect call
    std::chrono::milliseconds read_timeout{5000};
};

/// Reads collected by a client before they are issued as one batch
struct context_batch {
    std::vector<std::string> reads;
    std::vector<std::string> watches;
    std::optional<std::string> frame_id;

    void add_read(std::string name) { reads.push_back(std::move(name)); }
    void add_watch(std::string name) { watches.push_back(std::move(name)); }
    [[nodiscard]] bool empty() const noexcept { return reads.empty() && watches.empty(); }
};

struct inspector_stats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    uint64_t batched_reads = 0;
    uint64_t evictions = 0;
    uint64_t stale_reads = 0;
};

/// Client-side variable reads with a per-pause cache.
///
/// Misses are fetched with a single get_variables call on the session's
/// script_debugger, driven synchronously through runtime::block_on, so the
/// inspector works from plain threads and from coroutines alike. Cached
/// values only describe the current pause: invalidate_cache() must run on
/// every resume.
class variable_inspector {
public:
    variable_inspector(std::shared_ptr<script_debugger> debugger, runtime::scheduler& sched,
                       variable_inspector_options options = {})
        : debugger_(std::move(debugger))
        , sched_(sched)
        , options_(options) {}

    variable_inspector(const variable_inspector&) = delete;
    variable_inspector& operator=(const variable_inspector&) = delete;

    /// Values for `names` plus every watched name. Unknown names come back
    /// as `<unavailable>`. Pending batch entries are merged in and consumed.
    debug_result<std::map<std::string, variable>> inspect_variables(const std::vector<std::string>& names,
                                                                    context_batch* batch = nullptr) {
        std::optional<std::string> frame_id;
        std::set<std::string> wanted(names.begin(), names.end());
        if (batch) {
            for (auto& w : batch->watches) {
                watch_variable(w);
            }
            wanted.insert(batch->reads.begin(), batch->reads.end());
            frame_id = batch->frame_id;
            batch->reads.clear();
            batch->watches.clear();
        }
        {
            std::lock_guard<std::mutex> lock(mutex_);
            wanted.insert(watched_.begin(), watched_.end());
        }

        std::map<std::string, variable> out;
        std::vector<std::string> misses;
        std::string frame_key = frame_id.value_or(std::string());
        uint64_t epoch;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            epoch = epoch_;
            for (const auto& name : wanted) {
                auto it = cache_.find(cache_key(frame_key, name));
                if (it != cache_.end()) {
                    it->second.last_used = ++tick_;
                    out.emplace(name, it->second.value);
                    ++stats_.hits;
                } else {
                    misses.push_back(name);
                }
            }
            stats_.misses += misses.size();
        }
        if (misses.empty()) {
            return out;
        }

        auto fetched = runtime::try_block_on(sched_, debugger_->get_variables(frame_id), options_.read_timeout);
        if (!fetched) {
            return make_error(debug_errc::timeout, "variable read exceeded {} ms", options_.read_timeout.count());
        }
        if (!*fetched) {
            return std::unexpected(fetched->error());
        }

        std::lock_guard<std::mutex> lock(mutex_);
        ++stats_.batched_reads;
        // A resume during the read makes these values belong to the old pause:
        // hand them back but keep them out of the cache
        bool current = epoch == epoch_;
        if (!current) {
            ++stats_.stale_reads;
        }
        std::unordered_map<std::string, const variable*> by_name;
        for (const auto& v : **fetched) {
            if (current) {
                store_locked(frame_key, v);
            }
            by_name.insert_or_assign(v.name, &v);
        }
        for (const auto& name : misses) {
            auto it = by_name.find(name);
            if (it != by_name.end()) {
                out.emplace(name, *it->second);
            } else {
                out.emplace(name, variable{.name = name, .value = "<unavailable>", .type = "unavailable"});
            }
        }
        return out;
    }

    /// Issue whatever the batch has collected
    debug_result<std::map<std::string, variable>> flush(context_batch& batch) {
        return inspect_variables({}, &batch);
    }

    void watch_variable(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        watched_.insert(name);
    }

    bool unwatch_variable(const std::string& name) {
        std::lock_guard<std::mutex> lock(mutex_);
        return watched_.erase(name) != 0;
    }

    [[nodiscard]] std::vector<std::string> watched_variables() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return std::vector<std::string>(watched_.begin(), watched_.end());
    }

    /// Drop every cached value. Watches survive.
    void invalidate_cache() {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.clear();
        ++epoch_;
    }

    [[nodiscard]] size_t cached_count() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return cache_.size();
    }

    [[nodiscard]] inspector_stats stats() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return stats_;
    }

private:
    struct cache_entry {
        variable value;
        uint64_t last_used = 0;
    };

    static std::string cache_key(const std::string& frame, const std::string& name) {
        std::string key;
        key.reserve(frame.size() + name.size() + 1);
        key.append(frame).push_back('\0');
        key.append(name);
        return key;
    }

    void store_locked(const std::string& frame, const variable& v) {
        if (cache_.size() >= options_.max_cached_variables) {
            evict_locked();
        }
        cache_[cache_key(frame, v.name)] = cache_entry{v, ++tick_};
    }

    /// Drop the least recently used quarter, sparing watched names
    void evict_locked() {
        std::vector<std::pair<uint64_t, std::string>> candidates;
        candidates.reserve(cache_.size());
        for (const auto& [key, entry] : cache_) {
            if (!watched_.contains(entry.value.name)) {
                candidates.emplace_back(entry.last_used, key);
            }
        }
        std::sort(candidates.begin(), candidates.end());
        size_t count = std::max<size_t>(1, options_.max_cached_variables / 4);
        for (size_t i = 0; i < count && i < candidates.size(); ++i) {
            cache_.erase(candidates[i].second);
            ++stats_.evictions;
        }
        STEPWISE_LOG_DEBUG("variable cache evicted {} entries", std::min(count, candidates.size()));
    }

    std::shared_ptr<script_debugger> debugger_;
    runtime::scheduler& sched_;
    variable_inspector_options options_;

    mutable std::mutex mutex_;
    std::unordered_map<std::string, cache_entry> cache_;
    std::set<std::string> watched_;
    uint64_t tick_ = 0;
    uint64_t epoch_ = 0;
    inspector_stats stats_;
};

} // namespace stepwise::debug
