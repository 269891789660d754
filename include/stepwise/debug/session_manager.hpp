#pragma once

#include "config.hpp"
#include "debug_session.hpp"
#include "error.hpp"
#include <stepwise/coro/task.hpp>
#include <stepwise/log/macros.hpp>
#include <stepwise/runtime/scheduler.hpp>
#include <chrono>
#include <memory>
#include <mutex>
#include <random>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <fmt/format.h>

namespace stepwise::debug {

/// Registry of live sessions, keyed by a generated id.
///
/// Handles are shared: a session removed here stays usable by whoever still
/// holds it, but its coordinator is detached once the last handle drops.
class session_manager {
public:
    explicit session_manager(runtime::scheduler& sched,
                             std::shared_ptr<const expression_evaluator> evaluator = std::make_shared<simple_evaluator>())
        : sched_(sched)
        , evaluator_(std::move(evaluator)) {}

    session_manager(const session_manager&) = delete;
    session_manager& operator=(const session_manager&) = delete;

    /// Fails with invalid_state if another live session debugs the same script
    debug_result<std::string> create_session(session_config config = {}) {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!config.script_path.empty()) {
            for (const auto& [id, session] : sessions_) {
                if (session->metadata().script_path == config.script_path &&
                    session->state() != session_state::terminated) {
                    return make_error(debug_errc::invalid_state, "{} is already being debugged by session {}",
                                      config.script_path, id);
                }
            }
        }
        auto id = generate_id();
        auto session = std::make_shared<debug_session>(id, std::move(config), sched_, evaluator_);
        sessions_.emplace(id, std::move(session));
        STEPWISE_LOG_INFO("created debug session {}", id);
        return id;
    }

    debug_result<std::shared_ptr<debug_session>> get_session(const std::string& id) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        auto it = sessions_.find(id);
        if (it == sessions_.end()) {
            return make_error(debug_errc::not_found, "session {}", id);
        }
        return it->second;
    }

    [[nodiscard]] std::vector<std::string> list_sessions() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        std::vector<std::string> ids;
        ids.reserve(sessions_.size());
        for (const auto& [id, session] : sessions_) {
            ids.push_back(id);
        }
        return ids;
    }

    [[nodiscard]] size_t session_count() const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        return sessions_.size();
    }

    /// The live session debugging `script_path`, if any
    [[nodiscard]] std::shared_ptr<debug_session> find_session_for_script(const std::string& script_path) const {
        std::shared_lock<std::shared_mutex> lock(mutex_);
        for (const auto& [id, session] : sessions_) {
            if (session->metadata().script_path == script_path &&
                session->state() != session_state::terminated) {
                return session;
            }
        }
        return nullptr;
    }

    /// Terminate the session, then forget it
    coro::task<debug_result<void>> remove_session(std::string id) {
        std::shared_ptr<debug_session> session;
        {
            std::unique_lock<std::shared_mutex> lock(mutex_);
            auto it = sessions_.find(id);
            if (it == sessions_.end()) {
                co_return make_error(debug_errc::not_found, "session {}", id);
            }
            session = std::move(it->second);
            sessions_.erase(it);
        }
        auto r = co_await session->terminate();
        if (!r) {
            STEPWISE_LOG_WARNING("session {} terminate on removal: {}", id, r.error().to_string());
        }
        STEPWISE_LOG_INFO("removed debug session {}", id);
        co_return debug_result<void>{};
    }

    /// Drop every terminated session; returns how many went
    coro::task<size_t> cleanup_terminated() {
        auto removed = remove_if([](const debug_session& s) {
            return s.state() == session_state::terminated;
        });
        co_return removed.size();
    }

    /// Terminate and drop sessions with no activity for `max_idle`
    coro::task<size_t> cleanup_idle(std::chrono::milliseconds max_idle) {
        auto cutoff = std::chrono::system_clock::now() - max_idle;
        auto removed = remove_if([cutoff](const debug_session& s) {
            return s.metadata().last_activity < cutoff;
        });
        for (auto& session : removed) {
            auto r = co_await session->terminate();
            if (!r) {
                STEPWISE_LOG_WARNING("idle session {} terminate: {}", session->id(), r.error().to_string());
            }
            STEPWISE_LOG_INFO("expired idle session {}", session->id());
        }
        co_return removed.size();
    }

private:
    template<typename Pred>
    std::vector<std::shared_ptr<debug_session>> remove_if(Pred pred) {
        std::vector<std::shared_ptr<debug_session>> removed;
        std::unique_lock<std::shared_mutex> lock(mutex_);
        for (auto it = sessions_.begin(); it != sessions_.end();) {
            if (pred(*it->second)) {
                removed.push_back(std::move(it->second));
                it = sessions_.erase(it);
            } else {
                ++it;
            }
        }
        return removed;
    }

    std::string generate_id() {
        std::lock_guard<std::mutex> lock(rng_mutex_);
        uint64_t hi = rng_();
        uint64_t lo = rng_();
        return fmt::format("{:08x}-{:04x}-{:04x}-{:04x}-{:012x}",
                           hi >> 32, (hi >> 16) & 0xffff, hi & 0xffff,
                           lo >> 48, lo & 0xffffffffffffULL);
    }

    runtime::scheduler& sched_;
    std::shared_ptr<const expression_evaluator> evaluator_;

    mutable std::shared_mutex mutex_;
    std::unordered_map<std::string, std::shared_ptr<debug_session>> sessions_;

    std::mutex rng_mutex_;
    std::mt19937_64 rng_{std::random_device{}()};
};

} // namespace stepwise::debug
