#pragma once

#include <fmt/core.h>
#include <fmt/format.h>
#include <fmt/chrono.h>
#include <atomic>
#include <mutex>
#include <chrono>
#include <cstdio>
#include <optional>
#include <string_view>

namespace stepwise::log {

/// Log level enumeration
enum class level {
    debug = 0,
    info = 1,
    warning = 2,
    error = 3
};

/// Convert log level to string
constexpr const char* level_to_string(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "DEBUG";
        case level::info:    return "INFO";
        case level::warning: return "WARN";
        case level::error:   return "ERROR";
        default:             return "UNKNOWN";
    }
}

/// Parse a level name as written in STEPWISE_LOG_LEVEL (case-sensitive, lower case)
constexpr std::optional<level> level_from_string(std::string_view name) noexcept {
    if (name == "debug") return level::debug;
    if (name == "info") return level::info;
    if (name == "warning" || name == "warn") return level::warning;
    if (name == "error") return level::error;
    return std::nullopt;
}

constexpr const char* level_to_color(level lvl) noexcept {
    switch (lvl) {
        case level::debug:   return "\033[36m";
        case level::info:    return "\033[32m";
        case level::warning: return "\033[33m";
        case level::error:   return "\033[31m";
        default:             return "\033[0m";
    }
}

/// Process-wide logger
///
/// Writes `[time] [LEVEL] [file:line] message` lines to a FILE* sink
/// (stderr unless redirected). Writes are serialized; the level check is a
/// relaxed load so filtered calls stay cheap on the interpreter thread.
class logger {
public:
    static logger& instance() noexcept {
        static logger inst;
        return inst;
    }

    void set_level(level min_level) noexcept {
        min_level_.store(min_level, std::memory_order_relaxed);
    }

    level get_level() const noexcept {
        return min_level_.load(std::memory_order_relaxed);
    }

    [[nodiscard]] bool enabled(level lvl) const noexcept {
        return lvl >= min_level_.load(std::memory_order_relaxed);
    }

    /// Redirect output. Passing nullptr restores stderr.
    void set_sink(std::FILE* sink) noexcept {
        std::lock_guard<std::mutex> lock(mutex_);
        sink_ = sink ? sink : stderr;
    }

    /// ANSI colors are on by default; turn them off when the sink is not a tty
    void set_color(bool on) noexcept {
        color_.store(on, std::memory_order_relaxed);
    }

    template<typename... Args>
    void log(level lvl, const char* file, int line, fmt::format_string<Args...> fmt_str, Args&&... args) {
        if (!enabled(lvl)) {
            return;
        }

        auto msg = fmt::format(fmt_str, std::forward<Args>(args)...);

        auto now = std::chrono::system_clock::now();
        auto time = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        bool color = color_.load(std::memory_order_relaxed);

        std::lock_guard<std::mutex> lock(mutex_);
        fmt::print(sink_,
            "{}[{:%Y-%m-%d %H:%M:%S}.{:03d}] [{}] [{}:{}] {}{}\n",
            color ? level_to_color(lvl) : "",
            fmt::localtime(time),
            ms.count(),
            level_to_string(lvl),
            basename(file),
            line,
            msg,
            color ? "\033[0m" : ""
        );
        std::fflush(sink_);
    }

private:
    logger() noexcept : min_level_(level::info), color_(true) {}
    ~logger() = default;

    logger(const logger&) = delete;
    logger& operator=(const logger&) = delete;

    static constexpr std::string_view basename(std::string_view path) noexcept {
        auto pos = path.find_last_of('/');
        return pos == std::string_view::npos ? path : path.substr(pos + 1);
    }

    std::atomic<level> min_level_;
    std::atomic<bool> color_;
    std::mutex mutex_;
    std::FILE* sink_ = stderr;
};

} // namespace stepwise::log
