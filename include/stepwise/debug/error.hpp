#pragma once

#include <expected>
#include <string>
#include <utility>
#include <fmt/format.h>

namespace stepwise::debug {

/// Failure categories reported to debug clients
enum class debug_errc {
    not_found,          ///< Unknown breakpoint, session or frame
    invalid_state,      ///< Command not valid in the current session state
    timeout,            ///< Round trip exceeded operation_timeout_ms
    evaluation_error    ///< Watch or condition expression failed
};

constexpr const char* debug_errc_str(debug_errc code) noexcept {
    switch (code) {
        case debug_errc::not_found:        return "not found";
        case debug_errc::invalid_state:    return "invalid state";
        case debug_errc::timeout:          return "timeout";
        case debug_errc::evaluation_error: return "evaluation error";
        default:                           return "unknown error";
    }
}

struct debug_error {
    debug_errc code;
    std::string message;

    [[nodiscard]] std::string to_string() const {
        if (message.empty()) {
            return debug_errc_str(code);
        }
        return fmt::format("{}: {}", debug_errc_str(code), message);
    }

    bool operator==(debug_errc other) const noexcept { return code == other; }
};

template<typename T>
using debug_result = std::expected<T, debug_error>;

/// Build the error branch of a debug_result
template<typename... Args>
[[nodiscard]] std::unexpected<debug_error> make_error(debug_errc code,
                                                      fmt::format_string<Args...> fmt_str,
                                                      Args&&... args) {
    return std::unexpected(debug_error{code, fmt::format(fmt_str, std::forward<Args>(args)...)});
}

[[nodiscard]] inline std::unexpected<debug_error> make_error(debug_errc code) {
    return std::unexpected(debug_error{code, {}});
}

} // namespace stepwise::debug
