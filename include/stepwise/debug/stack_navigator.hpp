#pragma once

#include "error.hpp"
#include "types.hpp"
#include <algorithm>
#include <cstddef>
#include <iterator>
#include <span>
#include <string>
#include <string_view>
#include <vector>
#include <fmt/format.h>

namespace stepwise::debug {

/// Which names get_frame_variables returns
enum class variable_context : uint8_t {
    locals,             ///< the frame's captured locals only
    locals_and_watches  ///< locals plus supplied watch results
};

/// Read-only navigation and formatting over a captured stack snapshot.
/// Never touches the interpreter or any shared state.
class stack_navigator {
public:
    [[nodiscard]] static debug_result<stack_frame> navigate_to_frame(size_t index,
                                                                     std::span<const stack_frame> stack) {
        if (index >= stack.size()) {
            return make_error(debug_errc::not_found, "frame {} out of range (stack depth {})",
                              index, stack.size());
        }
        return stack[index];
    }

    /// `source:line[:column] in name`, with synthetic frames spelled out
    [[nodiscard]] static std::string format_frame(const stack_frame& frame) {
        std::string where = frame.location().to_string();
        std::string out;
        if (frame.name.empty() || frame.name == "main") {
            out = fmt::format("{} in main chunk", where);
        } else if (frame.name == "?" || frame.name == "(tail call)") {
            out = fmt::format("{} (tail call)", where);
        } else {
            out = fmt::format("{} in {}", where, frame.name);
        }
        if (!frame.is_user_code) {
            out += " [native]";
        }
        return out;
    }

    /// One `#i frame` line per frame; the current one is prefixed with `->`
    [[nodiscard]] static std::string format_stack_trace(std::span<const stack_frame> stack, size_t current) {
        std::string out;
        for (size_t i = 0; i < stack.size(); ++i) {
            fmt::format_to(std::back_inserter(out), "{} #{} {}\n",
                           i == current ? "->" : "  ", i, format_frame(stack[i]));
        }
        return out;
    }

    /// The frame's locals exactly as captured, in declaration order.
    /// Shadowed names keep every entry; the last one is the visible binding.
    /// Watches whose name is not a local are appended after the locals.
    [[nodiscard]] static std::vector<variable> get_frame_variables(
            const stack_frame& frame,
            variable_context context = variable_context::locals,
            std::span<const variable> watches = {}) {
        std::vector<variable> out(frame.locals.begin(), frame.locals.end());
        if (context == variable_context::locals_and_watches) {
            for (const auto& w : watches) {
                bool is_local = std::any_of(frame.locals.begin(), frame.locals.end(),
                                            [&](const variable& v) { return v.name == w.name; });
                if (!is_local) {
                    out.push_back(w);
                }
            }
        }
        return out;
    }

    /// The binding `name` resolves to in `frame`: the innermost (last) local
    [[nodiscard]] static debug_result<variable> find_frame_variable(const stack_frame& frame,
                                                                    std::string_view name) {
        auto it = std::find_if(frame.locals.rbegin(), frame.locals.rend(),
                               [&](const variable& v) { return v.name == name; });
        if (it == frame.locals.rend()) {
            return make_error(debug_errc::not_found, "no local named {} in frame {}", name, frame.id);
        }
        return *it;
    }
};

/// Current-frame cursor over one pause's snapshot
class navigator_cursor {
public:
    navigator_cursor() = default;
    explicit navigator_cursor(std::vector<stack_frame> stack) : stack_(std::move(stack)) {}

    [[nodiscard]] size_t current() const noexcept { return current_; }
    [[nodiscard]] size_t depth() const noexcept { return stack_.size(); }
    [[nodiscard]] const std::vector<stack_frame>& stack() const noexcept { return stack_; }

    debug_result<stack_frame> select(size_t index) {
        auto frame = stack_navigator::navigate_to_frame(index, stack_);
        if (frame) {
            current_ = index;
        }
        return frame;
    }

    /// Toward the caller
    debug_result<stack_frame> up() { return select(current_ + 1); }

    /// Toward the innermost frame
    debug_result<stack_frame> down() {
        if (current_ == 0) {
            return make_error(debug_errc::not_found, "already at the innermost frame");
        }
        return select(current_ - 1);
    }

    [[nodiscard]] debug_result<stack_frame> frame() const {
        return stack_navigator::navigate_to_frame(current_, stack_);
    }

    [[nodiscard]] std::string format() const {
        return stack_navigator::format_stack_trace(stack_, current_);
    }

    /// New pause, new snapshot; the cursor goes back to the top
    void reset(std::vector<stack_frame> stack) {
        stack_ = std::move(stack);
        current_ = 0;
    }

private:
    std::vector<stack_frame> stack_;
    size_t current_ = 0;
};

} // namespace stepwise::debug
