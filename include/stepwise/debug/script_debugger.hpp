#pragma once

#include "debug_coordinator.hpp"
#include "error.hpp"
#include "execution_manager.hpp"
#include "expression.hpp"
#include "types.hpp"
#include <stepwise/coro/task.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace stepwise::debug {

/// Capability interface a debug session drives, one implementation per
/// guest language. Every call is a coroutine so implementations are free
/// to reach the interpreter asynchronously.
class script_debugger {
public:
    virtual ~script_debugger() = default;

    /// Install breakpoints; returns their ids in order
    virtual coro::task<debug_result<std::vector<uint64_t>>> set_breakpoints(std::vector<breakpoint> bps) = 0;
    virtual coro::task<debug_result<void>> remove_breakpoint(uint64_t id) = 0;
    virtual coro::task<std::vector<breakpoint>> list_breakpoints() = 0;
    virtual coro::task<debug_state> get_state() = 0;
    virtual coro::task<debug_result<std::vector<stack_frame>>> get_stack_trace() = 0;
    /// Variables of a frame; the top frame when `frame_id` is unset
    virtual coro::task<debug_result<std::vector<variable>>> get_variables(std::optional<std::string> frame_id) = 0;
    virtual coro::task<debug_result<variable>> evaluate(std::string expression,
                                                        std::optional<std::string> frame_id) = 0;
    virtual coro::task<debug_result<void>> send_command(debug_command command) = 0;
    [[nodiscard]] virtual bool is_active() const = 0;
    [[nodiscard]] virtual std::string_view language() const noexcept = 0;
};

/// Language-agnostic implementation over the engine's own coordinator and
/// execution manager. Guest-specific behaviour enters only through the
/// expression_evaluator and the snapshots the hook captures.
class engine_debugger final : public script_debugger {
public:
    explicit engine_debugger(std::shared_ptr<debug_coordinator> coordinator,
                             std::string language = "lua")
        : coordinator_(std::move(coordinator))
        , language_(std::move(language)) {}

    coro::task<debug_result<std::vector<uint64_t>>> set_breakpoints(std::vector<breakpoint> bps) override {
        std::vector<uint64_t> ids;
        ids.reserve(bps.size());
        for (auto& bp : bps) {
            auto id = exec().add_breakpoint(std::move(bp));
            if (!id) {
                co_return std::unexpected(id.error());
            }
            ids.push_back(*id);
        }
        co_return ids;
    }

    coro::task<debug_result<void>> remove_breakpoint(uint64_t id) override {
        if (!exec().remove_breakpoint(id)) {
            co_return make_error(debug_errc::not_found, "breakpoint {}", id);
        }
        co_return debug_result<void>{};
    }

    coro::task<std::vector<breakpoint>> list_breakpoints() override {
        co_return exec().get_breakpoints();
    }

    coro::task<debug_state> get_state() override {
        co_return exec().get_state();
    }

    coro::task<debug_result<std::vector<stack_frame>>> get_stack_trace() override {
        auto state = exec().get_state();
        if (!state.is_paused()) {
            co_return make_error(debug_errc::invalid_state, "stack is only available while paused ({})",
                                 state.to_string());
        }
        co_return exec().get_stack_trace();
    }

    coro::task<debug_result<std::vector<variable>>> get_variables(std::optional<std::string> frame_id) override {
        co_return exec().get_variables(std::move(frame_id));
    }

    coro::task<debug_result<variable>> evaluate(std::string expression,
                                                std::optional<std::string> frame_id) override {
        auto locals = exec().get_variables(std::move(frame_id));
        if (!locals) {
            co_return std::unexpected(locals.error());
        }
        auto globals = coordinator_->globals();
        evaluation_scope scope{*locals, globals};
        auto result = exec().evaluator().evaluate(expression, scope);
        if (!result) {
            co_return std::unexpected(result.error());
        }
        co_return variable{
            .name = expression,
            .value = result->render(),
            .type = result->type_name(),
        };
    }

    coro::task<debug_result<void>> send_command(debug_command command) override {
        co_return coordinator_->send_command(command);
    }

    [[nodiscard]] bool is_active() const override {
        return coordinator_->execution()->is_active();
    }

    [[nodiscard]] std::string_view language() const noexcept override {
        return language_;
    }

    [[nodiscard]] const std::shared_ptr<debug_coordinator>& coordinator() const noexcept {
        return coordinator_;
    }

private:
    execution_manager& exec() const { return *coordinator_->execution(); }

    std::shared_ptr<debug_coordinator> coordinator_;
    std::string language_;
};

} // namespace stepwise::debug
