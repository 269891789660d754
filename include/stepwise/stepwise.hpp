#pragma once

/// stepwise - embedded script debugging engine
///
/// Include this file to get the runtime and every debug component.

#define STEPWISE_VERSION_MAJOR 0
#define STEPWISE_VERSION_MINOR 1
#define STEPWISE_VERSION_PATCH 0

// Coroutine runtime
#include "coro/promise_base.hpp"
#include "coro/task.hpp"
#include "runtime/scheduler.hpp"
#include "runtime/worker_thread.hpp"
#include "runtime/block_on.hpp"
#include "time/timer.hpp"
#include "sync/channel.hpp"

// Logging
#include "log/logger.hpp"
#include "log/macros.hpp"

// Debug engine
#include "debug/error.hpp"
#include "debug/types.hpp"
#include "debug/config.hpp"
#include "debug/generation.hpp"
#include "debug/breakpoint_index.hpp"
#include "debug/condition_cache.hpp"
#include "debug/fast_path_gate.hpp"
#include "debug/expression.hpp"
#include "debug/execution_manager.hpp"
#include "debug/debug_coordinator.hpp"
#include "debug/script_debugger.hpp"
#include "debug/stack_navigator.hpp"
#include "debug/variable_inspector.hpp"
#include "debug/debug_session.hpp"
#include "debug/session_manager.hpp"

#include <tuple>

namespace stepwise {

inline const char* version() noexcept {
    return "0.1.0";
}

inline constexpr auto version_tuple() noexcept {
    return std::make_tuple(STEPWISE_VERSION_MAJOR, STEPWISE_VERSION_MINOR, STEPWISE_VERSION_PATCH);
}

} // namespace stepwise

/// Hooking an interpreter:
///
/// ```cpp
/// stepwise::runtime::scheduler sched(2);
/// sched.start();
/// stepwise::debug::session_manager sessions(sched);
/// auto id = sessions.create_session({.stop_on_entry = true});
/// auto session = *sessions.get_session(*id);
///
/// // interpreter thread, once per line
/// if (session->gate().should_stop(source, line)) {
///     auto action = session->coordinator()->on_line({source, line}, {.depth = depth}, capture);
///     if (action == stepwise::debug::resume_action::terminate) abort_script();
/// }
/// ```
