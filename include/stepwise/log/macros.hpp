#pragma once

#include "logger.hpp"

/// Logging macros that stamp the call site.
///
/// The level is checked before the arguments are evaluated, so a filtered
/// line in the interpreter's slow path costs one relaxed load.
/// STEPWISE_LOG_DEBUG compiles to nothing unless STEPWISE_DEBUG is defined.

#define STEPWISE_LOG_AT(lvl, fmt, ...) \
    do { \
        auto& stepwise_logger_ = ::stepwise::log::logger::instance(); \
        if (stepwise_logger_.enabled(lvl)) { \
            stepwise_logger_.log(lvl, __FILE__, __LINE__, fmt __VA_OPT__(,) __VA_ARGS__); \
        } \
    } while (0)

#ifdef STEPWISE_DEBUG
    #define STEPWISE_LOG_DEBUG(fmt, ...) STEPWISE_LOG_AT(::stepwise::log::level::debug, fmt __VA_OPT__(,) __VA_ARGS__)
#else
    #define STEPWISE_LOG_DEBUG(fmt, ...) ((void)0)
#endif

#define STEPWISE_LOG_INFO(fmt, ...) STEPWISE_LOG_AT(::stepwise::log::level::info, fmt __VA_OPT__(,) __VA_ARGS__)
#define STEPWISE_LOG_WARNING(fmt, ...) STEPWISE_LOG_AT(::stepwise::log::level::warning, fmt __VA_OPT__(,) __VA_ARGS__)
#define STEPWISE_LOG_ERROR(fmt, ...) STEPWISE_LOG_AT(::stepwise::log::level::error, fmt __VA_OPT__(,) __VA_ARGS__)

/// Session-scoped lines carry a `[session <id>]` prefix; `fmt` must be a literal
#define STEPWISE_SESSION_LOG(lvl, id, fmt, ...) \
    STEPWISE_LOG_AT(lvl, "[session {}] " fmt, id __VA_OPT__(,) __VA_ARGS__)
