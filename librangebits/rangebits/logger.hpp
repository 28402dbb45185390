// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/config.hpp"
#include "rangebits/detail/discard.hpp"
#include "rangebits/error.hpp"

#include <caf/detail/scope_guard.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <string>

// RANGEBITS_INFO -> spdlog::info
// RANGEBITS_VERBOSE -> spdlog::debug
// RANGEBITS_DEBUG -> spdlog::trace
// RANGEBITS_TRACE -> spdlog::trace

#if RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_TRACE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_DEBUG
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_TRACE
#elif RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_VERBOSE
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_DEBUG
#elif RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_INFO
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_INFO
#elif RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_WARNING
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_WARN
#elif RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_ERROR
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_ERROR
#elif RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_CRITICAL
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_CRITICAL
#elif RANGEBITS_LOG_LEVEL == RANGEBITS_LOG_LEVEL_QUIET
#  define SPDLOG_ACTIVE_LEVEL SPDLOG_LEVEL_OFF
#endif

// Important: keep that below the log level mapping
#include "rangebits/detail/logger.hpp"

#if RANGEBITS_LOG_LEVEL >= RANGEBITS_LOG_LEVEL_TRACE

#  define RANGEBITS_TRACE(...)                                                 \
    SPDLOG_LOGGER_TRACE(::rangebits::detail::logger(), __VA_ARGS__)

#else // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_TRACE

#  define RANGEBITS_TRACE(...) RANGEBITS_DISCARD_ARGS(__VA_ARGS__)

#endif // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_TRACE

#if RANGEBITS_LOG_LEVEL >= RANGEBITS_LOG_LEVEL_DEBUG

#  define RANGEBITS_DEBUG(...)                                                 \
    SPDLOG_LOGGER_TRACE(::rangebits::detail::logger(), __VA_ARGS__)

#else // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_DEBUG

#  define RANGEBITS_DEBUG(...) RANGEBITS_DISCARD_ARGS(__VA_ARGS__)

#endif // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_DEBUG

#if RANGEBITS_LOG_LEVEL >= RANGEBITS_LOG_LEVEL_VERBOSE

#  define RANGEBITS_VERBOSE(...)                                               \
    SPDLOG_LOGGER_DEBUG(::rangebits::detail::logger(), __VA_ARGS__)

#else // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_VERBOSE

#  define RANGEBITS_VERBOSE(...) RANGEBITS_DISCARD_ARGS(__VA_ARGS__)

#endif // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_VERBOSE

#if RANGEBITS_LOG_LEVEL >= RANGEBITS_LOG_LEVEL_INFO

#  define RANGEBITS_INFO(...)                                                  \
    SPDLOG_LOGGER_INFO(::rangebits::detail::logger(), __VA_ARGS__)

#else // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_INFO

#  define RANGEBITS_INFO(...) RANGEBITS_DISCARD_ARGS(__VA_ARGS__)

#endif // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_INFO

#if RANGEBITS_LOG_LEVEL >= RANGEBITS_LOG_LEVEL_WARNING

#  define RANGEBITS_WARN(...)                                                  \
    SPDLOG_LOGGER_WARN(::rangebits::detail::logger(), __VA_ARGS__)

#else // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_WARNING

#  define RANGEBITS_WARN(...) RANGEBITS_DISCARD_ARGS(__VA_ARGS__)

#endif // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_WARNING

#if RANGEBITS_LOG_LEVEL >= RANGEBITS_LOG_LEVEL_ERROR

#  define RANGEBITS_ERROR(...)                                                 \
    SPDLOG_LOGGER_ERROR(::rangebits::detail::logger(), __VA_ARGS__)

#else // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_ERROR

#  define RANGEBITS_ERROR(...) RANGEBITS_DISCARD_ARGS(__VA_ARGS__)

#endif // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_ERROR

#if RANGEBITS_LOG_LEVEL >= RANGEBITS_LOG_LEVEL_CRITICAL

#  define RANGEBITS_CRITICAL(...)                                              \
    SPDLOG_LOGGER_CRITICAL(::rangebits::detail::logger(), __VA_ARGS__)

#else // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_CRITICAL

#  define RANGEBITS_CRITICAL(...) RANGEBITS_DISCARD_ARGS(__VA_ARGS__)

#endif // RANGEBITS_LOG_LEVEL < RANGEBITS_LOG_LEVEL_CRITICAL

namespace rangebits {

/// Converts a verbosity to its integer counterpart. For unknown values,
/// the `default_value` parameter will be returned.
/// Used to make log level strings from config, like 'debug', to a log level int.
int loglevel_to_int(std::string c, int default_value = RANGEBITS_LOG_LEVEL_QUIET);

/// Replaces the discarding default logger with console and file sinks as
/// configured in *cfg*. The returned guard shuts down logging.
[[nodiscard]] caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg);

} // namespace rangebits
