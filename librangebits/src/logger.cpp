// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/logger.hpp"

#include "rangebits/defaults.hpp"
#include "rangebits/detail/assert.hpp"

#include <caf/settings.hpp>
#include <fmt/format.h>
#include <spdlog/async.h>
#include <spdlog/common.h>
#include <spdlog/sinks/ansicolor_sink.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/null_sink.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <memory>
#include <optional>
#include <string_view>
#include <vector>

namespace rangebits {

caf::expected<caf::detail::scope_guard<void (*)()>>
create_log_context(const caf::settings& cfg) {
  if (!detail::setup_spdlog(cfg))
    return caf::make_error(ec::invalid_configuration,
                           "failed to set up logging");
  return {caf::detail::make_scope_guard(
    std::addressof(detail::shutdown_spdlog))};
}

/// Convert a log level to an int.
/// @note x is passed by value because it is modified.
int loglevel_to_int(std::string x, int default_value) {
  for (auto& ch : x)
    ch = static_cast<char>(std::tolower(static_cast<unsigned char>(ch)));
  if (x == "quiet")
    return RANGEBITS_LOG_LEVEL_QUIET;
  if (x == "critical")
    return RANGEBITS_LOG_LEVEL_CRITICAL;
  if (x == "error")
    return RANGEBITS_LOG_LEVEL_ERROR;
  if (x == "warning")
    return RANGEBITS_LOG_LEVEL_WARNING;
  if (x == "info")
    return RANGEBITS_LOG_LEVEL_INFO;
  if (x == "verbose")
    return RANGEBITS_LOG_LEVEL_VERBOSE;
  if (x == "debug")
    return RANGEBITS_LOG_LEVEL_DEBUG;
  if (x == "trace")
    return RANGEBITS_LOG_LEVEL_TRACE;
  return default_value;
}

namespace {

constexpr bool is_loglevel(const int value) {
  return value >= RANGEBITS_LOG_LEVEL_QUIET
         && value <= RANGEBITS_LOG_LEVEL_TRACE;
}

/// Converts a log level to an spdlog level.
spdlog::level::level_enum loglevel_to_spd(const int value) {
  RANGEBITS_ASSERT(is_loglevel(value));
  spdlog::level::level_enum level = spdlog::level::off;
  switch (value) {
    case RANGEBITS_LOG_LEVEL_QUIET:
      break;
    case RANGEBITS_LOG_LEVEL_CRITICAL:
      level = spdlog::level::critical;
      break;
    case RANGEBITS_LOG_LEVEL_ERROR:
      level = spdlog::level::err;
      break;
    case RANGEBITS_LOG_LEVEL_WARNING:
      level = spdlog::level::warn;
      break;
    case RANGEBITS_LOG_LEVEL_INFO:
      level = spdlog::level::info;
      break;
    case RANGEBITS_LOG_LEVEL_VERBOSE:
      level = spdlog::level::debug;
      break;
    case RANGEBITS_LOG_LEVEL_DEBUG:
    case RANGEBITS_LOG_LEVEL_TRACE:
      level = spdlog::level::trace;
      break;
  }
  return level;
}

/// Reads a verbosity setting, falling back to *fallback* if absent.
std::optional<std::string>
get_verbosity(const caf::settings& cfg, std::string_view key,
              std::string_view fallback) {
  auto result = std::string{fallback};
  if (auto value = caf::get_if<std::string>(&cfg, key)) {
    if (loglevel_to_int(*value, -1) < 0) {
      fmt::print(stderr, "failed to start logger; {} '{}' is invalid\n", key,
                 *value);
      return std::nullopt;
    }
    result = *value;
  }
  return result;
}

} // namespace

namespace detail {

bool setup_spdlog(const caf::settings& cfg) try {
  if (logger()->name() != "/dev/null") {
    RANGEBITS_ERROR("Log already up");
    return false;
  }
  auto console_verbosity
    = get_verbosity(cfg, "rangebits.console-verbosity",
                    defaults::logger::console_verbosity);
  auto file_verbosity = get_verbosity(cfg, "rangebits.file-verbosity",
                                      defaults::logger::file_verbosity);
  if (!console_verbosity || !file_verbosity)
    return false;
  auto console_level = loglevel_to_int(*console_verbosity);
  auto file_level = loglevel_to_int(*file_verbosity);
  auto color_setting = caf::get_or(cfg, "rangebits.console-color",
                                   std::string{defaults::logger::console_color});
  auto log_color = to_color_mode(color_setting);
  if (!log_color) {
    fmt::print(stderr,
               "failed to start logger; rangebits.console-color '{}' is "
               "invalid\n",
               color_setting);
    return false;
  }
  auto queue_size = caf::get_or(cfg, "rangebits.log-queue-size",
                                defaults::logger::queue_size);
  spdlog::init_thread_pool(queue_size, defaults::logger::logger_threads);
  std::vector<spdlog::sink_ptr> sinks;
  // Add console sink.
  auto console_sink
    = std::make_shared<spdlog::sinks::ansicolor_stderr_sink_mt>(*log_color);
  auto console_format
    = caf::get_or(cfg, "rangebits.console-format",
                  std::string{defaults::logger::console_format});
  console_sink->set_pattern(console_format);
  console_sink->set_level(loglevel_to_spd(console_level));
  sinks.push_back(std::move(console_sink));
  // Add file sink.
  if (file_level != RANGEBITS_LOG_LEVEL_QUIET) {
    auto log_file = caf::get_or(cfg, "rangebits.log-file",
                                std::string{defaults::logger::log_file});
    auto file_sink
      = std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file);
    file_sink->set_level(loglevel_to_spd(file_level));
    auto file_format = caf::get_or(cfg, "rangebits.file-format",
                                   std::string{defaults::logger::file_format});
    file_sink->set_pattern(file_format);
    sinks.push_back(std::move(file_sink));
  }
  // Replace the /dev/null logger that was created during init.
  logger() = std::make_shared<spdlog::async_logger>(
    "rangebits", sinks.begin(), sinks.end(), spdlog::thread_pool(),
    spdlog::async_overflow_policy::block);
  logger()->set_level(loglevel_to_spd(std::max(console_level, file_level)));
  spdlog::register_logger(logger());
  return true;
} catch (const spdlog::spdlog_ex& err) {
  fmt::print(stderr, "failed to start logger: {}\n", err.what());
  return false;
}

std::optional<spdlog::color_mode> to_color_mode(std::string_view str) {
  if (str == "automatic")
    return spdlog::color_mode::automatic;
  if (str == "always")
    return spdlog::color_mode::always;
  if (str == "never")
    return spdlog::color_mode::never;
  return std::nullopt;
}

void shutdown_spdlog() {
  RANGEBITS_DEBUG("shut down logging");
  spdlog::shutdown();
}

std::shared_ptr<spdlog::logger>& logger() {
  static std::shared_ptr<spdlog::logger> rangebits_logger
    = spdlog::async_factory::template create<spdlog::sinks::null_sink_mt>(
      "/dev/null");
  return rangebits_logger;
}

} // namespace detail

} // namespace rangebits
