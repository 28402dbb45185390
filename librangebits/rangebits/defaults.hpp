// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace rangebits::defaults {

// -- layout -------------------------------------------------------------------

namespace layout {

/// The number of rows per slice.
constexpr uint32_t band_size = uint32_t{1} << 16;

/// The largest array container before it turns into a bitset.
constexpr uint32_t array_cardinality_limit = 4096;

/// The largest serialized range bitmap. FlatBuffers addresses a buffer with
/// signed 32-bit offsets.
constexpr size_t max_bitmap_size = (size_t{1} << 31) - 1;

} // namespace layout

// -- configuration ------------------------------------------------------------

namespace configuration {

/// The environment variable prefix for configuration keys.
constexpr std::string_view env_prefix = "RANGEBITS";

/// The environment variable that names an explicit configuration file.
constexpr std::string_view config_env = "RANGEBITS_CONFIG";

/// The basename of configuration files.
constexpr std::string_view config_basename = "rangebits";

} // namespace configuration

// -- logger -------------------------------------------------------------------

namespace logger {

constexpr std::string_view console_verbosity = "info";

constexpr std::string_view console_format = "%^[%T.%e] %v%$";

constexpr std::string_view console_color = "automatic";

constexpr std::string_view file_verbosity = "quiet";

constexpr std::string_view file_format
  = "[%Y-%m-%dT%T.%e%z] [%n] [%l] [%s:%#] %v";

constexpr std::string_view log_file = "rangebits.log";

constexpr size_t queue_size = 8'192;

constexpr size_t logger_threads = 1;

} // namespace logger

// -- query --------------------------------------------------------------------

namespace query {

/// The number of threads evaluating one query.
constexpr size_t parallelism = 1;

/// The smallest number of slices a worker thread receives.
constexpr size_t min_slices_per_worker = 2;

} // namespace query

} // namespace rangebits::defaults
