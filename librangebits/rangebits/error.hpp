// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include <caf/error.hpp>
#include <caf/is_error_code_enum.hpp>
#include <fmt/format.h>

#include <string>
#include <utility>

namespace rangebits {

/// The error codes of the library.
enum class ec : uint8_t {
  /// No error.
  no_error = 0,
  /// The unspecified default error code.
  unspecified,
  /// An error while accessing the filesystem.
  filesystem_error,
  /// Failure during parsing.
  parse_error,
  /// An error with an input/output format.
  format_error,
  /// An error caused by wrong internal application logic.
  logic_error,
  /// A function received an argument it cannot work with.
  invalid_argument,
  /// The configuration is invalid.
  invalid_configuration,
  /// A value lies outside the domain declared for the builder.
  encoding_overflow,
  /// A query value lies outside the encodable domain of the bitmap.
  out_of_domain,
  /// A row arrived out of row order.
  out_of_order,
  /// A persisted bitmap has an inconsistent layout.
  corrupt_layout,
  /// An evaluation was stopped on request.
  cancelled,
  /// No error; number of error codes.
  ec_count,
};

/// @relates ec
auto to_string(ec x) -> const char*;

/// A formatting function that converts an error into a human-readable string.
/// @relates ec
auto render(const caf::error& err) -> std::string;

auto add_context_impl(const caf::error& error, std::string str) -> caf::error;

/// Appends a formatted note to the context of an error.
template <class... Ts>
auto add_context(const caf::error& error, fmt::format_string<Ts...> fmt,
                 Ts&&... args) -> caf::error {
  return add_context_impl(error, fmt::format(std::move(fmt),
                                             std::forward<Ts>(args)...));
}

} // namespace rangebits

CAF_ERROR_CODE_ENUM(rangebits::ec)
