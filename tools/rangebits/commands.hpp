// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <rangebits/fwd.hpp>

#include <caf/config_option_set.hpp>
#include <caf/error.hpp>

#include <iosfwd>
#include <string_view>

namespace rangebits::tool {

constexpr auto usage = std::string_view{
  "usage: rangebits [options] <command> [arguments]\n"
  "\n"
  "commands:\n"
  "  build <input> <output> [--min=N --max=N]\n"
  "      builds a range bitmap from one unsigned integer per line of\n"
  "      <input> ('-' reads from stdin) and writes it to <output>\n"
  "  query <file> <op> <value> [--count] [--parallelism=N]\n"
  "      prints the rows whose value satisfies '<op> <value>', where <op>\n"
  "      is one of ==, !=, <, <=, >, >= or eq, neq, lt, lte, gt, gte\n"
  "  inspect <file>\n"
  "      prints the directory of a range bitmap\n"};

/// Registers the options of the `build` and `query` commands.
void add_command_options(caf::config_option_set& options);

/// Runs the command named by the first positional argument of *cfg*. The
/// `build` command reads from *in* when its input is `-`, and all commands
/// print their results to *out*.
caf::error run_command(const configuration& cfg, std::istream& in,
                       std::ostream& out);

} // namespace rangebits::tool
