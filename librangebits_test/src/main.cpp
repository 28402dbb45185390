// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/logger.hpp"
#include "rangebits/test/test.hpp"

#include <caf/config_option_set.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>
#include <caf/test/unit_test.hpp>

#include <algorithm>
#include <iostream>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace caf::test {

int main(int, char**);

} // namespace caf::test

namespace {

// Retrieves arguments after the '--' delimiter.
std::vector<std::string> get_test_args(int argc, const char* const* argv) {
  constexpr std::string_view delimiter = "--";
  auto start = argv + 1;
  auto end = argv + argc;
  auto args_start = std::find(start, end, delimiter);
  if (args_start == end)
    return {};
  return {args_start + 1, end};
}

} // namespace

int main(int argc, char** argv) {
  std::string rangebits_loglevel = "quiet";
  auto test_args = get_test_args(argc, argv);
  if (!test_args.empty()) {
    auto options = caf::config_option_set{}
                     .add(rangebits_loglevel, "rangebits-verbosity",
                          "console verbosity for librangebits")
                     .add<bool>("help", "print this help text");
    caf::settings cfg;
    auto res = options.parse(cfg, test_args);
    if (res.first != caf::pec::success) {
      std::cout << "error while parsing argument \"" << *res.second
                << "\": " << to_string(res.first) << "\n\n";
      std::cout << options.help_text() << std::endl;
      return 1;
    }
    if (caf::get_or(cfg, "help", false)) {
      std::cout << options.help_text() << std::endl;
      return 0;
    }
    rangebits::test::config = {
      std::make_move_iterator(std::begin(test_args)),
      std::make_move_iterator(std::end(test_args)),
    };
  }
  caf::core::init_global_meta_objects();
  caf::settings log_settings;
  caf::put(log_settings, "rangebits.console-verbosity", rangebits_loglevel);
  caf::put(log_settings, "rangebits.console-format", "%^[%s:%#] %v%$");
  auto log_context = rangebits::create_log_context(log_settings);
  if (!log_context) {
    std::cerr << "failed to set up logging: "
              << to_string(log_context.error()) << std::endl;
    return 1;
  }
  // Run the unit tests.
  return caf::test::main(argc, argv);
}
