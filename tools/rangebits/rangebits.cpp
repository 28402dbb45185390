// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "commands.hpp"

#include <rangebits/configuration.hpp>
#include <rangebits/error.hpp>
#include <rangebits/logger.hpp>

#include <caf/error.hpp>
#include <caf/init_global_meta_objects.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <cstdlib>
#include <iostream>

int main(int argc, char** argv) {
  using namespace rangebits;
  caf::core::init_global_meta_objects();
  auto cfg = configuration{};
  tool::add_command_options(cfg.options());
  if (auto err = cfg.parse(argc, argv)) {
    fmt::print(stderr, "failed to parse configuration: {}\n", render(err));
    return EXIT_FAILURE;
  }
  if (caf::get_or(cfg.content(), "help", false)) {
    fmt::print("{}", tool::usage);
    return EXIT_SUCCESS;
  }
  if (cfg.remainder().empty()) {
    fmt::print(stderr, "{}", tool::usage);
    return EXIT_FAILURE;
  }
  auto log_context = create_log_context(cfg.content());
  if (!log_context) {
    fmt::print(stderr, "{}\n", render(log_context.error()));
    return EXIT_FAILURE;
  }
  if (auto err = tool::run_command(cfg, std::cin, std::cout)) {
    RANGEBITS_ERROR("{} failed: {}", cfg.remainder().front(), render(err));
    std::cout.flush();
    fmt::print(stderr, "{}\n", render(err));
    if (err == ec::invalid_argument)
      fmt::print(stderr, "\n{}", tool::usage);
    return EXIT_FAILURE;
  }
  return EXIT_SUCCESS;
}
