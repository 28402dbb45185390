// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/defaults.hpp"

#include <caf/config_option_set.hpp>
#include <caf/config_value.hpp>
#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/settings.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace rangebits {

/// Translates an environment variable to a config key. All keys follow the
/// pattern PREFIX_SUFFIX, where PREFIX is the application-specific prefix
/// that gets stripped and replaced by its lowercase form. Thereafter, SUFFIX
/// adheres to the following substitution rules:
/// 1. A '_' translates into '-'
/// 2. A "__" translates into the record separator '.'
/// @pre `!prefix.empty()`
std::optional<std::string>
to_config_key(std::string_view key,
              std::string_view prefix = defaults::configuration::env_prefix);

/// Parses a YAML document into a configuration value. Maps turn into
/// settings, sequences into lists, and scalars into the narrowest matching
/// type.
caf::expected<caf::config_value> from_yaml(std::string_view str);

/// The layered settings of a library client: built-in defaults, YAML
/// configuration files, environment variables and command-line options, in
/// increasing order of precedence.
class configuration {
public:
  configuration();

  /// Registers additional command-line options.
  caf::config_option_set& options() noexcept;

  /// Loads configuration files and the environment, then applies the
  /// command-line arguments. Arguments that do not start with `-` and all
  /// arguments after `--` are collected in the remainder.
  caf::error parse(int argc, char** argv);

  /// @copydoc parse
  caf::error parse(std::vector<std::string> args);

  [[nodiscard]] const caf::settings& content() const noexcept;

  caf::settings& content() noexcept;

  /// @returns the configuration files in the order they were applied.
  [[nodiscard]] const std::vector<std::filesystem::path>&
  config_files() const noexcept;

  /// @returns the positional arguments.
  [[nodiscard]] const std::vector<std::string>& remainder() const noexcept;

  /// @returns the directories searched for configuration files.
  [[nodiscard]] static std::vector<std::filesystem::path> config_dirs();

private:
  caf::config_option_set options_;
  caf::settings content_ = {};
  std::vector<std::filesystem::path> config_files_ = {};
  std::vector<std::string> remainder_ = {};
};

} // namespace rangebits
