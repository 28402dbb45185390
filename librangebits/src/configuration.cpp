// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/configuration.hpp"

#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"
#include "rangebits/logger.hpp"

#include <caf/pec.hpp>
#include <fmt/format.h>
#include <yaml-cpp/yaml.h>

#include <cctype>
#include <cstdlib>
#include <fstream>
#include <sstream>
#include <system_error>

extern char** environ;

namespace rangebits {

namespace {

/// Infers the type of a scalar, falling back to a string.
caf::config_value to_config_value(const std::string& str) {
  if (str.empty())
    return caf::config_value{str};
  if (auto value = caf::config_value::parse(str))
    return std::move(*value);
  return caf::config_value{str};
}

caf::config_value to_config_value(const YAML::Node& node) {
  switch (node.Type()) {
    case YAML::NodeType::Undefined:
    case YAML::NodeType::Null:
      return caf::config_value{};
    case YAML::NodeType::Scalar:
      return to_config_value(node.as<std::string>());
    case YAML::NodeType::Sequence: {
      auto xs = caf::config_value::list{};
      xs.reserve(node.size());
      for (const auto& element : node)
        xs.push_back(to_config_value(element));
      return caf::config_value{std::move(xs)};
    }
    case YAML::NodeType::Map: {
      auto xs = caf::settings{};
      for (const auto& pair : node)
        xs[pair.first.as<std::string>()] = to_config_value(pair.second);
      return caf::config_value{std::move(xs)};
    }
  }
  RANGEBITS_PANIC("unhandled YAML node type");
}

/// Merges *src* into *dst*, recursing into nested settings.
void merge(const caf::settings& src, caf::settings& dst) {
  for (const auto& [key, value] : src) {
    if (const auto* nested = caf::get_if<caf::settings>(&value)) {
      auto& target = dst[key];
      if (!caf::holds_alternative<caf::settings>(target))
        target = caf::settings{};
      merge(*nested, caf::get<caf::settings>(target));
    } else {
      dst[key] = value;
    }
  }
}

caf::expected<std::vector<std::filesystem::path>>
collect_config_files(const std::vector<std::filesystem::path>& dirs,
                     std::vector<std::string> cli_configs) {
  const auto basename = std::string{defaults::configuration::config_basename};
  auto result = std::vector<std::filesystem::path>{};
  for (const auto& dir : dirs) {
    // Support both *.yaml and *.yml extensions.
    auto conf_yaml = dir / (basename + ".yaml");
    auto conf_yml = dir / (basename + ".yml");
    std::error_code err{};
    const auto exists_conf_yaml = std::filesystem::exists(conf_yaml, err);
    if (err)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("failed to check if {} exists: {}",
                                         conf_yaml.string(), err.message()));
    const auto exists_conf_yml = std::filesystem::exists(conf_yml, err);
    if (err)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("failed to check if {} exists: {}",
                                         conf_yml.string(), err.message()));
    // We cannot decide which one to pick if we have two, so bail out.
    if (exists_conf_yaml && exists_conf_yml)
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("detected both '{}.yaml' and "
                                         "'{}.yml' files in {}",
                                         basename, basename, dir.string()));
    if (exists_conf_yaml)
      result.push_back(std::move(conf_yaml));
    else if (exists_conf_yml)
      result.push_back(std::move(conf_yml));
  }
  // Only check the environment if we don't have a config on the command line.
  if (cli_configs.empty())
    if (const auto* file
        = std::getenv(defaults::configuration::config_env.data()))
      cli_configs.emplace_back(file);
  for (const auto& file : cli_configs) {
    auto config_file = std::filesystem::path{file};
    std::error_code err{};
    if (std::filesystem::exists(config_file, err))
      result.push_back(std::move(config_file));
    else
      return caf::make_error(ec::invalid_configuration,
                             fmt::format("cannot find configuration file {}{}",
                                         config_file.string(),
                                         err ? ": " + err.message() : ""));
  }
  return result;
}

caf::expected<caf::settings> load_config_file(const std::filesystem::path& file) {
  auto in = std::ifstream{file};
  if (!in)
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to read config file {}",
                                       file.string()));
  auto contents = std::stringstream{};
  contents << in.rdbuf();
  auto yaml = from_yaml(contents.str());
  if (!yaml)
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to read config file {}: {}",
                                       file.string(), render(yaml.error())));
  // Skip empty config files.
  if (caf::holds_alternative<caf::none_t>(*yaml))
    return caf::settings{};
  auto* result = caf::get_if<caf::settings>(&*yaml);
  if (!result)
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to read config file {}: not a "
                                       "map of key-value pairs",
                                       file.string()));
  return std::move(*result);
}

/// Merges environment variables with the configured prefix into *config*.
void merge_environment(caf::settings& config) {
  for (auto** env = environ; env != nullptr && *env != nullptr; ++env) {
    const auto entry = std::string_view{*env};
    const auto separator = entry.find('=');
    if (separator == std::string_view::npos)
      continue;
    const auto key = entry.substr(0, separator);
    const auto value = std::string{entry.substr(separator + 1)};
    if (value.empty() || key == defaults::configuration::config_env)
      continue;
    if (auto config_key = to_config_key(key))
      caf::put(config, *config_key, to_config_value(value));
  }
}

} // namespace

std::optional<std::string>
to_config_key(std::string_view key, std::string_view prefix) {
  RANGEBITS_ASSERT(!prefix.empty());
  // PREFIX_X is the shortest allowed key.
  if (prefix.size() + 2 > key.size())
    return std::nullopt;
  if (!key.starts_with(prefix) || key[prefix.size()] != '_')
    return std::nullopt;
  auto result = std::string{};
  for (auto c : prefix)
    result += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  result += '.';
  // From here on, "__" is the record separator and '_' translates into '-'.
  const auto suffix = key.substr(prefix.size() + 1);
  for (size_t i = 0; i < suffix.size(); ++i) {
    if (suffix[i] == '_' && i + 1 < suffix.size() && suffix[i + 1] == '_') {
      result += '.';
      ++i;
    } else if (suffix[i] == '_') {
      result += '-';
    } else {
      result += static_cast<char>(
        std::tolower(static_cast<unsigned char>(suffix[i])));
    }
  }
  return result;
}

caf::expected<caf::config_value> from_yaml(std::string_view str) {
  try {
    auto node = YAML::Load(std::string{str});
    return to_config_value(node);
  } catch (const YAML::Exception& e) {
    return caf::make_error(ec::parse_error,
                           fmt::format("failed to parse YAML at line {} column "
                                       "{}: {}",
                                       e.mark.line + 1, e.mark.column + 1,
                                       e.msg));
  }
}

configuration::configuration() {
  options_.add<std::string>("?rangebits", "config",
                            "path to a configuration file")
    .add<std::string>("?rangebits", "console-verbosity",
                      "output verbosity level on the console")
    .add<std::string>("?rangebits", "console-format",
                      "format string for logging to the console")
    .add<std::string>("?rangebits", "console-color",
                      "console colors: automatic, always or never")
    .add<std::string>("?rangebits", "file-verbosity",
                      "output verbosity level in the log file")
    .add<std::string>("?rangebits", "file-format",
                      "format string for logging to the log file")
    .add<std::string>("?rangebits", "log-file", "log filename")
    .add<size_t>("?rangebits", "log-queue-size",
                 "number of messages the asynchronous logger buffers")
    .add<int64_t>("?rangebits.query", "parallelism",
                  "number of threads per query")
    .add<bool>("help,h?", "prints the help text");
}

caf::config_option_set& configuration::options() noexcept {
  return options_;
}

caf::error configuration::parse(int argc, char** argv) {
  RANGEBITS_ASSERT(argc > 0);
  return parse(std::vector<std::string>(argv + 1, argv + argc));
}

caf::error configuration::parse(std::vector<std::string> args) {
  // Separate options from positional arguments.
  auto cli = std::vector<std::string>{};
  remainder_.clear();
  for (auto i = args.begin(); i != args.end(); ++i) {
    if (*i == "--") {
      remainder_.insert(remainder_.end(), std::make_move_iterator(i + 1),
                        std::make_move_iterator(args.end()));
      break;
    }
    if (i->starts_with("-") && i->size() > 1)
      cli.push_back(std::move(*i));
    else
      remainder_.push_back(std::move(*i));
  }
  auto cli_settings = caf::settings{};
  auto [state, position] = options_.parse(cli_settings, cli);
  if (state != caf::pec::success)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("failed to parse option {}: {}",
                                       position != cli.end() ? *position : "",
                                       caf::to_string(state)));
  // Gather and apply configuration files.
  auto cli_configs = std::vector<std::string>{};
  if (auto file = caf::get_if<std::string>(&cli_settings, "rangebits.config"))
    cli_configs.push_back(*file);
  auto files = collect_config_files(config_dirs(), std::move(cli_configs));
  if (!files)
    return std::move(files.error());
  config_files_.clear();
  for (auto& file : *files) {
    auto settings = load_config_file(file);
    if (!settings)
      return std::move(settings.error());
    merge(*settings, content_);
    config_files_.push_back(std::move(file));
  }
  merge_environment(content_);
  merge(cli_settings, content_);
  return caf::none;
}

const caf::settings& configuration::content() const noexcept {
  return content_;
}

caf::settings& configuration::content() noexcept {
  return content_;
}

const std::vector<std::filesystem::path>&
configuration::config_files() const noexcept {
  return config_files_;
}

const std::vector<std::string>& configuration::remainder() const noexcept {
  return remainder_;
}

std::vector<std::filesystem::path> configuration::config_dirs() {
  auto result = std::vector<std::filesystem::path>{};
  const auto basename = std::string{defaults::configuration::config_basename};
  if (const auto* xdg_config_home = std::getenv("XDG_CONFIG_HOME"))
    result.push_back(std::filesystem::path{xdg_config_home} / basename);
  else if (const auto* home = std::getenv("HOME"))
    result.push_back(std::filesystem::path{home} / ".config" / basename);
  std::error_code err{};
  auto cwd = std::filesystem::current_path(err);
  if (!err)
    result.push_back(std::move(cwd));
  return result;
}

} // namespace rangebits
