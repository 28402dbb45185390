// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "commands.hpp"

#include <rangebits/configuration.hpp>
#include <rangebits/container.hpp>
#include <rangebits/defaults.hpp>
#include <rangebits/error.hpp>
#include <rangebits/operator.hpp>
#include <rangebits/range_bitmap.hpp>
#include <rangebits/range_bitmap_builder.hpp>
#include <rangebits/row_set.hpp>

#include <caf/expected.hpp>
#include <caf/settings.hpp>
#include <fmt/format.h>

#include <charconv>
#include <fstream>
#include <istream>
#include <iterator>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace rangebits::tool {

namespace {

/// Reads one value per line. Blank lines are skipped.
caf::error read_values(std::istream& in, range_bitmap_builder& builder) {
  auto line = std::string{};
  size_t line_number = 0;
  while (std::getline(in, line)) {
    ++line_number;
    auto str = std::string_view{line};
    while (!str.empty() && (str.back() == '\r' || str.back() == ' '))
      str.remove_suffix(1);
    while (!str.empty() && str.front() == ' ')
      str.remove_prefix(1);
    if (str.empty())
      continue;
    uint64_t value = 0;
    const auto* last = str.data() + str.size();
    auto [ptr, errc] = std::from_chars(str.data(), last, value);
    if (errc != std::errc{} || ptr != last)
      return caf::make_error(
        ec::parse_error,
        fmt::format("line {}: '{}' is not an unsigned integer", line_number,
                    str));
    if (auto err = builder.append(value))
      return add_context(err, "line {}", line_number);
  }
  if (in.bad())
    return caf::make_error(ec::filesystem_error,
                           fmt::format("failed to read line {}",
                                       line_number + 1));
  return caf::none;
}

caf::expected<uint64_t> parse_value(std::string_view str) {
  uint64_t result = 0;
  const auto* last = str.data() + str.size();
  auto [ptr, errc] = std::from_chars(str.data(), last, result);
  if (errc != std::errc{} || ptr != last)
    return caf::make_error(ec::parse_error,
                           fmt::format("'{}' is not an unsigned integer", str));
  return result;
}

caf::expected<range_bitmap_builder>
make_builder(const caf::settings& options) {
  const auto* min = caf::get_if<int64_t>(&options, "rangebits.build.min");
  const auto* max = caf::get_if<int64_t>(&options, "rangebits.build.max");
  if (!min && !max)
    return range_bitmap_builder{};
  if (!min || !max)
    return caf::make_error(ec::invalid_configuration,
                           "a declared domain requires both --min and --max");
  if (*min < 0 || *min > *max)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("invalid domain [{}, {}]", *min, *max));
  return range_bitmap_builder{
    domain{static_cast<uint64_t>(*min), static_cast<uint64_t>(*max)}};
}

caf::error build(const configuration& cfg,
                 const std::vector<std::string>& args, std::istream& in,
                 std::ostream& out) {
  if (args.size() != 2)
    return caf::make_error(ec::invalid_argument,
                           "build expects an input and an output path");
  auto builder = make_builder(cfg.content());
  if (!builder)
    return std::move(builder.error());
  if (args[0] == "-") {
    if (auto err = read_values(in, *builder))
      return err;
  } else {
    auto file = std::ifstream{args[0]};
    if (!file)
      return caf::make_error(ec::filesystem_error,
                             fmt::format("failed to open {}", args[0]));
    if (auto err = read_values(file, *builder))
      return add_context(err, "in {}", args[0]);
  }
  auto bitmap = builder->seal();
  if (!bitmap)
    return std::move(bitmap.error());
  if (auto err = save(args[1], *bitmap))
    return err;
  out << fmt::format("wrote {} rows in [{}, {}] to {} ({} bytes)\n",
                     bitmap->rows(), bitmap->min(), bitmap->max(), args[1],
                     bitmap->memusage());
  return caf::none;
}

caf::error query(const configuration& cfg,
                 const std::vector<std::string>& args, std::ostream& out) {
  if (args.size() != 3)
    return caf::make_error(ec::invalid_argument,
                           "query expects a file, an operator and a value");
  auto op = to_relational_operator(args[1]);
  if (!op)
    return std::move(op.error());
  auto value = parse_value(args[2]);
  if (!value)
    return std::move(value.error());
  const auto parallelism = caf::get_or(
    cfg.content(), "rangebits.query.parallelism",
    static_cast<int64_t>(defaults::query::parallelism));
  if (parallelism < 1)
    return caf::make_error(ec::invalid_configuration,
                           fmt::format("parallelism must be positive, got {}",
                                       parallelism));
  auto bitmap = range_bitmap::load(args[0]);
  if (!bitmap)
    return std::move(bitmap.error());
  auto options = query_options{};
  options.parallelism = static_cast<size_t>(parallelism);
  if (caf::get_or(cfg.content(), "rangebits.query.count", false)) {
    auto count = bitmap->count(*op, *value, options);
    if (!count)
      return std::move(count.error());
    out << fmt::format("{}\n", *count);
    return caf::none;
  }
  auto rows = bitmap->lookup(*op, *value, options);
  if (!rows)
    return std::move(rows.error());
  auto buffer = fmt::memory_buffer{};
  rows->for_each([&](id row) {
    fmt::format_to(std::back_inserter(buffer), "{}\n", row);
  });
  out << fmt::to_string(buffer);
  return caf::none;
}

caf::error inspect(const std::vector<std::string>& args, std::ostream& out) {
  if (args.size() != 1)
    return caf::make_error(ec::invalid_argument, "inspect expects a file");
  auto bitmap = range_bitmap::load(args[0]);
  if (!bitmap)
    return std::move(bitmap.error());
  out << fmt::format("rows: {}\n"
                     "domain: [{}, {}]\n"
                     "bit width: {}\n"
                     "slices: {}\n"
                     "size: {} bytes\n",
                     bitmap->rows(), bitmap->min(), bitmap->max(),
                     bitmap->bit_width(), bitmap->slice_count(),
                     bitmap->chunk()->size());
  for (size_t i = 0; i < bitmap->slice_count(); ++i) {
    const auto slice = bitmap->slice(i);
    out << fmt::format("slice {}: {} rows, mask {:#x}, {} planes\n",
                       slice.band(), slice.rows(), slice.mask(),
                       slice.plane_count());
    for (size_t bit = 0; bit < bitmap->bit_width(); ++bit) {
      const auto plane = slice.plane(bit);
      if (!plane)
        continue;
      out << fmt::format("  plane {}: {} with {} rows in {} bytes\n", bit,
                         kind(*plane), cardinality(*plane),
                         size_in_bytes(*plane));
    }
  }
  return caf::none;
}

} // namespace

void add_command_options(caf::config_option_set& options) {
  options
    .add<int64_t>("?rangebits.build", "min", "smallest value of the domain")
    .add<int64_t>("?rangebits.build", "max", "largest value of the domain")
    .add<bool>("?rangebits.query", "count", "print the number of matches");
}

caf::error run_command(const configuration& cfg, std::istream& in,
                       std::ostream& out) {
  const auto& args = cfg.remainder();
  if (args.empty())
    return caf::make_error(ec::invalid_argument, "missing command");
  const auto command = std::string_view{args.front()};
  const auto command_args = std::vector<std::string>(args.begin() + 1,
                                                     args.end());
  if (command == "build")
    return build(cfg, command_args, in, out);
  if (command == "query")
    return query(cfg, command_args, out);
  if (command == "inspect")
    return inspect(command_args, out);
  return caf::make_error(ec::invalid_argument,
                         fmt::format("unknown command '{}'", command));
}

} // namespace rangebits::tool
