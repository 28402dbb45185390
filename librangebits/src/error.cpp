// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/error.hpp"

#include "rangebits/detail/assert.hpp"

#include <caf/message.hpp>
#include <caf/pec.hpp>
#include <caf/sec.hpp>

#include <iterator>
#include <sstream>
#include <string>

namespace rangebits {

namespace {

const char* descriptions[] = {
  "no_error",
  "unspecified",
  "filesystem_error",
  "parse_error",
  "format_error",
  "logic_error",
  "invalid_argument",
  "invalid_configuration",
  "encoding_overflow",
  "out_of_domain",
  "out_of_order",
  "corrupt_layout",
  "cancelled",
};

static_assert(ec{std::size(descriptions)} == ec::ec_count,
              "Mismatch between number of error codes and descriptions");

void render_default_ctx(std::ostringstream& oss, const caf::message& ctx) {
  size_t size = ctx.size();
  if (size > 0) {
    oss << ":";
    for (size_t i = 0; i < size; ++i) {
      oss << ' ';
      if (ctx.match_element<std::string>(i))
        oss << ctx.get_as<std::string>(i);
      else
        oss << to_string(ctx);
    }
  }
}

} // namespace

auto to_string(ec x) -> const char* {
  auto index = static_cast<size_t>(x);
  RANGEBITS_ASSERT(index < std::size(descriptions));
  return descriptions[index];
}

auto render(const caf::error& err) -> std::string {
  if (!err)
    return "";
  std::ostringstream oss;
  oss << "!! ";
  switch (err.category()) {
    default:
      oss << "unknown";
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<rangebits::ec>:
      oss << to_string(static_cast<rangebits::ec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<caf::pec>:
      oss << to_string(static_cast<caf::pec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
    case caf::type_id_v<caf::sec>:
      oss << to_string(static_cast<caf::sec>(err.code()));
      render_default_ctx(oss, err.context());
      break;
  }
  return oss.str();
}

auto add_context_impl(const caf::error& error, std::string str) -> caf::error {
  if (!error)
    return error;
  if (error.context().empty())
    return caf::error{error.code(), error.category(),
                      caf::make_message(std::move(str))};
  return caf::error{
    error.code(),
    error.category(),
    caf::message::concat(error.context(), caf::make_message(std::move(str))),
  };
}

} // namespace rangebits
