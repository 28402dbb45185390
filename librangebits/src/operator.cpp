// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/operator.hpp"

#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"

namespace rangebits {

const char* to_string(relational_operator op) noexcept {
  switch (op) {
    case relational_operator::less:
      return "<";
    case relational_operator::less_equal:
      return "<=";
    case relational_operator::greater:
      return ">";
    case relational_operator::greater_equal:
      return ">=";
    case relational_operator::equal:
      return "==";
    case relational_operator::not_equal:
      return "!=";
  }
  return "<invalid>";
}

caf::expected<relational_operator>
to_relational_operator(std::string_view str) {
  if (str == "<" || str == "lt")
    return relational_operator::less;
  if (str == "<=" || str == "lte")
    return relational_operator::less_equal;
  if (str == ">" || str == "gt")
    return relational_operator::greater;
  if (str == ">=" || str == "gte")
    return relational_operator::greater_equal;
  if (str == "==" || str == "eq")
    return relational_operator::equal;
  if (str == "!=" || str == "neq")
    return relational_operator::not_equal;
  return caf::make_error(ec::parse_error,
                         fmt::format("unknown relational operator '{}'", str));
}

} // namespace rangebits
