// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include <caf/expected.hpp>
#include <fmt/format.h>

#include <string_view>

namespace rangebits {

/// A comparison between a stored value and a query value.
enum class relational_operator : uint8_t {
  less,
  less_equal,
  greater,
  greater_equal,
  equal,
  not_equal,
};

/// @relates relational_operator
const char* to_string(relational_operator op) noexcept;

/// Parses one of `<`, `<=`, `>`, `>=`, `==`, `!=`, or their mnemonic
/// spellings `lt`, `lte`, `gt`, `gte`, `eq`, `neq`.
/// @relates relational_operator
caf::expected<relational_operator> to_relational_operator(std::string_view str);

} // namespace rangebits

template <>
struct fmt::formatter<rangebits::relational_operator>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(rangebits::relational_operator op, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(op), ctx);
  }
};
