// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

namespace rangebits::detail {

template <class... Ts>
constexpr void discard(const Ts&...) noexcept {
  // nop
}

} // namespace rangebits::detail

/// Evaluates nothing, but keeps the arguments "used" for the compiler.
#define RANGEBITS_DISCARD_ARGS(...)                                            \
  do {                                                                         \
    if (false)                                                                 \
      ::rangebits::detail::discard(__VA_ARGS__);                               \
  } while (false)
