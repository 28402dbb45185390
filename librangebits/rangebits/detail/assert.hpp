// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/config.hpp"

#include <source_location>
#include <string>
#include <string_view>

namespace rangebits::detail {

/// Logs the message and throws. Marks a bug, not a recoverable condition.
[[noreturn]] void panic_impl(std::string message,
                             std::source_location source
                             = std::source_location::current());

[[noreturn]] void
fail_assertion_impl(const char* expr, std::string_view explanation,
                    std::source_location source);

} // namespace rangebits::detail

#if RANGEBITS_ENABLE_ASSERTIONS

#  define RANGEBITS_ASSERT(expr, ...)                                          \
    do {                                                                       \
      if (!static_cast<bool>(expr)) [[unlikely]] {                             \
        ::rangebits::detail::fail_assertion_impl(                              \
          #expr, ::std::string_view{__VA_ARGS__},                              \
          ::std::source_location::current());                                  \
      }                                                                        \
    } while (false)

#else

#  define RANGEBITS_ASSERT(expr, ...)                                          \
    static_cast<void>(sizeof(static_cast<bool>(expr)))

#endif

#define RANGEBITS_PANIC(message)                                               \
  ::rangebits::detail::panic_impl(message, ::std::source_location::current())
