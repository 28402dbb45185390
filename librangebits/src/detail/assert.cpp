// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/detail/assert.hpp"

#include "rangebits/logger.hpp"

#include <stdexcept>

namespace rangebits::detail {

void panic_impl(std::string message, std::source_location source) {
  RANGEBITS_ERROR("panic: {}", message);
  RANGEBITS_ERROR("version: {}", version::version);
  RANGEBITS_ERROR("source: {}:{}", source.file_name(), source.line());
  message += fmt::format(" @ {}:{}", source.file_name(), source.line());
  throw std::runtime_error(message);
}

void fail_assertion_impl(const char* expr, std::string_view explanation,
                         std::source_location source) {
  auto message = fmt::format("assertion `{}` failed", expr);
  if (!explanation.empty()) {
    message += ": ";
    message += explanation;
  }
  panic_impl(std::move(message), source);
}

} // namespace rangebits::detail
