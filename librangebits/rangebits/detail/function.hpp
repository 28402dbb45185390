// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <function2/function2.hpp>

namespace rangebits::detail {

/// A move-only, type-erased callable.
template <class... Signatures>
using unique_function = fu2::unique_function<Signatures...>;

} // namespace rangebits::detail
