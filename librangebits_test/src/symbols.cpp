// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#define CAF_TEST_NO_MAIN
#include <caf/test/unit_test_impl.hpp>

#include <set>
#include <string>

namespace rangebits::test {

std::set<std::string> config;

} // namespace rangebits::test
