// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <cstddef>
#include <iterator>
#include <span>

namespace rangebits::concepts {

/// Types that work with std::data and std::size (= containers)
template <class T>
concept container = requires(T& t) {
  std::data(t);
  std::size(t);
};

/// Contiguous byte buffers
template <class T>
concept byte_container = requires(T& t) {
  requires container<T>;
  requires sizeof(decltype(*std::data(t))) == 1;
};

} // namespace rangebits::concepts

namespace rangebits {

template <concepts::byte_container Buffer>
constexpr auto
as_bytes(const Buffer& xs) noexcept -> std::span<const std::byte> {
  const auto* const data = reinterpret_cast<const std::byte*>(std::data(xs));
  return {data, std::size(xs)};
}

} // namespace rangebits
