// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include <concepts>
#include <cstdint>
#include <limits>

namespace rangebits {

/// A fixed-size unsigned piece of data that supports various bitwise
/// operations.
template <std::unsigned_integral T>
struct word {
  // -- general ---------------------------------------------------------------

  /// The underlying block type.
  using value_type = T;

  /// The type to represent sizes.
  using size_type = uint64_t;

  /// The number of bits per block (aka. word size).
  static constexpr size_type width = std::numeric_limits<value_type>::digits;

  static_assert(width <= 64);

  // -- special block values --------------------------------------------------

  /// A block with all 0s.
  static constexpr value_type none = value_type{0};

  /// A block with all 1s.
  static constexpr value_type all = ~none;

  /// A block with only an LSB of 1.
  static constexpr value_type lsb1 = value_type{1};

  // -- masks -----------------------------------------------------------------

  /// Computes a bitmask for a given position.
  /// @param i The position where the 1-bit should be.
  /// @return `1 << i`
  /// @pre `i < width`
  static constexpr value_type mask(size_type i) {
    return lsb1 << i;
  }

  /// Computes a bitmask with only the *i* least significant bits set to 1.
  /// @param i The number least significant bits to set to 1.
  /// @pre `i <= width`
  static constexpr value_type lsb_mask(size_type i) {
    return i >= width ? all : ~(all << i);
  }

  // -- tests -----------------------------------------------------------------

  /// Extracts the *i*-th bit in a block.
  /// @param x The block to test.
  /// @param i The bit to extract.
  /// @returns The value at position *i*, counted from the LSB.
  /// @pre `i < width`
  static constexpr bool test(value_type x, size_type i) {
    return (x & mask(i)) == mask(i);
  }

  // -- counting --------------------------------------------------------------

  /// Computes the population count (aka. *Hamming weight* or *popcount*) of a
  /// word.
  /// @param x The block value.
  /// @returns The number of set bits in *x*.
  static constexpr size_type popcount(value_type x) {
    if constexpr (width <= 32) {
      return x == 0 ? 0 : __builtin_popcount(x);
    } else {
      return x == 0 ? 0 : __builtin_popcountll(x);
    }
  }

  /// Counts the number of trailing zeros.
  /// @param x The block value.
  /// @returns The number trailing zeros in *x*.
  static constexpr size_type count_trailing_zeros(value_type x) {
    if constexpr (width <= 32) {
      return x == 0 ? width : __builtin_ctz(x);
    } else {
      return x == 0 ? width : __builtin_ctzll(x);
    }
  }

  /// Counts the number of leading zeros.
  /// @param x The block value.
  /// @returns The number leading zeros in *x*.
  static constexpr size_type count_leading_zeros(value_type x) {
    if constexpr (width <= 32) {
      // The compiler builtin always assumes a width of 32 bits. We have to
      // adapt the return value according to the actual block width.
      return x == 0 ? width : (__builtin_clz(x) - (32 - width));
    } else {
      return x == 0 ? width : __builtin_clzll(x);
    }
  }

  /// Counts the 1-bits in the range `[0, i]`.
  /// @pre `i < width`
  static constexpr size_type rank(value_type x, size_type i) {
    return popcount(x & lsb_mask(i + 1));
  }

  /// Locates the *k*-th 1-bit, counting from 0 at the LSB.
  /// @pre `k < popcount(x)`
  static constexpr size_type select(value_type x, size_type k) {
    for (; k > 0; --k)
      x &= x - 1;
    return count_trailing_zeros(x);
  }

  // -- math ------------------------------------------------------------------

  /// Computes the number of bits required to represent *x*, i.e.,
  /// `ceil(log2(x + 1))`.
  static constexpr size_type significant_bits(value_type x) {
    return width - count_leading_zeros(x);
  }
};

} // namespace rangebits
