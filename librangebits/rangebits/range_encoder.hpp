// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>

namespace rangebits {

/// The closed interval of values a range bitmap can hold.
struct domain {
  uint64_t min = 0;
  uint64_t max = 0;

  friend bool operator==(const domain&, const domain&) = default;
};

/// Maps values onto the bit-planes of a range bitmap. Values are anchored at
/// the domain minimum and complemented within the bit width, so that plane
/// *i* holds the rows whose anchored value has a 0 in bit *i*.
class range_encoder {
public:
  /// @pre `d.min <= d.max`
  explicit range_encoder(domain d) noexcept;

  /// Restores an encoder with a persisted bit width.
  /// @pre `width <= 64` and the width covers `d.max - d.min`.
  range_encoder(domain d, size_t width) noexcept;

  [[nodiscard]] const domain& bounds() const noexcept;

  /// The number of planes, i.e., the bits needed for `max - min`.
  [[nodiscard]] size_t bit_width() const noexcept;

  /// The largest anchored value the bit width can represent.
  [[nodiscard]] uint64_t max_representable() const noexcept;

  /// Encodes a value for insertion.
  /// @returns the complemented anchored value, or `ec::encoding_overflow` if
  /// *value* lies outside the domain.
  [[nodiscard]] caf::expected<uint64_t> encode(uint64_t value) const;

  /// Anchors a query value at the domain minimum.
  /// @returns `value - min`, or `ec::out_of_domain` if the result is not
  /// representable with the bit width.
  [[nodiscard]] caf::expected<uint64_t> anchor(uint64_t value) const;

  /// Computes the bits needed to represent `x`.
  static size_t bit_width(uint64_t x) noexcept;

private:
  domain domain_;
  size_t bit_width_;
};

} // namespace rangebits
