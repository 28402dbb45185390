// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/range_encoder.hpp"

#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"
#include "rangebits/word.hpp"

#include <fmt/format.h>

namespace rangebits {

range_encoder::range_encoder(domain d) noexcept
  : range_encoder{d, bit_width(d.max - d.min)} {
  // nop
}

range_encoder::range_encoder(domain d, size_t width) noexcept
  : domain_{d}, bit_width_{width} {
  RANGEBITS_ASSERT(d.min <= d.max);
  RANGEBITS_ASSERT(width <= word<uint64_t>::width);
  RANGEBITS_ASSERT(bit_width(d.max - d.min) <= width);
}

const domain& range_encoder::bounds() const noexcept {
  return domain_;
}

size_t range_encoder::bit_width() const noexcept {
  return bit_width_;
}

uint64_t range_encoder::max_representable() const noexcept {
  return word<uint64_t>::lsb_mask(bit_width_);
}

caf::expected<uint64_t> range_encoder::encode(uint64_t value) const {
  if (value < domain_.min || value > domain_.max)
    return caf::make_error(ec::encoding_overflow,
                           fmt::format("value {} lies outside the domain "
                                       "[{}, {}]",
                                       value, domain_.min, domain_.max));
  return max_representable() - (value - domain_.min);
}

caf::expected<uint64_t> range_encoder::anchor(uint64_t value) const {
  if (value < domain_.min || value - domain_.min > max_representable())
    return caf::make_error(ec::out_of_domain,
                           fmt::format("value {} lies outside [{}, {} + {}]",
                                       value, domain_.min, domain_.min,
                                       max_representable()));
  return value - domain_.min;
}

size_t range_encoder::bit_width(uint64_t x) noexcept {
  return word<uint64_t>::significant_bits(x);
}

} // namespace rangebits
