// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/slice.hpp"

#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"
#include "rangebits/fbs/range_bitmap_generated.h"
#include "rangebits/logger.hpp"

#include <fmt/format.h>

namespace rangebits {

// -- slice_builder ------------------------------------------------------------

slice_builder::slice_builder(uint32_t band, size_t bit_width)
  : band_{band}, planes_(bit_width) {
  RANGEBITS_ASSERT(bit_width <= band_word::width);
}

void slice_builder::append(uint64_t encoded, uint32_t n) {
  RANGEBITS_ASSERT(rows_ + n <= defaults::layout::band_size);
  if (n == 0)
    return;
  for (auto bits = encoded; bits != 0; bits &= bits - 1) {
    const auto i = band_word::count_trailing_zeros(bits);
    RANGEBITS_ASSERT(i < planes_.size(), "encoded value exceeds bit width");
    auto& plane = planes_[i];
    if (n == 1)
      plane.add(static_cast<offset_type>(rows_));
    else
      plane = plane | container::make_range(static_cast<offset_type>(rows_), n);
  }
  rows_ += n;
}

uint32_t slice_builder::band() const noexcept {
  return band_;
}

uint32_t slice_builder::rows() const noexcept {
  return rows_;
}

bool slice_builder::full() const noexcept {
  return rows_ == defaults::layout::band_size;
}

uint64_t slice_builder::mask() const noexcept {
  uint64_t result = 0;
  for (size_t i = 0; i < planes_.size(); ++i)
    if (!planes_[i].empty())
      result |= band_word::mask(i);
  return result;
}

flatbuffers::Offset<fbs::Slice>
slice_builder::finish(flatbuffers::FlatBufferBuilder& builder) {
  auto planes = std::vector<flatbuffers::Offset<fbs::Plane>>{};
  size_t bytes = 0;
  for (auto& plane : planes_) {
    if (plane.empty())
      continue;
    plane.optimize();
    bytes += plane.size_in_bytes();
    planes.push_back(pack(builder, plane));
  }
  RANGEBITS_DEBUG("sealed slice {} with {} rows, {} planes and {} payload "
                  "bytes",
                  band_, rows_, planes.size(), bytes);
  const auto planes_offset = builder.CreateVector(planes);
  return fbs::CreateSlice(builder, band_, rows_, mask(), planes_offset);
}

// -- slice_view ---------------------------------------------------------------

slice_view::slice_view(const fbs::Slice& slice) noexcept : slice_{&slice} {
  // nop
}

uint32_t slice_view::band() const noexcept {
  return slice_->band();
}

uint32_t slice_view::rows() const noexcept {
  return slice_->rows();
}

uint64_t slice_view::mask() const noexcept {
  return slice_->mask();
}

size_t slice_view::plane_count() const noexcept {
  return slice_->planes() ? slice_->planes()->size() : 0;
}

bool slice_view::has_plane(size_t i) const noexcept {
  return i < band_word::width && band_word::test(mask(), i);
}

std::optional<container_view> slice_view::plane(size_t i) const noexcept {
  if (!has_plane(i))
    return std::nullopt;
  // Planes are stored densely in ascending bit order.
  const auto index = band_word::popcount(mask() & band_word::lsb_mask(i));
  return unpack(*slice_->planes()->Get(index));
}

caf::error validate(const fbs::Slice& slice, uint32_t band, uint32_t rows,
                    size_t bit_width) {
  if (slice.band() != band)
    return caf::make_error(ec::corrupt_layout,
                           fmt::format("slice {} claims band {}", band,
                                       slice.band()));
  if (slice.rows() != rows)
    return caf::make_error(ec::corrupt_layout,
                           fmt::format("slice {} holds {} rows instead of {}",
                                       band, slice.rows(), rows));
  if ((slice.mask() & ~band_word::lsb_mask(bit_width)) != 0)
    return caf::make_error(ec::corrupt_layout,
                           fmt::format("slice {} has planes beyond the bit "
                                       "width {}",
                                       band, bit_width));
  const auto planes = slice.planes() ? slice.planes()->size() : 0;
  if (planes != band_word::popcount(slice.mask()))
    return caf::make_error(ec::corrupt_layout,
                           fmt::format("slice {} stores {} planes for mask "
                                       "{:#x}",
                                       band, planes, slice.mask()));
  for (size_t i = 0; i < planes; ++i) {
    const auto* plane = slice.planes()->Get(i);
    if (!plane)
      return caf::make_error(ec::corrupt_layout,
                             fmt::format("slice {} has a null plane", band));
    if (auto err = validate(*plane, rows))
      return add_context(err, "in slice {}", band);
  }
  return caf::none;
}

} // namespace rangebits
