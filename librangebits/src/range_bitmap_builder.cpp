// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/range_bitmap_builder.hpp"

#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"
#include "rangebits/fbs/range_bitmap_generated.h"
#include "rangebits/logger.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <limits>

namespace rangebits {

namespace {

constexpr auto band_size = uint64_t{defaults::layout::band_size};

/// Bounds the table, vtable and alignment bytes around one container and
/// around one slice, including its entry in the slice vector.
constexpr size_t plane_overhead = 128;
constexpr size_t slice_overhead = 128;

/// Bounds the root table, its vtable and the file identifier.
constexpr size_t footer_size = 256;

/// An upper bound for the serialized size of one slice: no container is
/// larger than a bitset.
constexpr size_t max_slice_size(size_t bit_width) {
  return slice_overhead
         + bit_width * (words_per_band * sizeof(uint64_t) + plane_overhead);
}

uint64_t slices_for(uint64_t rows) {
  return rows / band_size + (rows % band_size != 0 ? 1 : 0);
}

} // namespace

range_bitmap_builder::range_bitmap_builder()
  : range_bitmap_builder{std::nullopt, defaults::layout::max_bitmap_size} {
  // nop
}

range_bitmap_builder::range_bitmap_builder(domain d)
  : range_bitmap_builder{d, defaults::layout::max_bitmap_size} {
  // nop
}

range_bitmap_builder::range_bitmap_builder(std::optional<domain> d,
                                           size_t max_size)
  : max_size_{std::min(max_size, defaults::layout::max_bitmap_size)} {
  if (d) {
    RANGEBITS_ASSERT(d->min <= d->max);
    encoder_.emplace(*d);
  }
}

caf::error range_bitmap_builder::append(uint64_t value) {
  return append(value, 1);
}

caf::error range_bitmap_builder::append(uint64_t value, uint64_t n) {
  if (auto err = check_open())
    return err;
  if (n == 0)
    return caf::none;
  if (n > std::numeric_limits<uint64_t>::max() - rows_)
    return caf::make_error(ec::invalid_argument,
                           fmt::format("appending {} rows overflows the row "
                                       "count",
                                       n));
  if (encoder_) {
    if (auto encoded = encoder_->encode(value); !encoded)
      return std::move(encoded.error());
    // Rows for the open slice count against the capacity again, so that
    // encoding cannot fail halfway through.
    if (auto err = check_capacity(slices_for(rows_ + n) - slices_.size()))
      return err;
    return encode(value, n);
  }
  if (pending_.empty()) {
    observed_min_ = value;
    observed_max_ = value;
  } else {
    observed_min_ = std::min(observed_min_, value);
    observed_max_ = std::max(observed_max_, value);
  }
  if (!pending_.empty() && pending_.back().first == value)
    pending_.back().second += n;
  else
    pending_.emplace_back(value, n);
  rows_ += n;
  return caf::none;
}

caf::error range_bitmap_builder::append_at(id row, uint64_t value) {
  if (auto err = check_open())
    return err;
  if (row != rows_)
    return caf::make_error(ec::out_of_order,
                           fmt::format("expected row {}, got row {}", rows_,
                                       row));
  return append(value);
}

uint64_t range_bitmap_builder::size() const noexcept {
  return rows_;
}

bool range_bitmap_builder::sealed() const noexcept {
  return sealed_;
}

caf::expected<range_bitmap> range_bitmap_builder::seal() {
  if (auto err = check_open())
    return err;
  if (!encoder_) {
    // Replay the buffered values now that the domain is known.
    encoder_.emplace(domain{observed_min_, observed_max_});
    rows_ = 0;
    for (const auto& [value, n] : pending_) {
      if (auto err = encode(value, n)) {
        sealed_ = true;
        pending_ = {};
        return err;
      }
    }
    pending_ = {};
  }
  if (current_)
    flush();
  sealed_ = true;
  const auto& bounds = encoder_->bounds();
  const auto slices_offset = builder_.CreateVector(slices_);
  const auto bitmap_offset = fbs::CreateRangeBitmap(
    builder_, rows_, bounds.min, bounds.max,
    static_cast<uint8_t>(encoder_->bit_width()), slices_offset);
  auto table = flatbuffer<fbs::RangeBitmap>{builder_, bitmap_offset,
                                            fbs::RangeBitmapIdentifier()};
  RANGEBITS_VERBOSE("sealed range bitmap with {} rows in {} slices over [{}, "
                    "{}] using {} planes ({} bytes)",
                    rows_, slices_.size(), bounds.min, bounds.max,
                    encoder_->bit_width(), table.chunk()->size());
  slices_ = {};
  return range_bitmap{std::move(table)};
}

caf::error range_bitmap_builder::check_open() const {
  if (sealed_)
    return caf::make_error(ec::logic_error,
                           "range bitmap builder is already sealed");
  return caf::none;
}

caf::error range_bitmap_builder::check_capacity(uint64_t slices) const {
  RANGEBITS_ASSERT(encoder_);
  const auto used = size_t{builder_.GetSize()} + footer_size;
  const auto per_slice = max_slice_size(encoder_->bit_width());
  if (used > max_size_ || slices > (max_size_ - used) / per_slice)
    return caf::make_error(ec::invalid_argument,
                           fmt::format("{} more slices of {} planes may "
                                       "exceed the maximum size of {} bytes "
                                       "at row {}",
                                       slices, encoder_->bit_width(),
                                       max_size_, rows_));
  return caf::none;
}

caf::error range_bitmap_builder::encode(uint64_t value, uint64_t n) {
  auto encoded = encoder_->encode(value);
  RANGEBITS_ASSERT(encoded, "value was validated against the domain");
  while (n > 0) {
    if (!current_) {
      if (auto err = check_capacity(1))
        return err;
      const auto band
        = static_cast<uint32_t>(rows_ / defaults::layout::band_size);
      current_.emplace(band, encoder_->bit_width());
    }
    const auto room = defaults::layout::band_size - current_->rows();
    const auto k = static_cast<uint32_t>(std::min<uint64_t>(n, room));
    current_->append(*encoded, k);
    rows_ += k;
    n -= k;
    if (current_->full())
      flush();
  }
  return caf::none;
}

void range_bitmap_builder::flush() {
  RANGEBITS_ASSERT(current_);
  slices_.push_back(current_->finish(builder_));
  current_.reset();
}

} // namespace rangebits
