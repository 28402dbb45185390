// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/defaults.hpp"
#include "rangebits/range_bitmap.hpp"
#include "rangebits/range_encoder.hpp"
#include "rangebits/slice.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <flatbuffers/flatbuffers.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace rangebits {

/// Builds a range bitmap from values that arrive in row order.
///
/// A builder either observes its domain, buffering all values until `seal()`
/// fixes minimum, maximum and bit width, or works with a domain declared up
/// front, in which case it encodes every value immediately and serializes
/// each slice as soon as it is full.
class range_bitmap_builder {
public:
  /// Constructs a builder that derives the domain from the appended values.
  range_bitmap_builder();

  /// Constructs a builder for values in *d*.
  /// @pre `d.min <= d.max`
  explicit range_bitmap_builder(domain d);

  /// Constructs a builder whose serialized bitmap may not exceed *max_size*
  /// bytes. Without a domain, the builder observes it.
  /// @pre `!d || d->min <= d->max`
  range_bitmap_builder(std::optional<domain> d, size_t max_size);

  range_bitmap_builder(const range_bitmap_builder&) = delete;
  range_bitmap_builder& operator=(const range_bitmap_builder&) = delete;
  range_bitmap_builder(range_bitmap_builder&&) noexcept = default;
  range_bitmap_builder& operator=(range_bitmap_builder&&) noexcept = default;
  ~range_bitmap_builder() noexcept = default;

  /// Appends one row.
  /// @returns `ec::encoding_overflow` if *value* lies outside the declared
  /// domain, and `ec::invalid_argument` if the rows could grow the bitmap
  /// past its maximum size. In both cases no row is recorded.
  caf::error append(uint64_t value);

  /// Appends *n* rows with the same value.
  caf::error append(uint64_t value, uint64_t n);

  /// Appends one row with an explicit row id.
  /// @returns `ec::out_of_order` unless `row == size()`.
  caf::error append_at(id row, uint64_t value);

  /// @returns the number of appended rows.
  [[nodiscard]] uint64_t size() const noexcept;

  [[nodiscard]] bool sealed() const noexcept;

  /// Finishes the bitmap. The builder rejects all further calls, even when
  /// sealing fails.
  /// @returns `ec::invalid_argument` if the bitmap exceeds its maximum size.
  caf::expected<range_bitmap> seal();

private:
  caf::error check_open() const;

  /// Fails unless *slices* more slices of the current bit width fit.
  caf::error check_capacity(uint64_t slices) const;

  /// Encodes and slices *n* rows of an already validated value.
  caf::error encode(uint64_t value, uint64_t n);

  /// Serializes the current slice.
  void flush();

  std::optional<range_encoder> encoder_ = {};
  std::vector<std::pair<uint64_t, uint64_t>> pending_ = {};
  uint64_t observed_min_ = 0;
  uint64_t observed_max_ = 0;
  flatbuffers::FlatBufferBuilder builder_ = {};
  std::vector<flatbuffers::Offset<fbs::Slice>> slices_ = {};
  std::optional<slice_builder> current_ = {};
  uint64_t rows_ = 0;
  size_t max_size_ = defaults::layout::max_bitmap_size;
  bool sealed_ = false;
};

} // namespace rangebits
