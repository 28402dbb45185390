// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/container.hpp"

#include <caf/error.hpp>
#include <flatbuffers/flatbuffers.h>

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace rangebits {

/// Accumulates the bit-planes of one band while rows arrive.
class slice_builder {
public:
  /// @pre `bit_width <= 64`
  slice_builder(uint32_t band, size_t bit_width);

  /// Appends *n* rows that carry the same encoded value.
  /// @pre `rows() + n <= band_size`
  void append(uint64_t encoded, uint32_t n = 1);

  [[nodiscard]] uint32_t band() const noexcept;

  [[nodiscard]] uint32_t rows() const noexcept;

  /// @returns whether the band holds `band_size` rows.
  [[nodiscard]] bool full() const noexcept;

  /// @returns the presence mask of the non-empty planes.
  [[nodiscard]] uint64_t mask() const noexcept;

  /// Optimizes all planes and serializes the slice.
  flatbuffers::Offset<fbs::Slice> finish(flatbuffers::FlatBufferBuilder& builder);

private:
  uint32_t band_;
  uint32_t rows_ = 0;
  std::vector<container> planes_;
};

/// A read-only view of a persisted slice. Planes are mapped lazily.
class slice_view {
public:
  explicit slice_view(const fbs::Slice& slice) noexcept;

  [[nodiscard]] uint32_t band() const noexcept;

  [[nodiscard]] uint32_t rows() const noexcept;

  [[nodiscard]] uint64_t mask() const noexcept;

  /// @returns the number of stored planes.
  [[nodiscard]] size_t plane_count() const noexcept;

  [[nodiscard]] bool has_plane(size_t i) const noexcept;

  /// Maps plane *i*.
  /// @returns `std::nullopt` if the plane is empty in this band.
  [[nodiscard]] std::optional<container_view> plane(size_t i) const noexcept;

private:
  const fbs::Slice* slice_;
};

/// Checks the directory of a persisted slice against its position in the
/// bitmap.
/// @relates slice_view
caf::error validate(const fbs::Slice& slice, uint32_t band, uint32_t rows,
                    size_t bit_width);

} // namespace rangebits
