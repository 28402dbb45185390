// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/evaluator.hpp"
#include "rangebits/flatbuffer.hpp"
#include "rangebits/operator.hpp"
#include "rangebits/range_encoder.hpp"
#include "rangebits/row_set.hpp"
#include "rangebits/slice.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>

namespace rangebits {

/// An immutable, bit-sliced index over a column of unsigned integers that
/// answers equality and range predicates. The bitmap lives in a single
/// FlatBuffers chunk, which may be memory-mapped; queries read only the
/// containers they touch and are safe to run concurrently.
class range_bitmap {
public:
  friend class range_bitmap_builder;

  // -- construction ---------------------------------------------------------

  /// Constructs an empty handle. All queries fail with `ec::logic_error`.
  range_bitmap() noexcept = default;

  /// Opens a bitmap in place without copying it.
  /// @returns the bitmap, or `ec::corrupt_layout` if the chunk does not hold
  /// a consistent bitmap.
  static caf::expected<range_bitmap> make(chunk_ptr chunk);

  /// Memory-maps a bitmap from a file.
  static caf::expected<range_bitmap> load(const std::filesystem::path& path);

  // -- metadata -------------------------------------------------------------

  [[nodiscard]] uint64_t rows() const noexcept;

  [[nodiscard]] uint64_t min() const noexcept;

  [[nodiscard]] uint64_t max() const noexcept;

  [[nodiscard]] size_t bit_width() const noexcept;

  [[nodiscard]] size_t slice_count() const noexcept;

  /// @pre `i < slice_count()`
  [[nodiscard]] slice_view slice(size_t i) const noexcept;

  [[nodiscard]] range_encoder encoder() const noexcept;

  /// @returns the bytes the bitmap occupies.
  [[nodiscard]] size_t memusage() const noexcept;

  /// @returns the chunk holding the bitmap, or `nullptr` for an empty handle.
  [[nodiscard]] chunk_ptr chunk() const noexcept;

  explicit operator bool() const noexcept;

  // -- queries --------------------------------------------------------------

  /// Selects the rows whose value satisfies `value op x`.
  [[nodiscard]] caf::expected<row_set>
  lookup(relational_operator op, uint64_t x,
         const query_options& options = {}) const;

  /// Counts the rows whose value satisfies `value op x`.
  [[nodiscard]] caf::expected<uint64_t>
  count(relational_operator op, uint64_t x,
        const query_options& options = {}) const;

  /// Selects the rows whose value lies in `[lo, hi]`.
  [[nodiscard]] caf::expected<row_set>
  between(uint64_t lo, uint64_t hi, const query_options& options = {}) const;

  /// Counts the rows whose value lies in `[lo, hi]`.
  [[nodiscard]] caf::expected<uint64_t>
  between_cardinality(uint64_t lo, uint64_t hi,
                      const query_options& options = {}) const;

  [[nodiscard]] caf::expected<row_set> eq(uint64_t x) const;
  [[nodiscard]] caf::expected<row_set> neq(uint64_t x) const;
  [[nodiscard]] caf::expected<row_set> lt(uint64_t x) const;
  [[nodiscard]] caf::expected<row_set> lte(uint64_t x) const;
  [[nodiscard]] caf::expected<row_set> gt(uint64_t x) const;
  [[nodiscard]] caf::expected<row_set> gte(uint64_t x) const;

  [[nodiscard]] caf::expected<row_set>
  eq(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<row_set>
  neq(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<row_set>
  lt(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<row_set>
  lte(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<row_set>
  gt(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<row_set>
  gte(uint64_t x, const row_set& context) const;

  [[nodiscard]] caf::expected<uint64_t> eq_cardinality(uint64_t x) const;
  [[nodiscard]] caf::expected<uint64_t> neq_cardinality(uint64_t x) const;
  [[nodiscard]] caf::expected<uint64_t> lt_cardinality(uint64_t x) const;
  [[nodiscard]] caf::expected<uint64_t> lte_cardinality(uint64_t x) const;
  [[nodiscard]] caf::expected<uint64_t> gt_cardinality(uint64_t x) const;
  [[nodiscard]] caf::expected<uint64_t> gte_cardinality(uint64_t x) const;

  [[nodiscard]] caf::expected<uint64_t>
  eq_cardinality(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<uint64_t>
  neq_cardinality(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<uint64_t>
  lt_cardinality(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<uint64_t>
  lte_cardinality(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<uint64_t>
  gt_cardinality(uint64_t x, const row_set& context) const;
  [[nodiscard]] caf::expected<uint64_t>
  gte_cardinality(uint64_t x, const row_set& context) const;

  // -- concepts -------------------------------------------------------------

  friend caf::error
  save(const std::filesystem::path& path, const range_bitmap& bitmap);

private:
  explicit range_bitmap(flatbuffer<fbs::RangeBitmap> table) noexcept;

  /// Anchors *x* and reduces the comparison to a kernel predicate.
  [[nodiscard]] caf::expected<predicate>
  make_predicate(relational_operator op, uint64_t x) const;

  flatbuffer<fbs::RangeBitmap> table_ = {};
};

} // namespace rangebits
