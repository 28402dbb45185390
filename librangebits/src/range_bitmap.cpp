// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/range_bitmap.hpp"

#include "rangebits/chunk.hpp"
#include "rangebits/error.hpp"
#include "rangebits/fbs/range_bitmap_generated.h"
#include "rangebits/logger.hpp"

#include <fmt/format.h>

namespace rangebits {

namespace {

constexpr auto band_size = uint64_t{defaults::layout::band_size};

/// Checks the directory of a verified buffer against the invariants that the
/// evaluator relies on.
caf::error validate_directory(const fbs::RangeBitmap& bitmap) {
  if (bitmap.min() > bitmap.max())
    return caf::make_error(ec::corrupt_layout,
                           fmt::format("minimum {} exceeds maximum {}",
                                       bitmap.min(), bitmap.max()));
  const auto width = range_encoder::bit_width(bitmap.max() - bitmap.min());
  if (bitmap.bit_width() != width)
    return caf::make_error(ec::corrupt_layout,
                           fmt::format("bit width {} does not match the "
                                       "domain [{}, {}]",
                                       bitmap.bit_width(), bitmap.min(),
                                       bitmap.max()));
  const auto expected_slices = (bitmap.rows() + band_size - 1) / band_size;
  const auto slices
    = bitmap.slices() ? uint64_t{bitmap.slices()->size()} : uint64_t{0};
  if (slices != expected_slices)
    return caf::make_error(ec::corrupt_layout,
                           fmt::format("{} rows require {} slices, found {}",
                                       bitmap.rows(), expected_slices, slices));
  for (uint64_t i = 0; i < slices; ++i) {
    const auto* slice = bitmap.slices()->Get(i);
    if (!slice)
      return caf::make_error(ec::corrupt_layout,
                             fmt::format("slice {} is null", i));
    const auto rows
      = i + 1 < slices ? band_size : bitmap.rows() - i * band_size;
    if (auto err = rangebits::validate(*slice, static_cast<uint32_t>(i),
                                       static_cast<uint32_t>(rows), width))
      return err;
  }
  return caf::none;
}

} // namespace

// -- construction -------------------------------------------------------------

caf::expected<range_bitmap> range_bitmap::make(chunk_ptr chunk) {
  if (!chunk)
    return caf::make_error(ec::invalid_argument,
                           "cannot open a range bitmap from a nullptr");
  auto table = flatbuffer<fbs::RangeBitmap>::make(
    std::move(chunk), fbs::RangeBitmapIdentifier());
  if (!table)
    return caf::make_error(ec::corrupt_layout, render(table.error()));
  if (auto err = validate_directory(**table))
    return err;
  return range_bitmap{std::move(*table)};
}

caf::expected<range_bitmap>
range_bitmap::load(const std::filesystem::path& path) {
  auto mapped = rangebits::chunk::mmap(path);
  if (!mapped)
    return std::move(mapped.error());
  auto result = make(std::move(*mapped));
  if (!result) {
    RANGEBITS_WARN("failed to load range bitmap from {}: {}", path.string(),
                   render(result.error()));
    return result;
  }
  RANGEBITS_VERBOSE("loaded range bitmap with {} rows and {} slices from {}",
                    result->rows(), result->slice_count(), path.string());
  return result;
}

range_bitmap::range_bitmap(flatbuffer<fbs::RangeBitmap> table) noexcept
  : table_{std::move(table)} {
  // nop
}

// -- metadata -----------------------------------------------------------------

uint64_t range_bitmap::rows() const noexcept {
  return table_ ? table_->rows() : 0;
}

uint64_t range_bitmap::min() const noexcept {
  return table_ ? table_->min() : 0;
}

uint64_t range_bitmap::max() const noexcept {
  return table_ ? table_->max() : 0;
}

size_t range_bitmap::bit_width() const noexcept {
  return table_ ? table_->bit_width() : 0;
}

size_t range_bitmap::slice_count() const noexcept {
  return table_ && table_->slices() ? table_->slices()->size() : 0;
}

slice_view range_bitmap::slice(size_t i) const noexcept {
  RANGEBITS_ASSERT(i < slice_count());
  return slice_view{*table_->slices()->Get(i)};
}

range_encoder range_bitmap::encoder() const noexcept {
  return range_encoder{domain{min(), max()}, bit_width()};
}

size_t range_bitmap::memusage() const noexcept {
  return sizeof(*this) + (table_ ? table_.chunk()->size() : 0);
}

chunk_ptr range_bitmap::chunk() const noexcept {
  return table_ ? table_.chunk() : nullptr;
}

range_bitmap::operator bool() const noexcept {
  return static_cast<bool>(table_);
}

// -- queries ------------------------------------------------------------------

caf::expected<predicate>
range_bitmap::make_predicate(relational_operator op, uint64_t x) const {
  if (!table_)
    return caf::make_error(ec::logic_error, "query on an empty range bitmap");
  auto anchored = encoder().anchor(x);
  if (!anchored)
    return std::move(anchored.error());
  return predicate::make(op, *anchored);
}

caf::expected<row_set>
range_bitmap::lookup(relational_operator op, uint64_t x,
                     const query_options& options) const {
  auto pred = make_predicate(op, x);
  if (!pred)
    return std::move(pred.error());
  return evaluate(table_, *pred, options);
}

caf::expected<uint64_t>
range_bitmap::count(relational_operator op, uint64_t x,
                    const query_options& options) const {
  auto pred = make_predicate(op, x);
  if (!pred)
    return std::move(pred.error());
  return evaluate_count(table_, *pred, options);
}

caf::expected<row_set>
range_bitmap::between(uint64_t lo, uint64_t hi,
                      const query_options& options) const {
  auto lower = make_predicate(relational_operator::greater_equal, lo);
  if (!lower)
    return std::move(lower.error());
  auto upper = make_predicate(relational_operator::less_equal, hi);
  if (!upper)
    return std::move(upper.error());
  return evaluate(table_, predicate::make_between(lo - min(), hi - min()),
                  options);
}

caf::expected<uint64_t>
range_bitmap::between_cardinality(uint64_t lo, uint64_t hi,
                                  const query_options& options) const {
  auto lower = make_predicate(relational_operator::greater_equal, lo);
  if (!lower)
    return std::move(lower.error());
  auto upper = make_predicate(relational_operator::less_equal, hi);
  if (!upper)
    return std::move(upper.error());
  return evaluate_count(table_,
                        predicate::make_between(lo - min(), hi - min()),
                        options);
}

caf::expected<row_set> range_bitmap::eq(uint64_t x) const {
  return lookup(relational_operator::equal, x);
}

caf::expected<row_set> range_bitmap::neq(uint64_t x) const {
  return lookup(relational_operator::not_equal, x);
}

caf::expected<row_set> range_bitmap::lt(uint64_t x) const {
  return lookup(relational_operator::less, x);
}

caf::expected<row_set> range_bitmap::lte(uint64_t x) const {
  return lookup(relational_operator::less_equal, x);
}

caf::expected<row_set> range_bitmap::gt(uint64_t x) const {
  return lookup(relational_operator::greater, x);
}

caf::expected<row_set> range_bitmap::gte(uint64_t x) const {
  return lookup(relational_operator::greater_equal, x);
}

caf::expected<row_set>
range_bitmap::eq(uint64_t x, const row_set& context) const {
  return lookup(relational_operator::equal, x, {.context = &context});
}

caf::expected<row_set>
range_bitmap::neq(uint64_t x, const row_set& context) const {
  return lookup(relational_operator::not_equal, x, {.context = &context});
}

caf::expected<row_set>
range_bitmap::lt(uint64_t x, const row_set& context) const {
  return lookup(relational_operator::less, x, {.context = &context});
}

caf::expected<row_set>
range_bitmap::lte(uint64_t x, const row_set& context) const {
  return lookup(relational_operator::less_equal, x, {.context = &context});
}

caf::expected<row_set>
range_bitmap::gt(uint64_t x, const row_set& context) const {
  return lookup(relational_operator::greater, x, {.context = &context});
}

caf::expected<row_set>
range_bitmap::gte(uint64_t x, const row_set& context) const {
  return lookup(relational_operator::greater_equal, x, {.context = &context});
}

caf::expected<uint64_t> range_bitmap::eq_cardinality(uint64_t x) const {
  return count(relational_operator::equal, x);
}

caf::expected<uint64_t> range_bitmap::neq_cardinality(uint64_t x) const {
  return count(relational_operator::not_equal, x);
}

caf::expected<uint64_t> range_bitmap::lt_cardinality(uint64_t x) const {
  return count(relational_operator::less, x);
}

caf::expected<uint64_t> range_bitmap::lte_cardinality(uint64_t x) const {
  return count(relational_operator::less_equal, x);
}

caf::expected<uint64_t> range_bitmap::gt_cardinality(uint64_t x) const {
  return count(relational_operator::greater, x);
}

caf::expected<uint64_t> range_bitmap::gte_cardinality(uint64_t x) const {
  return count(relational_operator::greater_equal, x);
}

caf::expected<uint64_t>
range_bitmap::eq_cardinality(uint64_t x, const row_set& context) const {
  return count(relational_operator::equal, x, {.context = &context});
}

caf::expected<uint64_t>
range_bitmap::neq_cardinality(uint64_t x, const row_set& context) const {
  return count(relational_operator::not_equal, x, {.context = &context});
}

caf::expected<uint64_t>
range_bitmap::lt_cardinality(uint64_t x, const row_set& context) const {
  return count(relational_operator::less, x, {.context = &context});
}

caf::expected<uint64_t>
range_bitmap::lte_cardinality(uint64_t x, const row_set& context) const {
  return count(relational_operator::less_equal, x, {.context = &context});
}

caf::expected<uint64_t>
range_bitmap::gt_cardinality(uint64_t x, const row_set& context) const {
  return count(relational_operator::greater, x, {.context = &context});
}

caf::expected<uint64_t>
range_bitmap::gte_cardinality(uint64_t x, const row_set& context) const {
  return count(relational_operator::greater_equal, x, {.context = &context});
}

// -- concepts -----------------------------------------------------------------

caf::error save(const std::filesystem::path& path, const range_bitmap& bitmap) {
  if (!bitmap)
    return caf::make_error(ec::logic_error,
                           "cannot save an empty range bitmap");
  if (auto err = write(path, bitmap.table_.chunk()))
    return err;
  RANGEBITS_VERBOSE("saved range bitmap with {} rows to {}", bitmap.rows(),
                    path.string());
  return caf::none;
}

} // namespace rangebits
