// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/defaults.hpp"
#include "rangebits/flatbuffer.hpp"
#include "rangebits/operator.hpp"

#include <caf/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <stop_token>

namespace rangebits {

/// Counters that make the work of a query observable.
struct evaluation_statistics {
  /// Slices whose planes were combined.
  uint64_t slices_evaluated = 0;

  /// Slices passed over because the context has no rows in their band.
  uint64_t slices_skipped = 0;

  /// Plane containers touched.
  uint64_t container_reads = 0;

  evaluation_statistics& operator+=(const evaluation_statistics& other) noexcept;

  friend bool
  operator==(const evaluation_statistics&, const evaluation_statistics&)
    = default;
};

/// Tunes a single query.
struct query_options {
  /// Restricts the result to these rows. Slices without context rows are
  /// skipped entirely.
  const row_set* context = nullptr;

  /// The number of threads that evaluate disjoint slice ranges.
  size_t parallelism = defaults::query::parallelism;

  /// Aborts the query with `ec::cancelled` when a stop is requested.
  std::stop_token stop = {};

  /// Receives the counters of the query, if set.
  evaluation_statistics* statistics = nullptr;
};

/// A comparison against an anchored query value, reduced to the shapes the
/// slice kernels evaluate.
struct predicate {
  enum class kind : uint8_t {
    none,      ///< No row matches.
    all,       ///< Every row matches.
    equal,     ///< `a == lo`
    not_equal, ///< `a != lo`
    at_most,   ///< `a <= hi`
    above,     ///< `a > lo`
    range,     ///< `lo <= a <= hi`
  };

  kind op = kind::none;
  uint64_t lo = 0;
  uint64_t hi = 0;

  /// Normalizes a relational comparison against the anchored value *x*.
  static predicate make(relational_operator op, uint64_t x) noexcept;

  /// Normalizes the closed interval `[lo, hi]` of anchored values.
  static predicate make_between(uint64_t lo, uint64_t hi) noexcept;

  friend bool operator==(const predicate&, const predicate&) = default;
};

/// Evaluates a predicate over all slices of a bitmap.
/// @returns the matching rows, or `ec::cancelled`.
caf::expected<row_set> evaluate(const flatbuffer<fbs::RangeBitmap>& bitmap,
                                const predicate& pred,
                                const query_options& options);

/// Counts the rows matching a predicate without materializing them.
/// @returns the number of matching rows, or `ec::cancelled`.
caf::expected<uint64_t>
evaluate_count(const flatbuffer<fbs::RangeBitmap>& bitmap,
               const predicate& pred, const query_options& options);

} // namespace rangebits
