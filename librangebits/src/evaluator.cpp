// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/evaluator.hpp"

#include "rangebits/container.hpp"
#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"
#include "rangebits/fbs/range_bitmap_generated.h"
#include "rangebits/logger.hpp"
#include "rangebits/row_set.hpp"
#include "rangebits/slice.hpp"

#include <algorithm>
#include <thread>
#include <vector>

namespace rangebits {

evaluation_statistics&
evaluation_statistics::operator+=(const evaluation_statistics& other) noexcept {
  slices_evaluated += other.slices_evaluated;
  slices_skipped += other.slices_skipped;
  container_reads += other.container_reads;
  return *this;
}

predicate predicate::make(relational_operator op, uint64_t x) noexcept {
  switch (op) {
    case relational_operator::equal:
      return {kind::equal, x, x};
    case relational_operator::not_equal:
      return {kind::not_equal, x, x};
    case relational_operator::less_equal:
      return {kind::at_most, 0, x};
    case relational_operator::less:
      if (x == 0)
        return {kind::none};
      return {kind::at_most, 0, x - 1};
    case relational_operator::greater:
      return {kind::above, x, 0};
    case relational_operator::greater_equal:
      if (x == 0)
        return {kind::all};
      return {kind::above, x - 1, 0};
  }
  RANGEBITS_PANIC("unreachable relational operator");
}

predicate predicate::make_between(uint64_t lo, uint64_t hi) noexcept {
  if (lo > hi)
    return {kind::none};
  if (lo == 0)
    return {kind::at_most, 0, hi};
  return {kind::range, lo, hi};
}

namespace {

bool is_empty(const band_bits& bits) noexcept {
  return std::all_of(bits.begin(), bits.end(), [](uint64_t w) {
    return w == 0;
  });
}

/// Sets the first *rows* bits.
void fill_rows(band_bits& bits, uint32_t rows) noexcept {
  const auto full = rows / band_word::width;
  for (size_t i = 0; i < words_per_band; ++i)
    bits[i] = i < full ? band_word::all : band_word::none;
  if (full < words_per_band)
    bits[full] = band_word::lsb_mask(rows % band_word::width);
}

uint32_t popcount(const band_bits& bits) noexcept {
  uint32_t result = 0;
  for (auto w : bits)
    result += band_word::popcount(w);
  return result;
}

/// Combines the planes of one slice. All kernels leave their result in *out*
/// and restrict it to the rows in *all*.
class slice_kernel {
public:
  slice_kernel(const slice_view& slice, size_t bit_width,
               evaluation_statistics& stats) noexcept
    : slice_{slice}, bit_width_{bit_width}, stats_{stats} {
    // nop
  }

  void evaluate(const predicate& pred, const band_bits& all, band_bits& out) {
    switch (pred.op) {
      case predicate::kind::none:
        out.fill(0);
        return;
      case predicate::kind::all:
        out = all;
        return;
      case predicate::kind::equal:
        equal(pred.lo, all, out);
        return;
      case predicate::kind::not_equal:
        equal(pred.lo, all, out);
        complement(all, out);
        return;
      case predicate::kind::at_most:
        at_most(pred.hi, all, out);
        return;
      case predicate::kind::above:
        at_most(pred.lo, all, out);
        complement(all, out);
        return;
      case predicate::kind::range: {
        RANGEBITS_ASSERT(pred.lo > 0);
        at_most(pred.hi, all, out);
        if (is_empty(out))
          return;
        auto below = band_bits{};
        at_most(pred.lo - 1, all, below);
        for (size_t i = 0; i < words_per_band; ++i)
          out[i] &= ~below[i];
        return;
      }
    }
  }

private:
  std::optional<container_view> read(size_t i) {
    auto result = slice_.plane(i);
    if (result)
      ++stats_.container_reads;
    return result;
  }

  /// Computes `out = all & ~out`.
  static void complement(const band_bits& all, band_bits& out) noexcept {
    for (size_t i = 0; i < words_per_band; ++i)
      out[i] = all[i] & ~out[i];
  }

  /// Keeps the rows whose anchored value equals *x*: a 1-bit removes the
  /// rows of the plane, a 0-bit keeps only them.
  void equal(uint64_t x, const band_bits& all, band_bits& out) {
    // A 0-bit with an empty plane rules out every row without any read.
    for (size_t i = 0; i < bit_width_; ++i) {
      if (!band_word::test(x, i) && !slice_.has_plane(i)) {
        out.fill(0);
        return;
      }
    }
    out = all;
    for (size_t i = 0; i < bit_width_; ++i) {
      if (is_empty(out))
        return;
      if (band_word::test(x, i)) {
        if (auto plane = read(i))
          and_not_into(*plane, out);
      } else {
        and_into(*read(i), out);
      }
    }
  }

  /// Keeps the rows whose anchored value is at most *x*, walking the planes
  /// from least to most significant bit.
  void at_most(uint64_t x, const band_bits& all, band_bits& out) {
    if (bit_width_ == 0) {
      out = all;
      return;
    }
    if (band_word::test(x, 0)) {
      out = all;
    } else if (auto plane = read(0)) {
      load(*plane, out);
    } else {
      out.fill(0);
    }
    for (size_t i = 1; i < bit_width_; ++i) {
      if (band_word::test(x, i)) {
        if (auto plane = read(i))
          or_into(*plane, out);
      } else if (auto plane = read(i)) {
        and_into(*plane, out);
      } else {
        out.fill(0);
      }
    }
    for (size_t i = 0; i < words_per_band; ++i)
      out[i] &= all[i];
  }

  const slice_view& slice_;
  size_t bit_width_;
  evaluation_statistics& stats_;
};

/// Collects matching rows band by band.
struct row_sink {
  void add(uint32_t band, const band_bits& bits) {
    if (!is_empty(bits))
      result.append(band, container::make(bits));
  }

  void merge(row_sink&& other) {
    result.concat(std::move(other.result));
  }

  row_set result = {};
};

/// Counts matching rows.
struct count_sink {
  void add(uint32_t, const band_bits& bits) noexcept {
    result += popcount(bits);
  }

  void merge(count_sink&& other) noexcept {
    result += other.result;
  }

  uint64_t result = 0;
};

/// Evaluates the slices `[first, last)` into *sink*.
template <class Sink>
caf::error run(const fbs::RangeBitmap& bitmap, size_t first, size_t last,
               const predicate& pred, const query_options& options, Sink& sink,
               evaluation_statistics& stats) {
  const auto* slices = bitmap.slices();
  auto all = band_bits{};
  auto out = band_bits{};
  for (auto i = first; i < last; ++i) {
    if (options.stop.stop_requested())
      return caf::make_error(ec::cancelled,
                             fmt::format("query stopped before slice {}", i));
    const auto slice = slice_view{*slices->Get(i)};
    fill_rows(all, slice.rows());
    if (options.context) {
      const auto* rows = options.context->find(slice.band());
      if (!rows) {
        ++stats.slices_skipped;
        continue;
      }
      and_into(rows->view(), all);
      if (is_empty(all)) {
        ++stats.slices_skipped;
        continue;
      }
    }
    ++stats.slices_evaluated;
    auto kernel = slice_kernel{slice, bitmap.bit_width(), stats};
    kernel.evaluate(pred, all, out);
    sink.add(slice.band(), out);
  }
  return caf::none;
}

template <class Sink>
caf::expected<Sink> run_all(const flatbuffer<fbs::RangeBitmap>& bitmap,
                            const predicate& pred,
                            const query_options& options) {
  const auto slices
    = bitmap->slices() ? size_t{bitmap->slices()->size()} : size_t{0};
  const auto workers = std::max(
    size_t{1},
    std::min(options.parallelism,
             slices / defaults::query::min_slices_per_worker));
  auto stats = evaluation_statistics{};
  auto result = Sink{};
  if (workers == 1) {
    if (auto err = run(*bitmap, 0, slices, pred, options, result, stats))
      return err;
  } else {
    auto sinks = std::vector<Sink>(workers);
    auto worker_stats = std::vector<evaluation_statistics>(workers);
    auto errors = std::vector<caf::error>(workers);
    {
      auto threads = std::vector<std::jthread>{};
      threads.reserve(workers);
      for (size_t w = 0; w < workers; ++w) {
        const auto first = slices * w / workers;
        const auto last = slices * (w + 1) / workers;
        // Each worker keeps the mapping alive on its own.
        threads.emplace_back([&, w, first, last, bitmap = bitmap] {
          errors[w] = run(*bitmap, first, last, pred, options, sinks[w],
                          worker_stats[w]);
        });
      }
    }
    for (size_t w = 0; w < workers; ++w) {
      if (errors[w])
        return std::move(errors[w]);
      result.merge(std::move(sinks[w]));
      stats += worker_stats[w];
    }
  }
  RANGEBITS_TRACE("evaluated {} slices with {} workers, skipped {}, read {} "
                  "containers",
                  stats.slices_evaluated, workers, stats.slices_skipped,
                  stats.container_reads);
  if (options.statistics)
    *options.statistics += stats;
  return result;
}

} // namespace

caf::expected<row_set> evaluate(const flatbuffer<fbs::RangeBitmap>& bitmap,
                                const predicate& pred,
                                const query_options& options) {
  auto result = run_all<row_sink>(bitmap, pred, options);
  if (!result)
    return std::move(result.error());
  return std::move(result->result);
}

caf::expected<uint64_t>
evaluate_count(const flatbuffer<fbs::RangeBitmap>& bitmap,
               const predicate& pred, const query_options& options) {
  auto result = run_all<count_sink>(bitmap, pred, options);
  if (!result)
    return std::move(result.error());
  return result->result;
}

} // namespace rangebits
