// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#define SUITE range_bitmap

#include "rangebits/range_bitmap.hpp"

#include "rangebits/error.hpp"
#include "rangebits/range_bitmap_builder.hpp"
#include "rangebits/test/test.hpp"

#include <algorithm>
#include <functional>
#include <limits>
#include <optional>
#include <random>
#include <stop_token>
#include <thread>
#include <utility>
#include <vector>

using namespace rangebits;

namespace {

constexpr auto band = id{defaults::layout::band_size};

constexpr relational_operator all_operators[] = {
  relational_operator::less,          relational_operator::less_equal,
  relational_operator::greater,       relational_operator::greater_equal,
  relational_operator::equal,         relational_operator::not_equal,
};

bool satisfies(uint64_t value, relational_operator op, uint64_t x) {
  switch (op) {
    case relational_operator::less:
      return value < x;
    case relational_operator::less_equal:
      return value <= x;
    case relational_operator::greater:
      return value > x;
    case relational_operator::greater_equal:
      return value >= x;
    case relational_operator::equal:
      return value == x;
    case relational_operator::not_equal:
      return value != x;
  }
  return false;
}

/// Computes the expected result of a query by scanning all values.
row_set scan(const std::vector<uint64_t>& values,
             const std::function<bool(uint64_t)>& pred) {
  auto result = row_set{};
  for (size_t i = 0; i < values.size(); ++i)
    if (pred(values[i]))
      result.add(i);
  return result;
}

range_bitmap make_bitmap(const std::vector<uint64_t>& values) {
  auto builder = range_bitmap_builder{};
  for (auto value : values)
    REQUIRE_SUCCESS(builder.append(value));
  return unbox(builder.seal());
}

std::vector<uint64_t> random_values(size_t n, uint64_t min, uint64_t max) {
  auto engine = std::mt19937_64{42};
  auto dist = std::uniform_int_distribution<uint64_t>{min, max};
  auto result = std::vector<uint64_t>(n);
  for (auto& x : result)
    x = dist(engine);
  return result;
}

} // namespace

TEST(basic queries) {
  auto bm = make_bitmap({5, 1, 9, 3, 7});
  CHECK_EQUAL(bm.rows(), 5u);
  CHECK_EQUAL(bm.min(), 1u);
  CHECK_EQUAL(bm.max(), 9u);
  CHECK_EQUAL(bm.bit_width(), 4u);
  CHECK_EQUAL(bm.slice_count(), 1u);
  CHECK_EQUAL(unbox(bm.eq(3)), (row_set{3}));
  CHECK_EQUAL(unbox(bm.neq(3)), (row_set{0, 1, 2, 4}));
  CHECK_EQUAL(unbox(bm.lte(5)), (row_set{0, 1, 3}));
  CHECK_EQUAL(unbox(bm.lt(5)), (row_set{1, 3}));
  CHECK_EQUAL(unbox(bm.gte(7)), (row_set{2, 4}));
  CHECK_EQUAL(unbox(bm.gt(7)), (row_set{2}));
  CHECK_EQUAL(unbox(bm.eq_cardinality(3)), 1u);
  CHECK_EQUAL(unbox(bm.lte_cardinality(5)), 3u);
  CHECK_EQUAL(unbox(bm.gt_cardinality(1)), 4u);
  MESSAGE("values between the stored ones");
  CHECK(unbox(bm.eq(4)).empty());
  CHECK_EQUAL(unbox(bm.lt(4)), (row_set{1, 3}));
  MESSAGE("the domain boundaries");
  CHECK_EQUAL(unbox(bm.lt(1)), row_set{});
  CHECK_EQUAL(unbox(bm.gte(1)), (row_set{0, 1, 2, 3, 4}));
  CHECK_EQUAL(unbox(bm.lte(9)), (row_set{0, 1, 2, 3, 4}));
  CHECK_EQUAL(unbox(bm.gt(9)), row_set{});
}

TEST(query values outside the domain) {
  auto bm = make_bitmap({5, 1, 9, 3, 7});
  auto below = bm.eq(0);
  REQUIRE(!below);
  CHECK_EQUAL(below.error(), ec::out_of_domain);
  MESSAGE("anchored values up to 2^width - 1 remain queryable");
  CHECK(unbox(bm.eq(16)).empty());
  CHECK_EQUAL(unbox(bm.lt(16)).cardinality(), 5u);
  auto above = bm.gte_cardinality(17);
  REQUIRE(!above);
  CHECK_EQUAL(above.error(), ec::out_of_domain);
}

TEST(queries match a full scan) {
  const auto values = random_values(2 * band + 8'464, 1'000, 1'999);
  auto bm = make_bitmap(values);
  REQUIRE_EQUAL(bm.rows(), values.size());
  CHECK_EQUAL(bm.slice_count(), 3u);
  CHECK_EQUAL(bm.bit_width(), 10u);
  for (auto x : {1'000u, 1'001u, 1'337u, 1'500u, 1'998u, 1'999u}) {
    for (auto op : all_operators) {
      MESSAGE("checking value " << to_string(op) << ' ' << x);
      const auto expected = scan(values, [&](uint64_t value) {
        return satisfies(value, op, x);
      });
      CHECK_EQUAL(unbox(bm.lookup(op, x)), expected);
      CHECK_EQUAL(unbox(bm.count(op, x)), expected.cardinality());
    }
  }
}

TEST(complement laws) {
  const auto values = random_values(band + 100, 0, 255);
  auto bm = make_bitmap(values);
  for (uint64_t x = 0; x < 256; x += 17) {
    CHECK_EQUAL(unbox(bm.eq_cardinality(x)) + unbox(bm.neq_cardinality(x)),
                bm.rows());
    CHECK_EQUAL(unbox(bm.lt_cardinality(x)) + unbox(bm.gte_cardinality(x)),
                bm.rows());
    CHECK_EQUAL(unbox(bm.lte_cardinality(x)) + unbox(bm.gt_cardinality(x)),
                bm.rows());
    CHECK_EQUAL(unbox(bm.lte(x)), unbox(bm.lt(x)) | unbox(bm.eq(x)));
    CHECK_EQUAL(unbox(bm.neq(x)), flip(unbox(bm.eq(x)), bm.rows()));
  }
}

TEST(monotonicity) {
  const auto values = random_values(10'000, 50, 305);
  auto bm = make_bitmap(values);
  auto previous = uint64_t{0};
  for (uint64_t x = 50; x <= 305; ++x) {
    const auto n = unbox(bm.lte_cardinality(x));
    CHECK_GREATER_EQUAL(n, previous);
    previous = n;
  }
  CHECK_EQUAL(previous, bm.rows());
}

TEST(between) {
  const auto values = random_values(band + 5'000, 10, 73);
  auto bm = make_bitmap(values);
  const auto intervals = std::vector<std::pair<uint64_t, uint64_t>>{
    {10, 73}, {10, 10}, {11, 40}, {40, 40}, {41, 73}, {73, 73},
  };
  for (const auto& interval : intervals) {
    const auto lo = interval.first;
    const auto hi = interval.second;
    const auto expected = scan(values, [&](uint64_t value) {
      return lo <= value && value <= hi;
    });
    CHECK_EQUAL(unbox(bm.between(lo, hi)), expected);
    CHECK_EQUAL(unbox(bm.between_cardinality(lo, hi)), expected.cardinality());
  }
  MESSAGE("an inverted interval is empty");
  CHECK(unbox(bm.between(50, 20)).empty());
  MESSAGE("bounds outside the domain fail");
  CHECK_EQUAL(bm.between(5, 20).error(), ec::out_of_domain);
}

TEST(context pushdown) {
  const auto values = random_values(2 * band + 1'000, 0, 999);
  auto bm = make_bitmap(values);
  auto context = row_set{};
  for (id i = 0; i < values.size(); i += 3)
    context.add(i);
  for (auto x : {0u, 1u, 500u, 999u}) {
    CHECK_EQUAL(unbox(bm.eq(x, context)), unbox(bm.eq(x)) & context);
    CHECK_EQUAL(unbox(bm.neq(x, context)), unbox(bm.neq(x)) & context);
    CHECK_EQUAL(unbox(bm.lt(x, context)), unbox(bm.lt(x)) & context);
    CHECK_EQUAL(unbox(bm.lte(x, context)), unbox(bm.lte(x)) & context);
    CHECK_EQUAL(unbox(bm.gt(x, context)), unbox(bm.gt(x)) & context);
    CHECK_EQUAL(unbox(bm.gte(x, context)), unbox(bm.gte(x)) & context);
    CHECK_EQUAL(unbox(bm.lte_cardinality(x, context)),
                (unbox(bm.lte(x)) & context).cardinality());
    CHECK_EQUAL(unbox(bm.neq_cardinality(x, context)),
                (unbox(bm.neq(x)) & context).cardinality());
  }
  MESSAGE("rows beyond the bitmap never match");
  auto beyond = row_set{values.size(), values.size() + 1};
  CHECK(unbox(bm.gte(0, beyond)).empty());
  CHECK(unbox(bm.neq(0, row_set{})).empty());
}

TEST(context skips slices without rows) {
  const auto values = random_values(3 * band, 0, 99);
  auto bm = make_bitmap(values);
  auto context = row_set::make_range(2 * band + 10, 2 * band + 20);
  auto stats = evaluation_statistics{};
  auto result = unbox(bm.lookup(relational_operator::greater_equal, 0,
                                {.context = &context, .statistics = &stats}));
  CHECK_EQUAL(result, context);
  CHECK_EQUAL(stats.slices_skipped, 2u);
  CHECK_EQUAL(stats.slices_evaluated, 1u);
}

TEST(context beyond the last slice reads nothing) {
  // The context touches the band of the partial last slice, but only at rows
  // the bitmap does not have.
  const auto values = random_values(band + 100, 0, 99);
  auto bm = make_bitmap(values);
  auto context = row_set::make_range(band + 200, band + 300);
  for (auto op : all_operators) {
    auto stats = evaluation_statistics{};
    auto result = unbox(bm.lookup(op, 42, {.context = &context,
                                           .statistics = &stats}));
    CHECK(result.empty());
    CHECK_EQUAL(unbox(bm.count(op, 42, {.context = &context})), 0u);
    CHECK_EQUAL(stats.slices_skipped, 2u);
    CHECK_EQUAL(stats.slices_evaluated, 0u);
    CHECK_EQUAL(stats.container_reads, 0u);
  }
}

TEST(empty planes short circuit equality) {
  // All values are odd, so no row has a 0 in the least significant bit.
  auto builder = range_bitmap_builder{domain{0, 3}};
  for (auto i = 0; i < 1'000; ++i)
    REQUIRE_SUCCESS(builder.append(i % 2 == 0 ? 1 : 3));
  auto bm = unbox(builder.seal());
  REQUIRE_EQUAL(bm.slice_count(), 1u);
  CHECK(!bm.slice(0).has_plane(0));
  CHECK(bm.slice(0).has_plane(1));
  auto stats = evaluation_statistics{};
  auto result
    = unbox(bm.lookup(relational_operator::equal, 2, {.statistics = &stats}));
  CHECK(result.empty());
  CHECK_EQUAL(stats.slices_evaluated, 1u);
  CHECK_EQUAL(stats.container_reads, 0u);
  CHECK_EQUAL(unbox(bm.eq_cardinality(3)), 500u);
  CHECK_EQUAL(unbox(bm.lt_cardinality(3)), 500u);
  CHECK_EQUAL(unbox(bm.gt_cardinality(0)), 1'000u);
}

TEST(repeated values) {
  auto builder = range_bitmap_builder{};
  REQUIRE_SUCCESS(builder.append(7, band - 10));
  REQUIRE_SUCCESS(builder.append(3, 20));
  REQUIRE_SUCCESS(builder.append(7, 0));
  REQUIRE_SUCCESS(builder.append(11, 5));
  CHECK_EQUAL(builder.size(), band + 15);
  auto bm = unbox(builder.seal());
  CHECK_EQUAL(bm.slice_count(), 2u);
  CHECK_EQUAL(unbox(bm.eq_cardinality(7)), band - 10);
  CHECK_EQUAL(unbox(bm.eq(3)), row_set::make_range(band - 10, band + 10));
  CHECK_EQUAL(unbox(bm.gt(7)), row_set::make_range(band + 10, band + 15));
}

TEST(single value domain) {
  auto builder = range_bitmap_builder{};
  for (auto i = 0; i < 100; ++i)
    REQUIRE_SUCCESS(builder.append(42));
  auto bm = unbox(builder.seal());
  CHECK_EQUAL(bm.bit_width(), 0u);
  CHECK_EQUAL(bm.slice(0).plane_count(), 0u);
  CHECK_EQUAL(unbox(bm.eq(42)), row_set::make_range(0, 100));
  CHECK(unbox(bm.neq(42)).empty());
  CHECK(unbox(bm.lt(42)).empty());
  CHECK_EQUAL(unbox(bm.lte_cardinality(42)), 100u);
  CHECK(unbox(bm.gt(42)).empty());
  CHECK_EQUAL(unbox(bm.gte_cardinality(42)), 100u);
  CHECK_EQUAL(bm.eq(43).error(), ec::out_of_domain);
}

TEST(empty bitmap) {
  auto builder = range_bitmap_builder{};
  auto bm = unbox(builder.seal());
  CHECK(static_cast<bool>(bm));
  CHECK_EQUAL(bm.rows(), 0u);
  CHECK_EQUAL(bm.slice_count(), 0u);
  CHECK(unbox(bm.eq(0)).empty());
  CHECK_EQUAL(unbox(bm.gte_cardinality(0)), 0u);
  MESSAGE("a default-constructed handle rejects queries");
  auto none = range_bitmap{};
  CHECK(!none);
  CHECK_EQUAL(none.eq(0).error(), ec::logic_error);
}

TEST(parallel evaluation) {
  auto builder = range_bitmap_builder{};
  auto engine = std::mt19937_64{7};
  auto values = std::uniform_int_distribution<uint64_t>{0, 4'095};
  auto lengths = std::uniform_int_distribution<uint64_t>{1, 512};
  while (builder.size() < 10 * band) {
    const auto n = std::min(lengths(engine), 10 * band - builder.size());
    REQUIRE_SUCCESS(builder.append(values(engine), n));
  }
  auto bm = unbox(builder.seal());
  REQUIRE_EQUAL(bm.slice_count(), 10u);
  auto context = row_set::make_range(band / 2, 7 * band);
  for (auto op : all_operators) {
    auto sequential_stats = evaluation_statistics{};
    auto parallel_stats = evaluation_statistics{};
    auto sequential = unbox(
      bm.lookup(op, 2'000, {.parallelism = 1, .statistics = &sequential_stats}));
    auto parallel = unbox(
      bm.lookup(op, 2'000, {.parallelism = 4, .statistics = &parallel_stats}));
    CHECK_EQUAL(parallel, sequential);
    CHECK(parallel_stats == sequential_stats);
    CHECK_EQUAL(unbox(bm.count(op, 2'000, {.parallelism = 8})),
                sequential.cardinality());
    CHECK_EQUAL(unbox(bm.lookup(op, 2'000,
                                {.context = &context, .parallelism = 3})),
                sequential & context);
  }
}

TEST(cancellation) {
  auto bm = make_bitmap(random_values(band + 1, 0, 9));
  auto source = std::stop_source{};
  source.request_stop();
  auto result = bm.lookup(relational_operator::less, 5,
                          {.stop = source.get_token()});
  REQUIRE(!result);
  CHECK_EQUAL(result.error(), ec::cancelled);
  auto count = bm.count(relational_operator::less, 5,
                        {.parallelism = 2, .stop = source.get_token()});
  REQUIRE(!count);
  CHECK_EQUAL(count.error(), ec::cancelled);
}

TEST(builder size limit) {
  MESSAGE("a declared domain rejects rows that may not fit");
  auto declared = range_bitmap_builder{domain{0, 255}, 100'000};
  CHECK_EQUAL(declared.append(0, 3 * band), ec::invalid_argument);
  CHECK_EQUAL(declared.size(), 0u);
  REQUIRE_SUCCESS(declared.append(0, band));
  auto small = unbox(declared.seal());
  CHECK_EQUAL(unbox(small.eq_cardinality(0)), band);
  MESSAGE("an observed domain fails when sealing");
  auto observed = range_bitmap_builder{std::nullopt, 100'000};
  for (id i = 0; i < 3 * band; ++i)
    REQUIRE_SUCCESS(observed.append(i % 256));
  auto failed = observed.seal();
  REQUIRE(!failed);
  CHECK_EQUAL(failed.error(), ec::invalid_argument);
  CHECK(observed.sealed());
  CHECK_EQUAL(observed.seal().error(), ec::logic_error);
}

TEST(concurrent readers) {
  const auto values = random_values(2 * band, 0, 63);
  auto bm = make_bitmap(values);
  const auto expected = unbox(bm.lte(31));
  auto results = std::vector<row_set>(4);
  {
    auto threads = std::vector<std::jthread>{};
    for (size_t i = 0; i < results.size(); ++i)
      threads.emplace_back([&, i] {
        if (auto result = bm.lte(31))
          results[i] = std::move(*result);
      });
  }
  for (const auto& result : results)
    CHECK_EQUAL(result, expected);
}

TEST(builder with a declared domain) {
  auto builder = range_bitmap_builder{domain{10, 20}};
  REQUIRE_SUCCESS(builder.append(10));
  REQUIRE_SUCCESS(builder.append(20));
  CHECK_EQUAL(builder.append(21), ec::encoding_overflow);
  CHECK_EQUAL(builder.append(9, 3), ec::encoding_overflow);
  CHECK_EQUAL(builder.size(), 2u);
  MESSAGE("rows must arrive in order");
  CHECK_EQUAL(builder.append_at(5, 15), ec::out_of_order);
  REQUIRE_SUCCESS(builder.append_at(2, 15));
  CHECK_EQUAL(builder.size(), 3u);
  auto bm = unbox(builder.seal());
  CHECK(builder.sealed());
  CHECK_EQUAL(bm.min(), 10u);
  CHECK_EQUAL(bm.max(), 20u);
  CHECK_EQUAL(unbox(bm.eq(15)), (row_set{2}));
  CHECK(unbox(bm.eq(12)).empty());
  MESSAGE("a sealed builder rejects further calls");
  CHECK_EQUAL(builder.append(15), ec::logic_error);
  CHECK_EQUAL(builder.append_at(3, 15), ec::logic_error);
  CHECK_EQUAL(builder.seal().error(), ec::logic_error);
}

TEST(full domain) {
  constexpr auto max = std::numeric_limits<uint64_t>::max();
  auto bm = make_bitmap({0, max, max / 2, 1});
  CHECK_EQUAL(bm.bit_width(), 64u);
  CHECK_EQUAL(unbox(bm.eq(max)), (row_set{1}));
  CHECK_EQUAL(unbox(bm.lte(max / 2)), (row_set{0, 2, 3}));
  CHECK_EQUAL(unbox(bm.gt(1)), (row_set{1, 2}));
  CHECK_EQUAL(unbox(bm.neq_cardinality(0)), 3u);
}
