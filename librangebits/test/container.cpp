// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#define SUITE container

#include "rangebits/container.hpp"

#include "rangebits/test/test.hpp"

#include <algorithm>
#include <iterator>
#include <random>
#include <set>
#include <vector>

using namespace rangebits;

namespace {

std::vector<offset_type> iota(uint32_t first, uint32_t last,
                              uint32_t step = 1) {
  auto result = std::vector<offset_type>{};
  for (auto i = first; i < last; i += step)
    result.push_back(static_cast<offset_type>(i));
  return result;
}

constexpr container_kind all_kinds[] = {
  container_kind::array,
  container_kind::bitset,
  container_kind::run,
};

/// Draws a mix of contiguous ranges and scattered offsets.
std::vector<offset_type> random_offsets(uint32_t seed, uint32_t range_first,
                                        uint32_t range_last,
                                        uint32_t scattered) {
  auto gen = std::mt19937{seed};
  auto dist = std::uniform_int_distribution<uint32_t>{0, 65535};
  auto xs = std::set<offset_type>{};
  for (auto i = range_first; i < range_last; ++i)
    xs.insert(static_cast<offset_type>(i));
  for (uint32_t i = 0; i < scattered; ++i)
    xs.insert(static_cast<offset_type>(dist(gen)));
  return {xs.begin(), xs.end()};
}

container make_as(const std::vector<offset_type>& xs, container_kind kind) {
  auto result = container::make(xs);
  result.convert(kind);
  return result;
}

} // namespace

TEST(representation choice) {
  MESSAGE("sparse offsets stay an array");
  auto sparse = container::make(std::vector<offset_type>{3, 17, 4711});
  CHECK_EQUAL(sparse.kind(), container_kind::array);
  CHECK_EQUAL(sparse.cardinality(), 3u);
  MESSAGE("a contiguous range becomes a run");
  auto dense = container::make(iota(100, 1100));
  CHECK_EQUAL(dense.kind(), container_kind::run);
  CHECK_EQUAL(dense.cardinality(), 1000u);
  CHECK_EQUAL(dense.size_in_bytes(), 4u);
  MESSAGE("many scattered offsets become a bitset");
  auto scattered = container::make(iota(0, 65536, 3));
  CHECK_EQUAL(scattered.kind(), container_kind::bitset);
  CHECK_EQUAL(scattered.cardinality(), 21846u);
  MESSAGE("the array limit is inclusive");
  auto at_limit = container::make(iota(0, 8192, 2));
  CHECK_EQUAL(at_limit.kind(), container_kind::array);
  auto above_limit = container::make(iota(0, 8194, 2));
  CHECK_EQUAL(above_limit.kind(), container_kind::bitset);
}

TEST(empty container) {
  auto x = container{};
  CHECK(x.empty());
  CHECK_EQUAL(x.cardinality(), 0u);
  CHECK(!x.contains(0));
  CHECK_EQUAL(x.rank(65535), 0u);
  CHECK(!x.select(0));
  CHECK_EQUAL(to_string(x), "{}");
  CHECK(container::make_range(42, 0).empty());
}

TEST(membership and rank) {
  const auto offsets = std::vector<offset_type>{1, 2, 3, 10, 65535};
  for (auto kind :
       {container_kind::array, container_kind::bitset, container_kind::run}) {
    MESSAGE("checking " << to_string(kind));
    auto x = container::make(offsets);
    x.convert(kind);
    CHECK_EQUAL(x.kind(), kind);
    CHECK_EQUAL(x.cardinality(), 5u);
    CHECK(x.contains(2));
    CHECK(x.contains(65535));
    CHECK(!x.contains(4));
    CHECK(!x.contains(0));
    CHECK_EQUAL(x.rank(0), 0u);
    CHECK_EQUAL(x.rank(3), 3u);
    CHECK_EQUAL(x.rank(9), 3u);
    CHECK_EQUAL(x.rank(65535), 5u);
    CHECK(x.select(0) == offset_type{1});
    CHECK(x.select(3) == offset_type{10});
    CHECK(x.select(4) == offset_type{65535});
    CHECK(!x.select(5));
    CHECK_EQUAL(x.offsets(), offsets);
    CHECK_EQUAL(to_string(x), "{1, 2, 3, 10, 65535}");
  }
}

TEST(equality ignores the representation) {
  auto x = container::make(iota(0, 64));
  auto y = x;
  y.convert(container_kind::bitset);
  CHECK_EQUAL(x, y);
  y.convert(container_kind::array);
  CHECK_EQUAL(x, y);
  y.add(64);
  CHECK_NOT_EQUAL(x, y);
}

TEST(add converts an array into a bitset) {
  auto x = container{};
  for (uint32_t i = 0; i < 4096; ++i)
    x.add(static_cast<offset_type>(i * 3));
  CHECK_EQUAL(x.kind(), container_kind::array);
  x.add(65000);
  CHECK_EQUAL(x.kind(), container_kind::bitset);
  CHECK_EQUAL(x.cardinality(), 4097u);
  CHECK(x.contains(65000));
  CHECK(x.contains(3 * 4095));
}

TEST(add keeps runs compact) {
  auto x = container::make_range(0, 1000);
  REQUIRE_EQUAL(x.kind(), container_kind::run);
  x.add(1000);
  CHECK_EQUAL(x.kind(), container_kind::run);
  CHECK_EQUAL(x.cardinality(), 1001u);
  MESSAGE("fragmenting a run container switches representations");
  auto y = container::make_range(0, 2);
  for (uint32_t i = 10; i < 100; i += 2)
    y.add(static_cast<offset_type>(i));
  CHECK_EQUAL(y.kind(), container_kind::array);
  CHECK_EQUAL(y.cardinality(), 47u);
}

TEST(set algebra) {
  auto evens = container::make(iota(0, 20000, 2));
  auto low = container::make_range(0, 10000);
  auto sparse = container::make(std::vector<offset_type>{1, 2, 3, 15000});
  MESSAGE("intersection");
  CHECK_EQUAL(evens & low, container::make(iota(0, 10000, 2)));
  CHECK_EQUAL(sparse & low, container::make(std::vector<offset_type>{1, 2, 3}));
  CHECK_EQUAL((sparse & evens).offsets(), (std::vector<offset_type>{2}));
  MESSAGE("union");
  auto both = evens | low;
  CHECK_EQUAL(both.cardinality(), 15000u);
  CHECK(both.contains(9999));
  CHECK(!both.contains(10001));
  CHECK_EQUAL((sparse | sparse), sparse);
  MESSAGE("difference");
  CHECK_EQUAL((low - evens), container::make(iota(1, 10000, 2)));
  CHECK_EQUAL((sparse - low).offsets(), (std::vector<offset_type>{15000}));
  CHECK((low - low).empty());
}

TEST(set algebra across representations) {
  const auto xs = random_offsets(1, 1'000, 5'000, 2'000);
  const auto ys = random_offsets(2, 3'000, 3'100, 500);
  auto expected_and = std::vector<offset_type>{};
  std::set_intersection(xs.begin(), xs.end(), ys.begin(), ys.end(),
                        std::back_inserter(expected_and));
  auto expected_or = std::vector<offset_type>{};
  std::set_union(xs.begin(), xs.end(), ys.begin(), ys.end(),
                 std::back_inserter(expected_or));
  auto expected_and_not = std::vector<offset_type>{};
  std::set_difference(xs.begin(), xs.end(), ys.begin(), ys.end(),
                      std::back_inserter(expected_and_not));
  for (auto kx : all_kinds) {
    for (auto ky : all_kinds) {
      MESSAGE(to_string(kx) << " with " << to_string(ky));
      const auto x = make_as(xs, kx);
      const auto y = make_as(ys, ky);
      REQUIRE_EQUAL(x.kind(), kx);
      REQUIRE_EQUAL(y.kind(), ky);
      const auto both = x & y;
      CHECK_EQUAL(both.offsets(), expected_and);
      CHECK_EQUAL(both.cardinality(), expected_and.size());
      const auto either = x | y;
      CHECK_EQUAL(either.offsets(), expected_or);
      CHECK_EQUAL(either.cardinality(), expected_or.size());
      const auto only = x - y;
      CHECK_EQUAL(only.offsets(), expected_and_not);
      CHECK_EQUAL(only.cardinality(), expected_and_not.size());
    }
  }
}

TEST(flip across representations) {
  const auto xs = random_offsets(3, 10'000, 12'000, 1'000);
  for (auto n : {uint32_t{0}, uint32_t{11'000}, uint32_t{65'536}}) {
    auto expected = std::vector<offset_type>{};
    for (uint32_t i = 0; i < n; ++i) {
      const auto offset = static_cast<offset_type>(i);
      if (!std::binary_search(xs.begin(), xs.end(), offset))
        expected.push_back(offset);
    }
    for (auto kind : all_kinds) {
      const auto x = make_as(xs, kind);
      const auto flipped = flip(x.view(), n);
      CHECK_EQUAL(flipped.offsets(), expected);
      CHECK_EQUAL(flipped.cardinality(), expected.size());
    }
  }
}

TEST(inspectors agree across representations) {
  const auto xs = random_offsets(4, 20'000, 30'000, 3'000);
  const auto positions = std::vector<offset_type>{
    0, 1, 19'999, 20'000, 25'000, 29'999, 30'000, 65'535};
  for (auto kind : all_kinds) {
    MESSAGE("checking " << to_string(kind));
    const auto x = make_as(xs, kind);
    CHECK_EQUAL(x.offsets(), xs);
    CHECK_EQUAL(x.cardinality(), xs.size());
    CHECK_EQUAL(x, container::make(xs));
    for (auto position : positions) {
      const auto upper = std::upper_bound(xs.begin(), xs.end(), position);
      CHECK_EQUAL(x.rank(position),
                  static_cast<uint32_t>(upper - xs.begin()));
      CHECK_EQUAL(x.contains(position),
                  std::binary_search(xs.begin(), xs.end(), position));
    }
    for (auto k : {size_t{0}, xs.size() / 2, xs.size() - 1})
      CHECK(x.select(static_cast<uint32_t>(k)) == xs[k]);
    CHECK(!x.select(static_cast<uint32_t>(xs.size())));
  }
}

TEST(flip) {
  auto x = container::make(std::vector<offset_type>{0, 2, 4});
  CHECK_EQUAL(flip(x.view(), 6), container::make(std::vector<offset_type>{1, 3,
                                                                          5}));
  CHECK_EQUAL(flip(container{}.view(), 65536).cardinality(), 65536u);
  CHECK(flip(container::make_range(0, 100).view(), 100).empty());
  CHECK(flip(x.view(), 0).empty());
}

TEST(word level kernels) {
  auto bits = band_bits{};
  auto x = container::make(iota(0, 128));
  load(x.view(), bits);
  CHECK_EQUAL(bits[0], band_word::all);
  CHECK_EQUAL(bits[1], band_word::all);
  CHECK_EQUAL(bits[2], band_word::none);
  and_not_into(container::make_range(64, 64).view(), bits);
  CHECK_EQUAL(bits[1], band_word::none);
  or_into(container::make(std::vector<offset_type>{130}).view(), bits);
  CHECK_EQUAL(bits[2], uint64_t{1} << 2);
  and_into(container::make_range(60, 100).view(), bits);
  CHECK_EQUAL(bits[0], band_word::all << 60);
  CHECK(intersects(container::make(std::vector<offset_type>{61}).view(), bits));
  CHECK(!intersects(container::make(std::vector<offset_type>{70}).view(),
                    bits));
}

TEST(views share the owned storage) {
  auto x = container::make(iota(0, 65536, 5));
  auto copy = container::make(x.view());
  CHECK_EQUAL(copy.kind(), x.kind());
  CHECK_EQUAL(copy, x);
  auto visited = std::vector<offset_type>{};
  for_each(x, [&](offset_type offset) {
    visited.push_back(offset);
  });
  CHECK_EQUAL(visited, iota(0, 65536, 5));
}
