// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#define SUITE range_bitmap_persistence

#include "rangebits/chunk.hpp"
#include "rangebits/error.hpp"
#include "rangebits/fbs/range_bitmap_generated.h"
#include "rangebits/range_bitmap.hpp"
#include "rangebits/range_bitmap_builder.hpp"
#include "rangebits/test/fixtures/filesystem.hpp"
#include "rangebits/test/test.hpp"

#include <flatbuffers/flatbuffers.h>

#include <fstream>
#include <vector>

using namespace rangebits;

namespace {

constexpr auto band = id{defaults::layout::band_size};

/// Finishes a hand-written bitmap directory.
chunk_ptr finish(flatbuffers::FlatBufferBuilder& builder, uint64_t rows,
                 uint64_t min, uint64_t max, uint8_t bit_width,
                 const std::vector<flatbuffers::Offset<fbs::Slice>>& slices) {
  const auto slices_offset = builder.CreateVector(slices);
  const auto root = fbs::CreateRangeBitmap(builder, rows, min, max, bit_width,
                                           slices_offset);
  builder.Finish(root, fbs::RangeBitmapIdentifier());
  return chunk::make(builder.Release());
}

flatbuffers::Offset<fbs::Plane>
make_array_plane(flatbuffers::FlatBufferBuilder& builder,
                 const std::vector<offset_type>& offsets) {
  const auto offsets_offset = builder.CreateVector(offsets);
  const auto array = fbs::container::CreateArray(builder, offsets_offset);
  return fbs::CreatePlane(builder, fbs::container::Container::array,
                          array.Union());
}

flatbuffers::Offset<fbs::Plane>
make_run_plane(flatbuffers::FlatBufferBuilder& builder,
               const std::vector<offset_type>& runs) {
  const auto runs_offset = builder.CreateVector(runs);
  const auto run = fbs::container::CreateRun(builder, runs_offset);
  return fbs::CreatePlane(builder, fbs::container::Container::run,
                          run.Union());
}

/// Wraps a single plane into a one-slice bitmap over the domain [0, 1].
chunk_ptr single_plane_bitmap(flatbuffers::FlatBufferBuilder& builder,
                              flatbuffers::Offset<fbs::Plane> plane,
                              uint32_t rows) {
  const auto planes = std::vector<flatbuffers::Offset<fbs::Plane>>{plane};
  const auto slice
    = fbs::CreateSlice(builder, 0, rows, 0b1, builder.CreateVector(planes));
  return finish(builder, rows, 0, 1, 1, {slice});
}

struct fixture : fixtures::filesystem {
  fixture() : fixtures::filesystem("range_bitmap_persistence") {
    auto builder = range_bitmap_builder{};
    for (id i = 0; i < band + 1'000; ++i)
      REQUIRE_SUCCESS(builder.append((i * 7919) % 1'000));
    bitmap = unbox(builder.seal());
  }

  range_bitmap bitmap;
};

} // namespace

FIXTURE_SCOPE(range_bitmap_persistence_tests, fixture)

TEST(save and load) {
  const auto filename = directory / "values.rbm";
  REQUIRE_SUCCESS(save(filename, bitmap));
  auto loaded = unbox(range_bitmap::load(filename));
  CHECK_EQUAL(loaded.rows(), bitmap.rows());
  CHECK_EQUAL(loaded.min(), bitmap.min());
  CHECK_EQUAL(loaded.max(), bitmap.max());
  CHECK_EQUAL(loaded.bit_width(), bitmap.bit_width());
  CHECK_EQUAL(loaded.slice_count(), 2u);
  for (auto x : {0u, 1u, 499u, 998u, 999u}) {
    CHECK_EQUAL(unbox(loaded.eq(x)), unbox(bitmap.eq(x)));
    CHECK_EQUAL(unbox(loaded.lt(x)), unbox(bitmap.lt(x)));
    CHECK_EQUAL(unbox(loaded.gte_cardinality(x)),
                unbox(bitmap.gte_cardinality(x)));
  }
  MESSAGE("the mapped bitmap outlives the file");
  std::filesystem::remove(filename);
  CHECK_EQUAL(unbox(loaded.eq_cardinality(0)),
              unbox(bitmap.eq_cardinality(0)));
}

TEST(open in place) {
  auto bytes = as_bytes(bitmap.chunk());
  auto copy = chunk::copy(std::vector<std::byte>(bytes.begin(), bytes.end()));
  auto reopened = unbox(range_bitmap::make(copy));
  CHECK_EQUAL(unbox(reopened.lte(500)), unbox(bitmap.lte(500)));
  CHECK_EQUAL(reopened.memusage(), bitmap.memusage());
}

TEST(saving an empty handle) {
  CHECK_EQUAL(save(directory / "empty.rbm", range_bitmap{}), ec::logic_error);
}

TEST(loading missing and empty files) {
  auto missing = range_bitmap::load(directory / "missing.rbm");
  REQUIRE(!missing);
  CHECK_EQUAL(missing.error(), ec::filesystem_error);
  {
    auto out = std::ofstream{directory / "empty.rbm"};
  }
  auto empty = range_bitmap::load(directory / "empty.rbm");
  REQUIRE(!empty);
  CHECK_EQUAL(empty.error(), ec::corrupt_layout);
  CHECK_EQUAL(range_bitmap::make(nullptr).error(), ec::invalid_argument);
}

TEST(truncated buffer) {
  const auto bytes = as_bytes(bitmap.chunk());
  auto truncated = chunk::copy(
    std::vector<std::byte>(bytes.begin(), bytes.begin() + bytes.size() / 2));
  CHECK_EQUAL(range_bitmap::make(truncated).error(), ec::corrupt_layout);
}

TEST(wrong identifier) {
  const auto bytes = as_bytes(bitmap.chunk());
  auto buffer = std::vector<std::byte>(bytes.begin(), bytes.end());
  buffer[sizeof(flatbuffers::uoffset_t)] = std::byte{'X'};
  CHECK_EQUAL(range_bitmap::make(chunk::copy(buffer)).error(),
              ec::corrupt_layout);
}

TEST(slice count mismatch) {
  auto builder = flatbuffers::FlatBufferBuilder{};
  const auto planes
    = std::vector<flatbuffers::Offset<fbs::Plane>>{
      make_array_plane(builder, {0, 1})};
  const auto slice
    = fbs::CreateSlice(builder, 0, 3, 0b1, builder.CreateVector(planes));
  // Two bands worth of rows, but only one slice.
  auto buffer = finish(builder, band + 3, 0, 1, 1, {slice});
  CHECK_EQUAL(range_bitmap::make(buffer).error(), ec::corrupt_layout);
}

TEST(mask and planes disagree) {
  auto builder = flatbuffers::FlatBufferBuilder{};
  const auto planes
    = std::vector<flatbuffers::Offset<fbs::Plane>>{
      make_array_plane(builder, {0, 1})};
  const auto slice
    = fbs::CreateSlice(builder, 0, 3, 0b11, builder.CreateVector(planes));
  auto buffer = finish(builder, 3, 0, 3, 2, {slice});
  CHECK_EQUAL(range_bitmap::make(buffer).error(), ec::corrupt_layout);
}

TEST(container exceeds its band) {
  auto builder = flatbuffers::FlatBufferBuilder{};
  const auto planes
    = std::vector<flatbuffers::Offset<fbs::Plane>>{
      make_array_plane(builder, {0, 5})};
  const auto slice
    = fbs::CreateSlice(builder, 0, 3, 0b1, builder.CreateVector(planes));
  auto buffer = finish(builder, 3, 0, 1, 1, {slice});
  CHECK_EQUAL(range_bitmap::make(buffer).error(), ec::corrupt_layout);
}

TEST(run container exceeds its band) {
  // The first run ends past the band although the last one is in bounds.
  auto builder = flatbuffers::FlatBufferBuilder{};
  const auto plane = make_run_plane(builder, {65'000, 1'000, 0, 0});
  auto buffer = single_plane_bitmap(builder, plane, band);
  CHECK_EQUAL(range_bitmap::make(buffer).error(), ec::corrupt_layout);
}

TEST(run container with unordered runs) {
  auto builder = flatbuffers::FlatBufferBuilder{};
  auto overlapping = make_run_plane(builder, {0, 10, 5, 2});
  CHECK_EQUAL(
    range_bitmap::make(single_plane_bitmap(builder, overlapping, 100)).error(),
    ec::corrupt_layout);
  builder.Clear();
  auto adjacent = make_run_plane(builder, {0, 1, 2, 3});
  CHECK_EQUAL(
    range_bitmap::make(single_plane_bitmap(builder, adjacent, 100)).error(),
    ec::corrupt_layout);
  builder.Clear();
  auto descending = make_run_plane(builder, {50, 0, 10, 0});
  CHECK_EQUAL(
    range_bitmap::make(single_plane_bitmap(builder, descending, 100)).error(),
    ec::corrupt_layout);
}

TEST(hand written run container) {
  // Rows 0, 1 and 5 hold the value 0, all others the value 1.
  auto builder = flatbuffers::FlatBufferBuilder{};
  const auto plane = make_run_plane(builder, {0, 1, 5, 0});
  auto bm = unbox(
    range_bitmap::make(single_plane_bitmap(builder, plane, 8)));
  CHECK_EQUAL(unbox(bm.eq(0)), (row_set{0, 1, 5}));
  CHECK_EQUAL(unbox(bm.eq(1)), (row_set{2, 3, 4, 6, 7}));
}

TEST(bit width disagrees with the domain) {
  auto builder = flatbuffers::FlatBufferBuilder{};
  const auto slice = fbs::CreateSlice(
    builder, 0, 3, 0,
    builder.CreateVector(std::vector<flatbuffers::Offset<fbs::Plane>>{}));
  auto buffer = finish(builder, 3, 0, 100, 2, {slice});
  CHECK_EQUAL(range_bitmap::make(buffer).error(), ec::corrupt_layout);
}

TEST(hand written bitmap) {
  // Values 1, 0, 1 in a domain of [0, 1]: plane 0 holds the rows with an
  // anchored 0 in bit 0.
  auto builder = flatbuffers::FlatBufferBuilder{};
  const auto planes
    = std::vector<flatbuffers::Offset<fbs::Plane>>{
      make_array_plane(builder, {1})};
  const auto slice
    = fbs::CreateSlice(builder, 0, 3, 0b1, builder.CreateVector(planes));
  auto bm = unbox(range_bitmap::make(finish(builder, 3, 0, 1, 1, {slice})));
  CHECK_EQUAL(unbox(bm.eq(0)), (row_set{1}));
  CHECK_EQUAL(unbox(bm.eq(1)), (row_set{0, 2}));
  CHECK_EQUAL(unbox(bm.lte(0)), (row_set{1}));
}

FIXTURE_SCOPE_END()
