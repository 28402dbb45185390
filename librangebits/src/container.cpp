// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/container.hpp"

#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"
#include "rangebits/fbs/range_bitmap_generated.h"

#include <algorithm>
#include <iterator>

namespace rangebits {

namespace {

namespace limits = defaults::layout;

constexpr size_t bitset_bytes = words_per_band * sizeof(uint64_t);

void set_range(band_bits& words, uint32_t first, uint32_t last) noexcept {
  RANGEBITS_ASSERT(first <= last);
  RANGEBITS_ASSERT(last < limits::band_size);
  const auto first_word = first / band_word::width;
  const auto last_word = last / band_word::width;
  const auto head = band_word::all << (first % band_word::width);
  const auto tail = band_word::lsb_mask(last % band_word::width + 1);
  if (first_word == last_word) {
    words[first_word] |= head & tail;
    return;
  }
  words[first_word] |= head;
  for (auto i = first_word + 1; i < last_word; ++i)
    words[i] = band_word::all;
  words[last_word] |= tail;
}

/// Finds the first position at or after *from* whose bit equals *bit*.
/// @returns `band_size` if there is none.
uint32_t find_next(const band_bits& words, uint32_t from, bool bit) noexcept {
  if (from >= limits::band_size)
    return limits::band_size;
  auto i = from / band_word::width;
  auto w = bit ? words[i] : ~words[i];
  w &= band_word::all << (from % band_word::width);
  while (w == 0) {
    if (++i == words_per_band)
      return limits::band_size;
    w = bit ? words[i] : ~words[i];
  }
  return static_cast<uint32_t>(i * band_word::width
                               + band_word::count_trailing_zeros(w));
}

uint32_t popcount(const band_bits& words) noexcept {
  uint32_t result = 0;
  for (auto w : words)
    result += band_word::popcount(w);
  return result;
}

array_container make_array(const band_bits& words, uint32_t cardinality) {
  auto offsets = std::vector<offset_type>{};
  offsets.reserve(cardinality);
  for (size_t i = 0; i < words_per_band; ++i)
    for (auto w = words[i]; w != 0; w &= w - 1)
      offsets.push_back(static_cast<offset_type>(
        i * band_word::width + band_word::count_trailing_zeros(w)));
  return array_container{std::move(offsets)};
}

run_container make_run(const band_bits& words) {
  auto result = run_container{};
  auto first = find_next(words, 0, true);
  while (first < limits::band_size) {
    auto end = find_next(words, first, false);
    result.append(static_cast<offset_type>(first),
                  static_cast<offset_type>(end - 1));
    first = find_next(words, end, true);
  }
  return result;
}

// -- per-view kernels ---------------------------------------------------------

uint32_t cardinality_of(const array_view& x) noexcept {
  return static_cast<uint32_t>(x.offsets().size());
}

uint32_t cardinality_of(const bitset_view& x) noexcept {
  return x.cardinality();
}

uint32_t cardinality_of(const run_view& x) noexcept {
  uint32_t result = 0;
  for (size_t i = 0; i < x.size(); ++i)
    result += uint32_t{x.length(i)} + 1;
  return result;
}

/// @returns the index of the first run whose last offset is not smaller than
/// *offset*.
size_t lower_run(const run_view& x, offset_type offset) noexcept {
  size_t lo = 0;
  size_t hi = x.size();
  while (lo < hi) {
    const auto mid = lo + (hi - lo) / 2;
    if (x.last(mid) < offset)
      lo = mid + 1;
    else
      hi = mid;
  }
  return lo;
}

} // namespace

const char* to_string(container_kind kind) noexcept {
  switch (kind) {
    case container_kind::array:
      return "array";
    case container_kind::bitset:
      return "bitset";
    case container_kind::run:
      return "run";
  }
  return "<invalid>";
}

// -- view functions -----------------------------------------------------------

container_kind kind(const container_view& x) noexcept {
  auto f = detail::overload{
    [](const array_view&) {
      return container_kind::array;
    },
    [](const bitset_view&) {
      return container_kind::bitset;
    },
    [](const run_view&) {
      return container_kind::run;
    },
  };
  return caf::visit(f, x);
}

uint32_t cardinality(const container_view& x) noexcept {
  return caf::visit(
    [](const auto& view) {
      return cardinality_of(view);
    },
    x);
}

bool contains(const container_view& x, offset_type offset) noexcept {
  auto f = detail::overload{
    [&](const array_view& view) {
      return std::binary_search(view.offsets().begin(), view.offsets().end(),
                                offset);
    },
    [&](const bitset_view& view) {
      return band_word::test(view.words()[offset / band_word::width],
                             offset % band_word::width);
    },
    [&](const run_view& view) {
      const auto i = lower_run(view, offset);
      return i < view.size() && view.start(i) <= offset;
    },
  };
  return caf::visit(f, x);
}

uint32_t rank(const container_view& x, offset_type offset) noexcept {
  auto f = detail::overload{
    [&](const array_view& view) {
      const auto offsets = view.offsets();
      return static_cast<uint32_t>(
        std::upper_bound(offsets.begin(), offsets.end(), offset)
        - offsets.begin());
    },
    [&](const bitset_view& view) {
      const auto words = view.words();
      const auto last = offset / band_word::width;
      uint32_t result = 0;
      for (size_t i = 0; i < last; ++i)
        result += band_word::popcount(words[i]);
      return static_cast<uint32_t>(
        result + band_word::rank(words[last], offset % band_word::width));
    },
    [&](const run_view& view) {
      uint32_t result = 0;
      for (size_t i = 0; i < view.size() && view.start(i) <= offset; ++i)
        result += std::min<uint32_t>(view.last(i), offset) - view.start(i) + 1;
      return result;
    },
  };
  return caf::visit(f, x);
}

std::optional<offset_type>
select(const container_view& x, uint32_t k) noexcept {
  auto f = detail::overload{
    [&](const array_view& view) -> std::optional<offset_type> {
      if (k >= view.offsets().size())
        return std::nullopt;
      return view.offsets()[k];
    },
    [&](const bitset_view& view) -> std::optional<offset_type> {
      const auto words = view.words();
      for (size_t i = 0; i < words.size(); ++i) {
        const auto n = band_word::popcount(words[i]);
        if (k < n)
          return static_cast<offset_type>(i * band_word::width
                                          + band_word::select(words[i], k));
        k -= n;
      }
      return std::nullopt;
    },
    [&](const run_view& view) -> std::optional<offset_type> {
      for (size_t i = 0; i < view.size(); ++i) {
        const auto n = uint32_t{view.length(i)} + 1;
        if (k < n)
          return static_cast<offset_type>(view.start(i) + k);
        k -= n;
      }
      return std::nullopt;
    },
  };
  return caf::visit(f, x);
}

size_t size_in_bytes(const container_view& x) noexcept {
  auto f = detail::overload{
    [](const array_view& view) {
      return view.offsets().size_bytes();
    },
    [](const bitset_view& view) {
      return view.words().size_bytes();
    },
    [](const run_view& view) {
      return view.runs().size_bytes();
    },
  };
  return caf::visit(f, x);
}

void load(const container_view& x, band_bits& out) noexcept {
  if (const auto* view = caf::get_if<bitset_view>(&x)) {
    std::copy(view->words().begin(), view->words().end(), out.begin());
    return;
  }
  out.fill(0);
  or_into(x, out);
}

void or_into(const container_view& x, band_bits& out) noexcept {
  auto f = detail::overload{
    [&](const array_view& view) {
      for (auto offset : view.offsets())
        out[offset / band_word::width]
          |= band_word::mask(offset % band_word::width);
    },
    [&](const bitset_view& view) {
      const auto words = view.words();
      for (size_t i = 0; i < words_per_band; ++i)
        out[i] |= words[i];
    },
    [&](const run_view& view) {
      for (size_t i = 0; i < view.size(); ++i)
        set_range(out, view.start(i), view.last(i));
    },
  };
  caf::visit(f, x);
}

void and_into(const container_view& x, band_bits& out) noexcept {
  if (const auto* view = caf::get_if<bitset_view>(&x)) {
    const auto words = view->words();
    for (size_t i = 0; i < words_per_band; ++i)
      out[i] &= words[i];
    return;
  }
  auto mask = band_bits{};
  or_into(x, mask);
  for (size_t i = 0; i < words_per_band; ++i)
    out[i] &= mask[i];
}

void and_not_into(const container_view& x, band_bits& out) noexcept {
  auto f = detail::overload{
    [&](const array_view& view) {
      for (auto offset : view.offsets())
        out[offset / band_word::width]
          &= ~band_word::mask(offset % band_word::width);
    },
    [&](const bitset_view& view) {
      const auto words = view.words();
      for (size_t i = 0; i < words_per_band; ++i)
        out[i] &= ~words[i];
    },
    [&](const run_view& view) {
      auto mask = band_bits{};
      for (size_t i = 0; i < view.size(); ++i)
        set_range(mask, view.start(i), view.last(i));
      for (size_t i = 0; i < words_per_band; ++i)
        out[i] &= ~mask[i];
    },
  };
  caf::visit(f, x);
}

bool intersects(const container_view& x, const band_bits& bits) noexcept {
  auto f = detail::overload{
    [&](const array_view& view) {
      return std::any_of(view.offsets().begin(), view.offsets().end(),
                         [&](offset_type offset) {
                           return band_word::test(
                             bits[offset / band_word::width],
                             offset % band_word::width);
                         });
    },
    [&](const bitset_view& view) {
      const auto words = view.words();
      for (size_t i = 0; i < words_per_band; ++i)
        if ((words[i] & bits[i]) != 0)
          return true;
      return false;
    },
    [&](const run_view& view) {
      for (size_t i = 0; i < view.size(); ++i)
        if (find_next(bits, view.start(i), true) <= view.last(i))
          return true;
      return false;
    },
  };
  return caf::visit(f, x);
}

// -- array_container ----------------------------------------------------------

array_container::array_container(std::vector<offset_type> offsets)
  : offsets_{std::move(offsets)} {
  RANGEBITS_ASSERT(std::is_sorted(offsets_.begin(), offsets_.end()));
}

array_view array_container::view() const noexcept {
  return array_view{offsets_};
}

void array_container::add(offset_type offset) {
  if (offsets_.empty() || offsets_.back() < offset) {
    offsets_.push_back(offset);
    return;
  }
  auto i = std::lower_bound(offsets_.begin(), offsets_.end(), offset);
  if (*i != offset)
    offsets_.insert(i, offset);
}

const std::vector<offset_type>& array_container::offsets() const noexcept {
  return offsets_;
}

// -- bitset_container ---------------------------------------------------------

bitset_container::bitset_container() : words_(words_per_band, 0) {
  // nop
}

bitset_container::bitset_container(const band_bits& words)
  : words_(words.begin(), words.end()), cardinality_{popcount(words)} {
  // nop
}

bitset_view bitset_container::view() const noexcept {
  return bitset_view{words_, cardinality_};
}

void bitset_container::add(offset_type offset) {
  auto& w = words_[offset / band_word::width];
  const auto bit = band_word::mask(offset % band_word::width);
  if ((w & bit) == 0) {
    w |= bit;
    ++cardinality_;
  }
}

// -- run_container ------------------------------------------------------------

run_container::run_container(std::vector<offset_type> runs)
  : runs_{std::move(runs)} {
  RANGEBITS_ASSERT(runs_.size() % 2 == 0);
}

run_view run_container::view() const noexcept {
  return run_view{runs_};
}

void run_container::add(offset_type offset) {
  const auto current = view();
  if (current.size() == 0 || current.last(current.size() - 1) + 1 < offset) {
    append(offset, offset);
    return;
  }
  if (current.last(current.size() - 1) + 1 == offset) {
    ++runs_.back();
    return;
  }
  if (rangebits::contains(current, offset))
    return;
  auto words = band_bits{};
  load(current, words);
  words[offset / band_word::width] |= band_word::mask(offset % band_word::width);
  *this = make_run(words);
}

void run_container::append(offset_type start, offset_type last) {
  RANGEBITS_ASSERT(start <= last);
  RANGEBITS_ASSERT(runs_.empty()
                   || uint32_t{runs_[runs_.size() - 2]} + runs_.back() + 1
                        < start);
  runs_.push_back(start);
  runs_.push_back(static_cast<offset_type>(last - start));
}

// -- container ----------------------------------------------------------------

container container::make(std::vector<offset_type> offsets) {
  auto result = container{array_container{std::move(offsets)}};
  result.optimize();
  return result;
}

container container::make(const band_bits& words) {
  uint32_t cardinality = 0;
  uint32_t runs = 0;
  uint64_t carry = 0;
  for (auto w : words) {
    cardinality += band_word::popcount(w);
    runs += band_word::popcount(w & ~((w << 1) | carry));
    carry = w >> (band_word::width - 1);
  }
  const auto array_bytes = size_t{cardinality} * sizeof(offset_type);
  const auto run_bytes = size_t{runs} * 2 * sizeof(offset_type);
  if (run_bytes < std::min(array_bytes, bitset_bytes))
    return container{make_run(words)};
  if (cardinality <= limits::array_cardinality_limit)
    return container{make_array(words, cardinality)};
  return container{bitset_container{words}};
}

container container::make(const container_view& view) {
  auto f = detail::overload{
    [](const array_view& x) {
      return container{array_container{
        std::vector<offset_type>(x.offsets().begin(), x.offsets().end())}};
    },
    [](const bitset_view& x) {
      auto words = band_bits{};
      std::copy(x.words().begin(), x.words().end(), words.begin());
      return container{bitset_container{words}};
    },
    [](const run_view& x) {
      return container{run_container{
        std::vector<offset_type>(x.runs().begin(), x.runs().end())}};
    },
  };
  return caf::visit(f, view);
}

container container::make_range(offset_type first, uint32_t count) {
  RANGEBITS_ASSERT(uint32_t{first} + count <= limits::band_size);
  if (count == 0)
    return container{};
  auto result = run_container{};
  result.append(first, static_cast<offset_type>(first + count - 1));
  return container{std::move(result)};
}

container_kind container::kind() const noexcept {
  return rangebits::kind(view());
}

container_view container::view() const noexcept {
  return caf::visit(
    [](const auto& x) -> container_view {
      return x.view();
    },
    container_);
}

bool container::empty() const noexcept {
  return cardinality() == 0;
}

uint32_t container::cardinality() const noexcept {
  return rangebits::cardinality(view());
}

bool container::contains(offset_type offset) const noexcept {
  return rangebits::contains(view(), offset);
}

uint32_t container::rank(offset_type offset) const noexcept {
  return rangebits::rank(view(), offset);
}

std::optional<offset_type> container::select(uint32_t k) const noexcept {
  return rangebits::select(view(), k);
}

size_t container::size_in_bytes() const noexcept {
  return rangebits::size_in_bytes(view());
}

std::vector<offset_type> container::offsets() const {
  auto result = std::vector<offset_type>{};
  result.reserve(cardinality());
  for_each(view(), [&](offset_type offset) {
    result.push_back(offset);
  });
  return result;
}

void container::add(offset_type offset) {
  if (auto* array = caf::get_if<array_container>(&container_)) {
    array->add(offset);
    if (array->offsets().size() > limits::array_cardinality_limit)
      convert(container_kind::bitset);
    return;
  }
  if (auto* run = caf::get_if<run_container>(&container_)) {
    run->add(offset);
    const auto view = run->view();
    const auto run_bytes = view.runs().size_bytes();
    const auto array_bytes = size_t{cardinality_of(view)} * sizeof(offset_type);
    if (run_bytes > std::min(array_bytes, bitset_bytes))
      optimize();
    return;
  }
  caf::visit(
    [&](auto& x) {
      x.add(offset);
    },
    container_);
}

void container::optimize() {
  auto words = band_bits{};
  load(view(), words);
  *this = make(words);
}

void container::convert(container_kind kind) {
  if (kind == this->kind())
    return;
  auto words = band_bits{};
  load(view(), words);
  switch (kind) {
    case container_kind::array:
      container_ = make_array(words, popcount(words));
      break;
    case container_kind::bitset:
      container_ = bitset_container{words};
      break;
    case container_kind::run:
      container_ = make_run(words);
      break;
  }
}

container::variant& container::get_data() noexcept {
  return container_;
}

const container::variant& container::get_data() const noexcept {
  return container_;
}

bool operator==(const container& x, const container& y) noexcept {
  if (x.cardinality() != y.cardinality())
    return false;
  auto lhs = band_bits{};
  auto rhs = band_bits{};
  load(x.view(), lhs);
  load(y.view(), rhs);
  return lhs == rhs;
}

container operator&(const container& x, const container& y) {
  return intersect(x.view(), y.view());
}

container operator|(const container& x, const container& y) {
  return unite(x.view(), y.view());
}

container operator-(const container& x, const container& y) {
  return difference(x.view(), y.view());
}

container intersect(const container_view& x, const container_view& y) {
  const auto* lhs = caf::get_if<array_view>(&x);
  const auto* rhs = caf::get_if<array_view>(&y);
  if (lhs && rhs) {
    auto result = std::vector<offset_type>{};
    std::set_intersection(lhs->offsets().begin(), lhs->offsets().end(),
                          rhs->offsets().begin(), rhs->offsets().end(),
                          std::back_inserter(result));
    return container::make(std::move(result));
  }
  // Lookups from the array side keep the result no larger than the array.
  if (lhs || rhs) {
    const auto& array = lhs ? *lhs : *rhs;
    const auto& other = lhs ? y : x;
    auto result = std::vector<offset_type>{};
    for (auto offset : array.offsets())
      if (contains(other, offset))
        result.push_back(offset);
    return container::make(std::move(result));
  }
  auto words = band_bits{};
  load(x, words);
  and_into(y, words);
  return container::make(words);
}

container unite(const container_view& x, const container_view& y) {
  const auto* lhs = caf::get_if<array_view>(&x);
  const auto* rhs = caf::get_if<array_view>(&y);
  if (lhs && rhs) {
    auto result = std::vector<offset_type>{};
    std::set_union(lhs->offsets().begin(), lhs->offsets().end(),
                   rhs->offsets().begin(), rhs->offsets().end(),
                   std::back_inserter(result));
    return container::make(std::move(result));
  }
  auto words = band_bits{};
  load(x, words);
  or_into(y, words);
  return container::make(words);
}

container difference(const container_view& x, const container_view& y) {
  if (const auto* lhs = caf::get_if<array_view>(&x)) {
    auto result = std::vector<offset_type>{};
    if (const auto* rhs = caf::get_if<array_view>(&y)) {
      std::set_difference(lhs->offsets().begin(), lhs->offsets().end(),
                          rhs->offsets().begin(), rhs->offsets().end(),
                          std::back_inserter(result));
    } else {
      for (auto offset : lhs->offsets())
        if (!contains(y, offset))
          result.push_back(offset);
    }
    return container::make(std::move(result));
  }
  auto words = band_bits{};
  load(x, words);
  and_not_into(y, words);
  return container::make(words);
}

container flip(const container_view& x, uint32_t n) {
  RANGEBITS_ASSERT(n <= limits::band_size);
  if (n == 0)
    return container{};
  auto words = band_bits{};
  set_range(words, 0, n - 1);
  and_not_into(x, words);
  return container::make(words);
}

std::string to_string(const container& x) {
  auto result = std::string{"{"};
  auto first = true;
  for_each(x.view(), [&](offset_type offset) {
    if (!first)
      result += ", ";
    first = false;
    result += std::to_string(offset);
  });
  result += '}';
  return result;
}

// -- persistence --------------------------------------------------------------

flatbuffers::Offset<fbs::Plane>
pack(flatbuffers::FlatBufferBuilder& builder, const container& x) {
  auto f = detail::overload{
    [&](const array_container& array) {
      const auto& offsets = array.offsets();
      const auto offsets_offset = builder.CreateVector(offsets);
      const auto array_offset
        = fbs::container::CreateArray(builder, offsets_offset);
      return fbs::CreatePlane(builder, fbs::container::Container::array,
                              array_offset.Union());
    },
    [&](const bitset_container& bitset) {
      const auto view = bitset.view();
      const auto words_offset
        = builder.CreateVector(view.words().data(), view.words().size());
      const auto bitset_offset = fbs::container::CreateBitset(
        builder, view.cardinality(), words_offset);
      return fbs::CreatePlane(builder, fbs::container::Container::bitset,
                              bitset_offset.Union());
    },
    [&](const run_container& run) {
      const auto runs = run.view().runs();
      const auto runs_offset = builder.CreateVector(runs.data(), runs.size());
      const auto run_offset = fbs::container::CreateRun(builder, runs_offset);
      return fbs::CreatePlane(builder, fbs::container::Container::run,
                              run_offset.Union());
    },
  };
  return caf::visit(f, x.get_data());
}

caf::error validate(const fbs::Plane& plane, uint32_t rows) {
  switch (plane.data_type()) {
    case fbs::container::Container::NONE:
      return caf::make_error(ec::corrupt_layout, "plane without a container");
    case fbs::container::Container::array: {
      const auto* array = plane.data_as_array();
      if (!array || !array->offsets() || array->offsets()->size() == 0)
        return caf::make_error(ec::corrupt_layout, "empty array container");
      const auto* offsets = array->offsets();
      if (offsets->size() > rows || offsets->Get(offsets->size() - 1) >= rows)
        return caf::make_error(
          ec::corrupt_layout,
          fmt::format("array container exceeds a band of {} rows", rows));
      return caf::none;
    }
    case fbs::container::Container::bitset: {
      const auto* bitset = plane.data_as_bitset();
      if (!bitset || !bitset->words()
          || bitset->words()->size() != words_per_band)
        return caf::make_error(ec::corrupt_layout,
                               "bitset container with a wrong word count");
      if (bitset->cardinality() == 0 || bitset->cardinality() > rows)
        return caf::make_error(
          ec::corrupt_layout,
          fmt::format("bitset cardinality {} is invalid for {} rows",
                      bitset->cardinality(), rows));
      return caf::none;
    }
    case fbs::container::Container::run: {
      const auto* run = plane.data_as_run();
      if (!run || !run->runs() || run->runs()->size() == 0
          || run->runs()->size() % 2 != 0)
        return caf::make_error(ec::corrupt_layout,
                               "run container with an odd number of values");
      // Runs must be ordered, disjoint and non-adjacent, and end in the band.
      const auto* runs = run->runs();
      auto next = uint32_t{0};
      for (flatbuffers::uoffset_t i = 0; i < runs->size(); i += 2) {
        const auto start = uint32_t{runs->Get(i)};
        const auto last = start + runs->Get(i + 1);
        if (start < next)
          return caf::make_error(
            ec::corrupt_layout,
            fmt::format("run {} at offset {} touches its predecessor", i / 2,
                        start));
        if (last >= rows)
          return caf::make_error(
            ec::corrupt_layout,
            fmt::format("run container exceeds a band of {} rows", rows));
        next = last + 2;
      }
      return caf::none;
    }
  }
  return caf::make_error(ec::corrupt_layout,
                         fmt::format("unknown container type {}",
                                     static_cast<int>(plane.data_type())));
}

container_view unpack(const fbs::Plane& plane) noexcept {
  switch (plane.data_type()) {
    case fbs::container::Container::array: {
      const auto* offsets = plane.data_as_array()->offsets();
      return array_view{{offsets->data(), offsets->size()}};
    }
    case fbs::container::Container::bitset: {
      const auto* bitset = plane.data_as_bitset();
      const auto* words = bitset->words();
      return bitset_view{{words->data(), words->size()},
                         bitset->cardinality()};
    }
    case fbs::container::Container::run: {
      const auto* runs = plane.data_as_run()->runs();
      return run_view{{runs->data(), runs->size()}};
    }
    case fbs::container::Container::NONE:
      break;
  }
  RANGEBITS_PANIC("unpacking an unvalidated plane");
}

} // namespace rangebits
