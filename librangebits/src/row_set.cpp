// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#include "rangebits/row_set.hpp"

#include "rangebits/detail/assert.hpp"

#include <algorithm>

namespace rangebits {

namespace {

constexpr auto band_size = id{defaults::layout::band_size};

/// @pre `x <= max_id`
uint32_t band_of(id x) noexcept {
  return static_cast<uint32_t>(x / band_size);
}

offset_type offset_of(id x) noexcept {
  return static_cast<offset_type>(x % band_size);
}

auto lower_band(const std::vector<row_set::entry>& entries, uint32_t band) {
  return std::lower_bound(entries.begin(), entries.end(), band,
                          [](const row_set::entry& x, uint32_t band) {
                            return x.band < band;
                          });
}

/// Merges two row sets band by band. *both* combines bands present on both
/// sides; bands present on one side only are kept iff *keep_lhs* or
/// *keep_rhs* is set.
template <class Both>
row_set merge(const row_set& x, const row_set& y, Both both, bool keep_lhs,
              bool keep_rhs) {
  auto result = row_set{};
  auto lhs = x.entries().begin();
  auto rhs = y.entries().begin();
  while (lhs != x.entries().end() || rhs != y.entries().end()) {
    if (rhs == y.entries().end()
        || (lhs != x.entries().end() && lhs->band < rhs->band)) {
      if (keep_lhs)
        result.append(lhs->band, lhs->bits);
      ++lhs;
    } else if (lhs == x.entries().end() || rhs->band < lhs->band) {
      if (keep_rhs)
        result.append(rhs->band, rhs->bits);
      ++rhs;
    } else {
      result.append(lhs->band, both(lhs->bits, rhs->bits));
      ++lhs;
      ++rhs;
    }
  }
  return result;
}

} // namespace

row_set::row_set(std::initializer_list<id> ids) {
  for (auto x : ids)
    add(x);
}

row_set row_set::make_range(id first, id last) {
  RANGEBITS_ASSERT(last <= max_id + 1, "row id out of range");
  auto result = row_set{};
  while (first < last) {
    const auto band = band_of(first);
    const auto band_end = std::min(last, (id{band} + 1) * band_size);
    result.append(band, container::make_range(
                          offset_of(first),
                          static_cast<uint32_t>(band_end - first)));
    first = band_end;
  }
  return result;
}

void row_set::add(id x) {
  RANGEBITS_ASSERT(x <= max_id, "row id out of range");
  const auto band = band_of(x);
  auto i = lower_band(entries_, band);
  if (i == entries_.end() || i->band != band)
    i = entries_.insert(i, entry{band, container{}});
  i->bits.add(offset_of(x));
}

void row_set::append(uint32_t band, container bits) {
  RANGEBITS_ASSERT(entries_.empty() || entries_.back().band < band);
  if (bits.empty())
    return;
  entries_.push_back(entry{band, std::move(bits)});
}

void row_set::concat(row_set&& other) {
  if (entries_.empty()) {
    entries_ = std::move(other.entries_);
    return;
  }
  RANGEBITS_ASSERT(other.entries_.empty()
                   || entries_.back().band < other.entries_.front().band);
  entries_.insert(entries_.end(),
                  std::make_move_iterator(other.entries_.begin()),
                  std::make_move_iterator(other.entries_.end()));
  other.entries_.clear();
}

bool row_set::empty() const noexcept {
  return entries_.empty();
}

uint64_t row_set::cardinality() const noexcept {
  uint64_t result = 0;
  for (const auto& x : entries_)
    result += x.bits.cardinality();
  return result;
}

bool row_set::contains(id x) const noexcept {
  if (x > max_id)
    return false;
  const auto* bits = find(band_of(x));
  return bits && bits->contains(offset_of(x));
}

uint64_t row_set::rank(id x) const noexcept {
  if (x > max_id)
    return cardinality();
  uint64_t result = 0;
  for (const auto& [band, bits] : entries_) {
    if (band > band_of(x))
      break;
    if (band < band_of(x))
      result += bits.cardinality();
    else
      result += bits.rank(offset_of(x));
  }
  return result;
}

std::optional<id> row_set::select(uint64_t k) const noexcept {
  for (const auto& [band, bits] : entries_) {
    const auto n = bits.cardinality();
    if (k < n) {
      if (auto offset = bits.select(static_cast<uint32_t>(k)))
        return id{band} * band_size + *offset;
      return std::nullopt;
    }
    k -= n;
  }
  return std::nullopt;
}

const container* row_set::find(uint32_t band) const noexcept {
  auto i = lower_band(entries_, band);
  if (i == entries_.end() || i->band != band)
    return nullptr;
  return &i->bits;
}

std::vector<id> row_set::rows() const {
  auto result = std::vector<id>{};
  result.reserve(cardinality());
  for_each([&](id x) {
    result.push_back(x);
  });
  return result;
}

const std::vector<row_set::entry>& row_set::entries() const noexcept {
  return entries_;
}

size_t row_set::memusage() const noexcept {
  auto result = sizeof(*this) + entries_.capacity() * sizeof(entry);
  for (const auto& x : entries_)
    result += x.bits.size_in_bytes();
  return result;
}

row_set operator&(const row_set& x, const row_set& y) {
  return merge(
    x, y,
    [](const container& lhs, const container& rhs) {
      return lhs & rhs;
    },
    false, false);
}

row_set operator|(const row_set& x, const row_set& y) {
  return merge(
    x, y,
    [](const container& lhs, const container& rhs) {
      return lhs | rhs;
    },
    true, true);
}

row_set operator-(const row_set& x, const row_set& y) {
  return merge(
    x, y,
    [](const container& lhs, const container& rhs) {
      return lhs - rhs;
    },
    true, false);
}

row_set flip(const row_set& x, id size) {
  return row_set::make_range(0, size) - x;
}

std::string to_string(const row_set& x) {
  auto result = std::string{"{"};
  auto first = true;
  x.for_each([&](id row) {
    if (!first)
      result += ", ";
    first = false;
    result += std::to_string(row);
  });
  result += '}';
  return result;
}

} // namespace rangebits
