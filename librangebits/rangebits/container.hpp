// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/defaults.hpp"
#include "rangebits/detail/overload.hpp"
#include "rangebits/word.hpp"

#include <caf/default_sum_type_access.hpp>
#include <caf/detail/type_list.hpp>
#include <caf/error.hpp>
#include <caf/sum_type.hpp>
#include <caf/variant.hpp>
#include <flatbuffers/flatbuffers.h>
#include <fmt/format.h>

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <type_traits>
#include <vector>

namespace rangebits {

/// The physical representation of a set of offsets within one band.
enum class container_kind : uint8_t {
  array,
  bitset,
  run,
};

/// @relates container_kind
const char* to_string(container_kind kind) noexcept;

/// The word type of uncompressed bit vectors.
using band_word = word<uint64_t>;

/// An uncompressed band with one bit per row, used as the working buffer of
/// all set algebra.
using band_bits
  = std::array<uint64_t, defaults::layout::band_size / band_word::width>;

/// The number of words in a band.
inline constexpr size_t words_per_band = std::tuple_size_v<band_bits>;

// -- views --------------------------------------------------------------------

/// A sorted sequence of distinct offsets.
class array_view {
public:
  array_view() noexcept = default;

  explicit array_view(std::span<const offset_type> offsets) noexcept
    : offsets_{offsets} {
    // nop
  }

  [[nodiscard]] std::span<const offset_type> offsets() const noexcept {
    return offsets_;
  }

private:
  std::span<const offset_type> offsets_ = {};
};

/// A 65536-bit vector with a cached population count.
class bitset_view {
public:
  bitset_view() noexcept = default;

  bitset_view(std::span<const uint64_t> words, uint32_t cardinality) noexcept
    : words_{words}, cardinality_{cardinality} {
    // nop
  }

  /// @pre `words().size() == words_per_band` for non-default views.
  [[nodiscard]] std::span<const uint64_t> words() const noexcept {
    return words_;
  }

  [[nodiscard]] uint32_t cardinality() const noexcept {
    return cardinality_;
  }

private:
  std::span<const uint64_t> words_ = {};
  uint32_t cardinality_ = 0;
};

/// Sorted, disjoint runs. Each run is a pair of *start* and *length*, and
/// covers the offsets `[start, start + length]`.
class run_view {
public:
  run_view() noexcept = default;

  explicit run_view(std::span<const offset_type> runs) noexcept
    : runs_{runs} {
    // nop
  }

  /// @returns the number of runs.
  [[nodiscard]] size_t size() const noexcept {
    return runs_.size() / 2;
  }

  [[nodiscard]] offset_type start(size_t i) const noexcept {
    return runs_[2 * i];
  }

  [[nodiscard]] offset_type length(size_t i) const noexcept {
    return runs_[2 * i + 1];
  }

  /// @returns the last offset in the *i*-th run.
  [[nodiscard]] uint32_t last(size_t i) const noexcept {
    return uint32_t{start(i)} + length(i);
  }

  [[nodiscard]] std::span<const offset_type> runs() const noexcept {
    return runs_;
  }

private:
  std::span<const offset_type> runs_ = {};
};

/// A non-owning view of any container representation. Views into a mapped
/// bitmap stay valid for as long as the mapping lives.
using container_view = caf::variant<array_view, bitset_view, run_view>;

/// @relates container_view
container_kind kind(const container_view& x) noexcept;

/// @relates container_view
uint32_t cardinality(const container_view& x) noexcept;

/// @relates container_view
bool contains(const container_view& x, offset_type offset) noexcept;

/// Counts the offsets in `[0, offset]`.
/// @relates container_view
uint32_t rank(const container_view& x, offset_type offset) noexcept;

/// Locates the *k*-th smallest offset, counting from 0.
/// @relates container_view
std::optional<offset_type> select(const container_view& x, uint32_t k) noexcept;

/// @returns the size of the payload of *x* in bytes.
/// @relates container_view
size_t size_in_bytes(const container_view& x) noexcept;

/// Overwrites *out* with the contents of *x*.
/// @relates container_view
void load(const container_view& x, band_bits& out) noexcept;

/// Computes `out |= x`.
/// @relates container_view
void or_into(const container_view& x, band_bits& out) noexcept;

/// Computes `out &= x`.
/// @relates container_view
void and_into(const container_view& x, band_bits& out) noexcept;

/// Computes `out &= ~x`.
/// @relates container_view
void and_not_into(const container_view& x, band_bits& out) noexcept;

/// Checks whether *x* and *bits* share at least one offset.
/// @relates container_view
bool intersects(const container_view& x, const band_bits& bits) noexcept;

/// Invokes *f* for every offset in ascending order.
/// @relates container_view
template <class F>
void for_each(const container_view& x, F f) {
  auto visitor = detail::overload{
    [&](const array_view& view) {
      for (auto offset : view.offsets())
        f(offset);
    },
    [&](const bitset_view& view) {
      const auto words = view.words();
      for (size_t i = 0; i < words.size(); ++i) {
        for (auto w = words[i]; w != 0; w &= w - 1) {
          const auto bit = band_word::count_trailing_zeros(w);
          f(static_cast<offset_type>(i * band_word::width + bit));
        }
      }
    },
    [&](const run_view& view) {
      for (size_t i = 0; i < view.size(); ++i)
        for (uint32_t offset = view.start(i); offset <= view.last(i); ++offset)
          f(static_cast<offset_type>(offset));
    },
  };
  caf::visit(visitor, x);
}

// -- owning containers --------------------------------------------------------

class array_container {
public:
  array_container() = default;

  /// @pre *offsets* is sorted and free of duplicates.
  explicit array_container(std::vector<offset_type> offsets);

  [[nodiscard]] array_view view() const noexcept;

  void add(offset_type offset);

  [[nodiscard]] const std::vector<offset_type>& offsets() const noexcept;

  friend bool operator==(const array_container&, const array_container&)
    = default;

private:
  std::vector<offset_type> offsets_ = {};
};

class bitset_container {
public:
  bitset_container();

  explicit bitset_container(const band_bits& words);

  [[nodiscard]] bitset_view view() const noexcept;

  void add(offset_type offset);

  friend bool operator==(const bitset_container&, const bitset_container&)
    = default;

private:
  std::vector<uint64_t> words_;
  uint32_t cardinality_ = 0;
};

class run_container {
public:
  run_container() = default;

  /// @pre *runs* holds sorted, disjoint and non-adjacent pairs of start and
  /// length.
  explicit run_container(std::vector<offset_type> runs);

  [[nodiscard]] run_view view() const noexcept;

  void add(offset_type offset);

  /// Appends the run `[start, last]`.
  /// @pre *start* lies behind the end of the last run.
  void append(offset_type start, offset_type last);

  friend bool operator==(const run_container&, const run_container&)
    = default;

private:
  std::vector<offset_type> runs_ = {};
};

// -- type-erased container ----------------------------------------------------

/// A set of offsets within one band, stored in one of three representations.
class container {
public:
  using types
    = caf::detail::type_list<array_container, bitset_container, run_container>;

  using variant = caf::detail::tl_apply_t<types, caf::variant>;

  /// Constructs an empty container.
  container() = default;

  /// Constructs a container from a concrete representation.
  template <class Container>
    requires(caf::detail::tl_contains<types, std::decay_t<Container>>::value)
  container(Container&& x) : container_(std::forward<Container>(x)) {
    // nop
  }

  /// Constructs a container from sorted, distinct offsets and chooses the
  /// smallest representation.
  static container make(std::vector<offset_type> offsets);

  /// Constructs a container from an uncompressed band and chooses the
  /// smallest representation.
  static container make(const band_bits& words);

  /// Copies a view into an owning container of the same kind.
  static container make(const container_view& view);

  /// Constructs the container holding `[first, first + count)`.
  /// @pre `first + count <= band_size`
  static container make_range(offset_type first, uint32_t count);

  // -- inspectors -----------------------------------------------------------

  [[nodiscard]] container_kind kind() const noexcept;

  [[nodiscard]] container_view view() const noexcept;

  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] uint32_t cardinality() const noexcept;

  [[nodiscard]] bool contains(offset_type offset) const noexcept;

  [[nodiscard]] uint32_t rank(offset_type offset) const noexcept;

  [[nodiscard]] std::optional<offset_type> select(uint32_t k) const noexcept;

  [[nodiscard]] size_t size_in_bytes() const noexcept;

  /// @returns all offsets in ascending order.
  [[nodiscard]] std::vector<offset_type> offsets() const;

  // -- modifiers ------------------------------------------------------------

  /// Inserts an offset. An array turns into a bitset when it outgrows
  /// `defaults::layout::array_cardinality_limit`, and a run container
  /// turns into the smaller of both once its runs take more space.
  void add(offset_type offset);

  /// Switches to the smallest representation for the current contents.
  void optimize();

  /// Switches to the given representation.
  void convert(container_kind kind);

  // -- concepts -------------------------------------------------------------

  variant& get_data() noexcept;
  [[nodiscard]] const variant& get_data() const noexcept;

  /// Compares the contained offsets, regardless of representation.
  friend bool operator==(const container& x, const container& y) noexcept;

  template <class F>
  friend void for_each(const container& x, F f) {
    for_each(x.view(), std::move(f));
  }

private:
  variant container_ = {};
};

/// @relates container
container operator&(const container& x, const container& y);

/// @relates container
container operator|(const container& x, const container& y);

/// @relates container
container operator-(const container& x, const container& y);

/// @relates container_view
container intersect(const container_view& x, const container_view& y);

/// @relates container_view
container unite(const container_view& x, const container_view& y);

/// @relates container_view
container difference(const container_view& x, const container_view& y);

/// Computes the offsets in `[0, n)` not in *x*.
/// @relates container
container flip(const container_view& x, uint32_t n);

/// @relates container
std::string to_string(const container& x);

// -- persistence --------------------------------------------------------------

/// Serializes a container into a plane.
/// @relates container
flatbuffers::Offset<fbs::Plane>
pack(flatbuffers::FlatBufferBuilder& builder, const container& x);

/// Checks that a plane describes a well-formed container for a band with
/// *rows* rows.
/// @relates container
caf::error validate(const fbs::Plane& plane, uint32_t rows);

/// Maps a plane without copying.
/// @pre `!validate(plane, rows)`
/// @relates container
container_view unpack(const fbs::Plane& plane) noexcept;

} // namespace rangebits

namespace caf {

template <>
struct sum_type_access<rangebits::container>
  : default_sum_type_access<rangebits::container> {};

} // namespace caf

template <>
struct fmt::formatter<rangebits::container_kind>
  : fmt::formatter<std::string_view> {
  template <class FormatContext>
  auto format(rangebits::container_kind kind, FormatContext& ctx) const {
    return fmt::formatter<std::string_view>::format(to_string(kind), ctx);
  }
};

template <>
struct fmt::formatter<rangebits::container> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const rangebits::container& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
