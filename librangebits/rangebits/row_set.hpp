// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/container.hpp"

#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <vector>

namespace rangebits {

/// A sparse set of row ids, grouped into bands of 65536 rows. Query results
/// and query contexts are row sets. Row ids are at most `max_id`.
class row_set {
public:
  /// The rows of one band.
  struct entry {
    uint32_t band;
    container bits;

    friend bool operator==(const entry&, const entry&) = default;
  };

  row_set() = default;

  row_set(std::initializer_list<id> ids);

  /// Constructs the set `[first, last)`.
  /// @pre `last <= max_id + 1`
  static row_set make_range(id first, id last);

  // -- modifiers ------------------------------------------------------------

  /// @pre `x <= max_id`
  void add(id x);

  /// Appends the rows of a band. Empty containers are dropped.
  /// @pre *band* is larger than all bands in the set.
  void append(uint32_t band, container bits);

  /// Appends all bands of *other*.
  /// @pre all bands of *other* are larger than all bands in the set.
  void concat(row_set&& other);

  // -- inspectors -----------------------------------------------------------

  [[nodiscard]] bool empty() const noexcept;

  [[nodiscard]] uint64_t cardinality() const noexcept;

  [[nodiscard]] bool contains(id x) const noexcept;

  /// Counts the rows in `[0, x]`. Ids past `max_id` count all rows.
  [[nodiscard]] uint64_t rank(id x) const noexcept;

  /// Locates the *k*-th smallest row, counting from 0.
  [[nodiscard]] std::optional<id> select(uint64_t k) const noexcept;

  /// @returns the rows of *band*, or `nullptr` if the band has none.
  [[nodiscard]] const container* find(uint32_t band) const noexcept;

  /// @returns all rows in ascending order.
  [[nodiscard]] std::vector<id> rows() const;

  [[nodiscard]] const std::vector<entry>& entries() const noexcept;

  [[nodiscard]] size_t memusage() const noexcept;

  /// Invokes *f* for every row in ascending order.
  template <class F>
  void for_each(F f) const {
    for (const auto& [band, bits] : entries_) {
      const auto base = id{band} * defaults::layout::band_size;
      rangebits::for_each(bits.view(), [&](offset_type offset) {
        f(base + offset);
      });
    }
  }

  // -- operators ------------------------------------------------------------

  friend row_set operator&(const row_set& x, const row_set& y);
  friend row_set operator|(const row_set& x, const row_set& y);
  friend row_set operator-(const row_set& x, const row_set& y);
  friend bool operator==(const row_set& x, const row_set& y) = default;

private:
  std::vector<entry> entries_ = {};
};

/// Computes the rows in `[0, size)` not in *x*.
/// @pre `size <= max_id + 1`
/// @relates row_set
row_set flip(const row_set& x, id size);

/// @relates row_set
std::string to_string(const row_set& x);

} // namespace rangebits

template <>
struct fmt::formatter<rangebits::row_set> : fmt::formatter<std::string> {
  template <class FormatContext>
  auto format(const rangebits::row_set& x, FormatContext& ctx) const {
    return fmt::formatter<std::string>::format(to_string(x), ctx);
  }
};
