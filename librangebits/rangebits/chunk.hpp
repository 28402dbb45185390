// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/as_bytes.hpp"
#include "rangebits/detail/function.hpp"

#include <caf/error.hpp>
#include <caf/expected.hpp>
#include <caf/intrusive_ptr.hpp>
#include <caf/ref_counted.hpp>

#include <algorithm>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <type_traits>
#include <utility>

namespace rangebits {

/// An immutable, reference-counted byte range. The deleter releases the
/// underlying memory once the last reference is gone, which lets a chunk own
/// a heap buffer and a file mapping alike.
class chunk final : public caf::ref_counted {
public:
  using view_type = std::span<const std::byte>;
  using deleter_type = detail::unique_function<void() noexcept>;

  chunk(const chunk&) = delete;
  chunk& operator=(const chunk&) = delete;

  ~chunk() noexcept override;

  /// Wraps *size* bytes at *data*, calling *deleter* on destruction.
  static chunk_ptr
  make(const void* data, size_t size, deleter_type&& deleter) noexcept;

  /// Takes ownership of *buffer*.
  template <concepts::byte_container Buffer>
    requires(!std::is_lvalue_reference_v<Buffer>)
  static chunk_ptr make(Buffer&& buffer) {
    // The heap allocation keeps the bytes in place when a small buffer
    // would otherwise move its inline storage.
    auto owned = std::make_unique<Buffer>(std::move(buffer));
    const auto bytes = as_bytes(*owned);
    return make(bytes.data(), bytes.size(),
                [owned = std::move(owned)]() noexcept {
                  static_cast<void>(owned);
                });
  }

  /// Copies *buffer* into a new chunk.
  template <concepts::byte_container Buffer>
  static chunk_ptr copy(const Buffer& buffer) {
    const auto bytes = as_bytes(buffer);
    auto owned = std::make_unique<std::byte[]>(bytes.size());
    std::copy(bytes.begin(), bytes.end(), owned.get());
    const auto* data = owned.get();
    return make(data, bytes.size(), [owned = std::move(owned)]() noexcept {
      static_cast<void>(owned);
    });
  }

  /// Maps the first *size* bytes of a file read-only, or the whole file if
  /// *size* is 0. An empty file yields an empty chunk.
  static caf::expected<chunk_ptr>
  mmap(const std::filesystem::path& filename, size_t size = 0);

  [[nodiscard]] const std::byte* data() const noexcept;

  [[nodiscard]] size_t size() const noexcept;

  [[nodiscard]] view_type view() const noexcept;

  friend view_type as_bytes(const chunk_ptr& x) noexcept;

private:
  chunk(view_type view, deleter_type&& deleter) noexcept;

  const view_type view_;
  deleter_type deleter_;
};

/// Writes the bytes of *x* to *filename*. The file appears under its final
/// name only once it is complete.
caf::error write(const std::filesystem::path& filename, const chunk_ptr& x);

} // namespace rangebits
