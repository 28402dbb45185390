// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/fwd.hpp"

#include "rangebits/chunk.hpp"
#include "rangebits/detail/assert.hpp"
#include "rangebits/error.hpp"

#include <caf/expected.hpp>
#include <flatbuffers/flatbuffers.h>
#include <fmt/format.h>

#include <cstdint>
#include <utility>

namespace rangebits {

/// A verified FlatBuffers root table that keeps the chunk holding it alive.
/// Copies share the chunk.
/// @tparam Table The generated FlatBuffers table type.
template <class Table>
class flatbuffer final {
public:
  /// Verifies that *chunk* holds a buffer with a *Table* at its root.
  /// @param identifier The file identifier the buffer must carry, if any.
  [[nodiscard]] static caf::expected<flatbuffer>
  make(chunk_ptr chunk, const char* identifier = nullptr) {
    if (!chunk)
      return caf::make_error(ec::invalid_argument,
                             fmt::format("failed to read {} from a nullptr",
                                         Table::GetFullyQualifiedName()));
    if (chunk->size() == 0 || chunk->size() >= FLATBUFFERS_MAX_BUFFER_SIZE)
      return caf::make_error(ec::format_error,
                             fmt::format("failed to read {} from {} bytes",
                                         Table::GetFullyQualifiedName(),
                                         chunk->size()));
    const auto* data = reinterpret_cast<const uint8_t*>(chunk->data());
    if (identifier
        && (chunk->size() < flatbuffers::kFileIdentifierLength
                              + sizeof(flatbuffers::uoffset_t)
            || !flatbuffers::BufferHasIdentifier(data, identifier)))
      return caf::make_error(ec::format_error,
                             fmt::format("buffer lacks the {} identifier '{}'",
                                         Table::GetFullyQualifiedName(),
                                         identifier));
    auto verifier = flatbuffers::Verifier{data, chunk->size()};
    if (!verifier.template VerifyBuffer<Table>(identifier))
      return caf::make_error(ec::format_error,
                             fmt::format("failed to verify {}",
                                         Table::GetFullyQualifiedName()));
    return flatbuffer{std::move(chunk)};
  }

  flatbuffer() noexcept = default;

  /// Finishes *builder* with *root* and takes over its buffer.
  flatbuffer(flatbuffers::FlatBufferBuilder& builder,
             flatbuffers::Offset<Table> root, const char* identifier)
    : flatbuffer{finish(builder, root, identifier)} {
    // nop
  }

  flatbuffer(const flatbuffer&) noexcept = default;
  flatbuffer& operator=(const flatbuffer&) noexcept = default;

  flatbuffer(flatbuffer&& other) noexcept
    : chunk_{std::exchange(other.chunk_, {})},
      table_{std::exchange(other.table_, {})} {
    // nop
  }

  flatbuffer& operator=(flatbuffer&& rhs) noexcept {
    chunk_ = std::exchange(rhs.chunk_, {});
    table_ = std::exchange(rhs.table_, {});
    return *this;
  }

  ~flatbuffer() noexcept = default;

  explicit operator bool() const noexcept {
    return table_ != nullptr;
  }

  const Table& operator*() const noexcept {
    RANGEBITS_ASSERT(table_);
    return *table_;
  }

  const Table* operator->() const noexcept {
    RANGEBITS_ASSERT(table_);
    return table_;
  }

  /// Accesses the chunk that holds the table.
  [[nodiscard]] const chunk_ptr& chunk() const noexcept {
    return chunk_;
  }

private:
  static chunk_ptr finish(flatbuffers::FlatBufferBuilder& builder,
                          flatbuffers::Offset<Table> root,
                          const char* identifier) {
    builder.Finish(root, identifier);
    auto result = rangebits::chunk::make(builder.Release());
    RANGEBITS_ASSERT(result);
    return result;
  }

  explicit flatbuffer(chunk_ptr chunk) noexcept
    : chunk_{std::move(chunk)},
      table_{flatbuffers::GetRoot<Table>(chunk_->data())} {
    // nop
  }

  chunk_ptr chunk_ = {};
  const Table* table_ = {};
};

} // namespace rangebits
