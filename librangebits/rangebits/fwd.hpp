// SPDX-FileCopyrightText: (c) 2024 The rangebits Contributors
// SPDX-License-Identifier: BSD-3-Clause

#pragma once

#include "rangebits/config.hpp" // IWYU pragma: export

#include <caf/config.hpp>
#include <caf/fwd.hpp>
#include <caf/type_id.hpp>

#include <cstdint>

#define RANGEBITS_ADD_TYPE_ID(type) CAF_ADD_TYPE_ID(rangebits_types, type)

// -- flatbuffers --------------------------------------------------------------

namespace flatbuffers {

class FlatBufferBuilder;

} // namespace flatbuffers

namespace rangebits::fbs {

struct Plane;
struct RangeBitmap;
struct Slice;

} // namespace rangebits::fbs

// -- classes -------------------------------------------------------------------

namespace rangebits {

class array_container;
class array_view;
class bitset_container;
class bitset_view;
class chunk;
class configuration;
class container;
class range_bitmap;
class range_bitmap_builder;
class range_encoder;
class row_set;
class run_container;
class run_view;
class slice_builder;
class slice_view;

struct domain;
struct evaluation_statistics;
struct predicate;
struct query_options;

enum class container_kind : uint8_t;
enum class ec : uint8_t;
enum class relational_operator : uint8_t;

template <class Table>
class flatbuffer;

/// A pointer to a chunk.
using chunk_ptr = caf::intrusive_ptr<chunk>;

/// Identifies a row.
using id = uint64_t;

/// The largest row id. Rows group into bands of 2^16 rows, and bands are
/// numbered with 32 bits.
constexpr id max_id = (id{1} << 48) - 1;

/// Identifies a row within a band.
using offset_type = uint16_t;

} // namespace rangebits

// -- type announcements -------------------------------------------------------

constexpr inline caf::type_id_t first_rangebits_type_id = caf::first_custom_type_id;

CAF_BEGIN_TYPE_ID_BLOCK(rangebits_types, first_rangebits_type_id)

  RANGEBITS_ADD_TYPE_ID((rangebits::ec))

CAF_END_TYPE_ID_BLOCK(rangebits_types)

#undef RANGEBITS_ADD_TYPE_ID
