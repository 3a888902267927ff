#pragma once
#include <vagus/schema/primitives.hpp>
#include <vagus/schema/value.hpp>

#include <cstddef>

// Canonical CBOR (RFC 8949 section 4.2, length-first map ordering):
// shortest heads, definite lengths only, map keys sorted by encoded length
// and then bytewise, floats in the narrowest IEEE-754 width that round
// trips. Null entries are encoded as given.
namespace vagus::schema::encoding::cbor {

inline constexpr auto kMaxNestingDepth = std::size_t{128};

void write(const value_t& v, bytes_t& out);
bytes_t write(const value_t& v);

/// Strict reader: rejects anything write() would not have produced.
value_t read(const bytes_view_t& bytes);

/// Copy of a map with its null-valued entries removed. Non-map values are
/// returned unchanged.
value_t strip_nulls(const value_t& v);

}  // namespace vagus::schema::encoding::cbor
