#pragma once
#include <vagus/crypto/hash.hpp>
#include <vagus/schema/encoding/cbor/codec.hpp>
#include <vagus/schema/encoding/cbor/intent.hpp>
#include <vagus/schema/encoding/encoder.hpp>
#include <vagus/schema/value.hpp>
#include <iterator>

namespace vagus::schema::encoding {

namespace cbor {

inline const value_t& to_value(const value_t& v) {
  return v;
}

inline void from_value(const value_t& v, value_t& o) {
  o = v;
}

}  // namespace cbor

struct cbor_encoder_tag {};

/// Canonical bytes of one value together with the two content hashes taken
/// over exactly those bytes.
struct cbor_digest final {
  vagus::schema::bytes_t encoded;
  vagus::schema::hash32_t sha256{};
  vagus::schema::hash32_t sha3_256{};
};

using cbor_digest_t = cbor_digest;

template <>
struct encoder<cbor_encoder_tag> final {
  template <typename T>
  vagus::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vagus::schema::bytes_t& out);

  template <typename T>
  T decode(const vagus::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vagus::schema::bytes_view_t& bytes);

  template <typename T>
  cbor_digest_t digest(const T& obj);
};

template <typename T>
vagus::schema::bytes_t encoder<cbor_encoder_tag>::encode(const T& obj) {
  return cbor::write(cbor::to_value(obj));
}

template <typename T>
void encoder<cbor_encoder_tag>::encode(const T& obj,
                                       vagus::schema::bytes_t& out) {
  auto encoded = encode(obj);
  out.insert(std::end(out), std::begin(encoded), std::end(encoded));
}

template <typename T>
T encoder<cbor_encoder_tag>::decode(const vagus::schema::bytes_view_t& bytes) {
  auto decoded = T{};
  cbor::from_value(cbor::read(bytes), decoded);
  return decoded;
}

template <typename T>
std::optional<T> encoder<cbor_encoder_tag>::try_decode(
    const vagus::schema::bytes_view_t& bytes) {
  try {
    return decode<T>(bytes);
  } catch (const encoding_error&) {
    return std::nullopt;
  }
}

template <typename T>
cbor_digest_t encoder<cbor_encoder_tag>::digest(const T& obj) {
  auto result = cbor_digest_t{};
  result.encoded = encode(obj);
  result.sha256 = vagus::crypto::sha256(
      vagus::schema::make_bytes_view(result.encoded));
  result.sha3_256 = vagus::crypto::sha3_256(
      vagus::schema::make_bytes_view(result.encoded));
  return result;
}

}  // namespace vagus::schema::encoding
