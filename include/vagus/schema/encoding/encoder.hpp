#pragma once
#include <vagus/schema/primitives.hpp>
#include <optional>
#include <span>
#include <stdexcept>

namespace vagus::schema::encoding {

/// Raised for input that has no canonical form, or for bytes that are not
/// the canonical encoding of any value.
class encoding_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Library selection is a build time setting: each wire format provides a
// tag and a specialization of this template. Hot swapping is not a goal.
template <typename Library>
struct encoder {
  template <typename T>
  vagus::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, vagus::schema::bytes_t& out);

  template <typename T>
  T decode(const vagus::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const vagus::schema::bytes_view_t& bytes);
};

}  // namespace vagus::schema::encoding
