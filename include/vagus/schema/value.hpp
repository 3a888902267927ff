#pragma once
#include <vagus/schema/primitives.hpp>

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

// Structured value understood by the canonical encoder and by the schema
// store. Maps keep their entries as an unordered list of pairs; ordering
// is decided by the encoder, never by insertion.
namespace vagus::schema {

struct value;

using array_t = std::vector<value>;
using map_entry_t = std::pair<value, value>;
using map_t = std::vector<map_entry_t>;

struct value final {
  using storage_t = std::variant<std::nullptr_t,
                                 bool,
                                 uint64_t,
                                 int64_t,
                                 double,
                                 std::string,
                                 bytes_t,
                                 array_t,
                                 map_t>;

  // The constructors put non-negative integers in uint64_t and negative
  // ones in int64_t. A non-negative int64_t set directly still encodes and
  // compares as the same number.
  storage_t data{nullptr};

  value() = default;
  value(std::nullptr_t) {}
  value(const bool v) : data{std::in_place_type<bool>, v} {}
  template <typename T,
            typename = std::enable_if_t<std::is_integral_v<T> &&
                                        !std::is_same_v<T, bool>>>
  value(const T v) {
    if constexpr (std::is_signed_v<T>) {
      if (v < 0) {
        data.emplace<int64_t>(static_cast<int64_t>(v));
        return;
      }
    }
    data.emplace<uint64_t>(static_cast<uint64_t>(v));
  }
  value(const double v) : data{std::in_place_type<double>, v} {}
  value(const char* v) : data{std::in_place_type<std::string>, v} {}
  value(std::string v) : data{std::in_place_type<std::string>, std::move(v)} {}
  value(const std::string_view v)
      : data{std::in_place_type<std::string>, v} {}
  value(bytes_t v) : data{std::in_place_type<bytes_t>, std::move(v)} {}
  value(array_t v) : data{std::in_place_type<array_t>, std::move(v)} {}
  value(map_t v) : data{std::in_place_type<map_t>, std::move(v)} {}

  bool operator==(const value& other) const;
  bool operator!=(const value& other) const;

  template <typename T>
  bool is() const {
    return std::holds_alternative<T>(data);
  }
};

using value_t = value;

value_t make_map(std::initializer_list<map_entry_t> entries);
value_t make_array(std::initializer_list<value_t> items);

const value_t* find(const map_t& map, std::string_view key);
const value_t* find(const value_t& map, std::string_view key);

std::optional<double> as_number(const value_t& v);
std::optional<bool> as_bool(const value_t& v);
const std::string* as_text(const value_t& v);
const array_t* as_array(const value_t& v);
const map_t* as_map(const value_t& v);

}  // namespace vagus::schema
