#include <vagus/schema/value.hpp>

#include <algorithm>

namespace vagus::schema {

namespace {

// Integers compare by value whichever alternative holds them.
std::optional<bool> compare_integers(const value::storage_t& lhs,
                                     const value::storage_t& rhs) {
  const auto* lhs_signed = std::get_if<int64_t>(&lhs);
  const auto* rhs_unsigned = std::get_if<uint64_t>(&rhs);
  if (lhs_signed == nullptr || rhs_unsigned == nullptr) {
    return std::nullopt;
  }
  return *lhs_signed >= 0 &&
         static_cast<uint64_t>(*lhs_signed) == *rhs_unsigned;
}

}  // namespace

bool value::operator==(const value& other) const {
  if (auto mixed = compare_integers(data, other.data)) {
    return *mixed;
  }
  if (auto mixed = compare_integers(other.data, data)) {
    return *mixed;
  }
  return data == other.data;
}

bool value::operator!=(const value& other) const {
  return !(*this == other);
}

value_t make_map(std::initializer_list<map_entry_t> entries) {
  return value_t{map_t{entries}};
}

value_t make_array(std::initializer_list<value_t> items) {
  return value_t{array_t{items}};
}

const value_t* find(const map_t& map, const std::string_view key) {
  auto it = std::ranges::find_if(map, [&](const map_entry_t& entry) {
    const auto* text = std::get_if<std::string>(&entry.first.data);
    return text != nullptr && *text == key;
  });
  if (it == std::end(map)) {
    return nullptr;
  }
  return &it->second;
}

const value_t* find(const value_t& map, const std::string_view key) {
  const auto* entries = as_map(map);
  if (entries == nullptr) {
    return nullptr;
  }
  return find(*entries, key);
}

std::optional<double> as_number(const value_t& v) {
  return std::visit(
      overloaded{[](const uint64_t n) -> std::optional<double> {
                   return static_cast<double>(n);
                 },
                 [](const int64_t n) -> std::optional<double> {
                   return static_cast<double>(n);
                 },
                 [](const double n) -> std::optional<double> { return n; },
                 [](const auto&) -> std::optional<double> {
                   return std::nullopt;
                 }},
      v.data);
}

std::optional<bool> as_bool(const value_t& v) {
  if (const auto* b = std::get_if<bool>(&v.data)) {
    return *b;
  }
  return std::nullopt;
}

const std::string* as_text(const value_t& v) {
  return std::get_if<std::string>(&v.data);
}

const array_t* as_array(const value_t& v) {
  return std::get_if<array_t>(&v.data);
}

const map_t* as_map(const value_t& v) {
  return std::get_if<map_t>(&v.data);
}

}  // namespace vagus::schema
