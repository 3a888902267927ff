#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vagus::schema {

using bytes_t = std::vector<uint8_t>;
using bytes_view_t = std::span<const uint8_t>;
using hash32_t = std::array<uint8_t, 32>;
using address_t = std::array<uint8_t, 20>;
using executor_id_t = uint64_t;
using nonce_t = uint64_t;
using timestamp_seconds_t = uint64_t;
using duration_seconds_t = uint64_t;

bytes_t make_bytes(const bytes_view_t& bytes);
bytes_t make_bytes(const std::string& bytes);
bytes_t make_bytes(const std::string_view& bytes);

bytes_view_t make_bytes_view(const bytes_t& bytes);
bytes_view_t make_bytes_view(const std::string& bytes);
bytes_view_t make_bytes_view(const std::string_view& bytes);

std::string make_string(const bytes_view_t& bytes);

// Hex helpers accept an optional 0x/0X prefix and either letter case.
// The throwing variants raise encoding_error on malformed or mis-sized
// input.
hash32_t make_hash32(const bytes_t& bytes);
hash32_t make_hash32(const std::string_view& hex);
std::optional<hash32_t> try_make_hash32(const std::string_view& hex);
hash32_t make_zero_hash();

address_t make_address(const std::string_view& hex);
std::optional<address_t> try_make_address(const std::string_view& hex);
address_t make_zero_address();

std::string to_hex(const bytes_view_t& bytes);
std::string to_prefixed_hex(const bytes_view_t& bytes);
std::optional<bytes_t> try_from_hex(const std::string_view hex);
bytes_t from_hex(const std::string_view hex);

/// Number text used in messages and parameter payloads: shortest
/// round-trip form, with ".0" appended to integral values.
std::string format_number(double value);

}  // namespace vagus::schema

template <class... Ts>
struct overloaded : Ts... {
  using Ts::operator()...;
};
template <class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
