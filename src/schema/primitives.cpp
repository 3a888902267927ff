#include <spdlog/fmt/fmt.h>
#include <vagus/schema/encoding/encoder.hpp>
#include <vagus/schema/primitives.hpp>

#include <algorithm>
#include <iterator>
#include <string_view>

namespace vagus::schema {

namespace {

std::string_view normalize_hex(std::string_view input) {
  if (input.size() >= 2 && input[0] == '0' &&
      (input[1] == 'x' || input[1] == 'X')) {
    input.remove_prefix(2);
  }
  return input;
}

std::optional<uint8_t> hex_nibble(const char c) {
  if (c >= '0' && c <= '9') {
    return static_cast<uint8_t>(c - '0');
  }
  if (c >= 'a' && c <= 'f') {
    return static_cast<uint8_t>(c - 'a' + 10);
  }
  if (c >= 'A' && c <= 'F') {
    return static_cast<uint8_t>(c - 'A' + 10);
  }
  return std::nullopt;
}

std::optional<bytes_t> try_from_hex_internal(std::string_view hex) {
  hex = normalize_hex(hex);
  if ((hex.size() % 2) != 0) {
    return std::nullopt;
  }

  auto decoded = bytes_t{};
  decoded.reserve(hex.size() / 2);
  for (size_t i = 0; i < hex.size(); i += 2) {
    auto high = hex_nibble(hex[i]);
    auto low = hex_nibble(hex[i + 1]);
    if (!high || !low) {
      return std::nullopt;
    }
    decoded.push_back(static_cast<uint8_t>((*high << 4u) | *low));
  }
  return decoded;
}

template <std::size_t N>
std::optional<std::array<uint8_t, N>> try_make_fixed(std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded || decoded->size() != N) {
    return std::nullopt;
  }
  auto out = std::array<uint8_t, N>{};
  std::copy(decoded->begin(), decoded->end(), out.begin());
  return out;
}

}  // namespace

bytes_t make_bytes(const bytes_view_t& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_t make_bytes(const std::string_view& bytes) {
  return bytes_t{std::begin(bytes), std::end(bytes)};
}

bytes_view_t make_bytes_view(const bytes_t& bytes) {
  return bytes_view_t{bytes};
}

bytes_view_t make_bytes_view(const std::string& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

bytes_view_t make_bytes_view(const std::string_view& bytes) {
  return bytes_view_t{reinterpret_cast<const uint8_t*>(bytes.data()),
                      bytes.size()};
}

std::string make_string(const bytes_view_t& bytes) {
  return std::string{reinterpret_cast<const char*>(bytes.data()), bytes.size()};
}

hash32_t make_hash32(const bytes_t& bytes) {
  if (bytes.size() != 32) {
    throw encoding::encoding_error{
        fmt::format("expected 32 bytes, got {}", bytes.size())};
  }
  auto hash = hash32_t{};
  std::copy(std::begin(bytes), std::end(bytes), std::begin(hash));
  return hash;
}

hash32_t make_hash32(const std::string_view& hex) {
  auto hash = try_make_hash32(hex);
  if (!hash) {
    throw encoding::encoding_error{
        fmt::format("'{}' is not a 32-byte hex string", hex)};
  }
  return *hash;
}

std::optional<hash32_t> try_make_hash32(const std::string_view& hex) {
  return try_make_fixed<32>(hex);
}

hash32_t make_zero_hash() {
  return {};
}

address_t make_address(const std::string_view& hex) {
  auto address = try_make_address(hex);
  if (!address) {
    throw encoding::encoding_error{
        fmt::format("'{}' is not a 20-byte address", hex)};
  }
  return *address;
}

std::optional<address_t> try_make_address(const std::string_view& hex) {
  return try_make_fixed<20>(hex);
}

address_t make_zero_address() {
  return {};
}

std::string to_hex(const bytes_view_t& bytes) {
  static constexpr auto kHex = std::string_view{"0123456789abcdef"};
  auto out = std::string{};
  out.resize(bytes.size() * 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    out[(2 * i)] = kHex[(bytes[i] >> 4u) & 0x0Fu];
    out[(2 * i) + 1] = kHex[bytes[i] & 0x0Fu];
  }
  return out;
}

std::string to_prefixed_hex(const bytes_view_t& bytes) {
  return "0x" + to_hex(bytes);
}

std::optional<bytes_t> try_from_hex(const std::string_view hex) {
  return try_from_hex_internal(hex);
}

bytes_t from_hex(const std::string_view hex) {
  auto decoded = try_from_hex_internal(hex);
  if (!decoded.has_value()) {
    throw encoding::encoding_error{fmt::format("invalid hex input '{}'", hex)};
  }
  return *decoded;
}

std::string format_number(const double value) {
  auto out = fmt::format("{}", value);
  auto integral = std::ranges::all_of(
      out, [](const char ch) { return ch == '-' || (ch >= '0' && ch <= '9'); });
  if (integral) {
    out += ".0";
  }
  return out;
}

}  // namespace vagus::schema
