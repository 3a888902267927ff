#pragma once
#include <vagus/schema/primitives.hpp>
#include <span>
#include <string_view>

namespace vagus::crypto {

/// FIPS 180-4 SHA-256.
vagus::schema::hash32_t sha256(const std::string_view& str);
vagus::schema::hash32_t sha256(const std::span<const uint8_t>& bytes);

/// FIPS 202 SHA3-256 (0x06 domain padding).
vagus::schema::hash32_t sha3_256(const std::string_view& str);
vagus::schema::hash32_t sha3_256(const std::span<const uint8_t>& bytes);

/// Original Keccak-256 (0x01 padding) as used by the EVM.
vagus::schema::hash32_t keccak256(const std::string_view& str);
vagus::schema::hash32_t keccak256(const std::span<const uint8_t>& bytes);

}  // namespace vagus::crypto
