#pragma once
#include <vagus/schema/intent.hpp>
#include <vagus/schema/primitives.hpp>
#include <vagus/schema/value.hpp>

#include <cstdint>
#include <string>
#include <string_view>

// Typed structured-data signing digests for intents. All hashing here is
// legacy Keccak-256 and every word is 32 bytes wide, big-endian, except
// addresses which keep their native 20 bytes.
namespace vagus::eip712 {

inline constexpr auto kDomainTypeString = std::string_view{
    "EIP712Domain(string name,string version,uint256 chainId,address "
    "verifyingContract)"};

inline constexpr auto kIntentTypeString = std::string_view{
    "Intent(uint256 executorId,bytes32 actionId,bytes params,bytes32 "
    "envelopeHash,bytes32 preStateRoot,uint256 notBefore,uint256 "
    "notAfter,uint32 maxDurationMs,uint32 maxEnergyJ,address planner,uint256 "
    "nonce)"};

struct domain final {
  std::string name;
  std::string version;
  uint64_t chain_id{};
  vagus::schema::address_t verifying_contract{};
};

using domain_t = domain;

/// Vagus / 1 / 31337 / zero address.
domain_t default_domain();

vagus::schema::hash32_t domain_separator(const domain_t& d);
vagus::schema::hash32_t struct_hash(const vagus::schema::intent_t& intent);

/// keccak256(0x19 0x01 || domain_separator || struct_hash).
vagus::schema::hash32_t signing_digest(const vagus::schema::intent_t& intent,
                                       const domain_t& d);

/// The intent as the signing `message`: hashes, params and planner as
/// 0x-prefixed lowercase hex, everything else as integers.
vagus::schema::value_t intent_message(const vagus::schema::intent_t& intent);

/// Full typed-data document for external wallets.
vagus::schema::value_t typed_data(const vagus::schema::intent_t& intent,
                                  const domain_t& d);

}  // namespace vagus::eip712
