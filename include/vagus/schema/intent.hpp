#pragma once
#include <vagus/schema/primitives.hpp>
#include <cstdint>

// Schema type: intent.
// Signable command describing one requested action together with its
// resource and validity bounds. Produced only by vagus::intent::builder.
namespace vagus::schema {

template <uint16_t Version>
struct intent;

template <>
struct intent<1> final {
  executor_id_t executor_id{};
  hash32_t action_id{};
  bytes_t params;
  hash32_t envelope_hash{};
  // All-zero until state roots are wired in.
  hash32_t pre_state_root{};
  timestamp_seconds_t not_before{};
  timestamp_seconds_t not_after{};
  uint32_t max_duration_ms{};
  uint32_t max_energy_j{};
  address_t planner{};
  nonce_t nonce{};

  bool operator==(const intent&) const = default;
};

using intent_t = intent<1>;

}  // namespace vagus::schema
