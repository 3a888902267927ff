#pragma once

#include <vagus/intent/builder.hpp>
#include <vagus/schema/defaults.hpp>
#include <vagus/schema/intent.hpp>
#include <vagus/schema/primitives.hpp>
#include <vagus/schema/schema_store.hpp>

#include <cstdint>
#include <string_view>
#include <variant>

namespace vagus::testing {

inline constexpr auto kReferenceNow =
    vagus::schema::timestamp_seconds_t{1700000000};
inline constexpr auto kReferencePlanner =
    std::string_view{"0x742d35Cc6645C0532925a3b8dC6b6b5a1C6Bb0B5"};

inline vagus::schema::hash32_t make_hash(const uint8_t seed) {
  auto out = vagus::schema::hash32_t{};
  for (std::size_t i = 0; i < out.size(); ++i) {
    out[i] = static_cast<uint8_t>(seed + static_cast<uint8_t>(i));
  }
  return out;
}

inline vagus::schema::schema_store_ptr make_default_store() {
  return vagus::schema::schema_store::load(
      vagus::schema::default_action_source(),
      vagus::schema::default_policy_source());
}

inline vagus::schema::address_t make_reference_planner() {
  return vagus::schema::make_address(kReferencePlanner);
}

/// MOVE_TO x=1.0 y=0.5 z=1.5 vMax=1.0 for executor 1, built at
/// kReferenceNow. The digests of this intent are pinned by the verifiers.
inline vagus::intent::builder make_reference_builder(
    const vagus::schema::schema_store_ptr& store) {
  auto builder = vagus::intent::builder{store, 1, make_reference_planner()};
  builder.set_action("MOVE_TO")
      .set_parameter("x", 1.0)
      .set_parameter("y", 0.5)
      .set_parameter("z", 1.5)
      .set_parameter("vMax", 1.0);
  return builder;
}

inline vagus::schema::intent_t make_reference_intent(
    const vagus::schema::schema_store_ptr& store) {
  return std::get<vagus::schema::intent_t>(
      make_reference_builder(store).build(kReferenceNow));
}

}  // namespace vagus::testing
