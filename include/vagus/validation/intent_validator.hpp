#pragma once
#include <vagus/schema/intent.hpp>
#include <vagus/schema/primitives.hpp>
#include <vagus/schema/schema_store.hpp>

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace vagus::validation {

/// Furthest into the future an intent's validity window may start.
inline constexpr auto kMaxStartSkewSeconds =
    vagus::schema::duration_seconds_t{3600};

using parameter_values_t = std::map<std::string, double, std::less<>>;

/// Temporal, resource and policy checks on a received intent. Returns
/// every problem found; an empty list means the intent is acceptable.
/// Parameter bounds are not part of this pass, see validate_parameters.
std::vector<std::string> validate(const vagus::schema::schema_store& store,
                                  const vagus::schema::intent_t& intent,
                                  std::string_view ans_state,
                                  vagus::schema::timestamp_seconds_t now);

std::vector<std::string> validate(const vagus::schema::schema_store& store,
                                  const vagus::schema::intent_t& intent,
                                  std::string_view ans_state);

/// Parse a "name:value;name:value" payload. Empty input is an empty map.
std::optional<parameter_values_t> decode_parameters(
    const vagus::schema::bytes_view_t& params);

/// Resolve the action from action_id, decode the payload and check every
/// parameter against its ANS-scaled bounds.
std::vector<std::string> validate_parameters(
    const vagus::schema::schema_store& store,
    const vagus::schema::intent_t& intent,
    std::string_view ans_state);

}  // namespace vagus::validation
