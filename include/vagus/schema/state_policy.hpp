#pragma once
#include <vagus/schema/state_scaling.hpp>
#include <string>
#include <vector>

// Schema type: state policy.
// Describes one ANS state (SAFE, DANGER, SHUTDOWN, ...) and the scaling
// it applies to brakeable parameters.
namespace vagus::schema {

template <uint16_t Version>
struct state_policy;

template <>
struct state_policy<1> final {
  std::string description;
  state_scaling_t scaling;
  std::vector<std::string> restrictions;
};

using state_policy_t = state_policy<1>;

}  // namespace vagus::schema
