#pragma once
#include <vagus/schema/state_policy.hpp>
#include <functional>
#include <map>
#include <string>

namespace vagus::schema {

template <uint16_t Version>
struct policy_schema;

template <>
struct policy_schema<1> final {
  std::map<std::string, state_policy_t, std::less<>> states;
};

using policy_schema_t = policy_schema<1>;

}  // namespace vagus::schema
