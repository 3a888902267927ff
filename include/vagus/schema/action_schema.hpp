#pragma once
#include <vagus/schema/parameter_schema.hpp>
#include <functional>
#include <map>
#include <string>

namespace vagus::schema {

template <uint16_t Version>
struct action_schema;

template <>
struct action_schema<1> final {
  std::string description;
  std::map<std::string, parameter_schema_t, std::less<>> parameters;
};

using action_schema_t = action_schema<1>;

}  // namespace vagus::schema
