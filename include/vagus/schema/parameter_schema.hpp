#pragma once
#include <cstdint>
#include <string>

// Schema type: parameter schema.
// Bounds for one actuation parameter. Only the upper bound of a brakeable
// parameter is throttled by the ANS state; the lower bound never moves.
namespace vagus::schema {

template <uint16_t Version>
struct parameter_schema;

template <>
struct parameter_schema<1> final {
  std::string type;
  std::string unit;
  double min{};
  double max{};
  bool brakeable{};
};

using parameter_schema_t = parameter_schema<1>;

}  // namespace vagus::schema
