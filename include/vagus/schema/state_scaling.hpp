#pragma once
#include <cstdint>

namespace vagus::schema {

template <uint16_t Version>
struct state_scaling;

// Both factors lie in [0, 1].
template <>
struct state_scaling<1> final {
  double speed{1.0};
  double force{1.0};
};

using state_scaling_t = state_scaling<1>;

}  // namespace vagus::schema
