#pragma once
#include <vagus/schema/schema_store.hpp>
#include <vagus/schema/state_scaling.hpp>

#include <cstdint>
#include <string>
#include <string_view>

namespace vagus::validation {

enum class check_error : uint32_t {
  none = 0,
  unknown_parameter = 1,
  below_minimum = 2,
  above_maximum = 3,
  unknown_state = 4,
  not_finite = 5,
};

/// Outcome of a single parameter check. `message` is empty on success and
/// otherwise holds the text downstream tooling matches on.
struct check_result final {
  check_error code{check_error::none};
  std::string message;

  bool ok() const { return code == check_error::none; }
};

using check_result_t = check_result;

enum class scaling_dimension : uint8_t { speed, force, combined };

/// Which ANS factor throttles a parameter. Rules are applied in order to
/// the lower-cased name: "speed" or a leading 'v' selects speed, then
/// "force" selects force, otherwise the smaller of the two applies.
scaling_dimension classify(std::string_view parameter_name);

double scaling_factor(const vagus::schema::state_scaling_t& scaling,
                      std::string_view parameter_name);

/// Literal [min, max] check. An unknown action and an unknown parameter
/// are reported identically.
check_result_t check_static(const vagus::schema::schema_store& store,
                            std::string_view action,
                            std::string_view parameter,
                            double value);

/// Like check_static, but the upper bound of a brakeable parameter is
/// multiplied by the scaling factor of `ans_state`.
check_result_t check_scaled(const vagus::schema::schema_store& store,
                            std::string_view action,
                            std::string_view parameter,
                            double value,
                            std::string_view ans_state);

}  // namespace vagus::validation
