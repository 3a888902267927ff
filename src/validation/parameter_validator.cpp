#include <spdlog/fmt/fmt.h>
#include <vagus/validation/parameter_validator.hpp>

#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <string>
#include <utility>

namespace vagus::validation {

namespace {

struct scaling_rule final {
  bool (*matches)(const std::string&);
  scaling_dimension dimension;
};

// Evaluated top to bottom; the first match wins.
const auto kScalingRules = std::array<scaling_rule, 2>{
    scaling_rule{.matches =
                     [](const std::string& name) {
                       return name.find("speed") != std::string::npos ||
                              name.starts_with('v');
                     },
                 .dimension = scaling_dimension::speed},
    scaling_rule{.matches =
                     [](const std::string& name) {
                       return name.find("force") != std::string::npos;
                     },
                 .dimension = scaling_dimension::force},
};

std::string to_lower(const std::string_view text) {
  auto lowered = std::string{text};
  std::ranges::transform(lowered, std::begin(lowered), [](const char c) {
    return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  });
  return lowered;
}

check_result_t failure(const check_error code, std::string message) {
  return check_result_t{.code = code, .message = std::move(message)};
}

check_result_t unknown_parameter(const std::string_view action,
                                 const std::string_view parameter) {
  return failure(check_error::unknown_parameter,
                 fmt::format("Parameter {} not found in action {}", parameter,
                             action));
}

check_result_t check_finite(const double value) {
  if (!std::isfinite(value)) {
    return failure(check_error::not_finite,
                   fmt::format("Value {} is not a finite number",
                               vagus::schema::format_number(value)));
  }
  return {};
}

check_result_t check_bounds(const vagus::schema::parameter_schema_t& schema,
                            const double value) {
  if (value < schema.min) {
    return failure(check_error::below_minimum,
                   fmt::format("Value {} below minimum {}",
                               vagus::schema::format_number(value),
                               vagus::schema::format_number(schema.min)));
  }
  if (value > schema.max) {
    return failure(check_error::above_maximum,
                   fmt::format("Value {} above maximum {}",
                               vagus::schema::format_number(value),
                               vagus::schema::format_number(schema.max)));
  }
  return {};
}

}  // namespace

scaling_dimension classify(const std::string_view parameter_name) {
  const auto lowered = to_lower(parameter_name);
  for (const auto& rule : kScalingRules) {
    if (rule.matches(lowered)) {
      return rule.dimension;
    }
  }
  return scaling_dimension::combined;
}

double scaling_factor(const vagus::schema::state_scaling_t& scaling,
                      const std::string_view parameter_name) {
  switch (classify(parameter_name)) {
    case scaling_dimension::speed:
      return scaling.speed;
    case scaling_dimension::force:
      return scaling.force;
    case scaling_dimension::combined:
      break;
  }
  return std::min(scaling.speed, scaling.force);
}

check_result_t check_static(const vagus::schema::schema_store& store,
                            const std::string_view action,
                            const std::string_view parameter,
                            const double value) {
  const auto* schema = store.find_parameter(action, parameter);
  if (schema == nullptr) {
    return unknown_parameter(action, parameter);
  }
  if (auto finite = check_finite(value); !finite.ok()) {
    return finite;
  }
  return check_bounds(*schema, value);
}

check_result_t check_scaled(const vagus::schema::schema_store& store,
                            const std::string_view action,
                            const std::string_view parameter,
                            const double value,
                            const std::string_view ans_state) {
  const auto* schema = store.find_parameter(action, parameter);
  if (schema == nullptr) {
    return unknown_parameter(action, parameter);
  }
  if (auto finite = check_finite(value); !finite.ok()) {
    return finite;
  }
  if (!schema->brakeable) {
    return check_bounds(*schema, value);
  }

  const auto scaling = store.find_scaling(ans_state);
  if (!scaling) {
    return failure(check_error::unknown_state,
                   fmt::format("Unknown ANS state: {}", ans_state));
  }
  const auto scaled_max = schema->max * scaling_factor(*scaling, parameter);
  if (value < schema->min) {
    return failure(check_error::below_minimum,
                   fmt::format("Value {} below minimum {}",
                               vagus::schema::format_number(value),
                               vagus::schema::format_number(schema->min)));
  }
  if (value > scaled_max) {
    return failure(
        check_error::above_maximum,
        fmt::format("Value {} above scaled maximum {:.3f} (original: {})",
                    vagus::schema::format_number(value), scaled_max,
                    vagus::schema::format_number(schema->max)));
  }
  return {};
}

}  // namespace vagus::validation
