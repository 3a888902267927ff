#pragma once
#include <vagus/schema/intent.hpp>
#include <vagus/schema/primitives.hpp>
#include <vagus/schema/schema_store.hpp>

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace vagus::intent {

/// Every problem found while validating a builder, in discovery order.
struct validation_errors final {
  std::vector<std::string> errors;
};

using validation_errors_t = validation_errors;
using build_result_t =
    std::variant<vagus::schema::intent_t, validation_errors_t>;

inline constexpr auto kDefaultMaxDurationMs = uint32_t{30000};
inline constexpr auto kDefaultMaxEnergyJ = uint32_t{1000};
inline constexpr auto kDefaultValiditySeconds =
    vagus::schema::duration_seconds_t{3600};

/// Accumulates an action, its parameters and resource limits, then
/// produces an intent. Single owner; discard after build().
class builder final {
 public:
  using parameter_map_t = std::map<std::string, double, std::less<>>;

  builder(vagus::schema::schema_store_ptr store,
          vagus::schema::executor_id_t executor_id,
          const vagus::schema::address_t& planner);

  builder& set_action(std::string_view name);
  // Repeating a name overwrites the earlier value.
  builder& set_parameter(std::string_view name, double value);
  builder& set_max_duration(uint32_t duration_ms);
  builder& set_max_energy(uint32_t energy_j);
  builder& set_validity_duration(vagus::schema::duration_seconds_t seconds);
  // Without an explicit nonce the build time in seconds is used.
  builder& set_nonce(vagus::schema::nonce_t nonce);

  /// All problems with the staged intent; empty when it can be built.
  /// Bounds are the static ones: the ANS state plays no part here.
  std::vector<std::string> validate() const;
  std::vector<std::string> validate(
      vagus::schema::timestamp_seconds_t now) const;

  build_result_t build() const;
  build_result_t build(vagus::schema::timestamp_seconds_t now) const;

  /// "name:value" entries sorted by name and joined with ';'. Integral
  /// values of int-typed parameters are written without a fraction.
  std::string encode_parameters() const;

  const parameter_map_t& parameters() const { return parameters_; }

 private:
  std::string format_parameter(const std::string& name, double value) const;

  vagus::schema::schema_store_ptr store_;
  vagus::schema::executor_id_t executor_id_;
  vagus::schema::address_t planner_;
  std::string action_name_;
  parameter_map_t parameters_;
  uint32_t max_duration_ms_{kDefaultMaxDurationMs};
  uint32_t max_energy_j_{kDefaultMaxEnergyJ};
  vagus::schema::duration_seconds_t validity_duration_s_{
      kDefaultValiditySeconds};
  std::optional<vagus::schema::nonce_t> nonce_;
};

/// SHA-256 over "{executor_id}:0x{action_id hex}:{params hex}".
vagus::schema::hash32_t make_envelope_hash(
    vagus::schema::executor_id_t executor_id,
    const vagus::schema::hash32_t& action_id,
    const vagus::schema::bytes_view_t& params);

vagus::schema::timestamp_seconds_t current_time_seconds();

build_result_t make_move_to_intent(vagus::schema::schema_store_ptr store,
                                   vagus::schema::executor_id_t executor_id,
                                   const vagus::schema::address_t& planner,
                                   double x,
                                   double y,
                                   double z,
                                   double v_max = 1.0);

build_result_t make_grasp_intent(vagus::schema::schema_store_ptr store,
                                 vagus::schema::executor_id_t executor_id,
                                 const vagus::schema::address_t& planner,
                                 double force,
                                 uint32_t duration_ms);

}  // namespace vagus::intent
