#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vagus/crypto/hash.hpp>
#include <vagus/intent/builder.hpp>
#include <vagus/validation/parameter_validator.hpp>

#include <chrono>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <utility>

namespace vagus::intent {

namespace {

// 2^53: every integer up to here is exactly representable in a double.
constexpr auto kMaxExactInteger = 9007199254740992.0;

}  // namespace

builder::builder(vagus::schema::schema_store_ptr store,
                 const vagus::schema::executor_id_t executor_id,
                 const vagus::schema::address_t& planner)
    : store_{std::move(store)}, executor_id_{executor_id}, planner_{planner} {
  if (!store_) {
    throw std::invalid_argument{"intent builder requires a schema store"};
  }
}

builder& builder::set_action(const std::string_view name) {
  action_name_ = name;
  return *this;
}

builder& builder::set_parameter(const std::string_view name,
                                const double value) {
  parameters_.insert_or_assign(std::string{name}, value);
  return *this;
}

builder& builder::set_max_duration(const uint32_t duration_ms) {
  max_duration_ms_ = duration_ms;
  return *this;
}

builder& builder::set_max_energy(const uint32_t energy_j) {
  max_energy_j_ = energy_j;
  return *this;
}

builder& builder::set_validity_duration(
    const vagus::schema::duration_seconds_t seconds) {
  validity_duration_s_ = seconds;
  return *this;
}

builder& builder::set_nonce(const vagus::schema::nonce_t nonce) {
  nonce_ = nonce;
  return *this;
}

std::vector<std::string> builder::validate() const {
  return validate(current_time_seconds());
}

std::vector<std::string> builder::validate(
    const vagus::schema::timestamp_seconds_t now) const {
  auto errors = std::vector<std::string>{};
  if (action_name_.empty()) {
    errors.emplace_back("Action name is required");
  } else if (store_->find_action(action_name_) == nullptr) {
    errors.push_back(fmt::format("Unknown action: {}", action_name_));
  } else {
    for (const auto& [name, value] : parameters_) {
      if (store_->find_parameter(action_name_, name) == nullptr) {
        errors.push_back(fmt::format("Unknown parameter: {} for action {}",
                                     name, action_name_));
        continue;
      }
      auto result =
          vagus::validation::check_static(*store_, action_name_, name, value);
      if (!result.ok()) {
        errors.push_back(
            fmt::format("Parameter {}: {}", name, result.message));
      }
    }
  }

  if (executor_id_ == 0) {
    errors.emplace_back("executor_id must be positive");
  }
  if (max_duration_ms_ == 0) {
    errors.emplace_back("max_duration_ms must be positive");
  }
  if (max_energy_j_ == 0) {
    errors.emplace_back("max_energy_j must be positive");
  }
  if (validity_duration_s_ >
      std::numeric_limits<vagus::schema::timestamp_seconds_t>::max() - now) {
    errors.emplace_back("Intent validity window overflows the timestamp range");
  }
  return errors;
}

build_result_t builder::build() const {
  return build(current_time_seconds());
}

build_result_t builder::build(
    const vagus::schema::timestamp_seconds_t now) const {
  auto errors = validate(now);
  if (!errors.empty()) {
    spdlog::debug("Intent for action '{}' failed validation with {} error(s)",
                  action_name_, errors.size());
    return validation_errors_t{.errors = std::move(errors)};
  }

  auto result = vagus::schema::intent_t{};
  result.executor_id = executor_id_;
  result.action_id = vagus::schema::make_action_id(action_name_);
  result.params = vagus::schema::make_bytes(encode_parameters());
  result.envelope_hash =
      make_envelope_hash(executor_id_, result.action_id,
                         vagus::schema::make_bytes_view(result.params));
  result.pre_state_root = vagus::schema::make_zero_hash();
  result.not_before = now;
  result.not_after = now + validity_duration_s_;
  result.max_duration_ms = max_duration_ms_;
  result.max_energy_j = max_energy_j_;
  result.planner = planner_;
  result.nonce = nonce_.value_or(now);

  spdlog::debug("Built {} intent for executor {} with nonce {}", action_name_,
                executor_id_, result.nonce);
  return result;
}

std::string builder::format_parameter(const std::string& name,
                                      const double value) const {
  // Integral values of int parameters carry no fractional part.
  const auto* schema = store_->find_parameter(action_name_, name);
  if (schema != nullptr && schema->type == "int" && std::trunc(value) == value &&
      std::fabs(value) <= kMaxExactInteger) {
    return fmt::format("{}", static_cast<int64_t>(value));
  }
  return vagus::schema::format_number(value);
}

std::string builder::encode_parameters() const {
  auto encoded = std::string{};
  for (const auto& [name, value] : parameters_) {
    if (!encoded.empty()) {
      encoded.push_back(';');
    }
    encoded += fmt::format("{}:{}", name, format_parameter(name, value));
  }
  return encoded;
}

vagus::schema::hash32_t make_envelope_hash(
    const vagus::schema::executor_id_t executor_id,
    const vagus::schema::hash32_t& action_id,
    const vagus::schema::bytes_view_t& params) {
  return vagus::crypto::sha256(
      fmt::format("{}:{}:{}", executor_id,
                  vagus::schema::to_prefixed_hex(action_id),
                  vagus::schema::to_hex(params)));
}

vagus::schema::timestamp_seconds_t current_time_seconds() {
  const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<vagus::schema::timestamp_seconds_t>(
      std::chrono::duration_cast<std::chrono::seconds>(since_epoch).count());
}

build_result_t make_move_to_intent(vagus::schema::schema_store_ptr store,
                                   const vagus::schema::executor_id_t executor_id,
                                   const vagus::schema::address_t& planner,
                                   const double x,
                                   const double y,
                                   const double z,
                                   const double v_max) {
  return builder{std::move(store), executor_id, planner}
      .set_action("MOVE_TO")
      .set_parameter("x", x)
      .set_parameter("y", y)
      .set_parameter("z", z)
      .set_parameter("vMax", v_max)
      .build();
}

build_result_t make_grasp_intent(vagus::schema::schema_store_ptr store,
                                 const vagus::schema::executor_id_t executor_id,
                                 const vagus::schema::address_t& planner,
                                 const double force,
                                 const uint32_t duration_ms) {
  return builder{std::move(store), executor_id, planner}
      .set_action("GRASP")
      .set_parameter("force", force)
      .set_parameter("duration", static_cast<double>(duration_ms))
      .build();
}

}  // namespace vagus::intent
