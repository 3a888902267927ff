#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vagus/intent/builder.hpp>
#include <vagus/validation/intent_validator.hpp>
#include <vagus/validation/parameter_validator.hpp>

#include <charconv>
#include <limits>
#include <system_error>

namespace vagus::validation {

namespace {

void check_temporal(const vagus::schema::intent_t& intent,
                    const vagus::schema::timestamp_seconds_t now,
                    std::vector<std::string>& errors) {
  if (intent.not_before > intent.not_after) {
    errors.emplace_back("not_before cannot be after not_after");
  }
  if (intent.not_after < now) {
    errors.emplace_back("Intent has already expired");
  }
  const auto latest_start =
      now > std::numeric_limits<vagus::schema::timestamp_seconds_t>::max() -
                kMaxStartSkewSeconds
          ? std::numeric_limits<vagus::schema::timestamp_seconds_t>::max()
          : now + kMaxStartSkewSeconds;
  if (intent.not_before > latest_start) {
    errors.emplace_back("Intent validity starts too far in the future");
  }
}

void check_resources(const vagus::schema::intent_t& intent,
                     std::vector<std::string>& errors) {
  if (intent.max_duration_ms == 0) {
    errors.emplace_back("max_duration_ms must be positive");
  }
  if (intent.max_energy_j == 0) {
    errors.emplace_back("max_energy_j must be positive");
  }
  if (intent.executor_id == 0) {
    errors.emplace_back("executor_id must be positive");
  }
}

void check_policy(const vagus::schema::schema_store& store,
                  const std::string_view ans_state,
                  std::vector<std::string>& errors) {
  const auto scaling = store.find_scaling(ans_state);
  if (!scaling) {
    errors.push_back(fmt::format("Unknown ANS state: {}", ans_state));
    return;
  }
  spdlog::debug("Applying {} scaling: speed={}, force={}", ans_state,
                scaling->speed, scaling->force);
}

}  // namespace

std::vector<std::string> validate(const vagus::schema::schema_store& store,
                                  const vagus::schema::intent_t& intent,
                                  const std::string_view ans_state,
                                  const vagus::schema::timestamp_seconds_t now) {
  auto errors = std::vector<std::string>{};
  check_temporal(intent, now, errors);
  check_resources(intent, errors);
  check_policy(store, ans_state, errors);
  return errors;
}

std::vector<std::string> validate(const vagus::schema::schema_store& store,
                                  const vagus::schema::intent_t& intent,
                                  const std::string_view ans_state) {
  return validate(store, intent, ans_state,
                  vagus::intent::current_time_seconds());
}

std::optional<parameter_values_t> decode_parameters(
    const vagus::schema::bytes_view_t& params) {
  auto values = parameter_values_t{};
  const auto text = vagus::schema::make_string(params);
  auto remaining = std::string_view{text};
  while (!remaining.empty()) {
    const auto end = remaining.find(';');
    const auto entry = remaining.substr(0, end);
    remaining = end == std::string_view::npos ? std::string_view{}
                                              : remaining.substr(end + 1);
    // A trailing separator would leave an empty entry behind.
    if (end != std::string_view::npos && remaining.empty()) {
      return std::nullopt;
    }

    const auto colon = entry.find(':');
    if (colon == std::string_view::npos || colon == 0) {
      return std::nullopt;
    }
    const auto name = entry.substr(0, colon);
    const auto number = entry.substr(colon + 1);
    auto value = double{};
    const auto [ptr, ec] =
        std::from_chars(number.data(), number.data() + number.size(), value);
    if (ec != std::errc{} || ptr != number.data() + number.size()) {
      return std::nullopt;
    }
    if (!values.emplace(std::string{name}, value).second) {
      return std::nullopt;
    }
  }
  return values;
}

std::vector<std::string> validate_parameters(
    const vagus::schema::schema_store& store,
    const vagus::schema::intent_t& intent,
    const std::string_view ans_state) {
  auto errors = std::vector<std::string>{};
  const auto action = store.find_action_name(intent.action_id);
  if (!action) {
    errors.push_back(
        fmt::format("Unknown action id: {}",
                    vagus::schema::to_prefixed_hex(intent.action_id)));
    return errors;
  }
  const auto values =
      decode_parameters(vagus::schema::make_bytes_view(intent.params));
  if (!values) {
    errors.emplace_back("Intent params are not a valid parameter payload");
    return errors;
  }
  for (const auto& [name, value] : *values) {
    auto result = check_scaled(store, *action, name, value, ans_state);
    if (!result.ok()) {
      errors.push_back(fmt::format("Parameter {}: {}", name, result.message));
    }
  }
  return errors;
}

}  // namespace vagus::validation
