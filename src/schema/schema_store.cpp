#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <vagus/crypto/hash.hpp>
#include <vagus/schema/schema_store.hpp>

#include <string>
#include <utility>

namespace vagus::schema {

namespace {

const map_t& require_map(const value_t& v, const std::string& context) {
  const auto* map = as_map(v);
  if (map == nullptr) {
    throw schema_load_error{fmt::format("{} must be a mapping", context)};
  }
  return *map;
}

const value_t& require_field(const map_t& map,
                             const std::string_view field,
                             const std::string& context) {
  const auto* v = find(map, field);
  if (v == nullptr) {
    throw schema_load_error{
        fmt::format("{} is missing required field '{}'", context, field)};
  }
  return *v;
}

std::string require_text(const map_t& map,
                         const std::string_view field,
                         const std::string& context) {
  const auto* text = as_text(require_field(map, field, context));
  if (text == nullptr) {
    throw schema_load_error{
        fmt::format("{}.{} must be a string", context, field)};
  }
  return *text;
}

double require_number(const map_t& map,
                      const std::string_view field,
                      const std::string& context) {
  auto number = as_number(require_field(map, field, context));
  if (!number) {
    throw schema_load_error{
        fmt::format("{}.{} must be a number", context, field)};
  }
  return *number;
}

bool require_bool(const map_t& map,
                  const std::string_view field,
                  const std::string& context) {
  auto flag = as_bool(require_field(map, field, context));
  if (!flag) {
    throw schema_load_error{
        fmt::format("{}.{} must be a boolean", context, field)};
  }
  return *flag;
}

std::string require_key(const map_entry_t& entry, const std::string& context) {
  const auto* key = as_text(entry.first);
  if (key == nullptr) {
    throw schema_load_error{fmt::format("{} keys must be strings", context)};
  }
  return *key;
}

parameter_schema_t parse_parameter(const value_t& source,
                                   const std::string& context) {
  const auto& map = require_map(source, context);
  auto parameter = parameter_schema_t{
      .type = require_text(map, "type", context),
      .unit = require_text(map, "unit", context),
      .min = require_number(map, "min", context),
      .max = require_number(map, "max", context),
      .brakeable = require_bool(map, "brakeable", context)};
  if (!(parameter.min <= parameter.max)) {
    throw schema_load_error{fmt::format("{} has min {} greater than max {}",
                                        context, parameter.min, parameter.max)};
  }
  return parameter;
}

action_schema_t parse_action(const value_t& source, const std::string& context) {
  const auto& map = require_map(source, context);
  auto action = action_schema_t{};
  action.description = require_text(map, "description", context);
  const auto& parameters = require_map(
      require_field(map, "parameters", context), context + ".parameters");
  for (const auto& entry : parameters) {
    auto name = require_key(entry, context + ".parameters");
    auto parameter =
        parse_parameter(entry.second, context + ".parameters." + name);
    if (!action.parameters.emplace(name, std::move(parameter)).second) {
      throw schema_load_error{
          fmt::format("{} declares parameter '{}' twice", context, name)};
    }
  }
  return action;
}

double require_factor(const map_t& map,
                      const std::string_view field,
                      const std::string& context) {
  auto factor = require_number(map, field, context);
  if (!(factor >= 0.0 && factor <= 1.0)) {
    throw schema_load_error{fmt::format(
        "{}.{} must lie in [0, 1], got {}", context, field, factor)};
  }
  return factor;
}

state_policy_t parse_state(const value_t& source, const std::string& context) {
  const auto& map = require_map(source, context);
  auto policy = state_policy_t{};
  policy.description = require_text(map, "description", context);

  const auto& scaling =
      require_map(require_field(map, "scaling", context), context + ".scaling");
  policy.scaling.speed = require_factor(scaling, "speed", context + ".scaling");
  policy.scaling.force = require_factor(scaling, "force", context + ".scaling");

  const auto* restrictions = as_array(require_field(map, "restrictions", context));
  if (restrictions == nullptr) {
    throw schema_load_error{
        fmt::format("{}.restrictions must be a list", context)};
  }
  for (const auto& restriction : *restrictions) {
    const auto* text = as_text(restriction);
    if (text == nullptr) {
      throw schema_load_error{
          fmt::format("{}.restrictions entries must be strings", context)};
    }
    policy.restrictions.push_back(*text);
  }
  return policy;
}

}  // namespace

hash32_t make_action_id(const std::string_view action_name) {
  return vagus::crypto::sha256(action_name);
}

std::shared_ptr<const schema_store> schema_store::load(
    const value_t& action_source,
    const value_t& policy_source) {
  if (action_source.is<std::nullptr_t>()) {
    throw schema_load_error{"action schema source is absent"};
  }
  if (policy_source.is<std::nullptr_t>()) {
    throw schema_load_error{"policy source is absent"};
  }

  auto actions = action_map_t{};
  const auto& action_root = require_map(action_source, "action source");
  const auto& action_entries = require_map(
      require_field(action_root, "actions", "action source"), "actions");
  for (const auto& entry : action_entries) {
    auto name = require_key(entry, "actions");
    auto action = parse_action(entry.second, "actions." + name);
    if (!actions.emplace(name, std::move(action)).second) {
      throw schema_load_error{fmt::format("action '{}' declared twice", name)};
    }
  }

  auto policy = policy_schema_t{};
  const auto& policy_root = require_map(policy_source, "policy source");
  const auto& state_entries = require_map(
      require_field(policy_root, "states", "policy source"), "states");
  for (const auto& entry : state_entries) {
    auto name = require_key(entry, "states");
    auto state = parse_state(entry.second, "states." + name);
    if (!policy.states.emplace(name, std::move(state)).second) {
      throw schema_load_error{fmt::format("state '{}' declared twice", name)};
    }
  }

  spdlog::info("Loaded {} action schema(s) and {} ANS state(s)",
               actions.size(), policy.states.size());
  return std::make_shared<const schema_store>(
      construction_key{}, std::move(actions), std::move(policy));
}

schema_store::schema_store(construction_key,
                           action_map_t actions,
                           policy_schema_t policy)
    : actions_(std::move(actions)), policy_(std::move(policy)) {
  for (const auto& [name, action] : actions_) {
    action_ids_.emplace(make_action_id(name), name);
  }
}

const action_schema_t* schema_store::find_action(
    const std::string_view name) const {
  auto it = actions_.find(name);
  if (it == std::end(actions_)) {
    return nullptr;
  }
  return &it->second;
}

std::optional<std::string_view> schema_store::find_action_name(
    const hash32_t& action_id) const {
  auto it = action_ids_.find(action_id);
  if (it == std::end(action_ids_)) {
    return std::nullopt;
  }
  return std::string_view{it->second};
}

const parameter_schema_t* schema_store::find_parameter(
    const std::string_view action,
    const std::string_view name) const {
  const auto* schema = find_action(action);
  if (schema == nullptr) {
    return nullptr;
  }
  auto it = schema->parameters.find(name);
  if (it == std::end(schema->parameters)) {
    return nullptr;
  }
  return &it->second;
}

const state_policy_t* schema_store::find_state(
    const std::string_view state) const {
  auto it = policy_.states.find(state);
  if (it == std::end(policy_.states)) {
    return nullptr;
  }
  return &it->second;
}

std::optional<state_scaling_t> schema_store::find_scaling(
    const std::string_view state) const {
  const auto* policy = find_state(state);
  if (policy == nullptr) {
    return std::nullopt;
  }
  return policy->scaling;
}

hash32_t schema_store::scaled_limits_hash(const std::string_view action,
                                          const std::string_view state) const {
  auto scaling = find_scaling(state);
  if (!scaling) {
    return make_zero_hash();
  }
  return vagus::crypto::sha256(fmt::format("{}:{}:{}", action,
                                           format_number(scaling->speed),
                                           format_number(scaling->force)));
}

}  // namespace vagus::schema
