#pragma once
#include <vagus/schema/action_schema.hpp>
#include <vagus/schema/parameter_schema.hpp>
#include <vagus/schema/policy_schema.hpp>
#include <vagus/schema/primitives.hpp>
#include <vagus/schema/state_policy.hpp>
#include <vagus/schema/state_scaling.hpp>
#include <vagus/schema/value.hpp>

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>

namespace vagus::schema {

/// Raised when an action or policy source is absent or malformed.
class schema_load_error final : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

/// action_id committed in an intent: SHA-256 of the action name bytes.
hash32_t make_action_id(std::string_view action_name);

/// Immutable registry of action parameter schemas and the ANS scaling
/// policy.
///
/// Built once from already-parsed sources and shared by const pointer.
/// Every lookup is a read of immutable state, so any number of threads may
/// query one instance concurrently. A hot reload means loading a new store
/// and swapping the shared pointer; readers keep their snapshot.
class schema_store final {
  // Restricts construction to load().
  struct construction_key final {
    explicit construction_key() = default;
  };

 public:
  using action_map_t = std::map<std::string, action_schema_t, std::less<>>;

  /// Parse both sources. Throws schema_load_error on a null source, a
  /// missing `actions`/`states` mapping, a missing or mistyped field,
  /// `min > max`, or a scaling factor outside [0, 1].
  static std::shared_ptr<const schema_store> load(
      const value_t& action_source,
      const value_t& policy_source);

  schema_store(construction_key,
               action_map_t actions,
               policy_schema_t policy);

  const action_schema_t* find_action(std::string_view name) const;

  /// Reverse lookup of an action name from its committed action_id.
  std::optional<std::string_view> find_action_name(
      const hash32_t& action_id) const;

  const parameter_schema_t* find_parameter(std::string_view action,
                                           std::string_view name) const;

  const state_policy_t* find_state(std::string_view state) const;

  std::optional<state_scaling_t> find_scaling(std::string_view state) const;

  /// SHA-256 over "{action}:{speed}:{force}" for the given state, or the
  /// zero hash when the state is unknown.
  hash32_t scaled_limits_hash(std::string_view action,
                              std::string_view state) const;

  const action_map_t& actions() const { return actions_; }
  const policy_schema_t& policy() const { return policy_; }

 private:
  action_map_t actions_;
  std::map<hash32_t, std::string> action_ids_;
  policy_schema_t policy_;
};

using schema_store_ptr = std::shared_ptr<const schema_store>;

}  // namespace vagus::schema
