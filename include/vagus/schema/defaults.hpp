#pragma once
#include <vagus/schema/value.hpp>

// Reference mechanical-arm profile: MOVE_TO, GRASP and HOME actions plus
// the SAFE / DANGER / SHUTDOWN policy.
namespace vagus::schema {

value_t default_action_source();
value_t default_policy_source();

}  // namespace vagus::schema
