#include <vagus/schema/defaults.hpp>

namespace vagus::schema {

namespace {

value_t parameter(const char* type,
                  const char* unit,
                  const double min,
                  const double max,
                  const bool brakeable) {
  return make_map({{"type", type},
                   {"unit", unit},
                   {"min", min},
                   {"max", max},
                   {"brakeable", brakeable}});
}

value_t state(const char* description,
              const double speed,
              const double force,
              array_t restrictions) {
  return make_map({{"description", description},
                   {"scaling", make_map({{"speed", speed}, {"force", force}})},
                   {"restrictions", value_t{std::move(restrictions)}}});
}

}  // namespace

value_t default_action_source() {
  auto move_to = make_map(
      {{"description", "Move the end effector to a cartesian position"},
       {"parameters",
        make_map({{"x", parameter("float", "m", -2.0, 2.0, true)},
                  {"y", parameter("float", "m", -2.0, 2.0, true)},
                  {"z", parameter("float", "m", 0.0, 3.0, true)},
                  {"vMax", parameter("float", "m/s", 0.0, 2.0, true)}})}});
  auto grasp = make_map(
      {{"description", "Close the gripper with a bounded force"},
       {"parameters",
        make_map({{"force", parameter("float", "N", 1.0, 100.0, true)},
                  {"duration",
                   parameter("int", "ms", 100.0, 10000.0, false)}})}});
  auto home = make_map({{"description", "Return to the home pose"},
                        {"parameters", value_t{map_t{}}}});
  return make_map({{"actions", make_map({{"MOVE_TO", std::move(move_to)},
                                         {"GRASP", std::move(grasp)},
                                         {"HOME", std::move(home)}})}});
}

value_t default_policy_source() {
  return make_map(
      {{"states",
        make_map({{"SAFE", state("Normal operation", 1.0, 1.0, {})},
                  {"DANGER",
                   state("Elevated risk, actuation throttled", 0.6, 0.7,
                         {"reduced_speed", "reduced_force"})},
                  {"SHUTDOWN",
                   state("Emergency stop, no actuation", 0.0, 0.0,
                         {"no_motion", "escape_only"})}})}});
}

}  // namespace vagus::schema
