#include <gtest/gtest.h>
#include <vagus/testing/common.hpp>
#include <vagus/validation/parameter_validator.hpp>

#include <limits>
#include <string>

namespace {

bool contains(const std::string& text, const std::string_view needle) {
  return text.find(needle) != std::string::npos;
}

}  // namespace

TEST(parameter_validator, static_bounds_are_inclusive) {
  auto store = vagus::testing::make_default_store();
  EXPECT_TRUE(vagus::validation::check_static(*store, "MOVE_TO", "x", 2.0).ok());
  EXPECT_TRUE(vagus::validation::check_static(*store, "MOVE_TO", "x", -2.0).ok());

  auto above = vagus::validation::check_static(*store, "MOVE_TO", "x", 2.5);
  EXPECT_EQ(above.code, vagus::validation::check_error::above_maximum);
  EXPECT_EQ(above.message, "Value 2.5 above maximum 2.0");

  auto below = vagus::validation::check_static(*store, "GRASP", "force", 0.5);
  EXPECT_EQ(below.code, vagus::validation::check_error::below_minimum);
  EXPECT_EQ(below.message, "Value 0.5 below minimum 1.0");
}

TEST(parameter_validator, unknown_action_and_parameter_report_the_same_way) {
  auto store = vagus::testing::make_default_store();
  auto unknown_param =
      vagus::validation::check_static(*store, "MOVE_TO", "w", 0.0);
  EXPECT_EQ(unknown_param.code,
            vagus::validation::check_error::unknown_parameter);
  EXPECT_EQ(unknown_param.message, "Parameter w not found in action MOVE_TO");

  auto unknown_action =
      vagus::validation::check_scaled(*store, "FLY", "x", 0.0, "SAFE");
  EXPECT_EQ(unknown_action.code,
            vagus::validation::check_error::unknown_parameter);
  EXPECT_EQ(unknown_action.message, "Parameter x not found in action FLY");
}

TEST(parameter_validator, safe_state_keeps_original_maximum) {
  auto store = vagus::testing::make_default_store();
  auto result =
      vagus::validation::check_scaled(*store, "MOVE_TO", "x", 3.0, "SAFE");
  EXPECT_FALSE(result.ok());
  EXPECT_TRUE(contains(result.message, "above scaled maximum"));
  EXPECT_TRUE(contains(result.message, "2.0"));
  EXPECT_EQ(result.message,
            "Value 3.0 above scaled maximum 2.000 (original: 2.0)");
}

TEST(parameter_validator, danger_state_throttles_speed) {
  auto store = vagus::testing::make_default_store();
  auto fast =
      vagus::validation::check_scaled(*store, "MOVE_TO", "vMax", 1.5, "DANGER");
  EXPECT_EQ(fast.code, vagus::validation::check_error::above_maximum);
  EXPECT_TRUE(contains(fast.message, "above scaled maximum 1.200"));

  EXPECT_TRUE(
      vagus::validation::check_scaled(*store, "MOVE_TO", "vMax", 1.0, "DANGER")
          .ok());
}

TEST(parameter_validator, danger_state_throttles_force) {
  auto store = vagus::testing::make_default_store();
  auto result =
      vagus::validation::check_scaled(*store, "GRASP", "force", 80.0, "DANGER");
  EXPECT_FALSE(result.ok());
  EXPECT_TRUE(contains(result.message, "70.000"));
  EXPECT_EQ(result.message,
            "Value 80.0 above scaled maximum 70.000 (original: 100.0)");
}

TEST(parameter_validator, position_uses_most_conservative_factor) {
  auto store = vagus::testing::make_default_store();
  // x is neither speed nor force: min(0.6, 0.7) * 2.0 = 1.2.
  EXPECT_TRUE(
      vagus::validation::check_scaled(*store, "MOVE_TO", "x", 1.2, "DANGER")
          .ok());
  auto result =
      vagus::validation::check_scaled(*store, "MOVE_TO", "x", 1.3, "DANGER");
  EXPECT_TRUE(contains(result.message, "above scaled maximum 1.200"));
}

TEST(parameter_validator, shutdown_rejects_any_positive_brakeable_value) {
  auto store = vagus::testing::make_default_store();
  for (const auto* name : {"x", "y", "z", "vMax"}) {
    SCOPED_TRACE(name);
    auto result =
        vagus::validation::check_scaled(*store, "MOVE_TO", name, 0.1, "SHUTDOWN");
    EXPECT_EQ(result.code, vagus::validation::check_error::above_maximum);
    EXPECT_TRUE(contains(result.message, "above scaled maximum 0.000"));
  }
  // The lower bound is never scaled, so zero stays admissible for z.
  EXPECT_TRUE(
      vagus::validation::check_scaled(*store, "MOVE_TO", "z", 0.0, "SHUTDOWN")
          .ok());
}

TEST(parameter_validator, non_brakeable_parameters_ignore_state) {
  auto store = vagus::testing::make_default_store();
  EXPECT_TRUE(vagus::validation::check_scaled(*store, "GRASP", "duration",
                                              10000.0, "SHUTDOWN")
                  .ok());
  // Not even an unknown state matters when nothing is scaled.
  EXPECT_TRUE(vagus::validation::check_scaled(*store, "GRASP", "duration",
                                              500.0, "PANIC")
                  .ok());
}

TEST(parameter_validator, unknown_state_is_reported) {
  auto store = vagus::testing::make_default_store();
  auto result =
      vagus::validation::check_scaled(*store, "MOVE_TO", "x", 0.0, "PANIC");
  EXPECT_EQ(result.code, vagus::validation::check_error::unknown_state);
  EXPECT_EQ(result.message, "Unknown ANS state: PANIC");
}

TEST(parameter_validator, non_finite_values_are_rejected) {
  auto store = vagus::testing::make_default_store();
  auto nan = vagus::validation::check_static(
      *store, "MOVE_TO", "x", std::numeric_limits<double>::quiet_NaN());
  EXPECT_EQ(nan.code, vagus::validation::check_error::not_finite);
  auto inf = vagus::validation::check_scaled(
      *store, "MOVE_TO", "x", -std::numeric_limits<double>::infinity(), "SAFE");
  EXPECT_EQ(inf.code, vagus::validation::check_error::not_finite);
}

TEST(parameter_validator, classification_follows_rule_order) {
  using vagus::validation::classify;
  using vagus::validation::scaling_dimension;
  EXPECT_EQ(classify("vMax"), scaling_dimension::speed);
  EXPECT_EQ(classify("Velocity"), scaling_dimension::speed);
  EXPECT_EQ(classify("max_speed"), scaling_dimension::speed);
  // Speed wins over force when both appear.
  EXPECT_EQ(classify("speed_force"), scaling_dimension::speed);
  // A leading 'v' wins even when "force" appears later.
  EXPECT_EQ(classify("vforce"), scaling_dimension::speed);
  EXPECT_EQ(classify("gripForce"), scaling_dimension::force);
  EXPECT_EQ(classify("x"), scaling_dimension::combined);
  EXPECT_EQ(classify("torque"), scaling_dimension::combined);
}

TEST(parameter_validator, scaled_maximum_is_monotonic_in_factor) {
  auto previous = -1.0;
  for (const auto factor : {0.0, 0.25, 0.5, 0.6, 0.7, 1.0}) {
    auto scaling =
        vagus::schema::state_scaling_t{.speed = factor, .force = factor};
    auto scaled = 2.0 * vagus::validation::scaling_factor(scaling, "vMax");
    EXPECT_LE(previous, scaled);
    previous = scaled;
  }
}
