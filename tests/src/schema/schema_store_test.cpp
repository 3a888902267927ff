#include <gtest/gtest.h>
#include <vagus/crypto/hash.hpp>
#include <vagus/schema/defaults.hpp>
#include <vagus/schema/schema_store.hpp>
#include <vagus/testing/common.hpp>

#include <string>

namespace {

vagus::schema::value_t single_action(vagus::schema::value_t schema) {
  return vagus::schema::make_map(
      {{"actions",
        vagus::schema::make_map(
            {{"PUSH", vagus::schema::make_map(
                          {{"description", "push"},
                           {"parameters", vagus::schema::make_map(
                                              {{"p", std::move(schema)}})}})}})}});
}

vagus::schema::value_t single_state(const double speed, const double force) {
  return vagus::schema::make_map(
      {{"states",
        vagus::schema::make_map(
            {{"SAFE",
              vagus::schema::make_map(
                  {{"description", "safe"},
                   {"scaling", vagus::schema::make_map(
                                   {{"speed", speed}, {"force", force}})},
                   {"restrictions", vagus::schema::make_array({})}})}})}});
}

vagus::schema::value_t parameter(const double min, const double max) {
  return vagus::schema::make_map({{"type", "float"},
                                  {"unit", "m"},
                                  {"min", min},
                                  {"max", max},
                                  {"brakeable", true}});
}

}  // namespace

TEST(schema_store, loads_the_default_profile) {
  auto store = vagus::testing::make_default_store();
  EXPECT_EQ(store->actions().size(), 3u);
  EXPECT_EQ(store->policy().states.size(), 3u);

  const auto* vmax = store->find_parameter("MOVE_TO", "vMax");
  ASSERT_NE(vmax, nullptr);
  EXPECT_EQ(vmax->min, 0.0);
  EXPECT_EQ(vmax->max, 2.0);
  EXPECT_TRUE(vmax->brakeable);

  const auto* duration = store->find_parameter("GRASP", "duration");
  ASSERT_NE(duration, nullptr);
  EXPECT_FALSE(duration->brakeable);

  ASSERT_NE(store->find_action("HOME"), nullptr);
  EXPECT_TRUE(store->find_action("HOME")->parameters.empty());
}

TEST(schema_store, loaded_stores_are_independent_snapshots) {
  auto first = vagus::schema::schema_store::load(
      vagus::schema::default_action_source(),
      vagus::schema::default_policy_source());
  auto second = vagus::schema::schema_store::load(
      vagus::schema::default_action_source(),
      vagus::schema::default_policy_source());
  ASSERT_NE(first, nullptr);
  EXPECT_EQ(first.use_count(), 1);
  EXPECT_NE(first, second);

  auto reader = first;
  first = second;
  EXPECT_EQ(reader.use_count(), 1);
  EXPECT_NE(reader->find_action("MOVE_TO"), nullptr);
}

TEST(schema_store, lookups_are_case_sensitive) {
  auto store = vagus::testing::make_default_store();
  EXPECT_EQ(store->find_action("move_to"), nullptr);
  EXPECT_EQ(store->find_parameter("MOVE_TO", "VMAX"), nullptr);
  EXPECT_EQ(store->find_parameter("NOPE", "x"), nullptr);
  EXPECT_FALSE(store->find_scaling("safe").has_value());
}

TEST(schema_store, scaling_factors_come_from_policy) {
  auto store = vagus::testing::make_default_store();
  auto danger = store->find_scaling("DANGER");
  ASSERT_TRUE(danger.has_value());
  EXPECT_DOUBLE_EQ(danger->speed, 0.6);
  EXPECT_DOUBLE_EQ(danger->force, 0.7);

  const auto* shutdown = store->find_state("SHUTDOWN");
  ASSERT_NE(shutdown, nullptr);
  EXPECT_EQ(shutdown->restrictions.size(), 2u);
  EXPECT_EQ(shutdown->scaling.speed, 0.0);
}

TEST(schema_store, action_name_resolves_from_action_id) {
  auto store = vagus::testing::make_default_store();
  auto name = store->find_action_name(vagus::schema::make_action_id("GRASP"));
  ASSERT_TRUE(name.has_value());
  EXPECT_EQ(*name, "GRASP");
  EXPECT_FALSE(
      store->find_action_name(vagus::testing::make_hash(1)).has_value());
  EXPECT_EQ(vagus::schema::to_hex(vagus::schema::make_action_id("MOVE_TO")),
            "dd86a3b3a5073bdfa3eb938006b3e6f222a0dc7b537cf8fd96bd90ec608db192");
}

TEST(schema_store, scaled_limits_hash_commits_to_factors) {
  auto store = vagus::testing::make_default_store();
  EXPECT_EQ(vagus::schema::to_hex(store->scaled_limits_hash("MOVE_TO", "DANGER")),
            "a2257c2c5ac7fec1dae63ce641d1a11e02f19d9e4854ec3074a4dc691d29a875");
  EXPECT_EQ(store->scaled_limits_hash("MOVE_TO", "DANGER"),
            vagus::crypto::sha256(std::string_view{"MOVE_TO:0.6:0.7"}));
  EXPECT_EQ(store->scaled_limits_hash("MOVE_TO", "PANIC"),
            vagus::schema::make_zero_hash());
}

TEST(schema_store, absent_sources_fail_to_load) {
  EXPECT_THROW(vagus::schema::schema_store::load(
                   nullptr, vagus::schema::default_policy_source()),
               vagus::schema::schema_load_error);
  EXPECT_THROW(vagus::schema::schema_store::load(
                   vagus::schema::default_action_source(), nullptr),
               vagus::schema::schema_load_error);
}

TEST(schema_store, malformed_sources_fail_to_load) {
  auto policy = single_state(1.0, 1.0);
  EXPECT_NO_THROW(
      vagus::schema::schema_store::load(single_action(parameter(0, 1)), policy));

  // Missing top-level mapping.
  EXPECT_THROW(vagus::schema::schema_store::load(
                   vagus::schema::make_map({{"other", 1}}), policy),
               vagus::schema::schema_load_error);
  // Missing required field.
  EXPECT_THROW(vagus::schema::schema_store::load(
                   single_action(vagus::schema::make_map(
                       {{"type", "float"}, {"unit", "m"}, {"min", 0.0}})),
                   policy),
               vagus::schema::schema_load_error);
  // Mistyped field.
  EXPECT_THROW(vagus::schema::schema_store::load(
                   single_action(vagus::schema::make_map({{"type", "float"},
                                                          {"unit", "m"},
                                                          {"min", "low"},
                                                          {"max", 1.0},
                                                          {"brakeable", true}})),
                   policy),
               vagus::schema::schema_load_error);
  // Inverted bounds.
  EXPECT_THROW(
      vagus::schema::schema_store::load(single_action(parameter(2, 1)), policy),
      vagus::schema::schema_load_error);
  // Scaling factor outside [0, 1].
  EXPECT_THROW(vagus::schema::schema_store::load(
                   single_action(parameter(0, 1)), single_state(1.5, 1.0)),
               vagus::schema::schema_load_error);
}

TEST(schema_store, integer_bounds_are_accepted) {
  auto store = vagus::schema::schema_store::load(
      single_action(vagus::schema::make_map({{"type", "int"},
                                             {"unit", "ms"},
                                             {"min", -3},
                                             {"max", 7},
                                             {"brakeable", false}})),
      single_state(1.0, 0.5));
  const auto* p = store->find_parameter("PUSH", "p");
  ASSERT_NE(p, nullptr);
  EXPECT_EQ(p->min, -3.0);
  EXPECT_EQ(p->max, 7.0);
}
