#include <gtest/gtest.h>
#include <vagus/schema/encoding/encoder.hpp>
#include <vagus/schema/primitives.hpp>
#include <vagus/schema/value.hpp>

#include <limits>
#include <string>

TEST(primitives, make_hash32_from_bytes_round_trips) {
  auto input = vagus::schema::bytes_t(32, 0xAB);
  auto hash = vagus::schema::make_hash32(input);
  EXPECT_EQ(hash.size(), 32u);
  EXPECT_EQ(hash[0], 0xAB);
  EXPECT_EQ(hash[31], 0xAB);
}

TEST(primitives, make_hash32_from_hex_string_decodes) {
  auto hash = vagus::schema::make_hash32(
      std::string_view{"0x0102030405060708090a0b0c0d0e0f10"
                       "1112131415161718191a1b1c1d1e1f20"});
  EXPECT_EQ(hash[0], 0x01);
  EXPECT_EQ(hash[31], 0x20);
}

TEST(primitives, make_zero_hash_returns_zero_bytes) {
  auto zero = vagus::schema::make_zero_hash();
  for (auto byte : zero) {
    EXPECT_EQ(byte, 0u);
  }
}

TEST(primitives, address_accepts_mixed_case_hex) {
  auto address = vagus::schema::make_address(
      "0x742d35Cc6645C0532925a3b8dC6b6b5a1C6Bb0B5");
  EXPECT_EQ(vagus::schema::to_prefixed_hex(address),
            "0x742d35cc6645c0532925a3b8dc6b6b5a1c6bb0b5");
}

TEST(primitives, address_outside_twenty_bytes_is_an_encoding_error) {
  EXPECT_FALSE(vagus::schema::try_make_address("0x1234").has_value());
  EXPECT_THROW(vagus::schema::make_address(
                   "0x742d35Cc6645C0532925a3b8dC6b6b5a1C6Bb0B500"),
               vagus::schema::encoding::encoding_error);
}

TEST(primitives, from_hex_rejects_odd_length_and_bad_digits) {
  EXPECT_FALSE(vagus::schema::try_from_hex("abc").has_value());
  EXPECT_FALSE(vagus::schema::try_from_hex("zz").has_value());
  EXPECT_EQ(vagus::schema::from_hex("0X0aFf"),
            (vagus::schema::bytes_t{0x0A, 0xFF}));
}

TEST(primitives, format_number_matches_planner_text) {
  EXPECT_EQ(vagus::schema::format_number(2.0), "2.0");
  EXPECT_EQ(vagus::schema::format_number(-1.5), "-1.5");
  EXPECT_EQ(vagus::schema::format_number(0.6), "0.6");
  EXPECT_EQ(vagus::schema::format_number(0.0), "0.0");
  EXPECT_EQ(vagus::schema::format_number(10000.0), "10000.0");
  EXPECT_EQ(vagus::schema::format_number(45.67), "45.67");
}

TEST(value, integers_normalise_by_sign) {
  EXPECT_TRUE(vagus::schema::value_t{42}.is<uint64_t>());
  EXPECT_TRUE(vagus::schema::value_t{-1}.is<int64_t>());
  EXPECT_EQ(vagus::schema::value_t{7}, vagus::schema::value_t{uint64_t{7}});
  EXPECT_NE(vagus::schema::value_t{7}, vagus::schema::value_t{7.0});
}

TEST(value, non_negative_signed_storage_equals_unsigned) {
  auto v = vagus::schema::value_t{};
  v.data.emplace<int64_t>(5);
  EXPECT_EQ(v, vagus::schema::value_t{5});
  EXPECT_EQ(vagus::schema::value_t{5}, v);
  v.data.emplace<int64_t>(-5);
  EXPECT_NE(v, vagus::schema::value_t{uint64_t{5}});
}

TEST(value, find_looks_up_text_keys) {
  auto map = vagus::schema::make_map({{"a", 1}, {"b", "two"}});
  ASSERT_NE(vagus::schema::find(map, "b"), nullptr);
  EXPECT_EQ(*vagus::schema::as_text(*vagus::schema::find(map, "b")), "two");
  EXPECT_EQ(vagus::schema::find(map, "c"), nullptr);
  EXPECT_EQ(*vagus::schema::as_number(*vagus::schema::find(map, "a")), 1.0);
}
