#include <gtest/gtest.h>
#include <vagus/crypto/hash.hpp>
#include <vagus/eip712/digest.hpp>
#include <vagus/testing/common.hpp>

#include <string>

namespace {

std::string hex(const vagus::schema::hash32_t& hash) {
  return vagus::schema::to_hex(hash);
}

const std::string& text_at(const vagus::schema::value_t& map,
                           const std::string_view key) {
  const auto* found = vagus::schema::find(map, key);
  EXPECT_NE(found, nullptr);
  static const auto empty = std::string{};
  if (found == nullptr || vagus::schema::as_text(*found) == nullptr) {
    return empty;
  }
  return *vagus::schema::as_text(*found);
}

}  // namespace

TEST(eip712_digest, domain_type_hash_is_the_standard_one) {
  EXPECT_EQ(hex(vagus::crypto::keccak256(vagus::eip712::kDomainTypeString)),
            "8b73c3c69bb8fe3d512ecc4cf759cc79239f7b179b0ffacaa9a75d522b39400f");
}

TEST(eip712_digest, default_domain_values) {
  auto domain = vagus::eip712::default_domain();
  EXPECT_EQ(domain.name, "Vagus");
  EXPECT_EQ(domain.version, "1");
  EXPECT_EQ(domain.chain_id, 31337u);
  EXPECT_EQ(domain.verifying_contract, vagus::schema::make_zero_address());
}

TEST(eip712_digest, reference_intent_digest_matches_known_answer) {
  auto store = vagus::testing::make_default_store();
  auto intent = vagus::testing::make_reference_intent(store);
  auto domain = vagus::eip712::default_domain();

  EXPECT_EQ(hex(vagus::eip712::domain_separator(domain)),
            "fc8f0877f6e699419dc0b9f393f3d78403ac2c273ce2d5284b82ad5429fab63f");
  EXPECT_EQ(hex(vagus::eip712::struct_hash(intent)),
            "8ec4e47a608508b70fdf1a1722d8a990d4f362e489ed7c5c85f2009c5b26a08e");
  EXPECT_EQ(hex(vagus::eip712::signing_digest(intent, domain)),
            "366d79e9e490406d46ba513f6e00bd7ccffea3a93dd2df8f1773c5255529780f");
}

TEST(eip712_digest, digest_is_deterministic) {
  auto store = vagus::testing::make_default_store();
  auto intent = vagus::testing::make_reference_intent(store);
  auto domain = vagus::eip712::default_domain();
  EXPECT_EQ(vagus::eip712::signing_digest(intent, domain),
            vagus::eip712::signing_digest(intent, domain));
}

TEST(eip712_digest, chain_id_changes_separator_and_digest) {
  auto store = vagus::testing::make_default_store();
  auto intent = vagus::testing::make_reference_intent(store);
  auto local = vagus::eip712::default_domain();
  auto mainnet = local;
  mainnet.chain_id = 1;

  EXPECT_NE(vagus::eip712::domain_separator(local),
            vagus::eip712::domain_separator(mainnet));
  EXPECT_EQ(hex(vagus::eip712::domain_separator(mainnet)),
            "385c158788aaf2c6884bb67d9b68de3cdba7ea2da0ab23ebbf00b9f704ce387c");
  EXPECT_EQ(hex(vagus::eip712::signing_digest(intent, mainnet)),
            "458c14e8c67360000b302c578b8da9ce806bd54deb2290ef158b71554a3e8ea1");
}

TEST(eip712_digest, every_field_feeds_the_struct_hash) {
  auto store = vagus::testing::make_default_store();
  auto base = vagus::testing::make_reference_intent(store);
  auto reference = vagus::eip712::struct_hash(base);

  auto changed = base;
  changed.nonce += 1;
  EXPECT_NE(vagus::eip712::struct_hash(changed), reference);

  changed = base;
  changed.pre_state_root = vagus::testing::make_hash(9);
  EXPECT_NE(vagus::eip712::struct_hash(changed), reference);

  changed = base;
  changed.params.push_back(';');
  EXPECT_NE(vagus::eip712::struct_hash(changed), reference);

  changed = base;
  changed.planner[19] ^= 0x01;
  EXPECT_NE(vagus::eip712::struct_hash(changed), reference);
}

TEST(eip712_digest, message_renders_hex_and_integers) {
  auto store = vagus::testing::make_default_store();
  auto intent = vagus::testing::make_reference_intent(store);
  auto message = vagus::eip712::intent_message(intent);

  EXPECT_EQ(text_at(message, "actionId"),
            "0xdd86a3b3a5073bdfa3eb938006b3e6f222a0dc7b537cf8fd96bd90ec608db192");
  EXPECT_EQ(text_at(message, "params"),
            "0x764d61783a312e303b783a312e303b793a302e353b7a3a312e35");
  EXPECT_EQ(text_at(message, "planner"),
            "0x742d35cc6645c0532925a3b8dc6b6b5a1c6bb0b5");
  ASSERT_NE(vagus::schema::find(message, "nonce"), nullptr);
  EXPECT_EQ(*vagus::schema::find(message, "nonce"),
            vagus::schema::value_t{vagus::testing::kReferenceNow});
  EXPECT_EQ(vagus::schema::as_map(message)->size(), 11u);
}

TEST(eip712_digest, typed_data_document_layout) {
  auto store = vagus::testing::make_default_store();
  auto intent = vagus::testing::make_reference_intent(store);
  auto document =
      vagus::eip712::typed_data(intent, vagus::eip712::default_domain());

  EXPECT_EQ(text_at(document, "primaryType"), "Intent");
  const auto* types = vagus::schema::find(document, "types");
  ASSERT_NE(types, nullptr);
  const auto* intent_fields =
      vagus::schema::as_array(*vagus::schema::find(*types, "Intent"));
  ASSERT_NE(intent_fields, nullptr);
  ASSERT_EQ(intent_fields->size(), 11u);
  EXPECT_EQ(text_at(intent_fields->front(), "name"), "executorId");
  EXPECT_EQ(text_at(intent_fields->back(), "type"), "uint256");

  const auto* domain = vagus::schema::find(document, "domain");
  ASSERT_NE(domain, nullptr);
  EXPECT_EQ(text_at(*domain, "name"), "Vagus");
  EXPECT_EQ(*vagus::schema::find(*domain, "chainId"),
            vagus::schema::value_t{31337});
  EXPECT_EQ(*vagus::schema::find(document, "message"),
            vagus::eip712::intent_message(intent));
}
