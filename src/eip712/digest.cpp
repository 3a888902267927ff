#include <boost/endian/conversion.hpp>
#include <vagus/crypto/hash.hpp>
#include <vagus/eip712/digest.hpp>

#include <array>
#include <iterator>

namespace vagus::eip712 {

namespace {

using word_t = std::array<uint8_t, 32>;

word_t make_word(const uint64_t n) {
  auto word = word_t{};
  boost::endian::store_big_u64(word.data() + 24, n);
  return word;
}

void append(vagus::schema::bytes_t& out,
            const vagus::schema::bytes_view_t& bytes) {
  out.insert(std::end(out), std::begin(bytes), std::end(bytes));
}

void append_word(vagus::schema::bytes_t& out, const uint64_t n) {
  append(out, make_word(n));
}

vagus::schema::value_t field(const std::string_view name,
                             const std::string_view type) {
  return vagus::schema::make_map({{"name", name}, {"type", type}});
}

}  // namespace

domain_t default_domain() {
  return domain_t{.name = "Vagus",
                  .version = "1",
                  .chain_id = 31337,
                  .verifying_contract = vagus::schema::make_zero_address()};
}

vagus::schema::hash32_t domain_separator(const domain_t& d) {
  auto data = vagus::schema::bytes_t{};
  data.reserve(32 * 4 + 20);
  append(data, vagus::crypto::keccak256(kDomainTypeString));
  append(data, vagus::crypto::keccak256(std::string_view{d.name}));
  append(data, vagus::crypto::keccak256(std::string_view{d.version}));
  append_word(data, d.chain_id);
  append(data, d.verifying_contract);
  return vagus::crypto::keccak256(vagus::schema::make_bytes_view(data));
}

vagus::schema::hash32_t struct_hash(const vagus::schema::intent_t& intent) {
  auto data = vagus::schema::bytes_t{};
  data.reserve(32 * 11 + 20);
  append(data, vagus::crypto::keccak256(kIntentTypeString));
  append_word(data, intent.executor_id);
  append(data, intent.action_id);
  append(data, vagus::crypto::keccak256(
                   vagus::schema::make_bytes_view(intent.params)));
  append(data, intent.envelope_hash);
  append(data, intent.pre_state_root);
  append_word(data, intent.not_before);
  append_word(data, intent.not_after);
  append_word(data, intent.max_duration_ms);
  append_word(data, intent.max_energy_j);
  append(data, intent.planner);
  append_word(data, intent.nonce);
  return vagus::crypto::keccak256(vagus::schema::make_bytes_view(data));
}

vagus::schema::hash32_t signing_digest(const vagus::schema::intent_t& intent,
                                       const domain_t& d) {
  auto data = vagus::schema::bytes_t{0x19, 0x01};
  append(data, domain_separator(d));
  append(data, struct_hash(intent));
  return vagus::crypto::keccak256(vagus::schema::make_bytes_view(data));
}

vagus::schema::value_t intent_message(const vagus::schema::intent_t& intent) {
  using vagus::schema::to_prefixed_hex;
  return vagus::schema::make_map({
      {"executorId", intent.executor_id},
      {"actionId", to_prefixed_hex(intent.action_id)},
      {"params", to_prefixed_hex(intent.params)},
      {"envelopeHash", to_prefixed_hex(intent.envelope_hash)},
      {"preStateRoot", to_prefixed_hex(intent.pre_state_root)},
      {"notBefore", intent.not_before},
      {"notAfter", intent.not_after},
      {"maxDurationMs", intent.max_duration_ms},
      {"maxEnergyJ", intent.max_energy_j},
      {"planner", to_prefixed_hex(intent.planner)},
      {"nonce", intent.nonce},
  });
}

vagus::schema::value_t typed_data(const vagus::schema::intent_t& intent,
                                  const domain_t& d) {
  using vagus::schema::make_array;
  using vagus::schema::make_map;
  auto types = make_map({
      {"EIP712Domain",
       make_array({field("name", "string"), field("version", "string"),
                   field("chainId", "uint256"),
                   field("verifyingContract", "address")})},
      {"Intent",
       make_array({field("executorId", "uint256"),
                   field("actionId", "bytes32"), field("params", "bytes"),
                   field("envelopeHash", "bytes32"),
                   field("preStateRoot", "bytes32"),
                   field("notBefore", "uint256"), field("notAfter", "uint256"),
                   field("maxDurationMs", "uint32"),
                   field("maxEnergyJ", "uint32"), field("planner", "address"),
                   field("nonce", "uint256")})},
  });
  auto domain_fields = make_map({
      {"name", d.name},
      {"version", d.version},
      {"chainId", d.chain_id},
      {"verifyingContract",
       vagus::schema::to_prefixed_hex(d.verifying_contract)},
  });
  return make_map({
      {"types", std::move(types)},
      {"primaryType", "Intent"},
      {"domain", std::move(domain_fields)},
      {"message", intent_message(intent)},
  });
}

}  // namespace vagus::eip712
