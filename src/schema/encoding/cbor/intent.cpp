#include <spdlog/fmt/fmt.h>
#include <vagus/schema/encoding/cbor/intent.hpp>
#include <vagus/schema/encoding/encoder.hpp>

#include <algorithm>
#include <limits>
#include <variant>

namespace vagus::schema::encoding::cbor {

namespace {

const value_t& require(const map_t& entries, const std::string_view key) {
  const auto* found = find(entries, key);
  if (found == nullptr) {
    throw encoding_error{fmt::format("intent field {} is missing", key)};
  }
  return *found;
}

uint64_t require_unsigned(const map_t& entries,
                          const std::string_view key,
                          const uint64_t maximum) {
  const auto* number = std::get_if<uint64_t>(&require(entries, key).data);
  if (number == nullptr || *number > maximum) {
    throw encoding_error{
        fmt::format("intent field {} is not an unsigned integer in range",
                    key)};
  }
  return *number;
}

const bytes_t& require_bytes(const map_t& entries,
                             const std::string_view key) {
  const auto* bytes = std::get_if<bytes_t>(&require(entries, key).data);
  if (bytes == nullptr) {
    throw encoding_error{fmt::format("intent field {} is not bytes", key)};
  }
  return *bytes;
}

template <std::size_t N>
std::array<uint8_t, N> require_fixed(const map_t& entries,
                                     const std::string_view key) {
  const auto& bytes = require_bytes(entries, key);
  if (bytes.size() != N) {
    throw encoding_error{fmt::format(
        "intent field {} must be {} bytes, got {}", key, N, bytes.size())};
  }
  auto out = std::array<uint8_t, N>{};
  std::ranges::copy(bytes, std::begin(out));
  return out;
}

}  // namespace

value_t to_value(const intent<1>& o) {
  return make_map({
      {"executorId", o.executor_id},
      {"actionId", make_bytes(o.action_id)},
      {"params", o.params},
      {"envelopeHash", make_bytes(o.envelope_hash)},
      {"preStateRoot", make_bytes(o.pre_state_root)},
      {"notBefore", o.not_before},
      {"notAfter", o.not_after},
      {"maxDurationMs", o.max_duration_ms},
      {"maxEnergyJ", o.max_energy_j},
      {"planner", make_bytes(o.planner)},
      {"nonce", o.nonce},
  });
}

void from_value(const value_t& v, intent<1>& o) {
  const auto* entries = as_map(v);
  if (entries == nullptr) {
    throw encoding_error{"intent must be encoded as a map"};
  }
  if (entries->size() != 11) {
    throw encoding_error{
        fmt::format("intent map has {} fields, expected 11", entries->size())};
  }
  constexpr auto u64_max = std::numeric_limits<uint64_t>::max();
  constexpr auto u32_max = uint64_t{std::numeric_limits<uint32_t>::max()};

  o.executor_id = require_unsigned(*entries, "executorId", u64_max);
  o.action_id = require_fixed<32>(*entries, "actionId");
  o.params = require_bytes(*entries, "params");
  o.envelope_hash = require_fixed<32>(*entries, "envelopeHash");
  o.pre_state_root = require_fixed<32>(*entries, "preStateRoot");
  o.not_before = require_unsigned(*entries, "notBefore", u64_max);
  o.not_after = require_unsigned(*entries, "notAfter", u64_max);
  o.max_duration_ms = static_cast<uint32_t>(
      require_unsigned(*entries, "maxDurationMs", u32_max));
  o.max_energy_j =
      static_cast<uint32_t>(require_unsigned(*entries, "maxEnergyJ", u32_max));
  o.planner = require_fixed<20>(*entries, "planner");
  o.nonce = require_unsigned(*entries, "nonce", u64_max);
}

}  // namespace vagus::schema::encoding::cbor
