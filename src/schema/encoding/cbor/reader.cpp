#include <spdlog/fmt/fmt.h>
#include <tinycbor/cbor.h>
#include <vagus/schema/encoding/cbor/codec.hpp>
#include <vagus/schema/encoding/encoder.hpp>

#include <algorithm>
#include <cmath>
#include <limits>

namespace vagus::schema::encoding::cbor {

namespace {

// Length-first key order and float width are checked while converting.
constexpr auto kValidationFlags = static_cast<uint32_t>(
    CborValidateShortestNumbers | CborValidateNoIndeterminateLength |
    CborValidateNoTags | CborValidateNoUndefined |
    CborValidateNoUnknownSimpleTypes | CborValidateCompleteData);

void check(const CborError error) {
  if (error != CborNoError) {
    throw encoding_error{
        fmt::format("invalid cbor: {}", cbor_error_string(error))};
  }
}

double half_to_double(const uint16_t half) {
  const auto exponent = static_cast<int>((half >> 10u) & 0x1Fu);
  const auto mantissa = static_cast<int>(half & 0x3FFu);
  auto magnitude = double{};
  if (exponent == 0) {
    magnitude = std::ldexp(mantissa, -24);
  } else if (exponent == 31) {
    magnitude = mantissa == 0 ? std::numeric_limits<double>::infinity()
                              : std::numeric_limits<double>::quiet_NaN();
  } else {
    magnitude = std::ldexp(mantissa + 1024, exponent - 25);
  }
  return (half & 0x8000u) != 0 ? -magnitude : magnitude;
}

bytes_view_t span_between(const uint8_t* begin, const uint8_t* end) {
  return bytes_view_t{begin, static_cast<std::size_t>(end - begin)};
}

value_t read_item(CborValue& it, std::size_t depth);

value_t read_integer(CborValue& it) {
  if (cbor_value_is_unsigned_integer(&it)) {
    auto n = uint64_t{};
    check(cbor_value_get_uint64(&it, &n));
    check(cbor_value_advance_fixed(&it));
    return value_t{n};
  }
  auto n = int64_t{};
  if (cbor_value_get_int64_checked(&it, &n) != CborNoError) {
    throw encoding_error{"negative integer below the int64 range"};
  }
  check(cbor_value_advance_fixed(&it));
  return value_t{n};
}

value_t read_float(CborValue& it) {
  const auto* start = cbor_value_get_next_byte(&it);
  auto decoded = double{};
  switch (cbor_value_get_type(&it)) {
    case CborHalfFloatType: {
      auto half = uint16_t{};
      check(cbor_value_get_half_float(&it, &half));
      decoded = half_to_double(half);
      break;
    }
    case CborFloatType: {
      auto single = float{};
      check(cbor_value_get_float(&it, &single));
      decoded = static_cast<double>(single);
      break;
    }
    default:
      check(cbor_value_get_double(&it, &decoded));
      break;
  }
  check(cbor_value_advance_fixed(&it));

  // Floats must already be in the width write() picks.
  const auto encoded = span_between(start, cbor_value_get_next_byte(&it));
  if (!std::ranges::equal(encoded, write(value_t{decoded}))) {
    throw encoding_error{"float not in its canonical width"};
  }
  return value_t{decoded};
}

value_t read_text(CborValue& it) {
  auto length = std::size_t{};
  check(cbor_value_get_string_length(&it, &length));
  auto text = std::string(length + 1, '\0');
  auto copied = text.size();
  auto next = CborValue{};
  check(cbor_value_copy_text_string(&it, text.data(), &copied, &next));
  text.resize(copied);
  it = next;
  return value_t{std::move(text)};
}

value_t read_bytes(CborValue& it) {
  auto length = std::size_t{};
  check(cbor_value_get_string_length(&it, &length));
  auto bytes = bytes_t(length + 1);
  auto copied = bytes.size();
  auto next = CborValue{};
  check(cbor_value_copy_byte_string(&it, bytes.data(), &copied, &next));
  bytes.resize(copied);
  it = next;
  return value_t{std::move(bytes)};
}

value_t read_array(CborValue& it, const std::size_t depth) {
  auto items = array_t{};
  auto inner = CborValue{};
  check(cbor_value_enter_container(&it, &inner));
  while (!cbor_value_at_end(&inner)) {
    items.push_back(read_item(inner, depth + 1));
  }
  check(cbor_value_leave_container(&it, &inner));
  return value_t{std::move(items)};
}

value_t read_map(CborValue& it, const std::size_t depth) {
  auto entries = map_t{};
  auto inner = CborValue{};
  check(cbor_value_enter_container(&it, &inner));
  auto previous_key = bytes_view_t{};
  auto first = true;
  while (!cbor_value_at_end(&inner)) {
    const auto* key_start = cbor_value_get_next_byte(&inner);
    auto key = read_item(inner, depth + 1);
    const auto key_bytes =
        span_between(key_start, cbor_value_get_next_byte(&inner));
    if (!first) {
      const auto ordered =
          previous_key.size() < key_bytes.size() ||
          (previous_key.size() == key_bytes.size() &&
           std::ranges::lexicographical_compare(previous_key, key_bytes));
      if (!ordered) {
        throw encoding_error{"map keys are not in canonical order"};
      }
    }
    first = false;
    previous_key = key_bytes;
    auto item = read_item(inner, depth + 1);
    entries.emplace_back(std::move(key), std::move(item));
  }
  check(cbor_value_leave_container(&it, &inner));
  return value_t{std::move(entries)};
}

value_t read_item(CborValue& it, const std::size_t depth) {
  if (depth > kMaxNestingDepth) {
    throw encoding_error{"nesting exceeds the supported depth"};
  }
  switch (cbor_value_get_type(&it)) {
    case CborIntegerType:
      return read_integer(it);
    case CborByteStringType:
      return read_bytes(it);
    case CborTextStringType:
      return read_text(it);
    case CborArrayType:
      return read_array(it, depth);
    case CborMapType:
      return read_map(it, depth);
    case CborBooleanType: {
      auto b = false;
      check(cbor_value_get_boolean(&it, &b));
      check(cbor_value_advance_fixed(&it));
      return value_t{b};
    }
    case CborNullType:
      check(cbor_value_advance_fixed(&it));
      return value_t{nullptr};
    case CborHalfFloatType:
    case CborFloatType:
    case CborDoubleType:
      return read_float(it);
    case CborTagType:
      throw encoding_error{"tagged items are not supported"};
    default:
      throw encoding_error{"unsupported cbor item"};
  }
}

}  // namespace

value_t read(const bytes_view_t& bytes) {
  auto parser = CborParser{};
  auto it = CborValue{};
  check(cbor_parser_init(bytes.data(), bytes.size(), 0, &parser, &it));
  check(cbor_value_validate(&it, kValidationFlags));

  auto result = read_item(it, 0);
  const auto* end = bytes.data() + bytes.size();
  if (cbor_value_get_next_byte(&it) != end) {
    throw encoding_error{
        fmt::format("{} trailing byte(s) after item",
                    end - cbor_value_get_next_byte(&it))};
  }
  return result;
}

}  // namespace vagus::schema::encoding::cbor
