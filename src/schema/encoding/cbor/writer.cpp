#include <spdlog/fmt/fmt.h>
#include <tinycbor/cbor.h>
#include <vagus/schema/encoding/cbor/codec.hpp>
#include <vagus/schema/encoding/encoder.hpp>

#include <algorithm>
#include <bit>
#include <cmath>
#include <iterator>
#include <limits>
#include <optional>
#include <utility>

namespace vagus::schema::encoding::cbor {

namespace {

constexpr auto kInitialBufferSize = std::size_t{256};

// Out-of-memory is not fatal: the encoder keeps counting the bytes it
// would have needed and the caller retries with a larger buffer.
void check(const CborError error) {
  if (error != CborNoError && error != CborErrorOutOfMemory) {
    throw encoding_error{
        fmt::format("cbor encoding failed: {}", cbor_error_string(error))};
  }
}

// Exact binary16 form of a finite float, if one exists.
std::optional<uint16_t> to_half_exact(const float value) {
  const auto bits = std::bit_cast<uint32_t>(value);
  const auto sign = static_cast<uint16_t>((bits >> 16u) & 0x8000u);
  const auto exponent = static_cast<int>((bits >> 23u) & 0xFFu);
  const auto mantissa = bits & 0x7FFFFFu;

  if (exponent == 0) {
    // Zero survives; float subnormals are far below the binary16 range.
    if (mantissa == 0) {
      return sign;
    }
    return std::nullopt;
  }

  const auto unbiased = exponent - 127;
  if (unbiased > 15) {
    return std::nullopt;
  }
  if (unbiased >= -14) {
    if ((mantissa & 0x1FFFu) != 0) {
      return std::nullopt;
    }
    return static_cast<uint16_t>(sign |
                                 static_cast<uint16_t>((unbiased + 15) << 10) |
                                 static_cast<uint16_t>(mantissa >> 13u));
  }
  if (unbiased < -24) {
    return std::nullopt;
  }
  // binary16 subnormal: value = m * 2^-24 with m < 1024.
  const auto significand = 0x800000u | mantissa;
  const auto shift = static_cast<uint32_t>(-(unbiased + 1));
  if ((significand & ((1u << shift) - 1u)) != 0) {
    return std::nullopt;
  }
  return static_cast<uint16_t>(sign | (significand >> shift));
}

void write_half(CborEncoder* encoder, const uint16_t half) {
  check(cbor_encode_half_float(encoder, &half));
}

void write_float(CborEncoder* encoder, const double value) {
  if (std::isnan(value)) {
    write_half(encoder, 0x7E00);
    return;
  }
  if (std::isinf(value)) {
    write_half(encoder, value > 0 ? 0x7C00 : 0xFC00);
    return;
  }

  if (std::fabs(value) <= std::numeric_limits<float>::max()) {
    const auto narrow = static_cast<float>(value);
    if (static_cast<double>(narrow) == value) {
      if (auto half = to_half_exact(narrow)) {
        write_half(encoder, *half);
        return;
      }
      check(cbor_encode_float(encoder, narrow));
      return;
    }
  }
  check(cbor_encode_double(encoder, value));
}

void write_item(const value_t& v, CborEncoder* encoder, std::size_t depth);

// Encodes one item into `out`, growing the buffer until it fits.
void write_document(const value_t& v, bytes_t& out, const std::size_t depth) {
  auto buffer = bytes_t(kInitialBufferSize);
  while (true) {
    auto encoder = CborEncoder{};
    cbor_encoder_init(&encoder, buffer.data(), buffer.size(), 0);
    write_item(v, &encoder, depth);
    const auto extra = cbor_encoder_get_extra_bytes_needed(&encoder);
    if (extra == 0) {
      const auto used = cbor_encoder_get_buffer_size(&encoder, buffer.data());
      out.insert(std::end(out), std::begin(buffer),
                 std::next(std::begin(buffer),
                           static_cast<std::ptrdiff_t>(used)));
      return;
    }
    buffer.resize(buffer.size() + extra);
  }
}

struct sorted_entry final {
  bytes_t encoded_key;
  const value_t* key{nullptr};
  const value_t* item{nullptr};
};

void write_map(const map_t& entries,
               CborEncoder* encoder,
               const std::size_t depth) {
  auto sorted = std::vector<sorted_entry>{};
  sorted.reserve(entries.size());
  for (const auto& [key, item] : entries) {
    auto entry = sorted_entry{.key = &key, .item = &item};
    write_document(key, entry.encoded_key, depth + 1);
    sorted.push_back(std::move(entry));
  }

  std::ranges::sort(sorted, [](const auto& lhs, const auto& rhs) {
    if (lhs.encoded_key.size() != rhs.encoded_key.size()) {
      return lhs.encoded_key.size() < rhs.encoded_key.size();
    }
    return lhs.encoded_key < rhs.encoded_key;
  });
  auto duplicate = std::ranges::adjacent_find(
      sorted, [](const auto& lhs, const auto& rhs) {
        return lhs.encoded_key == rhs.encoded_key;
      });
  if (duplicate != std::end(sorted)) {
    throw encoding_error{fmt::format("duplicate map key 0x{}",
                                     to_hex(duplicate->encoded_key))};
  }

  auto container = CborEncoder{};
  check(cbor_encoder_create_map(encoder, &container, sorted.size()));
  for (const auto& entry : sorted) {
    write_item(*entry.key, &container, depth + 1);
    write_item(*entry.item, &container, depth + 1);
  }
  check(cbor_encoder_close_container(encoder, &container));
}

void write_item(const value_t& v,
                CborEncoder* encoder,
                const std::size_t depth) {
  if (depth > kMaxNestingDepth) {
    throw encoding_error{"value nesting exceeds the supported depth"};
  }
  std::visit(
      overloaded{
          [&](const std::nullptr_t) { check(cbor_encode_null(encoder)); },
          [&](const bool b) { check(cbor_encode_boolean(encoder, b)); },
          [&](const uint64_t n) { check(cbor_encode_uint(encoder, n)); },
          [&](const int64_t n) {
            if (n >= 0) {
              check(cbor_encode_uint(encoder, static_cast<uint64_t>(n)));
              return;
            }
            // Magnitude, computed without overflowing at INT64_MIN.
            check(cbor_encode_negative_int(encoder,
                                           0 - static_cast<uint64_t>(n)));
          },
          [&](const double d) { write_float(encoder, d); },
          [&](const std::string& text) {
            check(cbor_encode_text_string(encoder, text.data(), text.size()));
          },
          [&](const bytes_t& bytes) {
            check(cbor_encode_byte_string(encoder, bytes.data(), bytes.size()));
          },
          [&](const array_t& items) {
            auto container = CborEncoder{};
            check(cbor_encoder_create_array(encoder, &container, items.size()));
            for (const auto& item : items) {
              write_item(item, &container, depth + 1);
            }
            check(cbor_encoder_close_container(encoder, &container));
          },
          [&](const map_t& entries) { write_map(entries, encoder, depth); }},
      v.data);
}

}  // namespace

void write(const value_t& v, bytes_t& out) {
  write_document(v, out, 0);
}

bytes_t write(const value_t& v) {
  auto out = bytes_t{};
  write(v, out);
  return out;
}

value_t strip_nulls(const value_t& v) {
  const auto* entries = as_map(v);
  if (entries == nullptr) {
    return v;
  }
  auto kept = map_t{};
  std::ranges::copy_if(*entries, std::back_inserter(kept),
                       [](const map_entry_t& entry) {
                         return !entry.second.is<std::nullptr_t>();
                       });
  return value_t{std::move(kept)};
}

}  // namespace vagus::schema::encoding::cbor
