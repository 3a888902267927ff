#include <boost/endian/conversion.hpp>
#include <nettle/sha3.h>
#include <openssl/evp.h>
#include <vagus/crypto/hash.hpp>

#include <algorithm>
#include <array>
#include <memory>
#include <stdexcept>

namespace vagus::crypto {

namespace {

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>;

vagus::schema::hash32_t evp_digest(const EVP_MD* md,
                                   const uint8_t* data,
                                   const std::size_t size) {
  auto ctx = evp_md_ctx_ptr{EVP_MD_CTX_new(), EVP_MD_CTX_free};
  if (!ctx) {
    throw std::runtime_error{"EVP_MD_CTX_new failed"};
  }
  auto output = vagus::schema::hash32_t{};
  auto length = 0u;
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 ||
      EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), output.data(), &length) != 1 ||
      length != output.size()) {
    throw std::runtime_error{"EVP digest failed"};
  }
  return output;
}

// Keccak-256 sponge over nettle's Keccak-f[1600] permutation. Rate is 136
// bytes; the final block carries the legacy 0x01 ... 0x80 padding.
constexpr auto kKeccakRate = std::size_t{SHA3_256_BLOCK_SIZE};

void absorb_block(sha3_state& state, const uint8_t* block) {
  for (std::size_t lane = 0; lane < kKeccakRate / 8; ++lane) {
    state.a[lane] ^= boost::endian::load_little_u64(block + (lane * 8));
  }
  sha3_permute(&state);
}

vagus::schema::hash32_t keccak_digest(const uint8_t* data, std::size_t size) {
  auto state = sha3_state{};
  while (size >= kKeccakRate) {
    absorb_block(state, data);
    data += kKeccakRate;
    size -= kKeccakRate;
  }

  auto last = std::array<uint8_t, kKeccakRate>{};
  std::copy_n(data, size, last.data());
  last[size] ^= 0x01u;
  last[kKeccakRate - 1] ^= 0x80u;
  absorb_block(state, last.data());

  auto output = vagus::schema::hash32_t{};
  for (std::size_t lane = 0; lane < output.size() / 8; ++lane) {
    boost::endian::store_little_u64(output.data() + (lane * 8),
                                    state.a[lane]);
  }
  return output;
}

const uint8_t* as_bytes(const std::string_view& str) {
  return reinterpret_cast<const uint8_t*>(str.data());
}

}  // namespace

vagus::schema::hash32_t sha256(const std::string_view& str) {
  return evp_digest(EVP_sha256(), as_bytes(str), str.size());
}

vagus::schema::hash32_t sha256(const std::span<const uint8_t>& bytes) {
  return evp_digest(EVP_sha256(), bytes.data(), bytes.size());
}

vagus::schema::hash32_t sha3_256(const std::string_view& str) {
  return evp_digest(EVP_sha3_256(), as_bytes(str), str.size());
}

vagus::schema::hash32_t sha3_256(const std::span<const uint8_t>& bytes) {
  return evp_digest(EVP_sha3_256(), bytes.data(), bytes.size());
}

vagus::schema::hash32_t keccak256(const std::string_view& str) {
  return keccak_digest(as_bytes(str), str.size());
}

vagus::schema::hash32_t keccak256(const std::span<const uint8_t>& bytes) {
  return keccak_digest(bytes.data(), bytes.size());
}

}  // namespace vagus::crypto
