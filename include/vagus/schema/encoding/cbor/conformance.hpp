#pragma once
#include <vagus/schema/value.hpp>
#include <string>
#include <vector>

namespace vagus::schema::encoding::cbor {

struct conformance_vector final {
  std::string name;
  value_t input;
};

using conformance_vector_t = conformance_vector;

/// Reference inputs shared with the on-chain verifiers, in publication
/// order. Their encodings and hashes are the cross-implementation gate.
const std::vector<conformance_vector_t>& conformance_vectors();

}  // namespace vagus::schema::encoding::cbor
