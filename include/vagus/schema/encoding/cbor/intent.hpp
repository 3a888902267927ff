#pragma once
#include <vagus/schema/intent.hpp>
#include <vagus/schema/value.hpp>

namespace vagus::schema::encoding::cbor {

// Intents travel as a map keyed by the camelCase field names of the
// signing message. Hashes, params and planner are byte strings.
value_t to_value(const intent<1>& o);
void from_value(const value_t& v, intent<1>& o);

}  // namespace vagus::schema::encoding::cbor
