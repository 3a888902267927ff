#include <vagus/schema/encoding/cbor/conformance.hpp>

namespace vagus::schema::encoding::cbor {

const std::vector<conformance_vector_t>& conformance_vectors() {
  static const auto vectors = std::vector<conformance_vector_t>{
      {.name = "empty_dict", .input = value_t{map_t{}}},
      {.name = "simple_dict",
       .input = make_map({{"key", "value"}, {"num", 42}})},
      {.name = "sorted_keys",
       .input = make_map({{"z", 1}, {"a", 2}, {"m", 3}})},
      {.name = "nested_dict",
       .input = make_map({{"outer", make_map({{"inner", "value"}})}})},
      {.name = "array", .input = make_array({1, 2, 3, 4})},
      {.name = "mixed_types",
       .input = make_map({{"int", 123},
                          {"float", 45.67},
                          {"bool", true},
                          {"str", "test"}})},
      {.name = "zero_values",
       .input = make_map({{"zero", 0}, {"false", false}, {"empty", ""}})},
      {.name = "large_int", .input = make_map({{"big", 4294967295u}})},
      {.name = "negative_int", .input = make_map({{"neg", -123}})},
      {.name = "intent_params",
       .input = make_map({{"velocity", 1000},
                          {"acceleration", 500},
                          {"duration_ms", 30000},
                          {"energy_j", 100}})},
      {.name = "state_root",
       .input = make_map(
           {{"position", make_map({{"x", 100}, {"y", 200}, {"z", 50}})},
            {"velocity", make_map({{"x", 10}, {"y", 5}, {"z", 0}})}})},
      {.name = "length_first_keys",
       .input = make_map({{"ccc", 3}, {"bb", 2}, {"b", 1}, {"a", 0}})},
      {.name = "float_widths",
       .input = make_map(
           {{"half", 1.5}, {"single", 100000.0}, {"double", 1.1}})},
      {.name = "null_and_bytes",
       .input = make_map({{"absent", nullptr},
                          {"data", bytes_t{0x01, 0x02, 0xFF}}})},
  };
  return vectors;
}

}  // namespace vagus::schema::encoding::cbor
