#include <boost/program_options.hpp>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <vagus/common/critical.hpp>
#include <vagus/eip712/digest.hpp>
#include <vagus/intent/builder.hpp>
#include <vagus/schema/defaults.hpp>
#include <vagus/schema/encoding/cbor/conformance.hpp>
#include <vagus/schema/encoding/cbor/encoder.hpp>
#include <vagus/schema/schema_store.hpp>
#include <vagus/validation/intent_validator.hpp>
#include <vagus/validation/parameter_validator.hpp>

#include <charconv>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>
#include <variant>
#include <vector>

namespace {

using encoder_t = vagus::schema::encoding::encoder<
    vagus::schema::encoding::cbor_encoder_tag>;
namespace po = boost::program_options;

double parse_number(const std::string_view text) {
  auto value = double{};
  const auto [ptr, ec] =
      std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    vagus::common::critical("parameter value must be a number");
  }
  return value;
}

std::pair<std::string, double> parse_parameter(const std::string_view arg) {
  const auto separator = arg.find('=');
  if (separator == std::string_view::npos || separator == 0) {
    vagus::common::critical("--param expects name=value");
  }
  return {std::string{arg.substr(0, separator)},
          parse_number(arg.substr(separator + 1))};
}

vagus::schema::address_t get_address(const po::variables_map& vm,
                                     const std::string& name) {
  auto address = vagus::schema::try_make_address(vm[name].as<std::string>());
  if (!address) {
    vagus::common::critical("address arguments must be 20-byte hex");
  }
  return *address;
}

vagus::eip712::domain_t make_domain(const po::variables_map& vm) {
  return vagus::eip712::domain_t{
      .name = vm["domain-name"].as<std::string>(),
      .version = vm["domain-version"].as<std::string>(),
      .chain_id = vm["chain-id"].as<uint64_t>(),
      .verifying_contract = get_address(vm, "verifying-contract")};
}

int run_build(const po::variables_map& vm,
              const vagus::schema::schema_store_ptr& store) {
  if (!vm.contains("action")) {
    vagus::common::critical("build mode requires --action");
  }
  auto builder =
      vagus::intent::builder{store, vm["executor-id"].as<uint64_t>(),
                             get_address(vm, "planner")};
  builder.set_action(vm["action"].as<std::string>())
      .set_max_duration(vm["max-duration-ms"].as<uint32_t>())
      .set_max_energy(vm["max-energy-j"].as<uint32_t>())
      .set_validity_duration(vm["validity-s"].as<uint64_t>());
  if (vm.contains("param")) {
    for (const auto& arg : vm["param"].as<std::vector<std::string>>()) {
      auto [name, value] = parse_parameter(arg);
      builder.set_parameter(name, value);
    }
  }
  if (vm.contains("nonce")) {
    builder.set_nonce(vm["nonce"].as<uint64_t>());
  }

  auto result = vm.contains("now") ? builder.build(vm["now"].as<uint64_t>())
                                   : builder.build();
  if (const auto* failed =
          std::get_if<vagus::intent::validation_errors_t>(&result)) {
    for (const auto& error : failed->errors) {
      spdlog::error("{}", error);
    }
    return 1;
  }
  const auto& intent = std::get<vagus::schema::intent_t>(result);

  const auto ans_state = vm["ans-state"].as<std::string>();
  auto policy_errors = vagus::validation::validate_parameters(*store, intent,
                                                              ans_state);
  for (const auto& error : policy_errors) {
    spdlog::warn("{} under {}", error, ans_state);
  }

  const auto domain = make_domain(vm);
  const auto content = encoder_t{}.digest(intent);
  using vagus::schema::to_prefixed_hex;
  std::cout << "action_id: " << to_prefixed_hex(intent.action_id) << '\n'
            << "params: " << to_prefixed_hex(intent.params) << '\n'
            << "envelope_hash: " << to_prefixed_hex(intent.envelope_hash)
            << '\n'
            << "not_before: " << intent.not_before << '\n'
            << "not_after: " << intent.not_after << '\n'
            << "nonce: " << intent.nonce << '\n'
            << "domain_separator: "
            << to_prefixed_hex(vagus::eip712::domain_separator(domain)) << '\n'
            << "struct_hash: "
            << to_prefixed_hex(vagus::eip712::struct_hash(intent)) << '\n'
            << "digest: "
            << to_prefixed_hex(vagus::eip712::signing_digest(intent, domain))
            << '\n'
            << "cbor_sha256: " << to_prefixed_hex(content.sha256) << '\n'
            << "cbor_sha3_256: " << to_prefixed_hex(content.sha3_256) << '\n';
  return policy_errors.empty() ? 0 : 2;
}

int run_check_param(const po::variables_map& vm,
                    const vagus::schema::schema_store_ptr& store) {
  if (!vm.contains("action") || !vm.contains("param")) {
    vagus::common::critical("check-param mode requires --action and --param");
  }
  const auto& params = vm["param"].as<std::vector<std::string>>();
  if (params.size() != 1) {
    vagus::common::critical("check-param mode takes exactly one --param");
  }
  const auto [name, value] = parse_parameter(params.front());
  const auto action = vm["action"].as<std::string>();
  const auto ans_state = vm["ans-state"].as<std::string>();

  auto result =
      vagus::validation::check_scaled(*store, action, name, value, ans_state);
  if (result.ok()) {
    std::cout << "valid\n";
    return 0;
  }
  std::cout << "invalid: " << result.message << '\n';
  return 1;
}

int run_vectors() {
  auto encoder = encoder_t{};
  std::cout << "version: \"1.0\"\n"
            << "test_vectors:\n";
  for (const auto& entry :
       vagus::schema::encoding::cbor::conformance_vectors()) {
    const auto content = encoder.digest(entry.input);
    std::cout << "- name: " << entry.name << '\n'
              << "  cbor_hex: " << vagus::schema::to_hex(content.encoded)
              << '\n'
              << "  sha256_hex: " << vagus::schema::to_hex(content.sha256)
              << '\n'
              << "  keccak_hex: " << vagus::schema::to_hex(content.sha3_256)
              << '\n';
  }
  return 0;
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  vagus_intent_tool build --action NAME [--param k=v]... "
               "[options]\n"
            << "  vagus_intent_tool check-param --action NAME --param k=v "
               "[--ans-state STATE]\n"
            << "  vagus_intent_tool vectors\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto logger = spdlog::stderr_color_mt("intent_tool");
  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(spdlog::level::warn);

  auto command = std::string{};
  auto options = po::options_description{"vagus_intent_tool options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "build|check-param|vectors")("verbose,v", "enable debug logging")(
      "action", po::value<std::string>(), "action name")(
      "param", po::value<std::vector<std::string>>()->composing(),
      "parameter as name=value, repeatable")(
      "ans-state", po::value<std::string>()->default_value("SAFE"),
      "ANS state used for scaled checks")(
      "executor-id", po::value<uint64_t>()->default_value(1),
      "executor id")("planner",
                     po::value<std::string>()->default_value(
                         "0x0000000000000000000000000000000000000000"),
                     "planner address hex")(
      "max-duration-ms",
      po::value<uint32_t>()->default_value(
          vagus::intent::kDefaultMaxDurationMs),
      "maximum duration in milliseconds")(
      "max-energy-j",
      po::value<uint32_t>()->default_value(vagus::intent::kDefaultMaxEnergyJ),
      "maximum energy in joules")(
      "validity-s",
      po::value<uint64_t>()->default_value(
          vagus::intent::kDefaultValiditySeconds),
      "validity window in seconds")("nonce", po::value<uint64_t>(),
                                    "explicit nonce")(
      "now", po::value<uint64_t>(), "build time in unix seconds")(
      "chain-id", po::value<uint64_t>()->default_value(31337),
      "signing domain chain id")(
      "domain-name", po::value<std::string>()->default_value("Vagus"),
      "signing domain name")(
      "domain-version", po::value<std::string>()->default_value("1"),
      "signing domain version")(
      "verifying-contract",
      po::value<std::string>()->default_value(
          "0x0000000000000000000000000000000000000000"),
      "signing domain verifying contract");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  try {
    po::store(po::command_line_parser(argc, argv)
                  .options(options)
                  .positional(positional)
                  .run(),
              vm);
    po::notify(vm);
  } catch (const po::error& e) {
    vagus::common::critical(e.what());
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }
  if (vm.contains("verbose")) {
    spdlog::set_level(spdlog::level::debug);
  }

  if (command == "vectors") {
    return run_vectors();
  }

  auto store = vagus::schema::schema_store::load(
      vagus::schema::default_action_source(),
      vagus::schema::default_policy_source());

  if (command == "build") {
    return run_build(vm, store);
  }
  if (command == "check-param") {
    return run_check_param(vm, store);
  }

  vagus::common::critical("command must be build|check-param|vectors");
}
