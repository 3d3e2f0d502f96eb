#include <turnstile/config/gate_config.hpp>
#include <turnstile/facilitator/client.hpp>
#include <turnstile/facilitator/https_transport.hpp>
#include <turnstile/payment/decision.hpp>
#include <turnstile/payment/extractor.hpp>
#include <turnstile/payment/gate.hpp>
#include <turnstile/payment/requirement_builder.hpp>
#include <turnstile/registry/network_registry.hpp>
#include <turnstile/schema/encoding/base58.hpp>
#include <turnstile/schema/encoding/json/encoder.hpp>
#include <turnstile/svm/address_derivation.hpp>
#include <turnstile/svm/exact_validator.hpp>
#include <turnstile/svm/program_ids.hpp>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>
#include <boost/program_options.hpp>

#include <spdlog/async.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <csignal>
#include <cstdlib>
#include <exception>
#include <fstream>
#include <iostream>
#include <iterator>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <utility>

namespace {

namespace asio = boost::asio;
namespace po = boost::program_options;

constexpr auto kExitOk = 0;
constexpr auto kExitRefused = 1;
constexpr auto kExitUsage = 2;

void configure_logging(const std::string& log_file, const bool verbose) {
  spdlog::init_thread_pool(8192, 1);

  // stdout carries command output; logs go to stderr and the file.
  auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
  auto file_sink =
      std::make_shared<spdlog::sinks::basic_file_sink_mt>(log_file, false);

  auto logger = std::make_shared<spdlog::async_logger>(
      "turnstile", spdlog::sinks_init_list{console_sink, file_sink},
      spdlog::thread_pool(), spdlog::async_overflow_policy::block);

  spdlog::set_default_logger(logger);
  spdlog::set_pattern("%H:%M:%S.%e [%^%l%$] [%n] %v");
  spdlog::set_level(verbose ? spdlog::level::debug : spdlog::level::info);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  turnstile_gate requirements --config FILE --resource ID "
               "[--network CHAIN]\n"
            << "  turnstile_gate inspect --config FILE --resource ID --claim "
               "FILE\n"
            << "  turnstile_gate derive-ata --owner ADDRESS --mint ADDRESS "
               "[--token-2022]\n"
            << "  turnstile_gate supported --config FILE\n"
            << "  turnstile_gate process --config FILE --resource ID --claim "
               "FILE\n\n";
  std::cout << options << '\n';
}

std::string require_option(const po::variables_map& vm, const char* name) {
  if (!vm.contains(name)) {
    std::cerr << "missing --" << name << '\n';
    spdlog::shutdown();
    std::exit(kExitUsage);
  }
  return vm[name].as<std::string>();
}

std::optional<turnstile::config::gate_config_t> load_config(
    const po::variables_map& vm) {
  auto error = std::string{};
  auto config =
      turnstile::config::load_gate_config(require_option(vm, "config"), error);
  if (!config) {
    spdlog::error("{}", error);
    return std::nullopt;
  }
  if (vm.contains("facilitator-url")) {
    config->facilitator_base_url = vm["facilitator-url"].as<std::string>();
  }
  if (vm.contains("timeout")) {
    config->request_timeout_seconds = vm["timeout"].as<uint64_t>();
  }
  if (vm.contains("max-retries")) {
    config->max_retries = vm["max-retries"].as<uint32_t>();
  }
  if (vm.contains("payments-enabled")) {
    config->payments_enabled = vm["payments-enabled"].as<bool>();
  }

  auto problems = turnstile::config::validate(*config);
  for (const auto& problem : problems) {
    spdlog::error("configuration: {}", problem);
  }
  if (!problems.empty()) {
    return std::nullopt;
  }
  return config;
}

std::optional<nlohmann::json> read_json_file(const std::string& path) {
  auto in = std::ifstream{path};
  if (!in) {
    spdlog::error("cannot open {}", path);
    return std::nullopt;
  }
  auto parsed = nlohmann::json::parse(in, nullptr, false);
  if (parsed.is_discarded()) {
    spdlog::error("{} is not valid JSON", path);
    return std::nullopt;
  }
  return parsed;
}

/// Drive one coroutine to completion on `io`. SIGINT/SIGTERM request stop
/// through `stop`, which the orchestrator checks before settling.
template <typename T>
T run_to_completion(asio::io_context& io,
                    asio::awaitable<T> task,
                    std::stop_source& stop) {
  auto signals = asio::signal_set{io, SIGINT, SIGTERM};
  signals.async_wait([&](const boost::system::error_code& ec, int) {
    if (!ec) {
      spdlog::warn("interrupted, cancelling");
      stop.request_stop();
    }
  });

  auto result = std::optional<T>{};
  auto error = std::exception_ptr{};
  asio::co_spawn(io, std::move(task), [&](std::exception_ptr e, T value) {
    error = e;
    if (!e) {
      result = std::move(value);
    }
    signals.cancel();
  });
  io.run();
  if (error) {
    std::rethrow_exception(error);
  }
  return std::move(*result);
}

std::shared_ptr<const turnstile::facilitator::facilitator_client> make_client(
    const turnstile::config::gate_config_t& config) {
  return std::make_shared<turnstile::facilitator::facilitator_client>(
      turnstile::config::make_client_options(config),
      std::make_shared<turnstile::facilitator::https_transport>());
}

int run_requirements(const po::variables_map& vm) {
  auto config = load_config(vm);
  if (!config) {
    return kExitUsage;
  }
  auto registry = turnstile::registry::network_registry_t{
      turnstile::config::make_network_policies(*config)};
  auto builder =
      turnstile::payment::requirement_builder{registry, config->pricing};
  auto network = vm.contains("network") ? vm["network"].as<std::string>()
                                        : config->default_network;

  auto built = builder.build(require_option(vm, "resource"), network);
  if (auto* error = std::get_if<turnstile::schema::structural_error>(&built)) {
    spdlog::error("{}", error->reason);
    return kExitRefused;
  }
  auto decision = turnstile::payment::payment_decision_t{
      turnstile::payment::payment_required_t{
          .body = std::get<turnstile::schema::payment_required_t>(built),
          .context = {}}};
  std::cout << turnstile::payment::to_jsonrpc_error(decision)->dump(2) << '\n';
  return kExitOk;
}

int run_inspect(const po::variables_map& vm) {
  auto config = load_config(vm);
  if (!config) {
    return kExitUsage;
  }
  auto claim_json = read_json_file(require_option(vm, "claim"));
  if (!claim_json) {
    return kExitUsage;
  }

  auto extracted = turnstile::payment::extract(
      nlohmann::json{{"payment", *claim_json}});
  if (auto* malformed =
          std::get_if<turnstile::payment::payment_malformed_t>(&extracted)) {
    std::cout << nlohmann::json{{"valid", false},
                                {"error", "malformed"},
                                {"detail", malformed->reason}}
                     .dump(2)
              << '\n';
    return kExitRefused;
  }
  const auto& claim = std::get<turnstile::schema::payment_claim_t>(extracted);

  auto registry = turnstile::registry::network_registry_t{
      turnstile::config::make_network_policies(*config)};
  auto builder =
      turnstile::payment::requirement_builder{registry, config->pricing};
  const auto* policy = registry.lookup_policy(claim.accepted.network);
  if (policy == nullptr) {
    std::cout << nlohmann::json{{"valid", false},
                                {"error", "unsupported_network"},
                                {"detail", claim.accepted.network}}
                     .dump(2)
              << '\n';
    return kExitRefused;
  }
  auto offered = builder.requirements(require_option(vm, "resource"), *policy);
  if (std::ranges::none_of(offered, [&](const auto& requirement) {
        return requirement.same_terms(claim.accepted);
      })) {
    std::cout << nlohmann::json{{"valid", false},
                                {"error", "requirement_mismatch"},
                                {"detail", "accepted requirement is not offered"}}
                     .dump(2)
              << '\n';
    return kExitRefused;
  }

  auto result = turnstile::svm::validate_exact(claim, *policy);
  if (auto* violation = std::get_if<turnstile::svm::violation_t>(&result)) {
    std::cout << nlohmann::json{{"valid", false},
                                {"error", turnstile::schema::to_string(
                                              violation->kind)},
                                {"detail", violation->detail}}
                     .dump(2)
              << '\n';
    return kExitRefused;
  }
  const auto& transfer = std::get<turnstile::svm::exact_transfer_t>(result);
  std::cout << nlohmann::json{{"valid", true},
                              {"payer", transfer.payer_hint},
                              {"destination", turnstile::schema::encoding::to_base58(
                                                  transfer.destination)},
                              {"amount", std::to_string(transfer.amount)},
                              {"computeUnitPrice", transfer.compute_unit_price}}
                   .dump(2)
            << '\n';
  return kExitOk;
}

int run_derive_ata(const po::variables_map& vm) {
  auto owner =
      turnstile::schema::encoding::try_make_address(require_option(vm, "owner"));
  auto mint =
      turnstile::schema::encoding::try_make_address(require_option(vm, "mint"));
  if (!owner || !mint) {
    spdlog::error("owner and mint must be base58 32-byte addresses");
    return kExitUsage;
  }
  const auto& token_program = vm.contains("token-2022")
                                  ? turnstile::svm::kToken2022Program
                                  : turnstile::svm::kTokenProgram;
  auto address =
      turnstile::svm::associated_token_address(*owner, *mint, token_program);
  if (!address) {
    spdlog::error("no off-curve associated account exists");
    return kExitRefused;
  }
  std::cout << turnstile::schema::encoding::to_base58(*address) << '\n';
  return kExitOk;
}

int run_supported(const po::variables_map& vm) {
  auto config = load_config(vm);
  if (!config) {
    return kExitUsage;
  }
  auto client = make_client(*config);
  auto io = asio::io_context{};
  auto stop = std::stop_source{};
  auto trace_id = turnstile::payment::payment_gate::make_trace_id();
  auto result = run_to_completion(io, client->supported(trace_id), stop);
  if (auto* failure =
          std::get_if<turnstile::facilitator::facilitator_failure_t>(&result)) {
    spdlog::error("[{}] supported failed: {}", trace_id, failure->detail);
    return kExitRefused;
  }
  std::cout << nlohmann::json(
                   std::get<turnstile::schema::supported_capabilities_t>(result))
                   .dump(2)
            << '\n';
  return kExitOk;
}

int run_process(const po::variables_map& vm) {
  auto config = load_config(vm);
  if (!config) {
    return kExitUsage;
  }
  auto claim_json = read_json_file(require_option(vm, "claim"));
  if (!claim_json) {
    return kExitUsage;
  }

  auto registry = turnstile::registry::network_registry_t{
      turnstile::config::make_network_policies(*config)};
  auto builder =
      turnstile::payment::requirement_builder{registry, config->pricing};
  auto gate = turnstile::payment::payment_gate{
      turnstile::payment::gate_settings_t{
          .payments_enabled = config->payments_enabled,
          .default_network = config->default_network},
      registry, builder, make_client(*config)};

  auto call = turnstile::payment::protected_call_t{
      .resource_id = require_option(vm, "resource"),
      .network = vm.contains("network") ? vm["network"].as<std::string>()
                                        : std::string{},
      .meta = nlohmann::json{{"payment", *claim_json}},
  };

  auto io = asio::io_context{};
  auto stop = std::stop_source{};
  auto decision = run_to_completion(
      io, gate.authorize(std::move(call), stop.get_token()), stop);

  if (auto* receipt =
          std::get_if<turnstile::payment::payment_authorized_t>(&decision)) {
    std::cout << turnstile::payment::to_receipt(*receipt).dump(2) << '\n';
    return kExitOk;
  }
  std::cout << turnstile::payment::to_jsonrpc_error(decision)->dump(2) << '\n';
  return kExitRefused;
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto log_file = std::string{};
  auto options = po::options_description{"turnstile_gate options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "requirements|inspect|derive-ata|supported|process")(
      "config,c", po::value<std::string>(), "gate configuration JSON file")(
      "resource,r", po::value<std::string>(), "protected resource id")(
      "network,n", po::value<std::string>(), "CAIP-2 chain id")(
      "claim", po::value<std::string>(), "payment claim JSON file")(
      "owner", po::value<std::string>(), "base58 owner address")(
      "mint", po::value<std::string>(), "base58 mint address")(
      "token-2022", "derive under the Token-2022 program")(
      "facilitator-url", po::value<std::string>(),
      "override facilitator_base_url")(
      "timeout", po::value<uint64_t>(), "override request_timeout_seconds")(
      "max-retries", po::value<uint32_t>(), "override max_retries")(
      "payments-enabled", po::value<bool>(), "override payments_enabled")(
      "log-file", po::value<std::string>(&log_file)
                      ->default_value("turnstile_gate.log"),
      "log file path")("verbose,v", "enable debug logging");

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
    std::cerr << e.what() << '\n';
    return kExitUsage;
  }

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return kExitOk;
  }

  configure_logging(log_file, vm.contains("verbose"));

  auto status = kExitUsage;
  if (command == "requirements") {
    status = run_requirements(vm);
  } else if (command == "inspect") {
    status = run_inspect(vm);
  } else if (command == "derive-ata") {
    status = run_derive_ata(vm);
  } else if (command == "supported") {
    status = run_supported(vm);
  } else if (command == "process") {
    status = run_process(vm);
  } else {
    std::cerr << "command must be "
                 "requirements|inspect|derive-ata|supported|process\n";
  }

  spdlog::shutdown();
  return status;
}
