#include <turnstile/config/gate_config.hpp>
#include <turnstile/facilitator/endpoint.hpp>
#include <turnstile/schema/chain_id.hpp>
#include <turnstile/schema/encoding/base58.hpp>
#include <turnstile/schema/protocol.hpp>
#include <turnstile/svm/exact_validator.hpp>

#include <spdlog/fmt/fmt.h>

#include <fstream>
#include <limits>
#include <string_view>
#include <utility>

namespace turnstile::config {

namespace {

constexpr auto kMaxRequestTimeoutSeconds = uint64_t{300};
constexpr auto kMaxRetries = uint32_t{10};

template <typename T>
void read_optional(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    it->get_to(out);
  }
}

template <typename T>
void read_optional(const nlohmann::json& j,
                   const char* key,
                   std::optional<T>& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = it->get<T>();
  }
}

// Numeric settings must be non-negative JSON integers that fit the field; a
// plain get<> would wrap -1 to the type's maximum.
template <typename T>
T unsigned_value(const nlohmann::json& value, const std::string_view key) {
  if (!value.is_number_integer() ||
      (!value.is_number_unsigned() && value.get<int64_t>() < 0)) {
    throw nlohmann::json::type_error::create(
        302, fmt::format("{} must be an unsigned integer, got {}", key, value.dump()),
        &value);
  }
  const auto raw = value.get<uint64_t>();
  if constexpr (sizeof(T) < sizeof(uint64_t)) {
    if (raw > std::numeric_limits<T>::max()) {
      throw nlohmann::json::out_of_range::create(
          406,
          fmt::format("{} must be <= {}, got {}", key,
                      uint64_t{std::numeric_limits<T>::max()}, raw),
          &value);
    }
  }
  return static_cast<T>(raw);
}

template <typename T>
void read_unsigned(const nlohmann::json& j, const char* key, T& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = unsigned_value<T>(*it, key);
  }
}

template <typename T>
void read_unsigned(const nlohmann::json& j,
                   const char* key,
                   std::optional<T>& out) {
  auto it = j.find(key);
  if (it != j.end() && !it->is_null()) {
    out = unsigned_value<T>(*it, key);
  }
}

void validate_network(const std::string& id,
                      const network_config_t& network,
                      std::vector<std::string>& problems) {
  auto chain = schema::validate_chain_id(id);
  if (auto* error = std::get_if<schema::structural_error>(&chain)) {
    problems.push_back(fmt::format("invalid network '{}': {}", id, error->reason));
    return;
  }
  if (network.assets.empty()) {
    problems.push_back(
        fmt::format("network '{}' must have at least one asset", id));
  }
  if (network.pay_to.empty()) {
    problems.push_back(fmt::format("network '{}' must have pay_to", id));
  }
  for (const auto& asset : network.assets) {
    if (asset.address.empty()) {
      problems.push_back(
          fmt::format("asset address cannot be empty in network '{}'", id));
    }
    if (asset.display_name.empty()) {
      problems.push_back(
          fmt::format("asset name cannot be empty in network '{}'", id));
    }
  }

  if (std::get<schema::chain_id_t>(chain).chain_namespace !=
      svm::kSvmNamespace) {
    return;
  }
  if (!network.min_compute_unit_price || !network.max_compute_unit_price) {
    problems.push_back(fmt::format(
        "network '{}' must set min_compute_unit_price and "
        "max_compute_unit_price",
        id));
  } else if (*network.min_compute_unit_price >
             *network.max_compute_unit_price) {
    problems.push_back(fmt::format(
        "network '{}': min_compute_unit_price ({}) must be <= "
        "max_compute_unit_price ({})",
        id, *network.min_compute_unit_price, *network.max_compute_unit_price));
  }
  if (!network.pay_to.empty() &&
      !schema::encoding::try_make_address(network.pay_to)) {
    problems.push_back(
        fmt::format("network '{}': pay_to is not a base58 address", id));
  }
  for (const auto& asset : network.assets) {
    if (!asset.address.empty() &&
        !schema::encoding::try_make_address(asset.address)) {
      problems.push_back(fmt::format(
          "network '{}': asset {} is not a base58 address", id, asset.address));
    }
  }
}

void validate_pricing(const schema::pricing_t& pricing,
                      std::vector<std::string>& problems) {
  if (!schema::try_parse_u64(pricing.default_amount)) {
    problems.push_back(fmt::format(
        "pricing.default_amount '{}' is not an unsigned integer",
        pricing.default_amount));
  }
  if (pricing.max_timeout_seconds < schema::kMinTimeoutSeconds ||
      pricing.max_timeout_seconds > schema::kMaxTimeoutSeconds) {
    problems.push_back(fmt::format(
        "pricing.max_timeout_seconds must be between {} and {}, got {}",
        schema::kMinTimeoutSeconds, schema::kMaxTimeoutSeconds,
        pricing.max_timeout_seconds));
  }
  for (const auto& [resource, price] : pricing.resources) {
    if (resource.empty()) {
      problems.push_back("pricing.resources has an empty resource id");
    }
    if (!schema::try_parse_u64(price.amount)) {
      problems.push_back(fmt::format(
          "pricing.resources.{}.amount '{}' is not an unsigned integer",
          resource, price.amount));
    }
  }
}

}  // namespace

std::vector<std::string> validate(const gate_config_t& config) {
  auto problems = std::vector<std::string>{};
  if (!config.payments_enabled) {
    return problems;
  }

  if (config.facilitator_base_url.empty()) {
    problems.push_back("facilitator_base_url is required when payments are enabled");
  } else {
    auto error = std::string{};
    if (!facilitator::parse_https_url(config.facilitator_base_url, error)) {
      problems.push_back(fmt::format("invalid facilitator_base_url '{}': {}",
                                     config.facilitator_base_url, error));
    }
  }
  if (config.request_timeout_seconds == 0 ||
      config.request_timeout_seconds > kMaxRequestTimeoutSeconds) {
    problems.push_back(fmt::format(
        "request_timeout_seconds must be between 1 and {}, got {}",
        kMaxRequestTimeoutSeconds, config.request_timeout_seconds));
  }
  if (config.max_retries > kMaxRetries) {
    problems.push_back(fmt::format("max_retries must be <= {}, got {}",
                                   kMaxRetries, config.max_retries));
  }

  if (config.networks.empty()) {
    problems.push_back("at least one network must be configured");
  }
  for (const auto& [id, network] : config.networks) {
    validate_network(id, network, problems);
  }
  if (!config.networks.empty() && !config.networks.contains(config.default_network)) {
    problems.push_back(fmt::format(
        "default_network '{}' is not a configured network", config.default_network));
  }

  validate_pricing(config.pricing, problems);
  return problems;
}

std::vector<schema::network_policy_t> make_network_policies(
    const gate_config_t& config) {
  auto out = std::vector<schema::network_policy_t>{};
  out.reserve(config.networks.size());
  for (const auto& [id, network] : config.networks) {
    auto chain = schema::validate_chain_id(id);
    auto* chain_id = std::get_if<schema::chain_id_t>(&chain);
    if (chain_id == nullptr) {
      continue;
    }
    out.push_back(schema::network_policy_t{
        .chain_id = std::move(*chain_id),
        .accepted_assets = network.assets,
        .pay_to = network.pay_to,
        .min_gas_price = network.min_compute_unit_price.value_or(0),
        .max_gas_price = network.max_compute_unit_price.value_or(
            std::numeric_limits<uint64_t>::max()),
    });
  }
  return out;
}

facilitator::client_options_t make_client_options(const gate_config_t& config) {
  auto error = std::string{};
  auto endpoint = facilitator::parse_https_url(config.facilitator_base_url, error);
  return facilitator::client_options_t{
      .endpoint = endpoint.value_or(facilitator::endpoint_t{}),
      .retry = facilitator::make_retry_policy(
          config.max_retries,
          std::chrono::milliseconds{config.retry_base_delay_ms},
          std::chrono::seconds{config.request_timeout_seconds}),
  };
}

void from_json(const nlohmann::json& j, network_config_t& value) {
  value.assets.clear();
  for (const auto& asset : j.at("assets")) {
    value.assets.push_back(schema::asset_t{
        .address = asset.at("address").get<std::string>(),
        .display_name = asset.at("name").get<std::string>(),
        .decimals = uint8_t{0},
    });
    read_unsigned(asset, "decimals", value.assets.back().decimals);
  }
  value.pay_to = j.at("pay_to").get<std::string>();
  read_unsigned(j, "min_compute_unit_price", value.min_compute_unit_price);
  read_unsigned(j, "max_compute_unit_price", value.max_compute_unit_price);
}

void from_json(const nlohmann::json& j, gate_config_t& value) {
  read_optional(j, "payments_enabled", value.payments_enabled);
  read_optional(j, "facilitator_base_url", value.facilitator_base_url);
  read_unsigned(j, "request_timeout_seconds", value.request_timeout_seconds);
  read_unsigned(j, "max_retries", value.max_retries);
  read_unsigned(j, "retry_base_delay_ms", value.retry_base_delay_ms);
  read_optional(j, "default_network", value.default_network);
  read_optional(j, "networks", value.networks);

  auto pricing = j.find("pricing");
  if (pricing == j.end() || pricing->is_null()) {
    return;
  }
  read_optional(*pricing, "default_amount", value.pricing.default_amount);
  read_unsigned(*pricing, "max_timeout_seconds",
                value.pricing.max_timeout_seconds);
  auto resources = pricing->find("resources");
  if (resources != pricing->end() && resources->is_object()) {
    for (const auto& [resource, price] : resources->items()) {
      auto entry = schema::resource_price_t{
          .amount = price.at("amount").get<std::string>(),
          .description = std::nullopt,
      };
      read_optional(price, "description", entry.description);
      value.pricing.resources.insert_or_assign(resource, std::move(entry));
    }
  }
}

std::optional<gate_config_t> load_gate_config(const std::filesystem::path& path,
                                              std::string& error) {
  auto in = std::ifstream{path};
  if (!in) {
    error = fmt::format("cannot open {}", path.string());
    return std::nullopt;
  }
  try {
    return nlohmann::json::parse(in).get<gate_config_t>();
  } catch (const nlohmann::json::exception& e) {
    error = fmt::format("{}: {}", path.string(), e.what());
  }
  return std::nullopt;
}

}  // namespace turnstile::config
