#pragma once

#include <turnstile/facilitator/client.hpp>
#include <turnstile/schema/asset.hpp>
#include <turnstile/schema/network_policy.hpp>
#include <turnstile/schema/pricing.hpp>

#include <nlohmann/json.hpp>

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace turnstile::config {

struct network_config final {
  std::vector<schema::asset_t> assets;
  std::string pay_to;
  std::optional<uint64_t> min_compute_unit_price;
  std::optional<uint64_t> max_compute_unit_price;
};

using network_config_t = network_config;

struct gate_config final {
  bool payments_enabled{false};
  std::string facilitator_base_url;
  uint64_t request_timeout_seconds{30};
  uint32_t max_retries{3};
  uint64_t retry_base_delay_ms{100};
  // CAIP-2 id of the chain requirements are issued on by default.
  std::string default_network;
  // Keyed by CAIP-2 chain id.
  std::map<std::string, network_config_t> networks;
  schema::pricing_t pricing;
};

using gate_config_t = gate_config;

/// Human-readable problems; empty when the configuration is usable. A
/// disabled gate is always usable.
std::vector<std::string> validate(const gate_config_t& config);

/// Registry contents. Entries with an invalid chain id are skipped; they
/// only survive `validate` when payments are disabled.
std::vector<schema::network_policy_t> make_network_policies(
    const gate_config_t& config);

facilitator::client_options_t make_client_options(const gate_config_t& config);

/// Read a JSON configuration file. Absent keys keep their defaults.
std::optional<gate_config_t> load_gate_config(const std::filesystem::path& path,
                                              std::string& error);

void from_json(const nlohmann::json& j, network_config_t& value);
void from_json(const nlohmann::json& j, gate_config_t& value);

}  // namespace turnstile::config
