#include <turnstile/payment/requirement_builder.hpp>
#include <turnstile/schema/protocol.hpp>

#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>

#include <utility>

namespace turnstile::payment {

requirement_builder::requirement_builder(
    const registry::network_registry_t& registry,
    schema::pricing_t pricing)
    : registry_{registry}, pricing_{std::move(pricing)} {}

build_result_t requirement_builder::build(
    const std::string_view resource_id,
    const std::string_view chain_id) const {
  if (resource_id.empty()) {
    return schema::structural_error{"resource id is empty"};
  }
  auto validated = schema::validate_chain_id(chain_id);
  if (auto* error = std::get_if<schema::structural_error>(&validated)) {
    return *error;
  }
  const auto* policy =
      registry_.lookup_policy(std::get<schema::chain_id_t>(validated));
  if (policy == nullptr) {
    return schema::structural_error{
        fmt::format("network {} is not configured", chain_id)};
  }

  auto accepts = requirements(resource_id, *policy);
  if (accepts.empty()) {
    return schema::structural_error{
        fmt::format("no assets configured for network {}", chain_id)};
  }

  spdlog::debug("issuing {} payment requirement(s) for {} on {}",
                accepts.size(), resource_id, chain_id);
  return schema::payment_required_t{
      .x402_version = schema::kX402Version,
      .error = fmt::format("Payment required to call tool '{}'", resource_id),
      .resource = describe(resource_id),
      .accepts = std::move(accepts),
  };
}

std::vector<schema::payment_requirement_t> requirement_builder::requirements(
    const std::string_view resource_id,
    const schema::network_policy_t& policy) const {
  auto amount = pricing_.default_amount;
  if (auto it = pricing_.resources.find(resource_id);
      it != std::end(pricing_.resources)) {
    amount = it->second.amount;
  }

  auto out = std::vector<schema::payment_requirement_t>{};
  out.reserve(policy.accepted_assets.size());
  for (const auto& asset : policy.accepted_assets) {
    out.push_back(schema::payment_requirement_t{
        .scheme = std::string{schema::kExactScheme},
        .network = schema::to_string(policy.chain_id),
        .amount = amount,
        .asset = asset.address,
        .pay_to = policy.pay_to,
        .max_timeout_seconds = pricing_.max_timeout_seconds,
        .extra = nullptr,
    });
  }
  return out;
}

schema::resource_info_t requirement_builder::describe(
    const std::string_view resource_id) const {
  auto description = fmt::format("MCP tool call: {}", resource_id);
  if (auto it = pricing_.resources.find(resource_id);
      it != std::end(pricing_.resources) && it->second.description) {
    description = *it->second.description;
  }
  return schema::resource_info_t{
      .url = fmt::format("{}{}", schema::kResourceUrlPrefix, resource_id),
      .description = std::move(description),
      .mime_type = std::string{schema::kResourceMimeType},
  };
}

}  // namespace turnstile::payment
