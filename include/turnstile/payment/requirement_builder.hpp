#pragma once

#include <turnstile/registry/network_registry.hpp>
#include <turnstile/schema/chain_id.hpp>
#include <turnstile/schema/payment_requirement.hpp>
#include <turnstile/schema/pricing.hpp>

#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace turnstile::payment {

using build_result_t =
    std::variant<schema::payment_required_t, schema::structural_error>;

/// Emits the payment alternatives for a protected resource: one "exact"
/// requirement per asset the chain's policy accepts.
class requirement_builder final {
 public:
  requirement_builder(const registry::network_registry_t& registry,
                      schema::pricing_t pricing);

  build_result_t build(std::string_view resource_id,
                       std::string_view chain_id) const;

  std::vector<schema::payment_requirement_t> requirements(
      std::string_view resource_id,
      const schema::network_policy_t& policy) const;

  schema::resource_info_t describe(std::string_view resource_id) const;

  const schema::pricing_t& pricing() const { return pricing_; }

 private:
  const registry::network_registry_t& registry_;
  schema::pricing_t pricing_;
};

}  // namespace turnstile::payment
