#include <turnstile/common/critical.hpp>
#include <turnstile/registry/network_registry.hpp>

#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <utility>

namespace turnstile::registry {

network_registry::network_registry(
    std::vector<schema::network_policy_t> policies) {
  policies_.reserve(policies.size());
  for (auto& policy : policies) {
    auto key = schema::to_string(policy.chain_id);
    if (policies_.contains(key)) {
      common::critical(fmt::format("duplicate network policy for {}", key));
    }
    policies_.emplace(std::move(key), std::move(policy));
  }
}

const schema::network_policy_t* network_registry::lookup_policy(
    const schema::chain_id_t& chain_id) const {
  return lookup_policy(schema::to_string(chain_id));
}

const schema::network_policy_t* network_registry::lookup_policy(
    const std::string_view chain_id) const {
  auto it = policies_.find(std::string{chain_id});
  if (it == std::end(policies_)) {
    return nullptr;
  }
  return &it->second;
}

bool network_registry::contains(const schema::chain_id_t& chain_id) const {
  return lookup_policy(chain_id) != nullptr;
}

std::vector<schema::chain_id_t> network_registry::chains() const {
  auto out = std::vector<schema::chain_id_t>{};
  out.reserve(policies_.size());
  for (const auto& [key, policy] : policies_) {
    out.push_back(policy.chain_id);
  }
  std::ranges::sort(out, [](const auto& a, const auto& b) {
    return schema::to_string(a) < schema::to_string(b);
  });
  return out;
}

}  // namespace turnstile::registry
