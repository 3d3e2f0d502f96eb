#pragma once

#include <turnstile/schema/chain_id.hpp>
#include <turnstile/schema/network_policy.hpp>

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace turnstile::registry {

/// Supported chains and their payment policies. Filled once at start-up;
/// concurrent readers need no synchronisation afterwards.
class network_registry final {
 public:
  network_registry() = default;
  explicit network_registry(std::vector<schema::network_policy_t> policies);

  const schema::network_policy_t* lookup_policy(
      const schema::chain_id_t& chain_id) const;
  const schema::network_policy_t* lookup_policy(std::string_view chain_id) const;

  bool contains(const schema::chain_id_t& chain_id) const;
  std::vector<schema::chain_id_t> chains() const;
  size_t size() const { return policies_.size(); }

 private:
  std::unordered_map<std::string, schema::network_policy_t> policies_;
};

using network_registry_t = network_registry;

}  // namespace turnstile::registry
