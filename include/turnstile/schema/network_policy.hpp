#pragma once

#include <turnstile/schema/asset.hpp>
#include <turnstile/schema/chain_id.hpp>

#include <algorithm>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace turnstile::schema {

/// Per-chain payment policy. Built once at start-up and read-only afterwards.
struct network_policy final {
  chain_id_t chain_id;
  std::vector<asset_t> accepted_assets;
  std::string pay_to;
  // Compute-unit price bounds, inclusive, in micro-lamports for SVM chains.
  uint64_t min_gas_price{};
  uint64_t max_gas_price{};

  bool accepts(const std::string_view asset_address) const {
    return std::ranges::any_of(accepted_assets, [&](const asset_t& value) {
      return value.address == asset_address;
    });
  }
};

using network_policy_t = network_policy;

}  // namespace turnstile::schema
