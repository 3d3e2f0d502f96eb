#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace turnstile::schema {

struct verify_outcome final {
  bool is_valid{};
  std::optional<std::string> payer;
  std::optional<std::string> reason;
};

using verify_outcome_t = verify_outcome;

/// Result of POST /settle. `settled == true` is only ever produced after a
/// valid verify_outcome for the same claim.
struct settlement_outcome final {
  bool settled{};
  std::optional<std::string> transaction_ref;
  std::string chain_id;
  std::optional<std::string> payer;
  std::optional<std::string> error_reason;
};

using settlement_outcome_t = settlement_outcome;

struct supported_kind final {
  uint32_t x402_version{};
  std::string scheme;
  std::string network;
  nlohmann::json extra;
};

using supported_kind_t = supported_kind;

struct supported_capabilities final {
  std::vector<supported_kind_t> kinds;
  std::vector<std::string> extensions;
  // network -> facilitator signer addresses
  std::map<std::string, std::vector<std::string>> signers;
};

using supported_capabilities_t = supported_capabilities;

}  // namespace turnstile::schema
