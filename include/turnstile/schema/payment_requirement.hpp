#pragma once

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace turnstile::schema {

struct resource_info final {
  std::string url;
  std::optional<std::string> description;
  std::optional<std::string> mime_type;

  bool operator==(const resource_info&) const = default;
};

using resource_info_t = resource_info;

/// One acceptable way to pay for a protected call.
///
/// `amount` is a base-10 u64 in the asset's smallest unit, kept as a string
/// on the wire so no client rounds it through a floating point type.
struct payment_requirement final {
  std::string scheme;
  std::string network;
  std::string amount;
  std::string asset;
  std::string pay_to;
  uint64_t max_timeout_seconds{};
  // Scheme-specific data; null when absent.
  nlohmann::json extra;

  bool operator==(const payment_requirement&) const = default;

  /// True when both requirements ask for the same payment. `extra` and the
  /// timeout are advisory and do not take part.
  bool same_terms(const payment_requirement& other) const {
    return scheme == other.scheme && network == other.network &&
           amount == other.amount && asset == other.asset &&
           pay_to == other.pay_to;
  }
};

using payment_requirement_t = payment_requirement;

/// Body of the "payment required" error. The requirements in `accepts` are
/// alternatives: satisfying any one of them is enough.
struct payment_required final {
  uint32_t x402_version{2};
  std::optional<std::string> error;
  resource_info_t resource;
  std::vector<payment_requirement_t> accepts;
};

using payment_required_t = payment_required;

}  // namespace turnstile::schema
