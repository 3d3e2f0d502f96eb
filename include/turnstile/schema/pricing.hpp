#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

namespace turnstile::schema {

struct resource_price final {
  // u64 smallest units, decimal.
  std::string amount;
  std::optional<std::string> description;
};

using resource_price_t = resource_price;

/// Price list for protected resources. Resources without an entry are
/// charged `default_amount`.
struct pricing final {
  std::string default_amount{"1000000"};
  uint64_t max_timeout_seconds{60};
  std::map<std::string, resource_price_t, std::less<>> resources;
};

using pricing_t = pricing;

}  // namespace turnstile::schema
