#pragma once

#include <cstdint>
#include <string>

namespace turnstile::schema {

/// Fungible value unit on one chain. `decimals` is display-only; every
/// amount check works on raw smallest-unit integers.
struct asset final {
  std::string address;
  std::string display_name;
  uint8_t decimals{};

  bool operator==(const asset&) const = default;
};

using asset_t = asset;

}  // namespace turnstile::schema
